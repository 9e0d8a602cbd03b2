#pragma once

#include <expected>
#include <system_error>

namespace fungible::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  invalid_instruction,
  invalid_argument,
  insufficient_balance,
  insufficient_allowance,
  overflow
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::program

template<>
struct std::is_error_code_enum< fungible::program::program_errc >: public std::true_type
{};
