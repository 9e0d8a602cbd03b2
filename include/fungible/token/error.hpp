#pragma once

#include <expected>
#include <system_error>

namespace fungible::token {

enum class token_errc : int // NOLINT(performance-enum-size)
{
  ok,
  insufficient_balance,
  insufficient_allowance,
  overflow,
  already_constructed,
  unexpected_object
};

const std::error_category& token_category() noexcept;

std::error_code make_error_code( token_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::token

template<>
struct std::is_error_code_enum< fungible::token::token_errc >: public std::true_type
{};
