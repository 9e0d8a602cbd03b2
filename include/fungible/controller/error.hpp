#pragma once

#include <expected>
#include <system_error>

namespace fungible::controller {

enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  read_only_context,
  bad_file_descriptor,
  end_of_input
};

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  not_open
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::controller

template<>
struct std::is_error_code_enum< fungible::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< fungible::controller::controller_errc >: public std::true_type
{};
