#pragma once

#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fungible/encode/error.hpp>

namespace fungible::encode {

/**
 * Lower case hex with a `0x` prefix.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

/**
 * Decodes hex with an optional `0x` prefix.
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decodes hex of exactly `out.size()` bytes into `out`. Fails with
 * `invalid_length` for any other width and leaves `out` untouched on error.
 */
std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept;

} // namespace fungible::encode
