#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <boost/serialization/array.hpp>

#include <fungible/encode/error.hpp>

namespace fungible::protocol {

constexpr std::size_t account_length = 32;

/**
 * Opaque identity of a holder or caller. The host decides how an account
 * is derived; the ledger only compares and hashes it.
 */
using account = std::array< std::byte, account_length >;

struct account_hash
{
  std::size_t operator()( const account& a ) const noexcept;
};

std::string to_string( const account& a );
encode::result< account > account_from_string( std::string_view sv ) noexcept;

} // namespace fungible::protocol
