#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <system_error>

#include <boost/endian.hpp>

#include <fungible/memory.hpp>
#include <fungible/protocol/account.hpp>
#include <fungible/token/error.hpp>
#include <fungible/token/object_store.hpp>

namespace fungible::token {

using allowance_key = std::array< std::byte, 2 * protocol::account_length >;

allowance_key make_allowance_key( const protocol::account& owner, const protocol::account& spender ) noexcept;

/**
 * Amounts are stored as 8 byte little endian integers.
 */
std::uint64_t decode_amount( std::span< const std::byte > object );

/**
 * A typed view of one object space holding amounts. Absent keys read as 0.
 */
template< typename Key >
class mapping final
{
public:
  mapping( object_store& store, std::uint32_t space ) noexcept:
      _store( &store ),
      _space( space )
  {}

  std::uint64_t get( const Key& key ) const
  {
    return decode_amount( _store->get_object( _space, memory::as_bytes( key ) ) );
  }

  std::error_code insert( const Key& key, std::uint64_t value )
  {
    boost::endian::native_to_little_inplace( value );
    return _store->put_object( _space, memory::as_bytes( key ), memory::as_bytes( value ) );
  }

private:
  object_store* _store;
  std::uint32_t _space;
};

} // namespace fungible::token
