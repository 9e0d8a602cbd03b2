#include <fungible/token/mapping.hpp>

#include <algorithm>

namespace fungible::token {

allowance_key make_allowance_key( const protocol::account& owner, const protocol::account& spender ) noexcept
{
  allowance_key key{};
  auto itr = std::ranges::copy( owner, key.begin() ).out;
  std::ranges::copy( spender, itr );
  return key;
}

std::uint64_t decode_amount( std::span< const std::byte > object )
{
  if( !object.size() )
    return 0;

  if( object.size() != sizeof( std::uint64_t ) )
    throw std::system_error( token_errc::unexpected_object );

  auto amount = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( amount );
  return amount;
}

} // namespace fungible::token
