#include <fungible/protocol/account.hpp>

#include <string_view>

#include <fungible/encode/hex.hpp>
#include <fungible/memory/memory.hpp>

namespace fungible::protocol {

std::size_t account_hash::operator()( const account& a ) const noexcept
{
  return std::hash< std::string_view >{}( memory::as_string_view( a ) );
}

std::string to_string( const account& a )
{
  return encode::to_hex( a );
}

encode::result< account > account_from_string( std::string_view sv ) noexcept
{
  account a{};
  if( auto error = encode::from_hex( sv, a ); error )
    return std::unexpected( error );

  return a;
}

} // namespace fungible::protocol
