#include <fungible/token/events.hpp>

#include <sstream>
#include <string>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <fungible/memory.hpp>

namespace fungible::token {

namespace {

template< typename T >
std::vector< std::byte > encode( const T& t )
{
  std::stringstream stream;

  {
    boost::archive::binary_oarchive oa( stream, boost::archive::no_header );
    oa << t;
  }

  auto str = stream.str();
  auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

template< typename T >
result< T > decode( const protocol::event& ev, std::string_view name )
{
  if( ev.name != name )
    return std::unexpected( token_errc::unexpected_object );

  T t;

  try
  {
    std::stringstream stream( std::string( memory::as_string_view( ev.data ) ) );
    boost::archive::binary_iarchive ia( stream, boost::archive::no_header );
    ia >> t;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( token_errc::unexpected_object );
  }

  return t;
}

} // namespace

protocol::event make_event( const transfer_event& ev, const protocol::account& source )
{
  protocol::event event;
  event.source = source;
  event.name   = event_name::transfer;
  event.data   = encode( ev );

  if( ev.from )
    event.impacted.push_back( *ev.from );

  if( ev.to )
    event.impacted.push_back( *ev.to );

  return event;
}

protocol::event make_event( const approval_event& ev, const protocol::account& source )
{
  protocol::event event;
  event.source = source;
  event.name   = event_name::approval;
  event.data   = encode( ev );
  event.impacted.push_back( ev.owner );
  event.impacted.push_back( ev.spender );

  return event;
}

result< transfer_event > decode_transfer( const protocol::event& ev )
{
  return decode< transfer_event >( ev, event_name::transfer );
}

result< approval_event > decode_approval( const protocol::event& ev )
{
  return decode< approval_event >( ev, event_name::approval );
}

} // namespace fungible::token
