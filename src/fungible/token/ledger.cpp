#include <fungible/token/events.hpp>
#include <fungible/token/ledger.hpp>

#include <limits>

#include <boost/endian.hpp>

#include <fungible/memory.hpp>

namespace fungible::token {

ledger::ledger( object_store& store, event_sink& sink, const protocol::account& source ) noexcept:
    _store( store ),
    _sink( sink ),
    _source( source ),
    _balances( store, space::balance ),
    _allowances( store, space::allowance )
{}

std::error_code ledger::construct( const protocol::account& caller, std::uint64_t initial_supply, const metadata& md )
{
  if( constructed() )
    return token_errc::already_constructed;

  auto supply = boost::endian::native_to_little( initial_supply );
  if( auto error = _store.put_object( space::supply, {}, memory::as_bytes( supply ) ); error )
    return error;

  auto decimals = boost::endian::native_to_little( md.decimals );

  if( auto error = _store.put_object( space::name, {}, memory::as_bytes( md.name ) ); error )
    return error;

  if( auto error = _store.put_object( space::symbol, {}, memory::as_bytes( md.symbol ) ); error )
    return error;

  if( auto error = _store.put_object( space::decimals, {}, memory::as_bytes( decimals ) ); error )
    return error;

  if( auto error = _balances.insert( caller, initial_supply ); error )
    return error;

  return _sink.emit_event( make_event( transfer_event{ .from = {}, .to = caller, .value = initial_supply }, _source ) );
}

bool ledger::constructed() const
{
  return _store.get_object( space::supply, {} ).size() > 0;
}

std::uint64_t ledger::total_supply() const
{
  return decode_amount( _store.get_object( space::supply, {} ) );
}

std::uint64_t ledger::balance_of( const protocol::account& account ) const
{
  return _balances.get( account );
}

std::uint64_t ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  return _allowances.get( make_allowance_key( owner, spender ) );
}

std::string ledger::get_string( std::uint32_t id ) const
{
  auto object = _store.get_object( id, {} );
  return std::string( memory::as_string_view( object ) );
}

std::string ledger::name() const
{
  return get_string( space::name );
}

std::string ledger::symbol() const
{
  return get_string( space::symbol );
}

std::uint32_t ledger::decimals() const
{
  auto object = _store.get_object( space::decimals, {} );
  if( !object.size() )
    return 0;

  if( object.size() != sizeof( std::uint32_t ) )
    throw std::system_error( token_errc::unexpected_object );

  return boost::endian::little_to_native( memory::bit_cast< std::uint32_t >( object ) );
}

std::error_code ledger::transfer( const protocol::account& caller, const protocol::account& to, std::uint64_t value )
{
  return transfer_from_to( caller, to, value );
}

std::error_code
ledger::approve( const protocol::account& caller, const protocol::account& spender, std::uint64_t value )
{
  if( auto error = _allowances.insert( make_allowance_key( caller, spender ), value ); error )
    return error;

  return _sink.emit_event(
    make_event( approval_event{ .owner = caller, .spender = spender, .value = value }, _source ) );
}

std::error_code ledger::transfer_from( const protocol::account& caller,
                                       const protocol::account& from,
                                       const protocol::account& to,
                                       std::uint64_t value )
{
  auto key     = make_allowance_key( from, caller );
  auto allowed = _allowances.get( key );

  if( allowed < value )
    return token_errc::insufficient_allowance;

  if( auto error = transfer_from_to( from, to, value ); error )
    return error;

  return _allowances.insert( key, allowed - value );
}

std::error_code
ledger::transfer_from_to( const protocol::account& from, const protocol::account& to, std::uint64_t value )
{
  auto from_balance = _balances.get( from );

  if( from_balance < value )
    return token_errc::insufficient_balance;

  // The credit is read after the debit, a transfer to self leaves the balance as is
  auto to_balance = from == to ? from_balance - value : _balances.get( to );

  if( std::numeric_limits< std::uint64_t >::max() - value < to_balance )
    return token_errc::overflow;

  if( auto error = _balances.insert( from, from_balance - value ); error )
    return error;

  if( auto error = _balances.insert( to, to_balance + value ); error )
    return error;

  return _sink.emit_event( make_event( transfer_event{ .from = from, .to = to, .value = value }, _source ) );
}

} // namespace fungible::token
