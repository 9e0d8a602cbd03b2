#include <fungible/program/token_program.hpp>

#include <type_traits>
#include <utility>

#include <boost/endian.hpp>

#include <fungible/memory.hpp>
#include <fungible/protocol.hpp>
#include <fungible/token.hpp>

namespace fungible::program {

namespace {

template< typename T >
  requires std::is_integral_v< T >
std::error_code read_argument( system_interface* system, T& t )
{
  if( system->read( file_descriptor::stdin, memory::as_writable_bytes( t ) ) )
    return program_errc::invalid_argument;

  boost::endian::little_to_native_inplace( t );
  return program_errc::ok;
}

std::error_code read_argument( system_interface* system, protocol::account& account )
{
  if( system->read( file_descriptor::stdin, memory::as_writable_bytes( account.data(), account.size() ) ) )
    return program_errc::invalid_argument;

  return program_errc::ok;
}

template< typename... Args >
std::error_code read_arguments( system_interface* system, Args&... args )
{
  std::error_code error;
  ( ( error = error ? error : read_argument( system, args ) ), ... );
  return error;
}

template< typename T >
  requires std::is_integral_v< T >
std::error_code write_result( system_interface* system, T t )
{
  boost::endian::native_to_little_inplace( t );
  return system->write( file_descriptor::stdout, memory::as_bytes( t ) );
}

std::error_code from_ledger_error( std::error_code error )
{
  if( error.category() != token::token_category() )
    return error;

  switch( static_cast< token::token_errc >( error.value() ) )
  {
    case token::token_errc::ok:
      return program_errc::ok;
    case token::token_errc::insufficient_balance:
      return program_errc::insufficient_balance;
    case token::token_errc::insufficient_allowance:
      return program_errc::insufficient_allowance;
    case token::token_errc::overflow:
      return program_errc::overflow;
    default:
      return error;
  }
}

} // namespace

std::error_code token_program::run( system_interface* system )
{
  token::ledger ledger( *system, *system, system->get_program() );

  std::uint32_t instr = 0;
  if( auto error = read_argument( system, instr ); error )
    return program_errc::invalid_instruction;

  switch( instr )
  {
    case std::to_underlying( instruction::name ):
      return system->write( file_descriptor::stdout, memory::as_bytes( ledger.name() ) );
    case std::to_underlying( instruction::symbol ):
      return system->write( file_descriptor::stdout, memory::as_bytes( ledger.symbol() ) );
    case std::to_underlying( instruction::decimals ):
      return write_result( system, ledger.decimals() );
    case std::to_underlying( instruction::total_supply ):
      return write_result( system, ledger.total_supply() );
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account account{};

        if( auto error = read_arguments( system, account ); error )
          return error;

        return write_result( system, ledger.balance_of( account ) );
      }
    case std::to_underlying( instruction::allowance ):
      {
        protocol::account owner{};
        protocol::account spender{};

        if( auto error = read_arguments( system, owner, spender ); error )
          return error;

        return write_result( system, ledger.allowance( owner, spender ) );
      }
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account to{};
        std::uint64_t value = 0;

        if( auto error = read_arguments( system, to, value ); error )
          return error;

        return from_ledger_error( ledger.transfer( system->get_caller(), to, value ) );
      }
    case std::to_underlying( instruction::approve ):
      {
        protocol::account spender{};
        std::uint64_t value = 0;

        if( auto error = read_arguments( system, spender, value ); error )
          return error;

        return from_ledger_error( ledger.approve( system->get_caller(), spender, value ) );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        protocol::account from{};
        protocol::account to{};
        std::uint64_t value = 0;

        if( auto error = read_arguments( system, from, to, value ); error )
          return error;

        return from_ledger_error( ledger.transfer_from( system->get_caller(), from, to, value ) );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace fungible::program
