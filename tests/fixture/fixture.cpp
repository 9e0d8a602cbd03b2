// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>

#include <boost/endian.hpp>
#include <boost/filesystem.hpp>

#include <fungible/controller.hpp>
#include <fungible/log.hpp>
#include <fungible/memory.hpp>
#include <fungible/protocol.hpp>
#include <fungible/state_db.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  fungible::log::initialize( quill::loglevel_from_string( log_level ) );

  _controller = std::make_unique< fungible::controller::controller >();

  _state_dir = std::filesystem::temp_directory_path() / boost::filesystem::unique_path().string();
  LOG_INFO( fungible::log::instance(), "Using temporary directory: {}", _state_dir.string() );
  std::filesystem::create_directory( _state_dir );

  _genesis_data.deployer        = make_account( "alice" );
  _genesis_data.initial_supply  = 100;
  _genesis_data.metadata.name   = "Token";
  _genesis_data.metadata.symbol = "TOKEN";

  _controller->open( _state_dir, _genesis_data, false );
}

fixture::~fixture()
{
  _controller->close();
  std::filesystem::remove_all( _state_dir );
}

fungible::protocol::account fixture::make_account( std::string_view name ) noexcept
{
  fungible::protocol::account account{};
  const auto bytes = fungible::memory::as_bytes( name.substr( 0, account.size() ) );
  std::ranges::copy( bytes, account.begin() );
  return account;
}

void fixture::reopen( bool reset )
{
  _controller->close();
  _controller->open( _state_dir, _genesis_data, reset );
}

void fixture::write_object( std::uint32_t space,
                            std::span< const std::byte > key,
                            std::span< const std::byte > value )
{
  _controller->close();

  {
    fungible::state_db::backends::file::file_backend backend;
    if( backend.open( state_file() ) )
      throw std::runtime_error( "unable to open state file" );

    backend.start_write_batch();
    backend.put( fungible::state_db::make_object_key( space, key ), std::vector< std::byte >( value.begin(), value.end() ) );

    if( backend.end_write_batch() || backend.close() )
      throw std::runtime_error( "unable to write state file" );
  }

  _controller->open( _state_dir, _genesis_data, false );
}

std::filesystem::path fixture::state_file() const
{
  return _state_dir / "state.bin";
}

fungible::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin ) const noexcept
{
  fungible::protocol::program_input input;
  input.stdin = std::move( stdin );
  return input;
}

std::uint64_t fixture::balance_of( const fungible::protocol::account& account ) const
{
  auto output = _controller->read( make_input( make_stdin( instruction::balance_of, account ) ) );
  if( !output || output->code )
    throw std::runtime_error( "balance_of query failed" );

  return boost::endian::little_to_native( fungible::memory::bit_cast< std::uint64_t >( output->stdout ) );
}

std::uint64_t fixture::allowance( const fungible::protocol::account& owner,
                                  const fungible::protocol::account& spender ) const
{
  auto output = _controller->read( make_input( make_stdin( instruction::allowance, owner, spender ) ) );
  if( !output || output->code )
    throw std::runtime_error( "allowance query failed" );

  return boost::endian::little_to_native( fungible::memory::bit_cast< std::uint64_t >( output->stdout ) );
}

std::uint64_t fixture::total_supply() const
{
  auto output = _controller->read( make_input( make_stdin( instruction::total_supply ) ) );
  if( !output || output->code )
    throw std::runtime_error( "total_supply query failed" );

  return boost::endian::little_to_native( fungible::memory::bit_cast< std::uint64_t >( output->stdout ) );
}

bool fixture::verify( const fungible::controller::result< fungible::protocol::call_receipt >& receipt,
                      fungible::program::program_errc code ) const
{
  if( !receipt )
  {
    LOG_ERROR( fungible::log::instance(), "Call failed: {}", receipt.error().message() );
    return false;
  }

  if( receipt->output.code != std::to_underlying( code ) )
  {
    LOG_ERROR( fungible::log::instance(),
               "Expected code {}, got {}",
               std::to_underlying( code ),
               receipt->output.code );
    return false;
  }

  if( code != fungible::program::program_errc::ok && !receipt->events.empty() )
  {
    LOG_ERROR( fungible::log::instance(), "Reverted call produced {} event(s)", receipt->events.size() );
    return false;
  }

  return true;
}

} // namespace test

// NOLINTEND
