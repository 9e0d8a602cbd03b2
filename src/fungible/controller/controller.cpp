#include <fungible/controller/controller.hpp>
#include <fungible/controller/state.hpp>

#include "chronicler.hpp"
#include "execution_context.hpp"

#include <fungible/log.hpp>
#include <fungible/program.hpp>
#include <fungible/token.hpp>

#include <span>
#include <stdexcept>

namespace fungible::controller {

controller::controller():
    _chronicler( std::make_unique< chronicler >() )
{}

controller::~controller()
{
  close();
}

void controller::open( const std::optional< std::filesystem::path >& p, const state::genesis_data& data, bool reset )
{
  close();

  if( p )
  {
    auto state_file = *p / "state.bin";

    if( reset )
    {
      LOG_INFO( fungible::log::instance(), "Resetting state..." );
      std::error_code ec;
      std::filesystem::remove( state_file, ec );
      if( ec )
        throw std::runtime_error( "unable to remove state file: " + ec.message() );
    }

    std::filesystem::create_directories( *p );

    auto backend = std::make_shared< state_db::backends::file::file_backend >();
    if( auto error = backend->open( state_file ); error )
      throw std::runtime_error( "unable to open state: " + error.message() );

    _backend = backend;
  }
  else
  {
    _backend = std::make_shared< state_db::backends::map::map_backend >();
  }

  _root = std::make_shared< state_db::state_delta >( _backend );
  _chronicler->clear();

  if( _backend->empty() )
  {
    auto genesis = _root->make_child();
    execution_context context( genesis, data.deployer, state::program_id(), {}, intent::call );
    token::ledger ledger( context, context, state::program_id() );

    if( auto error = ledger.construct( data.deployer, data.initial_supply, data.metadata ); error )
      throw std::runtime_error( "unable to write genesis state: " + error.message() );

    genesis->set_revision( _root->revision() + 1 );
    if( auto error = genesis->commit(); error )
      throw std::runtime_error( "unable to commit genesis state: " + error.message() );

    _chronicler->record( context.session() );

    LOG_INFO( fungible::log::instance(),
              "Constructed ledger with supply {} for {}",
              data.initial_supply,
              fungible::log::hex{ data.deployer.data(), data.deployer.size() } );
  }

  LOG_INFO( fungible::log::instance(), "Opened state at revision {}", _root->revision() );
}

void controller::close()
{
  if( !_backend )
    return;

  if( auto file = std::dynamic_pointer_cast< state_db::backends::file::file_backend >( _backend ); file )
  {
    if( auto error = file->close(); error )
      LOG_ERROR( fungible::log::instance(), "Unable to close state: {}", error.message() );
  }

  _root.reset();
  _backend.reset();
}

result< protocol::call_receipt > controller::execute( const protocol::account& caller,
                                                      const protocol::program_input& input )
{
  if( !_root )
    return std::unexpected( controller_errc::not_open );

  auto delta = _root->make_child();
  execution_context context( delta, caller, state::program_id(), input.stdin, intent::call );
  program::token_program token_program;

  std::error_code error;

  try
  {
    error = token_program.run( &context );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( fungible::log::instance(), "Call aborted: {}", e.what() );
    return std::unexpected( e.code() );
  }

  if( error && error.category() != program::program_category() )
    return std::unexpected( error );

  protocol::call_receipt receipt;
  receipt.output      = std::move( context.output() );
  receipt.output.code = error.value();
  receipt.revision    = _root->revision();

  if( error )
  {
    LOG_DEBUG( fungible::log::instance(),
               "Call from {} reverted: {}",
               fungible::log::hex{ caller.data(), caller.size() },
               error.message() );
    return receipt;
  }

  if( delta->pending() )
  {
    delta->set_revision( _root->revision() + 1 );
    if( auto commit_error = delta->commit(); commit_error )
    {
      LOG_ERROR( fungible::log::instance(), "Unable to commit call: {}", commit_error.message() );
      return std::unexpected( commit_error );
    }

    receipt.revision = _root->revision();
  }

  receipt.events = _chronicler->record( context.session() );

  LOG_DEBUG( fungible::log::instance(),
             "Call from {} applied at revision {} [{} event(s)]",
             fungible::log::hex{ caller.data(), caller.size() },
             receipt.revision,
             receipt.events.size() );

  return receipt;
}

result< protocol::program_output > controller::read( const protocol::program_input& input ) const
{
  if( !_root )
    return std::unexpected( controller_errc::not_open );

  execution_context context( _root->make_child(), {}, state::program_id(), input.stdin );
  program::token_program token_program;

  std::error_code error;

  try
  {
    error = token_program.run( &context );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( fungible::log::instance(), "Read aborted: {}", e.what() );
    return std::unexpected( e.code() );
  }

  if( error && error.category() != program::program_category() )
    return std::unexpected( error );

  auto output = std::move( context.output() );
  output.code = error.value();
  return output;
}

std::uint64_t controller::revision() const
{
  if( !_root )
    return 0;

  return _root->revision();
}

const std::vector< protocol::event >& controller::events() const
{
  return _chronicler->events();
}

} // namespace fungible::controller
