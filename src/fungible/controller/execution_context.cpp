#include "execution_context.hpp"

#include <fungible/controller/error.hpp>

#include <algorithm>
#include <stdexcept>

namespace fungible::controller {

execution_context::execution_context( state_db::state_delta_ptr state,
                                      const protocol::account& caller,
                                      const protocol::account& program,
                                      std::span< const std::byte > input,
                                      intent i ):
    _state( std::move( state ) ),
    _caller( caller ),
    _program( program ),
    _input( input ),
    _intent( i )
{
  if( !_state )
    throw std::runtime_error( "state delta does not exist" );
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    _output.stdout.insert( _output.stdout.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    _output.stderr.insert( _output.stderr.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  if( buffer.size() > _input.size() - _input_offset )
    return reversion_errc::end_of_input;

  std::ranges::copy( _input.subspan( _input_offset, buffer.size() ), buffer.begin() );
  _input_offset += buffer.size();
  return reversion_errc::ok;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( auto value = _state->get( state_db::make_object_key( id, key ) ); value )
    return *value;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state->put( state_db::make_object_key( id, key ), value );
  return reversion_errc::ok;
}

std::error_code execution_context::emit_event( protocol::event&& ev )
{
  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  ev.source = _program;
  _session.push_event( std::move( ev ) );
  return reversion_errc::ok;
}

const protocol::account& execution_context::get_caller() const
{
  return _caller;
}

const protocol::account& execution_context::get_program() const
{
  return _program;
}

protocol::program_output& execution_context::output() noexcept
{
  return _output;
}

chronicler_session& execution_context::session() noexcept
{
  return _session;
}

} // namespace fungible::controller
