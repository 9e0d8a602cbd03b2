#include <fungible/state_db/state_delta.hpp>

#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fungible::state_db {

state_delta::state_delta( std::shared_ptr< backends::abstract_backend > backend ):
    _backend( std::move( backend ) )
{
  if( !_backend )
    throw std::runtime_error( "root state delta requires a backend" );

  _revision = _backend->revision();
}

state_delta::state_delta( state_delta_ptr parent ):
    _parent( std::move( parent ) ),
    _revision( _parent->revision() )
{}

std::int64_t state_delta::put( key_type&& key, std::span< const std::byte > value )
{
  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  if( root() )
  {
    _backend->put( std::move( key ), value_type( value.begin(), value.end() ) );
    return size;
  }

  _removed_objects.erase( key );
  _writes.insert_or_assign( std::move( key ), value_type( value.begin(), value.end() ) );

  return size;
}

std::int64_t state_delta::remove( key_type&& key )
{
  auto current_value = get( key );
  if( !current_value )
    return 0;

  std::int64_t size = -( std::ssize( key ) + std::ssize( *current_value ) );

  if( root() )
  {
    _backend->remove( key );
    return size;
  }

  _writes.erase( key );
  _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const key_type& key ) const
{
  if( root() )
    return _backend->get( key );

  if( removed( key ) )
    return {};

  if( auto itr = _writes.find( key ); itr != _writes.end() )
    return std::span< const std::byte >( itr->second );

  return _parent->get( key );
}

state_delta_ptr state_delta::make_child()
{
  return state_delta_ptr( new state_delta( shared_from_this() ) );
}

std::error_code state_delta::commit()
{
  if( root() )
    throw std::runtime_error( "cannot commit root" );

  if( !_parent->root() )
  {
    for( auto& r_key: _removed_objects )
      _parent->remove( key_type( r_key ) );

    for( auto& [ key, value ]: _writes )
      _parent->put( key_type( key ), value );

    _parent->set_revision( _revision );
  }
  else
  {
    auto& backend      = _parent->_backend;
    auto prev_revision = backend->revision();

    // Prior values of every touched key, restored if the batch fails
    std::vector< std::pair< key_type, std::optional< value_type > > > undo;
    undo.reserve( _removed_objects.size() + _writes.size() );

    auto save = [ & ]( const key_type& key )
    {
      if( auto value = backend->get( key ); value )
        undo.emplace_back( key, value_type( value->begin(), value->end() ) );
      else
        undo.emplace_back( key, std::nullopt );
    };

    backend->start_write_batch();

    for( const auto& r_key: _removed_objects )
    {
      save( r_key );
      backend->remove( r_key );
    }

    for( const auto& [ key, value ]: _writes )
    {
      save( key );
      backend->put( key_type( key ), value_type( value ) );
    }

    backend->set_revision( _revision );

    auto error = backend->store_metadata();
    if( auto batch_error = backend->end_write_batch(); !error )
      error = batch_error;

    if( error )
    {
      for( auto itr = undo.rbegin(); itr != undo.rend(); ++itr )
      {
        if( itr->second )
          backend->put( std::move( itr->first ), std::move( *itr->second ) );
        else
          backend->remove( itr->first );
      }

      backend->set_revision( prev_revision );
      return error;
    }

    _parent->_revision = _revision;
  }

  _writes.clear();
  _removed_objects.clear();

  return state_db_errc::ok;
}

bool state_delta::root() const noexcept
{
  return !_parent;
}

bool state_delta::removed( const key_type& key ) const
{
  return _removed_objects.contains( key );
}

std::uint64_t state_delta::revision() const
{
  return _revision;
}

void state_delta::set_revision( std::uint64_t revision )
{
  _revision = revision;
  if( root() )
    _backend->set_revision( revision );
}

std::size_t state_delta::pending() const noexcept
{
  return _writes.size() + _removed_objects.size();
}

} // namespace fungible::state_db
