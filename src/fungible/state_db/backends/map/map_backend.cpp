#include <fungible/state_db/backends/map/map_backend.hpp>
#include <fungible/state_db/error.hpp>

#include <algorithm>
#include <iterator>

namespace fungible::state_db::backends::map {

map_backend::map_backend():
    abstract_backend()
{}

map_backend::map_backend( std::uint64_t revision ):
    abstract_backend( revision )
{}

map_backend::~map_backend() {}

std::int64_t map_backend::put( key_type&& key, value_type&& value )
{
  std::int64_t size = std::ssize( value );
  auto itr          = _map.lower_bound( key );

  if( itr != _map.end() && std::ranges::equal( key, itr->first ) )
    size -= std::ssize( itr->second );
  else
    size += std::ssize( key );

  _map.insert_or_assign( itr, std::move( key ), std::move( value ) );

  return size;
}

std::optional< std::span< const std::byte > > map_backend::get( const key_type& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

std::int64_t map_backend::remove( const key_type& key )
{
  std::int64_t size = 0;

  if( auto itr = _map.find( key ); itr != _map.end() )
  {
    size -= std::ssize( itr->first ) + std::ssize( itr->second );
    _map.erase( itr );
  }

  return size;
}

void map_backend::clear() noexcept
{
  _map.clear();
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

void map_backend::start_write_batch() {}

std::error_code map_backend::end_write_batch()
{
  return state_db_errc::ok;
}

std::error_code map_backend::store_metadata()
{
  return state_db_errc::ok;
}

} // namespace fungible::state_db::backends::map
