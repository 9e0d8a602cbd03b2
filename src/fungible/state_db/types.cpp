#include <fungible/state_db/types.hpp>

#include <boost/endian.hpp>

#include <fungible/memory.hpp>

namespace fungible::state_db {

key_type make_object_key( std::uint32_t space, std::span< const std::byte > key )
{
  key_type object_key;
  object_key.reserve( object_space_size + key.size() );

  boost::endian::native_to_big_inplace( space );
  auto space_bytes = memory::as_bytes( space );

  object_key.insert( object_key.end(), space_bytes.begin(), space_bytes.end() );
  object_key.insert( object_key.end(), key.begin(), key.end() );

  return object_key;
}

} // namespace fungible::state_db
