#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <vector>

namespace fungible::state_db {

class state_delta;

using key_type   = std::vector< std::byte >;
using value_type = std::vector< std::byte >;
using map_type   = std::map< key_type, value_type >;

using state_delta_ptr = std::shared_ptr< state_delta >;

constexpr std::size_t object_space_size = sizeof( std::uint32_t );

/**
 * Objects live in numbered spaces. The stored key is the big endian space id
 * followed by the object key, so each space is a contiguous key range.
 */
key_type make_object_key( std::uint32_t space, std::span< const std::byte > key );

} // namespace fungible::state_db
