#pragma once

#include <cstdint>
#include <span>
#include <system_error>

namespace fungible::token {

/**
 * Key-value persistence provided by the host. Objects are grouped in
 * numbered spaces. A missing object is returned as an empty span.
 */
struct object_store
{
  object_store()                      = default;
  object_store( const object_store& ) = delete;
  object_store( object_store&& )      = delete;
  virtual ~object_store()             = default;

  object_store& operator=( const object_store& ) = delete;
  object_store& operator=( object_store&& )      = delete;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;
};

} // namespace fungible::token
