#pragma once

#include <fungible/state_db/backends/backend.hpp>
#include <fungible/state_db/error.hpp>
#include <fungible/state_db/types.hpp>

#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace fungible::state_db {

/**
 * A layer of uncommitted writes on top of a parent delta. The root delta
 * owns the backend; children buffer their writes in memory until commit,
 * or are simply dropped to discard them.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  explicit state_delta( std::shared_ptr< backends::abstract_backend > backend );
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;
  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  ~state_delta()                               = default;

  std::int64_t put( key_type&& key, std::span< const std::byte > value );
  std::int64_t remove( key_type&& key );
  std::optional< std::span< const std::byte > > get( const key_type& key ) const;

  state_delta_ptr make_child();
  std::error_code commit();

  bool root() const noexcept;
  bool removed( const key_type& key ) const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  std::size_t pending() const noexcept;

private:
  explicit state_delta( state_delta_ptr parent );

  state_delta_ptr _parent;
  std::shared_ptr< backends::abstract_backend > _backend;
  map_type _writes;
  std::set< key_type > _removed_objects;
  std::uint64_t _revision = 0;
};

} // namespace fungible::state_db
