#pragma once

#include <fungible/state_db/backends/backend.hpp>

namespace fungible::state_db::backends::map {

class map_backend: public abstract_backend
{
public:
  map_backend();
  map_backend( const map_backend& )            = default;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = default;
  map_backend& operator=( map_backend&& )      = delete;
  explicit map_backend( std::uint64_t revision );
  ~map_backend() override;

  // Modifiers
  std::int64_t put( key_type&& key, value_type&& value ) final;
  std::optional< std::span< const std::byte > > get( const key_type& key ) const final;
  std::int64_t remove( const key_type& key ) final;
  void clear() noexcept final;

  std::uint64_t size() const noexcept final;

  void start_write_batch() override;
  std::error_code end_write_batch() override;

  std::error_code store_metadata() override;

protected:
  map_type _map;
};

} // namespace fungible::state_db::backends::map
