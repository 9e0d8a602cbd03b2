#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <fungible/state_db/types.hpp>

namespace fungible::state_db::backends {

class abstract_backend
{
public:
  abstract_backend();
  explicit abstract_backend( std::uint64_t revision );
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual std::int64_t put( key_type&& key, value_type&& value )                                 = 0;
  virtual std::optional< std::span< const std::byte > > get( const key_type& key ) const = 0;
  virtual std::int64_t remove( const key_type& key )                                             = 0;
  virtual void clear()                                                                           = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t );

  virtual void start_write_batch()          = 0;
  virtual std::error_code end_write_batch() = 0;

  virtual std::error_code store_metadata() = 0;

private:
  std::uint64_t _revision = 0;
};

} // namespace fungible::state_db::backends
