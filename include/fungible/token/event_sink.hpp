#pragma once

#include <system_error>

#include <fungible/protocol/event.hpp>

namespace fungible::token {

struct event_sink
{
  event_sink()                    = default;
  event_sink( const event_sink& ) = delete;
  event_sink( event_sink&& )      = delete;
  virtual ~event_sink()           = default;

  event_sink& operator=( const event_sink& ) = delete;
  event_sink& operator=( event_sink&& )      = delete;

  virtual std::error_code emit_event( protocol::event&& ev ) = 0;
};

} // namespace fungible::token
