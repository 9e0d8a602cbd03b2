#pragma once

#include <fungible/protocol/event.hpp>

#include <cstdint>
#include <vector>

namespace fungible::controller {

class chronicler_session
{
public:
  void push_event( protocol::event&& ev );
  std::vector< protocol::event >& events() noexcept;

private:
  std::vector< protocol::event > _events;
};

/**
 * Numbers the events of committed calls. Numbering starts at 0 for each
 * opened state.
 */
class chronicler final
{
public:
  std::vector< protocol::event > record( chronicler_session& session );
  const std::vector< protocol::event >& events() const noexcept;
  void clear() noexcept;

private:
  std::vector< protocol::event > _events;
  std::uint64_t _seq_no = 0;
};

} // namespace fungible::controller
