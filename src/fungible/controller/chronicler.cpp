#include "chronicler.hpp"

namespace fungible::controller {

/*
 * Chronicler session
 */

void chronicler_session::push_event( protocol::event&& ev )
{
  _events.emplace_back( std::move( ev ) );
}

std::vector< protocol::event >& chronicler_session::events() noexcept
{
  return _events;
}

/*
 * Chronicler
 */

std::vector< protocol::event > chronicler::record( chronicler_session& session )
{
  auto& events = session.events();

  for( auto& ev: events )
  {
    ev.sequence = _seq_no++;
    _events.push_back( ev );
  }

  return std::move( events );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

void chronicler::clear() noexcept
{
  _events.clear();
  _seq_no = 0;
}

} // namespace fungible::controller
