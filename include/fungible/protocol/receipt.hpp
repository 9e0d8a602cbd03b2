#pragma once

#include <cstdint>
#include <vector>

#include <boost/serialization/vector.hpp>

#include <fungible/protocol/event.hpp>
#include <fungible/protocol/program.hpp>

namespace fungible::protocol {

/**
 * Outcome of one state changing call. `events` is empty unless the call
 * succeeded and its writes were committed.
 */
struct call_receipt
{
  std::uint64_t revision = 0;
  program_output output;
  std::vector< event > events;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & revision;
    ar & output;
    ar & events;
  }
};

} // namespace fungible::protocol
