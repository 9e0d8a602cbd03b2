#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <fungible/protocol/account.hpp>

namespace fungible::protocol {

/**
 * A structured log record. The indexed fields of the record are listed in
 * `impacted` so observers can filter on them without decoding `data`.
 */
struct event
{
  std::uint64_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & sequence;
    ar & source;
    ar & name;
    ar & data;
    ar & impacted;
  }
};

} // namespace fungible::protocol
