#pragma once

#include <cstdint>
#include <vector>

#include <boost/serialization/vector.hpp>

namespace fungible::protocol {

struct program_input
{
  std::vector< std::byte > stdin;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & stdin;
  }
};

struct program_output
{
  std::int32_t code = 0;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & code;
    ar & stdout;
    ar & stderr;
  }
};

} // namespace fungible::protocol
