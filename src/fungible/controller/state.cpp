#include <fungible/controller/state.hpp>

#include <algorithm>
#include <string_view>

#include <fungible/memory.hpp>

namespace fungible::controller { namespace state {

const protocol::account& program_id()
{
  static const protocol::account id = []()
  {
    using namespace std::string_view_literals;
    protocol::account a{};
    std::ranges::copy( memory::as_bytes( "token"sv ), a.begin() );
    return a;
  }();

  return id;
}

}} // namespace fungible::controller::state
