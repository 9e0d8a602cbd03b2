#pragma once

#include <cstdint>

#include <fungible/protocol/account.hpp>
#include <fungible/token/ledger.hpp>

namespace fungible::controller { namespace state {

/**
 * Parameters of the ledger, applied once when the state is empty.
 */
struct genesis_data
{
  protocol::account deployer{};
  std::uint64_t initial_supply = 0;
  token::metadata metadata;
};

const protocol::account& program_id();

}} // namespace fungible::controller::state
