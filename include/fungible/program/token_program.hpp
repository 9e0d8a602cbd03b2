#pragma once

#include <cstdint>

#include <fungible/program/error.hpp>
#include <fungible/program/program.hpp>

namespace fungible::program {

/**
 * Binds the token ledger to a host. Reads a little endian instruction
 * followed by its arguments from stdin and writes little endian results to
 * stdout.
 */
struct token_program final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    allowance,
    transfer,
    approve,
    transfer_from
  };

  token_program()                       = default;
  token_program( const token_program& ) = delete;
  token_program( token_program&& )      = delete;
  ~token_program() override             = default;

  token_program& operator=( const token_program& ) = delete;
  token_program& operator=( token_program&& )      = delete;

  std::error_code run( system_interface* system ) override;
};

} // namespace fungible::program
