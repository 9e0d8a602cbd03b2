#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include <fungible/protocol/account.hpp>
#include <fungible/token/error.hpp>
#include <fungible/token/event_sink.hpp>
#include <fungible/token/mapping.hpp>
#include <fungible/token/object_store.hpp>

namespace fungible::token {

/**
 * Object spaces of the ledger inside the host's object store.
 */
namespace space {

constexpr std::uint32_t supply    = 0;
constexpr std::uint32_t balance   = 1;
constexpr std::uint32_t allowance = 2;
constexpr std::uint32_t name      = 3;
constexpr std::uint32_t symbol    = 4;
constexpr std::uint32_t decimals  = 5;

} // namespace space

struct metadata
{
  std::string name      = "Token";
  std::string symbol    = "TKN";
  std::uint32_t decimals = 8;
};

/**
 * ERC20 style balance and allowance ledger.
 *
 * The ledger keeps no state of its own. Every read and write goes through
 * the injected object store and every notification through the event
 * sink, so the host decides durability and whether a failed call's writes
 * are kept. Caller identity is always an explicit argument.
 *
 * The sum of all balances equals the total supply at all times.
 */
class ledger final
{
public:
  ledger( object_store& store, event_sink& sink, const protocol::account& source = {} ) noexcept;
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  /**
   * Sets the total supply and credits all of it to `caller`. May only be
   * called once per store.
   */
  std::error_code
  construct( const protocol::account& caller, std::uint64_t initial_supply, const metadata& md = metadata{} );

  bool constructed() const;

  std::uint64_t total_supply() const;
  std::uint64_t balance_of( const protocol::account& account ) const;
  std::uint64_t allowance( const protocol::account& owner, const protocol::account& spender ) const;

  std::string name() const;
  std::string symbol() const;
  std::uint32_t decimals() const;

  std::error_code transfer( const protocol::account& caller, const protocol::account& to, std::uint64_t value );

  /**
   * Overwrites the allowance of `spender` over the caller's balance.
   *
   * Changing a non-zero allowance to another non-zero value lets a spender
   * who observes the change spend both the old and the new allowance when
   * its transfer_from is ordered first. Set the allowance to 0 and back
   * when that matters.
   */
  std::error_code approve( const protocol::account& caller, const protocol::account& spender, std::uint64_t value );

  std::error_code transfer_from( const protocol::account& caller,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 std::uint64_t value );

private:
  std::error_code transfer_from_to( const protocol::account& from, const protocol::account& to, std::uint64_t value );

  std::string get_string( std::uint32_t id ) const;

  object_store& _store;
  event_sink& _sink;
  protocol::account _source;
  mapping< protocol::account > _balances;
  mapping< allowance_key > _allowances;
};

} // namespace fungible::token
