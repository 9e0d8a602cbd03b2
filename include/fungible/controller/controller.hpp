#pragma once

#include <fungible/controller/error.hpp>
#include <fungible/controller/state.hpp>
#include <fungible/protocol.hpp>
#include <fungible/state_db.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace fungible::controller {

class chronicler;

class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Opens the state stored under `p`, or a volatile in-memory state when
   * no path is given. An empty state is initialized from `data`.
   */
  void open( const std::optional< std::filesystem::path >& p, const state::genesis_data& data, bool reset );
  void close();

  /**
   * Runs a state changing call on behalf of `caller`. The call's writes
   * and events are kept only when the program succeeds. A program error is
   * reported through the receipt's output code.
   */
  result< protocol::call_receipt > execute( const protocol::account& caller, const protocol::program_input& input );

  result< protocol::program_output > read( const protocol::program_input& input ) const;

  std::uint64_t revision() const;
  const std::vector< protocol::event >& events() const;

private:
  std::shared_ptr< state_db::backends::abstract_backend > _backend;
  state_db::state_delta_ptr _root;
  std::unique_ptr< chronicler > _chronicler;
};

} // namespace fungible::controller
