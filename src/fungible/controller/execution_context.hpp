#pragma once

#include "chronicler.hpp"

#include <fungible/program.hpp>
#include <fungible/protocol.hpp>
#include <fungible/state_db.hpp>

#include <cstdint>
#include <span>

namespace fungible::controller {

enum class intent : std::uint8_t
{
  read_only,
  call
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( state_db::state_delta_ptr state,
                     const protocol::account& caller,
                     const protocol::account& program,
                     std::span< const std::byte > input,
                     intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code emit_event( protocol::event&& ev ) final;

  const protocol::account& get_caller() const final;
  const protocol::account& get_program() const final;

  protocol::program_output& output() noexcept;
  chronicler_session& session() noexcept;

private:
  state_db::state_delta_ptr _state;
  protocol::account _caller;
  protocol::account _program;
  std::span< const std::byte > _input;
  std::size_t _input_offset = 0;
  intent _intent;
  protocol::program_output _output;
  chronicler_session _session;
};

} // namespace fungible::controller
