#pragma once

#include <span>
#include <system_error>

#include <fungible/program/error.hpp>
#include <fungible/protocol/account.hpp>
#include <fungible/token/event_sink.hpp>
#include <fungible/token/object_store.hpp>

namespace fungible::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * Everything a program may ask of its host during one call: its input and
 * output streams, object storage, event emission and the identity of the
 * account that made the call.
 */
struct system_interface: public token::object_store,
                         public token::event_sink
{
  system_interface()           = default;
  ~system_interface() override = default;

  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual const protocol::account& get_caller() const  = 0;
  virtual const protocol::account& get_program() const = 0;
};

} // namespace fungible::program
