#pragma once

#include <ranges>

#include <boost/endian.hpp>

#include <fungible/controller.hpp>
#include <fungible/memory.hpp>
#include <fungible/program.hpp>
#include <fungible/protocol.hpp>

#include <array>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace test {

using instruction = fungible::program::token_program::instruction;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static fungible::protocol::account make_account( std::string_view name ) noexcept;

  void reopen( bool reset = false );

  /**
   * Writes a raw object into the stored state, bypassing the ledger. The
   * controller is reopened afterwards.
   */
  void write_object( std::uint32_t space, std::span< const std::byte > key, std::span< const std::byte > value );

  std::filesystem::path state_file() const;

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = fungible::memory::as_bytes( std::addressof( t ), 1 );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< std::ranges::range T >
  void append_stdin( std::vector< std::byte >& input, const T& t ) const noexcept
  {
    const auto bytes = fungible::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T, std::size_t N >
  void append_stdin( std::vector< std::byte >& input, const std::array< T, N >& t ) const noexcept
  {
    return append_stdin( input, std::ranges::views::all( t ) );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const noexcept
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  fungible::protocol::program_input make_input( std::vector< std::byte >&& stdin ) const noexcept;

  std::uint64_t balance_of( const fungible::protocol::account& account ) const;
  std::uint64_t allowance( const fungible::protocol::account& owner, const fungible::protocol::account& spender ) const;
  std::uint64_t total_supply() const;

  bool verify( const fungible::controller::result< fungible::protocol::call_receipt >& receipt,
               fungible::program::program_errc code = fungible::program::program_errc::ok ) const;

  std::unique_ptr< fungible::controller::controller > _controller;
  std::filesystem::path _state_dir;
  fungible::controller::state::genesis_data _genesis_data;
};

} // namespace test
