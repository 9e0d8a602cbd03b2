// NOLINTBEGIN

#include <boost/endian/conversion.hpp>
#include <gtest/gtest.h>
#include <fungible/log.hpp>
#include <fungible/memory.hpp>
#include <fungible/program.hpp>
#include <fungible/state_db.hpp>
#include <fungible/token.hpp>
#include <test/fixture.hpp>

using fungible::program::program_errc;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" ),
      alice( make_account( "alice" ) ),
      bob( make_account( "bob" ) ),
      carol( make_account( "carol" ) )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  fungible::protocol::account alice;
  fungible::protocol::account bob;
  fungible::protocol::account carol;
};

TEST_F( integration, metadata )
{
  auto response = _controller->read( make_input( make_stdin( test::instruction::name ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( response->code, 0 );
  EXPECT_EQ( fungible::memory::as_string_view( response->stdout ), "Token" );

  response = _controller->read( make_input( make_stdin( test::instruction::symbol ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( fungible::memory::as_string_view( response->stdout ), "TOKEN" );

  response = _controller->read( make_input( make_stdin( test::instruction::decimals ) ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( std::uint32_t( 8 ),
             boost::endian::little_to_native( fungible::memory::bit_cast< std::uint32_t >( response->stdout ) ) );

  EXPECT_EQ( total_supply(), 100 );
  EXPECT_EQ( balance_of( alice ), 100 );
  EXPECT_EQ( balance_of( bob ), 0 );
}

TEST_F( integration, genesis_event )
{
  const auto& events = _controller->events();
  ASSERT_EQ( events.size(), 1 );
  EXPECT_EQ( events[ 0 ].sequence, 0 );
  EXPECT_EQ( events[ 0 ].source, fungible::controller::state::program_id() );

  auto transfer = fungible::token::decode_transfer( events[ 0 ] );
  ASSERT_TRUE( transfer.has_value() );
  EXPECT_FALSE( transfer->from.has_value() );
  EXPECT_EQ( transfer->to, alice );
  EXPECT_EQ( transfer->value, 100 );

  EXPECT_EQ( _controller->revision(), 1 );
}

TEST_F( integration, transfer )
{
  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 40 ) ) ) );

  ASSERT_TRUE( verify( receipt ) );
  EXPECT_EQ( receipt->revision, 2 );
  EXPECT_EQ( _controller->revision(), 2 );

  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].sequence, 1 );
  EXPECT_EQ( receipt->events[ 0 ].name, fungible::token::event_name::transfer );
  ASSERT_EQ( receipt->events[ 0 ].impacted.size(), 2 );
  EXPECT_EQ( receipt->events[ 0 ].impacted[ 0 ], alice );
  EXPECT_EQ( receipt->events[ 0 ].impacted[ 1 ], bob );

  auto transfer = fungible::token::decode_transfer( receipt->events[ 0 ] );
  ASSERT_TRUE( transfer.has_value() );
  EXPECT_EQ( transfer->from, alice );
  EXPECT_EQ( transfer->to, bob );
  EXPECT_EQ( transfer->value, 40 );

  EXPECT_EQ( balance_of( alice ), 60 );
  EXPECT_EQ( balance_of( bob ), 40 );
  EXPECT_EQ( total_supply(), 100 );
}

TEST_F( integration, reverted_call_leaves_state )
{
  auto receipt = _controller->execute( bob, make_input( make_stdin( test::instruction::transfer, carol, std::uint64_t( 1 ) ) ) );

  ASSERT_TRUE( verify( receipt, program_errc::insufficient_balance ) );
  EXPECT_EQ( receipt->revision, 1 );
  EXPECT_EQ( _controller->revision(), 1 );
  EXPECT_EQ( _controller->events().size(), 1 );
  EXPECT_EQ( balance_of( bob ), 0 );
  EXPECT_EQ( balance_of( carol ), 0 );
}

TEST_F( integration, delegated_transfer )
{
  ASSERT_TRUE( verify( _controller->execute( alice, make_input( make_stdin( test::instruction::approve, bob, std::uint64_t( 200 ) ) ) ) ) );
  EXPECT_EQ( allowance( alice, bob ), 200 );

  auto receipt = _controller->execute(
    bob,
    make_input( make_stdin( test::instruction::transfer_from, alice, carol, std::uint64_t( 50 ) ) ) );

  ASSERT_TRUE( verify( receipt ) );
  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].name, fungible::token::event_name::transfer );
  EXPECT_EQ( balance_of( carol ), 50 );
  EXPECT_EQ( allowance( alice, bob ), 150 );

  auto revision = _controller->revision();

  ASSERT_TRUE( verify( _controller->execute(
                         bob,
                         make_input( make_stdin( test::instruction::transfer_from, alice, carol, std::uint64_t( 300 ) ) ) ),
                       program_errc::insufficient_allowance ) );

  ASSERT_TRUE( verify( _controller->execute(
                         bob,
                         make_input( make_stdin( test::instruction::transfer_from, alice, carol, std::uint64_t( 100 ) ) ) ),
                       program_errc::insufficient_balance ) );

  EXPECT_EQ( _controller->revision(), revision );
  EXPECT_EQ( balance_of( alice ), 50 );
  EXPECT_EQ( balance_of( carol ), 50 );
  EXPECT_EQ( allowance( alice, bob ), 150 );
}

TEST_F( integration, approval_event )
{
  auto receipt =
    _controller->execute( alice, make_input( make_stdin( test::instruction::approve, bob, std::uint64_t( 25 ) ) ) );

  ASSERT_TRUE( verify( receipt ) );
  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].name, fungible::token::event_name::approval );

  auto approval = fungible::token::decode_approval( receipt->events[ 0 ] );
  ASSERT_TRUE( approval.has_value() );
  EXPECT_EQ( approval->owner, alice );
  EXPECT_EQ( approval->spender, bob );
  EXPECT_EQ( approval->value, 25 );
}

TEST_F( integration, invalid_input )
{
  auto receipt = _controller->execute( alice, make_input( make_stdin( std::uint32_t( 42 ) ) ) );
  EXPECT_TRUE( verify( receipt, program_errc::invalid_instruction ) );

  receipt = _controller->execute( alice, make_input( {} ) );
  EXPECT_TRUE( verify( receipt, program_errc::invalid_instruction ) );

  receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob ) ) );
  EXPECT_TRUE( verify( receipt, program_errc::invalid_argument ) );

  EXPECT_EQ( balance_of( alice ), 100 );
}

TEST_F( integration, read_only_query )
{
  auto response =
    _controller->read( make_input( make_stdin( test::instruction::approve, bob, std::uint64_t( 10 ) ) ) );

  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), fungible::controller::reversion_errc::read_only_context );
  EXPECT_EQ( allowance( fungible::protocol::account{}, bob ), 0 );
  EXPECT_EQ( _controller->revision(), 1 );
}

TEST_F( integration, query_does_not_advance_revision )
{
  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::balance_of, alice ) ) );

  ASSERT_TRUE( verify( receipt ) );
  EXPECT_EQ( receipt->revision, 1 );
  EXPECT_TRUE( receipt->events.empty() );
  EXPECT_EQ( std::uint64_t( 100 ),
             boost::endian::little_to_native( fungible::memory::bit_cast< std::uint64_t >( receipt->output.stdout ) ) );
}

TEST_F( integration, persistence )
{
  ASSERT_TRUE( verify( _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 30 ) ) ) ) ) );
  ASSERT_TRUE( verify( _controller->execute( alice, make_input( make_stdin( test::instruction::approve, carol, std::uint64_t( 5 ) ) ) ) ) );

  reopen();

  EXPECT_EQ( _controller->revision(), 3 );
  EXPECT_TRUE( _controller->events().empty() );
  EXPECT_EQ( balance_of( alice ), 70 );
  EXPECT_EQ( balance_of( bob ), 30 );
  EXPECT_EQ( allowance( alice, carol ), 5 );

  reopen( true );

  EXPECT_EQ( _controller->revision(), 1 );
  EXPECT_EQ( balance_of( alice ), 100 );
  EXPECT_EQ( balance_of( bob ), 0 );
  EXPECT_EQ( allowance( alice, carol ), 0 );
}

TEST_F( integration, reset_restarts_event_sequence )
{
  ASSERT_TRUE( verify( _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 1 ) ) ) ) ) );
  ASSERT_EQ( _controller->events().size(), 2 );
  EXPECT_EQ( _controller->events().back().sequence, 1 );

  reopen( true );

  ASSERT_EQ( _controller->events().size(), 1 );
  EXPECT_EQ( _controller->events()[ 0 ].sequence, 0 );

  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 1 ) ) ) );
  ASSERT_TRUE( verify( receipt ) );
  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].sequence, 1 );
}

TEST_F( integration, corrupt_amount )
{
  const auto corrupt = std::uint32_t( 7 );
  write_object( fungible::token::space::balance, fungible::memory::as_bytes( bob ), fungible::memory::as_bytes( corrupt ) );

  auto revision = _controller->revision();
  EXPECT_EQ( revision, 1 );
  EXPECT_TRUE( _controller->events().empty() );

  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 10 ) ) ) );

  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), fungible::token::token_errc::unexpected_object );
  EXPECT_EQ( _controller->revision(), revision );
  EXPECT_TRUE( _controller->events().empty() );
  EXPECT_EQ( balance_of( alice ), 100 );

  auto response = _controller->read( make_input( make_stdin( test::instruction::balance_of, bob ) ) );

  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), fungible::token::token_errc::unexpected_object );

  // Accounts with well formed balances are unaffected
  ASSERT_TRUE( verify( _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, carol, std::uint64_t( 10 ) ) ) ) ) );
  EXPECT_EQ( balance_of( carol ), 10 );
  EXPECT_EQ( _controller->revision(), revision + 1 );
}

TEST_F( integration, failed_commit_leaves_state )
{
  auto temp_file = state_file();
  temp_file += ".tmp";

  // The snapshot cannot be written while a directory occupies its temporary path
  std::filesystem::create_directory( temp_file );

  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, bob, std::uint64_t( 40 ) ) ) );

  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), fungible::state_db::state_db_errc::io_error );
  EXPECT_EQ( _controller->revision(), 1 );
  EXPECT_EQ( _controller->events().size(), 1 );
  EXPECT_EQ( balance_of( alice ), 100 );
  EXPECT_EQ( balance_of( bob ), 0 );

  std::filesystem::remove( temp_file );

  receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::transfer, carol, std::uint64_t( 5 ) ) ) );
  ASSERT_TRUE( verify( receipt ) );
  EXPECT_EQ( receipt->revision, 2 );
  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].sequence, 1 );

  reopen();

  EXPECT_EQ( _controller->revision(), 2 );
  EXPECT_EQ( balance_of( alice ), 95 );
  EXPECT_EQ( balance_of( bob ), 0 );
  EXPECT_EQ( balance_of( carol ), 5 );
}

TEST_F( integration, not_open )
{
  _controller->close();

  auto receipt = _controller->execute( alice, make_input( make_stdin( test::instruction::total_supply ) ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), fungible::controller::controller_errc::not_open );

  auto response = _controller->read( make_input( make_stdin( test::instruction::total_supply ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), fungible::controller::controller_errc::not_open );
}

// NOLINTEND
