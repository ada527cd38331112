// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>
#include <memory>

#include <ducat/log.hpp>
#include <ducat/protocol/account.hpp>
#include <ducat/token.hpp>

using ducat::protocol::account;
using ducat::token::amount;
using ducat::token::token_errc;

namespace {

account make_test_account( std::uint8_t id )
{
  account acc{};
  acc[ 0 ] = std::byte{ id };
  return acc;
}

constexpr amount max_amount = std::numeric_limits< amount >::max();

} // namespace

class transfer_engine: public ::testing::Test
{
public:
  transfer_engine():
      events( std::make_shared< ducat::token::event_log >() ),
      engine( ledger )
  {
    ledger.set_event_sink( events );
  }

  amount sum_of_balances() const
  {
    amount sum = 0;
    for( const auto& [ acc, balance ]: ledger.balances().entries() )
      sum += balance;

    return sum;
  }

  void expect_conserved() const
  {
    EXPECT_EQ( sum_of_balances(), engine.total_supply() );
  }

  const account alice = make_test_account( 1 );
  const account bob   = make_test_account( 2 );
  const account carol = make_test_account( 3 );
  const account dave  = make_test_account( 4 );

  ducat::token::ledger ledger;
  std::shared_ptr< ducat::token::event_log > events;
  ducat::token::transfer_engine engine;
};

TEST_F( transfer_engine, scenario )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 1'000 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( alice ), 1'000 );
  EXPECT_EQ( engine.token_details().total_supply, 1'000 );
  EXPECT_EQ( engine.token_details().name, "Tok" );
  EXPECT_EQ( engine.token_details().ticker, "TOK" );
  EXPECT_TRUE( events->events().empty() );
  expect_conserved();

  ASSERT_EQ( engine.transfer( alice, bob, 300 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( alice ), 700 );
  EXPECT_EQ( engine.balance_of( bob ), 300 );
  ASSERT_EQ( events->events().size(), 1 );
  EXPECT_EQ( events->events().back(),
             ducat::protocol::event( ducat::protocol::transfer_event{ .from = alice, .to = bob, .value = 300 } ) );
  expect_conserved();

  ASSERT_EQ( engine.approve( alice, carol, 200 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, carol ), 200 );
  ASSERT_EQ( events->events().size(), 2 );
  EXPECT_EQ( events->events().back(),
             ducat::protocol::event( ducat::protocol::approval_event{ .owner = alice, .spender = carol, .value = 200 } ) );

  ASSERT_EQ( engine.transfer_from( carol, alice, dave, 150 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, carol ), 50 );
  EXPECT_EQ( engine.balance_of( alice ), 550 );
  EXPECT_EQ( engine.balance_of( dave ), 150 );
  ASSERT_EQ( events->events().size(), 4 );
  EXPECT_EQ( events->events()[ 2 ],
             ducat::protocol::event( ducat::protocol::approval_event{ .owner = alice, .spender = carol, .value = 150 } ) );
  EXPECT_EQ( events->events()[ 3 ],
             ducat::protocol::event( ducat::protocol::transfer_event{ .from = alice, .to = dave, .value = 150 } ) );
  expect_conserved();

  EXPECT_EQ( engine.transfer_from( carol, alice, dave, 100 ), token_errc::insufficient_allowance );
  EXPECT_EQ( engine.allowance( alice, carol ), 50 );
  EXPECT_EQ( engine.balance_of( alice ), 550 );
  EXPECT_EQ( engine.balance_of( bob ), 300 );
  EXPECT_EQ( engine.balance_of( dave ), 150 );
  EXPECT_EQ( events->events().size(), 4 );
  expect_conserved();
}

TEST_F( transfer_engine, unseen_keys_read_zero )
{
  EXPECT_EQ( engine.balance_of( alice ), 0 );
  EXPECT_EQ( engine.allowance( alice, bob ), 0 );
  EXPECT_EQ( engine.total_supply(), 0 );
  EXPECT_TRUE( engine.token_details().name.empty() );
  EXPECT_FALSE( ledger.registry().issued() );

  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 10 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( bob ), 0 );
  EXPECT_EQ( engine.allowance( bob, alice ), 0 );
}

TEST_F( transfer_engine, issue_limits )
{
  const std::string name_64( 64, 'n' );
  const std::string ticker_32( 32, 't' );

  EXPECT_EQ( engine.issue( alice, name_64 + "n", "TOK", 1 ), token_errc::name_too_long );
  EXPECT_EQ( engine.issue( alice, "Tok", ticker_32 + "t", 1 ), token_errc::ticker_too_long );
  EXPECT_EQ( engine.issue( alice, name_64 + "n", ticker_32 + "t", 1 ), token_errc::name_too_long );
  EXPECT_FALSE( ledger.registry().issued() );
  EXPECT_EQ( engine.balance_of( alice ), 0 );

  EXPECT_EQ( engine.issue( alice, name_64, ticker_32, 1 ), token_errc::ok );
  EXPECT_TRUE( ledger.registry().issued() );
  EXPECT_EQ( engine.token_details().name, name_64 );
  EXPECT_EQ( engine.token_details().ticker, ticker_32 );
}

TEST_F( transfer_engine, reissue_forbidden )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 1'000 ), token_errc::ok );
  ASSERT_EQ( engine.transfer( alice, bob, 400 ), token_errc::ok );

  auto error = engine.issue( carol, "Other", "OTH", 5 );
  EXPECT_EQ( error, token_errc::already_issued );
  EXPECT_EQ( error.message(), "token has already been issued" );

  EXPECT_EQ( engine.token_details().name, "Tok" );
  EXPECT_EQ( engine.total_supply(), 1'000 );
  EXPECT_EQ( engine.balance_of( carol ), 0 );
  expect_conserved();
}

TEST_F( transfer_engine, reissue_overwrite )
{
  ducat::token::ledger compat( ducat::token::config{ .reissue = ducat::token::reissue_policy::overwrite } );
  ducat::token::transfer_engine compat_engine( compat );

  ASSERT_EQ( compat_engine.issue( alice, "Tok", "TOK", 1'000 ), token_errc::ok );
  ASSERT_EQ( compat_engine.transfer( alice, bob, 400 ), token_errc::ok );
  ASSERT_EQ( compat_engine.issue( alice, "New", "NEW", 50 ), token_errc::ok );

  EXPECT_EQ( compat_engine.token_details().name, "New" );
  EXPECT_EQ( compat_engine.total_supply(), 50 );
  EXPECT_EQ( compat_engine.balance_of( alice ), 50 );
  EXPECT_EQ( compat_engine.balance_of( bob ), 400 );
}

TEST_F( transfer_engine, transfer_insufficient_balance )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );

  EXPECT_EQ( engine.transfer( alice, bob, 101 ), token_errc::insufficient_balance );
  EXPECT_EQ( engine.transfer( bob, alice, 1 ), token_errc::insufficient_balance );
  EXPECT_EQ( engine.balance_of( alice ), 100 );
  EXPECT_EQ( engine.balance_of( bob ), 0 );
  EXPECT_TRUE( events->events().empty() );

  EXPECT_EQ( engine.transfer( alice, bob, 100 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( alice ), 0 );
  EXPECT_EQ( engine.balance_of( bob ), 100 );
  EXPECT_TRUE( ledger.balances().entries().contains( alice ) );
  expect_conserved();
}

TEST_F( transfer_engine, transfer_zero_and_self )
{
  EXPECT_EQ( engine.transfer( alice, bob, 0 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( bob ), 0 );

  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );
  events->clear();

  EXPECT_EQ( engine.transfer( alice, alice, 60 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( alice ), 100 );
  ASSERT_EQ( events->events().size(), 1 );
  EXPECT_EQ( events->events().back(),
             ducat::protocol::event( ducat::protocol::transfer_event{ .from = alice, .to = alice, .value = 60 } ) );

  EXPECT_EQ( engine.transfer( alice, alice, 101 ), token_errc::insufficient_balance );
  expect_conserved();
}

TEST_F( transfer_engine, transfer_overflow )
{
  ducat::token::ledger compat( ducat::token::config{ .reissue = ducat::token::reissue_policy::overwrite } );
  ducat::token::transfer_engine compat_engine( compat );

  ASSERT_EQ( compat_engine.issue( alice, "Tok", "TOK", max_amount ), token_errc::ok );
  ASSERT_EQ( compat_engine.transfer( alice, bob, max_amount ), token_errc::ok );
  ASSERT_EQ( compat_engine.issue( alice, "Tok", "TOK", 10 ), token_errc::ok );

  EXPECT_EQ( compat_engine.transfer( alice, bob, 10 ), token_errc::overflow );
  EXPECT_EQ( compat_engine.balance_of( alice ), 10 );
  EXPECT_EQ( compat_engine.balance_of( bob ), max_amount );

  ASSERT_EQ( compat_engine.approve( alice, carol, 10 ), token_errc::ok );
  EXPECT_EQ( compat_engine.transfer_from( carol, alice, bob, 10 ), token_errc::overflow );
  EXPECT_EQ( compat_engine.allowance( alice, carol ), 10 );
  EXPECT_EQ( compat_engine.balance_of( alice ), 10 );
  EXPECT_EQ( compat_engine.balance_of( bob ), max_amount );
}

TEST_F( transfer_engine, approve_is_additive )
{
  EXPECT_EQ( engine.approve( alice, bob, 10 ), token_errc::ok );
  EXPECT_EQ( engine.approve( alice, bob, 5 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, bob ), 15 );
  EXPECT_EQ( engine.allowance( bob, alice ), 0 );

  ASSERT_EQ( events->events().size(), 2 );
  EXPECT_EQ( events->events()[ 1 ],
             ducat::protocol::event( ducat::protocol::approval_event{ .owner = alice, .spender = bob, .value = 5 } ) );
}

TEST_F( transfer_engine, approve_overflow )
{
  ASSERT_EQ( engine.approve( alice, bob, max_amount ), token_errc::ok );
  EXPECT_EQ( engine.approve( alice, bob, 1 ), token_errc::overflow );
  EXPECT_EQ( engine.allowance( alice, bob ), max_amount );
  EXPECT_EQ( events->events().size(), 1 );

  EXPECT_EQ( engine.approve( alice, bob, 0 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, bob ), max_amount );
}

TEST_F( transfer_engine, transfer_from_is_atomic )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );
  ASSERT_EQ( engine.approve( alice, carol, 500 ), token_errc::ok );
  events->clear();

  EXPECT_EQ( engine.transfer_from( carol, alice, dave, 200 ), token_errc::insufficient_balance );
  EXPECT_EQ( engine.allowance( alice, carol ), 500 );
  EXPECT_EQ( engine.balance_of( alice ), 100 );
  EXPECT_EQ( engine.balance_of( dave ), 0 );
  EXPECT_TRUE( events->events().empty() );
  EXPECT_FALSE( ledger.balances().entries().contains( dave ) );
  expect_conserved();

  EXPECT_EQ( engine.transfer_from( carol, alice, dave, 100 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, carol ), 400 );
  EXPECT_EQ( engine.balance_of( alice ), 0 );
  EXPECT_EQ( engine.balance_of( dave ), 100 );
  expect_conserved();
}

TEST_F( transfer_engine, transfer_from_uses_spender_allowance )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );
  ASSERT_EQ( engine.approve( alice, dave, 50 ), token_errc::ok );

  // The allowance belongs to dave, the caller, not to the recipient.
  EXPECT_EQ( engine.transfer_from( carol, alice, dave, 10 ), token_errc::insufficient_allowance );
  EXPECT_EQ( engine.transfer_from( dave, alice, carol, 10 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, dave ), 40 );
  EXPECT_EQ( engine.balance_of( carol ), 10 );
  expect_conserved();
}

TEST_F( transfer_engine, transfer_from_consumes_whole_allowance )
{
  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );
  ASSERT_EQ( engine.approve( alice, carol, 60 ), token_errc::ok );

  EXPECT_EQ( engine.transfer_from( carol, alice, bob, 60 ), token_errc::ok );
  EXPECT_EQ( engine.allowance( alice, carol ), 0 );
  EXPECT_EQ( engine.transfer_from( carol, alice, bob, 1 ), token_errc::insufficient_allowance );
  EXPECT_EQ( engine.transfer_from( carol, alice, bob, 0 ), token_errc::ok );
  EXPECT_EQ( engine.balance_of( bob ), 60 );
  expect_conserved();
}

TEST_F( transfer_engine, rejections_leave_no_trace )
{
  ducat::log::initialize();
  ducat::log::set_level( "debug" );

  ASSERT_EQ( engine.issue( alice, "Tok", "TOK", 100 ), token_errc::ok );
  ASSERT_EQ( engine.approve( alice, carol, max_amount ), token_errc::ok );
  ASSERT_EQ( engine.approve( alice, dave, 5 ), token_errc::ok );
  events->clear();

  const auto registry   = ledger.registry().details();
  const auto balances   = ledger.balances().entries();
  const auto allowances = ledger.allowances().entries();

  EXPECT_EQ( engine.issue( bob, std::string( 65, 'n' ), "TOK", 1 ), token_errc::name_too_long );
  EXPECT_EQ( engine.issue( bob, "Tok", std::string( 33, 't' ), 1 ), token_errc::ticker_too_long );
  EXPECT_EQ( engine.issue( bob, "Tok", "TOK", 1 ), token_errc::already_issued );
  EXPECT_EQ( engine.transfer( bob, alice, 1 ), token_errc::insufficient_balance );
  EXPECT_EQ( engine.approve( alice, carol, 1 ), token_errc::overflow );
  EXPECT_EQ( engine.transfer_from( dave, alice, bob, 6 ), token_errc::insufficient_allowance );
  EXPECT_EQ( engine.transfer_from( carol, alice, bob, 101 ), token_errc::insufficient_balance );

  EXPECT_EQ( ledger.registry().details(), registry );
  EXPECT_EQ( ledger.balances().entries(), balances );
  EXPECT_EQ( ledger.allowances().entries(), allowances );
  EXPECT_TRUE( events->events().empty() );

  ducat::log::instance()->flush_log();
}

TEST_F( transfer_engine, events_without_sink )
{
  ducat::token::ledger quiet;
  ducat::token::transfer_engine quiet_engine( quiet );

  ASSERT_EQ( quiet_engine.issue( alice, "Tok", "TOK", 10 ), token_errc::ok );
  EXPECT_EQ( quiet_engine.transfer( alice, bob, 4 ), token_errc::ok );
  EXPECT_EQ( quiet_engine.balance_of( bob ), 4 );
  EXPECT_TRUE( events->events().empty() );
}

// NOLINTEND
