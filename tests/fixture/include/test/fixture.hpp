#pragma once

#include <concepts>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <ducat/host/call_context.hpp>
#include <ducat/memory.hpp>
#include <ducat/program.hpp>
#include <ducat/protocol.hpp>
#include <ducat/token.hpp>

namespace test {

using instruction = ducat::program::erc20::instruction;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level, const ducat::token::config& cfg = {} );
  ~fixture();

  std::vector< std::byte > make_issue_input( std::string_view name, std::string_view ticker, std::uint64_t supply );
  std::vector< std::byte > make_transfer_input( const ducat::protocol::account& to, std::uint64_t amount );
  std::vector< std::byte > make_approve_input( const ducat::protocol::account& spender, std::uint64_t amount );
  std::vector< std::byte > make_transfer_from_input( const ducat::protocol::account& from,
                                                     const ducat::protocol::account& to,
                                                     std::uint64_t amount );
  std::vector< std::byte > make_balance_of_input( const ducat::protocol::account& account );
  std::vector< std::byte > make_allowance_input( const ducat::protocol::account& owner,
                                                 const ducat::protocol::account& spender );

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = ducat::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  void append_stdin( std::vector< std::byte >& input, const ducat::protocol::account& account ) const noexcept
  {
    input.insert( input.end(), account.begin(), account.end() );
  }

  void append_stdin( std::vector< std::byte >& input, std::string_view str ) const noexcept
  {
    append_stdin( input, static_cast< std::uint32_t >( str.size() ) );
    const auto bytes = ducat::memory::as_bytes( str );
    input.insert( input.end(), bytes.begin(), bytes.end() );
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

  struct outcome
  {
    std::error_code code;
    std::vector< std::byte > stdout;
  };

  outcome call( const ducat::protocol::account& caller, std::vector< std::byte >&& stdin );

  std::uint64_t read_amount( const outcome& out ) const;
  std::string_view read_string( const outcome& out ) const;

  std::uint64_t sum_of_balances() const;

  std::unique_ptr< ducat::token::ledger > _ledger;
  std::unique_ptr< ducat::program::erc20 > _program;
  std::shared_ptr< ducat::token::event_log > _events;
};

} // namespace test
