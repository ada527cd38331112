#pragma once

#include <string_view>
#include <system_error>

#include <ducat/protocol/account.hpp>
#include <ducat/token/error.hpp>
#include <ducat/token/ledger.hpp>
#include <ducat/token/types.hpp>

namespace ducat::token {

class session;

/**
 * The token state transitions.
 *
 * Holds no state of its own. Each operation runs in its own session over the
 * ledger and either commits every write and event or none of them.
 */
class transfer_engine final
{
public:
  explicit transfer_engine( ledger& l ) noexcept;
  transfer_engine( const transfer_engine& ) = delete;
  transfer_engine( transfer_engine&& )      = delete;
  ~transfer_engine()                        = default;

  transfer_engine& operator=( const transfer_engine& ) = delete;
  transfer_engine& operator=( transfer_engine&& )      = delete;

  /**
   * Creates the token and grants the whole supply to the caller.
   */
  std::error_code
  issue( const protocol::account& caller, std::string_view name, std::string_view ticker, amount total_supply );

  std::error_code transfer( const protocol::account& caller, const protocol::account& to, amount value );

  /**
   * Increases the caller's allowance for spender by value.
   */
  std::error_code approve( const protocol::account& caller, const protocol::account& spender, amount value );

  /**
   * Moves value from one account to another on the authority of the caller's
   * allowance, consuming that much of it.
   */
  std::error_code transfer_from( const protocol::account& caller,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 amount value );

  const token& token_details() const noexcept;
  amount total_supply() const noexcept;
  amount balance_of( const protocol::account& account ) const noexcept;
  amount allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept;

private:
  static std::error_code
  move_balance( session& s, const protocol::account& from, const protocol::account& to, amount value );

  ledger& _ledger;
};

} // namespace ducat::token
