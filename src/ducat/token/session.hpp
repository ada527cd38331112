#pragma once

#include <map>
#include <optional>
#include <vector>

#include <ducat/protocol/account.hpp>
#include <ducat/protocol/event.hpp>
#include <ducat/token/ledger.hpp>
#include <ducat/token/types.hpp>

namespace ducat::token {

class transfer_engine;

/**
 * Stages writes and events over a ledger for a single transfer_engine
 * operation.
 *
 * Reads see staged values first and fall through to the ledger. Nothing
 * reaches the ledger or its event sink until commit(); a session destroyed
 * without committing discards everything it staged.
 */
class session final
{
public:
  session( const session& ) = delete;
  session( session&& )      = delete;
  ~session()                = default;

  session& operator=( const session& ) = delete;
  session& operator=( session&& )      = delete;

private:
  friend class transfer_engine;

  explicit session( ledger& l ) noexcept;

  const config& configuration() const noexcept;

  bool issued() const noexcept;
  const token& token_details() const noexcept;
  amount balance_of( const protocol::account& account ) const noexcept;
  amount allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept;

  void set_token( token&& t );
  void set_balance( const protocol::account& account, amount value );
  void set_allowance( const protocol::account& owner, const protocol::account& spender, amount value );
  void add_event( protocol::event&& e );

  // Applies staged writes to the ledger, then emits staged events in order.
  // Throws if the session has already been committed.
  void commit();
  void discard() noexcept;

  ledger& _ledger;
  std::optional< token > _token;
  std::map< protocol::account, amount > _balances;
  std::map< allowance_ledger::key_type, amount > _allowances;
  std::vector< protocol::event > _events;
  bool _committed = false;
};

} // namespace ducat::token
