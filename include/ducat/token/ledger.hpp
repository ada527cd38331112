#pragma once

#include <map>
#include <memory>
#include <utility>

#include <ducat/protocol/account.hpp>
#include <ducat/protocol/event.hpp>
#include <ducat/token/event_sink.hpp>
#include <ducat/token/types.hpp>

namespace ducat::token {

class session;

class token_registry final
{
public:
  /**
   * Returns the issued token, or an empty record with zero supply if no token
   * has been issued.
   */
  const token& details() const noexcept;
  bool issued() const noexcept;

private:
  friend class session;

  void set( token&& t );

  token _token;
  bool _issued = false;
};

class balance_ledger final
{
public:
  using map_type = std::map< protocol::account, amount >;

  amount balance_of( const protocol::account& account ) const noexcept;
  const map_type& entries() const noexcept;

private:
  friend class session;

  void set( const protocol::account& account, amount value );

  map_type _balances;
};

class allowance_ledger final
{
public:
  using key_type = std::pair< protocol::account, protocol::account >;
  using map_type = std::map< key_type, amount >;

  amount allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept;
  const map_type& entries() const noexcept;

private:
  friend class session;

  void set( const protocol::account& owner, const protocol::account& spender, amount value );

  map_type _allowances;
};

/**
 * Owns the token record and both ledgers. Stores are only written through a
 * committed session.
 */
class ledger final
{
public:
  explicit ledger( const config& cfg = {} );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  const config& configuration() const noexcept;

  const token_registry& registry() const noexcept;
  const balance_ledger& balances() const noexcept;
  const allowance_ledger& allowances() const noexcept;

  void set_event_sink( const std::shared_ptr< event_sink >& sink ) noexcept;
  std::shared_ptr< event_sink > sink() const noexcept;

private:
  friend class session;

  config _config;
  token_registry _registry;
  balance_ledger _balances;
  allowance_ledger _allowances;
  std::weak_ptr< event_sink > _sink;
};

/**
 * Hands an event to the event sink registered on the ledger. Events are
 * dropped when the host has not registered a sink.
 */
void emit( ledger& l, const protocol::event& e );

} // namespace ducat::token
