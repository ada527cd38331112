#include <ducat/token/ledger.hpp>

#include <ducat/log.hpp>

namespace ducat::token {

const token& token_registry::details() const noexcept
{
  return _token;
}

bool token_registry::issued() const noexcept
{
  return _issued;
}

void token_registry::set( token&& t )
{
  _token  = std::move( t );
  _issued = true;
}

amount balance_ledger::balance_of( const protocol::account& account ) const noexcept
{
  if( auto itr = _balances.find( account ); itr != _balances.end() )
    return itr->second;

  return 0;
}

const balance_ledger::map_type& balance_ledger::entries() const noexcept
{
  return _balances;
}

void balance_ledger::set( const protocol::account& account, amount value )
{
  _balances.insert_or_assign( account, value );
}

amount allowance_ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept
{
  if( auto itr = _allowances.find( key_type{ owner, spender } ); itr != _allowances.end() )
    return itr->second;

  return 0;
}

const allowance_ledger::map_type& allowance_ledger::entries() const noexcept
{
  return _allowances;
}

void allowance_ledger::set( const protocol::account& owner, const protocol::account& spender, amount value )
{
  _allowances.insert_or_assign( key_type{ owner, spender }, value );
}

ledger::ledger( const config& cfg ):
    _config( cfg )
{}

const config& ledger::configuration() const noexcept
{
  return _config;
}

const token_registry& ledger::registry() const noexcept
{
  return _registry;
}

const balance_ledger& ledger::balances() const noexcept
{
  return _balances;
}

const allowance_ledger& ledger::allowances() const noexcept
{
  return _allowances;
}

void ledger::set_event_sink( const std::shared_ptr< event_sink >& sink ) noexcept
{
  _sink = sink;
}

std::shared_ptr< event_sink > ledger::sink() const noexcept
{
  return _sink.lock();
}

void emit( ledger& l, const protocol::event& e )
{
  if( auto sink = l.sink() )
    sink->record( e );
  else
    LOG_TRACE_L1( ducat::log::instance(), "No event sink registered, dropping {} event", protocol::event_name( e ) );
}

} // namespace ducat::token
