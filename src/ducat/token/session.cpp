#include <ducat/token/session.hpp>

#include <stdexcept>

namespace ducat::token {

session::session( ledger& l ) noexcept:
    _ledger( l )
{}

const config& session::configuration() const noexcept
{
  return _ledger.configuration();
}

bool session::issued() const noexcept
{
  return _token.has_value() || _ledger.registry().issued();
}

const token& session::token_details() const noexcept
{
  if( _token )
    return *_token;

  return _ledger.registry().details();
}

amount session::balance_of( const protocol::account& account ) const noexcept
{
  if( auto itr = _balances.find( account ); itr != _balances.end() )
    return itr->second;

  return _ledger.balances().balance_of( account );
}

amount session::allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept
{
  if( auto itr = _allowances.find( allowance_ledger::key_type{ owner, spender } ); itr != _allowances.end() )
    return itr->second;

  return _ledger.allowances().allowance( owner, spender );
}

void session::set_token( token&& t )
{
  _token = std::move( t );
}

void session::set_balance( const protocol::account& account, amount value )
{
  _balances.insert_or_assign( account, value );
}

void session::set_allowance( const protocol::account& owner, const protocol::account& spender, amount value )
{
  _allowances.insert_or_assign( allowance_ledger::key_type{ owner, spender }, value );
}

void session::add_event( protocol::event&& e )
{
  _events.push_back( std::move( e ) );
}

void session::commit()
{
  if( _committed )
    throw std::runtime_error( "session has already been committed" );

  if( _token )
    _ledger._registry.set( std::move( *_token ) );

  for( const auto& [ account, value ]: _balances )
    _ledger._balances.set( account, value );

  for( const auto& [ key, value ]: _allowances )
    _ledger._allowances.set( key.first, key.second, value );

  _committed = true;

  for( const auto& e: _events )
    emit( _ledger, e );

  discard();
}

void session::discard() noexcept
{
  _token.reset();
  _balances.clear();
  _allowances.clear();
  _events.clear();
}

} // namespace ducat::token
