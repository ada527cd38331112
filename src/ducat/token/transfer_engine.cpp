#include <ducat/token/session.hpp>
#include <ducat/token/transfer_engine.hpp>

#include <ducat/log.hpp>

namespace ducat::token {

transfer_engine::transfer_engine( ledger& l ) noexcept:
    _ledger( l )
{}

std::error_code transfer_engine::issue( const protocol::account& caller,
                                        std::string_view name,
                                        std::string_view ticker,
                                        amount total_supply )
{
  if( name.size() > max_name_size )
  {
    LOG_DEBUG( ducat::log::instance(), "Token name of {} bytes exceeds {}", name.size(), max_name_size );
    return token_errc::name_too_long;
  }

  if( ticker.size() > max_ticker_size )
  {
    LOG_DEBUG( ducat::log::instance(), "Token ticker of {} bytes exceeds {}", ticker.size(), max_ticker_size );
    return token_errc::ticker_too_long;
  }

  session s( _ledger );

  if( s.issued() )
  {
    if( s.configuration().reissue == reissue_policy::forbid )
    {
      LOG_DEBUG( ducat::log::instance(),
                 "Issue by {} rejected, {} is already issued",
                 ducat::log::hex{ caller.data(), caller.size() },
                 s.token_details().ticker );
      return token_errc::already_issued;
    }

    LOG_WARNING( ducat::log::instance(),
                 "Overwriting issued token {}, supply is no longer conserved",
                 s.token_details().ticker );
  }

  s.set_token( token{ .name = std::string( name ), .ticker = std::string( ticker ), .total_supply = total_supply } );
  s.set_balance( caller, total_supply );
  s.commit();

  LOG_INFO( ducat::log::instance(),
            "Issued {} ({}) with supply {} to {}",
            name,
            ticker,
            total_supply,
            ducat::log::hex{ caller.data(), caller.size() } );

  return token_errc::ok;
}

std::error_code transfer_engine::transfer( const protocol::account& caller, const protocol::account& to, amount value )
{
  session s( _ledger );

  if( auto error = move_balance( s, caller, to, value ); error )
    return error;

  s.commit();
  return token_errc::ok;
}

std::error_code
transfer_engine::approve( const protocol::account& caller, const protocol::account& spender, amount value )
{
  session s( _ledger );

  auto updated_allowance = checked_add( s.allowance( caller, spender ), value );
  if( !updated_allowance )
  {
    LOG_DEBUG( ducat::log::instance(),
               "Approval of {} for {} by {} overflows",
               value,
               ducat::log::hex{ spender.data(), spender.size() },
               ducat::log::hex{ caller.data(), caller.size() } );
    return token_errc::overflow;
  }

  s.set_allowance( caller, spender, *updated_allowance );
  s.add_event( protocol::approval_event{ .owner = caller, .spender = spender, .value = value } );
  s.commit();

  LOG_TRACE_L1( ducat::log::instance(),
                "Allowance of {} for {} is now {}",
                ducat::log::hex{ caller.data(), caller.size() },
                ducat::log::hex{ spender.data(), spender.size() },
                *updated_allowance );

  return token_errc::ok;
}

std::error_code transfer_engine::transfer_from( const protocol::account& caller,
                                                const protocol::account& from,
                                                const protocol::account& to,
                                                amount value )
{
  session s( _ledger );

  auto current_allowance = s.allowance( from, caller );
  if( current_allowance < value )
  {
    LOG_DEBUG( ducat::log::instance(),
               "Delegated transfer of {} by {} exceeds allowance {}",
               value,
               ducat::log::hex{ caller.data(), caller.size() },
               current_allowance );
    return token_errc::insufficient_allowance;
  }

  s.set_allowance( from, caller, current_allowance - value );
  s.add_event( protocol::approval_event{ .owner = from, .spender = caller, .value = value } );

  if( auto error = move_balance( s, from, to, value ); error )
    return error;

  s.commit();
  return token_errc::ok;
}

std::error_code
transfer_engine::move_balance( session& s, const protocol::account& from, const protocol::account& to, amount value )
{
  auto from_balance = s.balance_of( from );
  if( from_balance < value )
  {
    LOG_DEBUG( ducat::log::instance(),
               "Transfer of {} from {} exceeds balance {}",
               value,
               ducat::log::hex{ from.data(), from.size() },
               from_balance );
    return token_errc::insufficient_balance;
  }

  if( from != to )
  {
    auto updated_from_balance = checked_sub( from_balance, value );
    auto updated_to_balance   = checked_add( s.balance_of( to ), value );

    if( !updated_from_balance || !updated_to_balance )
    {
      LOG_DEBUG( ducat::log::instance(),
                 "Transfer of {} to {} overflows",
                 value,
                 ducat::log::hex{ to.data(), to.size() } );
      return token_errc::overflow;
    }

    s.set_balance( from, *updated_from_balance );
    s.set_balance( to, *updated_to_balance );
  }

  s.add_event( protocol::transfer_event{ .from = from, .to = to, .value = value } );

  LOG_TRACE_L1( ducat::log::instance(),
                "Staged transfer of {} from {} to {}",
                value,
                ducat::log::hex{ from.data(), from.size() },
                ducat::log::hex{ to.data(), to.size() } );

  return token_errc::ok;
}

const token& transfer_engine::token_details() const noexcept
{
  return _ledger.registry().details();
}

amount transfer_engine::total_supply() const noexcept
{
  return _ledger.registry().details().total_supply;
}

amount transfer_engine::balance_of( const protocol::account& account ) const noexcept
{
  return _ledger.balances().balance_of( account );
}

amount transfer_engine::allowance( const protocol::account& owner, const protocol::account& spender ) const noexcept
{
  return _ledger.allowances().allowance( owner, spender );
}

} // namespace ducat::token
