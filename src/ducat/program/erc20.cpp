#include <ducat/program/erc20.hpp>

#include <concepts>
#include <utility>

#include <boost/endian.hpp>

#include <ducat/log.hpp>
#include <ducat/memory.hpp>
#include <ducat/token/transfer_engine.hpp>

namespace ducat::program {

namespace {

template< std::integral T >
result< T > read_integral( system_interface* system )
{
  T t = 0;
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( t ) ); error )
    return std::unexpected( error );

  boost::endian::little_to_native_inplace( t );
  return t;
}

result< protocol::account > read_account( system_interface* system )
{
  protocol::account account{};
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( account ) ); error )
    return std::unexpected( error );

  return account;
}

// A length prefix over max_size is answered with too_long before any of the
// string is read.
result< std::string > read_string( system_interface* system, std::size_t max_size, std::error_code too_long )
{
  auto length = read_integral< std::uint32_t >( system );
  if( !length )
    return std::unexpected( length.error() );

  if( *length > max_size )
  {
    LOG_DEBUG( ducat::log::instance(), "String of {} bytes exceeds limit of {}", *length, max_size );
    return std::unexpected( too_long );
  }

  std::string str( *length, '\0' );
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( str ) ); error )
    return std::unexpected( error );

  return str;
}

std::error_code write_amount( system_interface* system, token::amount value )
{
  boost::endian::native_to_little_inplace( value );
  return system->write( file_descriptor::stdout, memory::as_bytes( value ) );
}

} // namespace

erc20::erc20( token::ledger& l ) noexcept:
    _ledger( l )
{}

std::error_code erc20::run( system_interface* system )
{
  auto instr = read_integral< std::uint32_t >( system );
  if( !instr )
    return instr.error();

  token::transfer_engine engine( _ledger );
  const auto& caller = system->get_caller();

  switch( *instr )
  {
    case std::to_underlying( instruction::issue ):
      {
        auto name = read_string( system, token::max_name_size, token::token_errc::name_too_long );
        if( !name )
          return name.error();

        auto ticker = read_string( system, token::max_ticker_size, token::token_errc::ticker_too_long );
        if( !ticker )
          return ticker.error();

        auto supply = read_integral< token::amount >( system );
        if( !supply )
          return supply.error();

        return engine.issue( caller, *name, *ticker, *supply );
      }
    case std::to_underlying( instruction::transfer ):
      {
        auto to = read_account( system );
        if( !to )
          return to.error();

        auto value = read_integral< token::amount >( system );
        if( !value )
          return value.error();

        return engine.transfer( caller, *to, *value );
      }
    case std::to_underlying( instruction::approve ):
      {
        auto spender = read_account( system );
        if( !spender )
          return spender.error();

        auto value = read_integral< token::amount >( system );
        if( !value )
          return value.error();

        return engine.approve( caller, *spender, *value );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        auto from = read_account( system );
        if( !from )
          return from.error();

        auto to = read_account( system );
        if( !to )
          return to.error();

        auto value = read_integral< token::amount >( system );
        if( !value )
          return value.error();

        return engine.transfer_from( caller, *from, *to, *value );
      }
    case std::to_underlying( instruction::name ):
      return system->write( file_descriptor::stdout, memory::as_bytes( engine.token_details().name ) );
    case std::to_underlying( instruction::ticker ):
      return system->write( file_descriptor::stdout, memory::as_bytes( engine.token_details().ticker ) );
    case std::to_underlying( instruction::total_supply ):
      return write_amount( system, engine.total_supply() );
    case std::to_underlying( instruction::balance_of ):
      {
        auto account = read_account( system );
        if( !account )
          return account.error();

        return write_amount( system, engine.balance_of( *account ) );
      }
    case std::to_underlying( instruction::allowance ):
      {
        auto owner = read_account( system );
        if( !owner )
          return owner.error();

        auto spender = read_account( system );
        if( !spender )
          return spender.error();

        return write_amount( system, engine.allowance( *owner, *spender ) );
      }
    default:
      LOG_DEBUG( ducat::log::instance(), "Unknown instruction {}", *instr );
      return program_errc::invalid_instruction;
  }
}

} // namespace ducat::program
