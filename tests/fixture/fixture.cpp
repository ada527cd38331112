// NOLINTBEGIN

#include <test/fixture.hpp>

#include <ducat/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level, const ducat::token::config& cfg )
{
  ducat::log::initialize();
  ducat::log::set_level( log_level );

  _ledger  = std::make_unique< ducat::token::ledger >( cfg );
  _program = std::make_unique< ducat::program::erc20 >( *_ledger );
  _events  = std::make_shared< ducat::token::event_log >();
  _ledger->set_event_sink( _events );

  LOG_INFO( ducat::log::instance(), "Starting fixture {}", name );
}

fixture::~fixture()
{
  ducat::log::instance()->flush_log();
}

std::vector< std::byte >
fixture::make_issue_input( std::string_view name, std::string_view ticker, std::uint64_t supply )
{
  return make_stdin( instruction::issue, name, ticker, supply );
}

std::vector< std::byte > fixture::make_transfer_input( const ducat::protocol::account& to, std::uint64_t amount )
{
  return make_stdin( instruction::transfer, to, amount );
}

std::vector< std::byte > fixture::make_approve_input( const ducat::protocol::account& spender, std::uint64_t amount )
{
  return make_stdin( instruction::approve, spender, amount );
}

std::vector< std::byte > fixture::make_transfer_from_input( const ducat::protocol::account& from,
                                                            const ducat::protocol::account& to,
                                                            std::uint64_t amount )
{
  return make_stdin( instruction::transfer_from, from, to, amount );
}

std::vector< std::byte > fixture::make_balance_of_input( const ducat::protocol::account& account )
{
  return make_stdin( instruction::balance_of, account );
}

std::vector< std::byte > fixture::make_allowance_input( const ducat::protocol::account& owner,
                                                        const ducat::protocol::account& spender )
{
  return make_stdin( instruction::allowance, owner, spender );
}

fixture::outcome fixture::call( const ducat::protocol::account& caller, std::vector< std::byte >&& stdin )
{
  ducat::host::call_context context( caller, std::move( stdin ) );

  outcome out;
  out.code   = _program->run( &context );
  out.stdout = context.output();
  return out;
}

std::uint64_t fixture::read_amount( const outcome& out ) const
{
  auto value = ducat::memory::bit_cast< std::uint64_t >( out.stdout );
  boost::endian::little_to_native_inplace( value );
  return value;
}

std::string_view fixture::read_string( const outcome& out ) const
{
  return std::string_view( ducat::memory::pointer_cast< const char* >( out.stdout.data() ), out.stdout.size() );
}

std::uint64_t fixture::sum_of_balances() const
{
  std::uint64_t sum = 0;
  for( const auto& [ account, balance ]: _ledger->balances().entries() )
    sum += balance;

  return sum;
}

} // namespace test

// NOLINTEND
