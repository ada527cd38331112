#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

#include <boost/archive/binary_oarchive.hpp>
#include <boost/endian.hpp>
#include <boost/program_options.hpp>
#include <boost/serialization/vector.hpp>

#include <ducat/host/call_context.hpp>
#include <ducat/host/config.hpp>
#include <ducat/host/script.hpp>
#include <ducat/log.hpp>
#include <ducat/memory.hpp>
#include <ducat/program.hpp>
#include <ducat/protocol.hpp>
#include <ducat/token.hpp>

using namespace ducat;

const std::string& version_string()
{
  static const std::string version = std::string( "ducat_host v" ) + DUCAT_VERSION;
  return version;
}

namespace {

void log_output( const host::call& c, const host::call_context& context )
{
  const auto& out = context.output();

  switch( c.instruction )
  {
    case program::erc20::instruction::name:
    case program::erc20::instruction::ticker:
      LOG_INFO( ducat::log::instance(),
                "{}: {}",
                c.description,
                std::string_view( memory::pointer_cast< const char* >( out.data() ), out.size() ) );
      break;
    case program::erc20::instruction::total_supply:
    case program::erc20::instruction::balance_of:
    case program::erc20::instruction::allowance:
      {
        auto value = memory::bit_cast< std::uint64_t >( out );
        boost::endian::little_to_native_inplace( value );
        LOG_INFO( ducat::log::instance(), "{}: {}", c.description, value );
        break;
      }
    default:
      break;
  }
}

void log_event( const protocol::event& e )
{
  std::visit(
    [ & ]( const auto& ev )
    {
      using T = std::decay_t< decltype( ev ) >;
      if constexpr( std::is_same_v< T, protocol::transfer_event > )
        LOG_INFO( ducat::log::instance(),
                  "Event transfer - From: {}, To: {}, Value: {}",
                  ducat::log::hex{ ev.from.data(), ev.from.size() },
                  ducat::log::hex{ ev.to.data(), ev.to.size() },
                  ev.value );
      else
        LOG_INFO( ducat::log::instance(),
                  "Event approval - Owner: {}, Spender: {}, Value: {}",
                  ducat::log::hex{ ev.owner.data(), ev.owner.size() },
                  ducat::log::hex{ ev.spender.data(), ev.spender.size() },
                  ev.value );
    },
    e );
}

} // namespace

int main( int argc, char** argv )
{
  host::options opts;
  host::script script;

  try
  {
    auto options = host::make_options_description();

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( host::option_key( host::constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( host::option_key( host::constants::version_option ) ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    opts = host::load_options( args );

    ducat::log::initialize();
    ducat::log::set_level( opts.log_level );

    LOG_INFO( ducat::log::instance(), "{}", version_string() );

    if( !opts.config_found )
      LOG_WARNING( ducat::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    script = host::load_script_file( opts.script );
    LOG_INFO( ducat::log::instance(), "Loaded {} calls from {}", script.calls.size(), opts.script.string() );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;

  try
  {
    token::ledger ledger( opts.token );
    auto events = std::make_shared< token::event_log >();
    ledger.set_event_sink( events );

    program::erc20 erc20( ledger );

    std::size_t failures = 0;
    for( const auto& c: script.calls )
    {
      host::call_context context( c.caller, std::vector< std::byte >( c.input ) );
      auto recorded = events->events().size();

      if( auto error = erc20.run( &context ); error )
      {
        ++failures;
        LOG_WARNING( ducat::log::instance(),
                     "Call {} by {} failed: {}",
                     c.description,
                     ducat::log::hex{ c.caller.data(), c.caller.size() },
                     error.message() );
        continue;
      }

      LOG_INFO( ducat::log::instance(),
                "Call {} by {} succeeded",
                c.description,
                ducat::log::hex{ c.caller.data(), c.caller.size() } );
      log_output( c, context );

      for( auto i = recorded; i < events->events().size(); ++i )
        log_event( events->events()[ i ] );
    }

    const auto& details = ledger.registry().details();
    LOG_INFO( ducat::log::instance(),
              "Token: {} ({}), total supply: {}",
              details.name,
              details.ticker,
              details.total_supply );

    for( const auto& [ account, balance ]: ledger.balances().entries() )
      LOG_INFO( ducat::log::instance(),
                "Balance of {}: {}",
                ducat::log::hex{ account.data(), account.size() },
                balance );

    LOG_INFO( ducat::log::instance(),
              "Replayed {} calls, {} failed, {} events recorded",
              script.calls.size(),
              failures,
              events->events().size() );

    if( opts.event_log )
    {
      std::ofstream ofs( *opts.event_log, std::ios::binary );
      if( !ofs )
        throw std::runtime_error( "unable to open event log at " + opts.event_log->string() );

      boost::archive::binary_oarchive oa( ofs );
      oa << events->events();
      LOG_INFO( ducat::log::instance(), "Wrote event log to {}", opts.event_log->string() );
    }
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( ducat::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  LOG_INFO( ducat::log::instance(), "Shut down gracefully" );

  return retcode;
}
