#include <ducat/host/script.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <boost/endian.hpp>

#include <ducat/encode.hpp>
#include <ducat/memory.hpp>

namespace ducat::host {

using instruction = program::erc20::instruction;

void append_input( std::vector< std::byte >& input, std::uint32_t value )
{
  boost::endian::native_to_little_inplace( value );
  const auto bytes = memory::as_bytes( value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

void append_input( std::vector< std::byte >& input, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  const auto bytes = memory::as_bytes( value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

void append_input( std::vector< std::byte >& input, const protocol::account& account )
{
  input.insert( input.end(), account.begin(), account.end() );
}

void append_input( std::vector< std::byte >& input, std::string_view str )
{
  append_input( input, static_cast< std::uint32_t >( str.size() ) );
  const auto bytes = memory::as_bytes( str );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

protocol::account resolve_account( const std::string& ref, const std::map< std::string, protocol::account >& accounts )
{
  if( auto itr = accounts.find( ref ); itr != accounts.end() )
    return itr->second;

  if( ref.starts_with( "0x" ) )
  {
    protocol::account account{};
    if( auto error = encode::from_hex( ref, memory::as_writable_bytes( account ) ); error )
      throw std::runtime_error( "invalid account " + ref + ": " + error.message() );

    return account;
  }

  if( auto account = protocol::make_account( std::string_view( ref ) ); account )
    return *account;

  throw std::runtime_error( "invalid account " + ref + ": label exceeds 32 bytes" );
}

namespace {

const YAML::Node& require( const YAML::Node& node, const std::string& key, const std::string& context )
{
  if( !node[ key ] )
    throw std::runtime_error( context + " requires '" + key + "'" );

  return node;
}

template< typename T >
T field( const YAML::Node& node, const std::string& key, const std::string& context )
{
  return require( node, key, context )[ key ].as< T >();
}

protocol::account
account_field( const YAML::Node& node, const std::string& key, const std::string& context, const script& s )
{
  return resolve_account( field< std::string >( node, key, context ), s.accounts );
}

const std::map< std::string, instruction >& instructions()
{
  static const std::map< std::string, instruction > instructions{
    { "issue",         instruction::issue         },
    { "transfer",      instruction::transfer      },
    { "approve",       instruction::approve       },
    { "transfer_from", instruction::transfer_from },
    { "name",          instruction::name          },
    { "ticker",        instruction::ticker        },
    { "total_supply",  instruction::total_supply  },
    { "balance_of",    instruction::balance_of    },
    { "allowance",     instruction::allowance     }
  };

  return instructions;
}

call load_call( const YAML::Node& node, std::size_t index, const script& s )
{
  const auto context = "call " + std::to_string( index );

  if( !node.IsMap() )
    throw std::runtime_error( context + " is not a map" );

  call c;

  if( node[ "caller" ] )
    c.caller = resolve_account( node[ "caller" ].as< std::string >(), s.accounts );

  std::optional< YAML::Node > args;
  for( const auto& [ name, instr ]: instructions() )
  {
    if( !node[ name ] )
      continue;

    if( args )
      throw std::runtime_error( context + " names more than one operation" );

    args          = node[ name ];
    c.instruction = instr;
    c.description = name;
  }

  if( !args )
    throw std::runtime_error( context + " names no operation" );

  const auto& a = *args;
  append_input( c.input, static_cast< std::uint32_t >( std::to_underlying( c.instruction ) ) );

  switch( c.instruction )
  {
    case instruction::issue:
      append_input( c.input, std::string_view( field< std::string >( a, "name", context ) ) );
      append_input( c.input, std::string_view( field< std::string >( a, "ticker", context ) ) );
      append_input( c.input, field< std::uint64_t >( a, "supply", context ) );
      break;
    case instruction::transfer:
      append_input( c.input, account_field( a, "to", context, s ) );
      append_input( c.input, field< std::uint64_t >( a, "value", context ) );
      break;
    case instruction::approve:
      append_input( c.input, account_field( a, "spender", context, s ) );
      append_input( c.input, field< std::uint64_t >( a, "value", context ) );
      break;
    case instruction::transfer_from:
      append_input( c.input, account_field( a, "from", context, s ) );
      append_input( c.input, account_field( a, "to", context, s ) );
      append_input( c.input, field< std::uint64_t >( a, "value", context ) );
      break;
    case instruction::balance_of:
      append_input( c.input, account_field( a, "account", context, s ) );
      break;
    case instruction::allowance:
      append_input( c.input, account_field( a, "owner", context, s ) );
      append_input( c.input, account_field( a, "spender", context, s ) );
      break;
    case instruction::name:
    case instruction::ticker:
    case instruction::total_supply:
      break;
  }

  return c;
}

} // namespace

script load_script( const YAML::Node& node )
{
  script s;

  if( const auto& accounts = node[ "accounts" ]; accounts )
  {
    if( !accounts.IsMap() )
      throw std::runtime_error( "'accounts' is not a map" );

    for( const auto& entry: accounts )
    {
      auto name = entry.first.as< std::string >();
      auto ref  = entry.second.as< std::string >();

      if( !ref.starts_with( "0x" ) )
        throw std::runtime_error( "account " + name + " must be a 0x prefixed hex string" );

      s.accounts.insert_or_assign( name, resolve_account( ref, s.accounts ) );
    }
  }

  const auto& calls = node[ "calls" ];
  if( !calls || !calls.IsSequence() )
    throw std::runtime_error( "script requires a 'calls' sequence" );

  std::size_t index = 0;
  for( const auto& entry: calls )
    s.calls.emplace_back( load_call( entry, index++, s ) );

  return s;
}

script load_script_file( const std::filesystem::path& p )
{
  if( !std::filesystem::exists( p ) )
    throw std::runtime_error( "unable to locate script at " + p.string() );

  return load_script( YAML::LoadFile( p.string() ) );
}

} // namespace ducat::host
