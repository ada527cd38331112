#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <ducat/program/erc20.hpp>
#include <ducat/protocol/account.hpp>

namespace ducat::host {

struct call
{
  protocol::account caller{};
  program::erc20::instruction instruction = program::erc20::instruction::name;
  std::vector< std::byte > input;
  std::string description;
};

struct script
{
  std::map< std::string, protocol::account > accounts;
  std::vector< call > calls;
};

/**
 * Resolves an account reference. A name from the accounts table wins, then a
 * 0x prefixed 32 byte hex string, then a label of at most 32 bytes padded
 * with zeroes.
 *
 * Throws if the reference is none of these.
 */
protocol::account resolve_account( const std::string& ref, const std::map< std::string, protocol::account >& accounts );

/**
 * Parses a call script of the form
 *
 *   accounts:
 *     alice: "0x..."
 *   calls:
 *     - caller: alice
 *       issue: { name: Token, ticker: TOK, supply: 1000 }
 *     - caller: alice
 *       transfer: { to: bob, value: 300 }
 *     - balance_of: { account: bob }
 *
 * Throws on any malformed entry.
 */
script load_script( const YAML::Node& node );
script load_script_file( const std::filesystem::path& p );

void append_input( std::vector< std::byte >& input, std::uint32_t value );
void append_input( std::vector< std::byte >& input, std::uint64_t value );
void append_input( std::vector< std::byte >& input, const protocol::account& account );
void append_input( std::vector< std::byte >& input, std::string_view str );

} // namespace ducat::host
