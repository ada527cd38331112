#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <ducat/token/types.hpp>

namespace ducat::host {

namespace constants {

using namespace std::string_literals;

const auto help_option            = "help,h"s;
const auto version_option         = "version,v"s;
const auto basedir_option         = "basedir,d"s;
const auto basedir_default        = "."s;
const auto script_option          = "script,s"s;
const auto script_default         = "script.yml"s;
const auto event_log_option       = "event-log,e"s;
const auto event_log_default      = ""s;
const auto log_level_option       = "log-level,l"s;
const auto log_level_default      = "info"s;
const auto reissue_policy_option  = "reissue-policy,r"s;
const auto reissue_policy_default = "forbid"s;

const auto config_section = "ducat"s;

} // namespace constants

struct options
{
  std::filesystem::path basedir;
  std::filesystem::path script;
  std::optional< std::filesystem::path > event_log;
  std::string log_level;
  token::config token;
  bool config_found = false;
};

std::optional< token::reissue_policy > reissue_policy_from_string( std::string_view str ) noexcept;

boost::program_options::options_description make_options_description();

/**
 * Resolves the host options. A value given on the command line wins over
 * the ducat section of basedir/config.yml (or config.yaml), which wins over
 * the default. Relative paths resolve against basedir.
 *
 * Throws on a malformed config file or an invalid option value.
 */
options load_options( const boost::program_options::variables_map& args );

/**
 * Strips the short alias from an option name, "log-level,l" becomes "log-level".
 */
inline std::string option_key( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& section )
{
  auto key = option_key( option );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( section && section[ key ] )
    return section[ key ].as< T >();

  return default_value;
}

} // namespace ducat::host
