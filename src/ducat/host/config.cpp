#include <ducat/host/config.hpp>

#include <stdexcept>

namespace ducat::host {

std::optional< token::reissue_policy > reissue_policy_from_string( std::string_view str ) noexcept
{
  if( str == "forbid" )
    return token::reissue_policy::forbid;

  if( str == "overwrite" )
    return token::reissue_policy::overwrite;

  return {};
}

boost::program_options::options_description make_options_description()
{
  namespace po = boost::program_options;

  po::options_description options;

  // clang-format off
  options.add_options()
    ( constants::help_option.c_str()          , "Print this help message and exit" )
    ( constants::version_option.c_str()       , "Print version string and exit" )
    ( constants::basedir_option.c_str()       , po::value< std::string >()->default_value( constants::basedir_default ), "Base directory holding config.yml" )
    ( constants::script_option.c_str()        , po::value< std::string >(), "The YAML call script to replay" )
    ( constants::event_log_option.c_str()     , po::value< std::string >(), "Write committed events to this file" )
    ( constants::log_level_option.c_str()     , po::value< std::string >(), "The log filtering level" )
    ( constants::reissue_policy_option.c_str(), po::value< std::string >(), "Handling of a repeated issue, 'forbid' or 'overwrite'. (Default: 'forbid')" );
  // clang-format on

  return options;
}

options load_options( const boost::program_options::variables_map& args )
{
  options opts;

  opts.basedir = std::filesystem::path( args[ option_key( constants::basedir_option ) ].as< std::string >() );
  if( opts.basedir.is_relative() )
    opts.basedir = std::filesystem::current_path() / opts.basedir;

  YAML::Node section;

  auto yaml_config = opts.basedir / "config.yml";
  if( !std::filesystem::exists( yaml_config ) )
    yaml_config = opts.basedir / "config.yaml";

  if( std::filesystem::exists( yaml_config ) )
  {
    auto config       = YAML::LoadFile( yaml_config.string() );
    section           = config[ constants::config_section ];
    opts.config_found = true;
  }

  // clang-format off
  opts.log_level      = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, section );
  opts.script         = std::filesystem::path( get_option< std::string >( constants::script_option, constants::script_default, args, section ) );
  auto event_log      = get_option< std::string >( constants::event_log_option, constants::event_log_default, args, section );
  auto reissue_policy = get_option< std::string >( constants::reissue_policy_option, constants::reissue_policy_default, args, section );
  // clang-format on

  if( opts.script.is_relative() )
    opts.script = opts.basedir / opts.script;

  if( !event_log.empty() )
  {
    opts.event_log = std::filesystem::path( event_log );
    if( opts.event_log->is_relative() )
      opts.event_log = opts.basedir / *opts.event_log;
  }

  if( auto policy = reissue_policy_from_string( reissue_policy ); policy )
    opts.token.reissue = *policy;
  else
    throw std::runtime_error( reissue_policy + " is not a valid reissue policy" );

  return opts;
}

} // namespace ducat::host
