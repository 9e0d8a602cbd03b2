#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/endian.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <fungible/controller.hpp>
#include <fungible/encode.hpp>
#include <fungible/log.hpp>
#include <fungible/memory.hpp>
#include <fungible/program.hpp>
#include <fungible/protocol.hpp>
#include <fungible/token.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option            = "help,h"s;
constexpr auto basedir_option         = "basedir,d"s;
const auto basedir_default            = ".fungible"s;
constexpr auto log_level_option       = "log-level,l"s;
constexpr auto log_level_default      = "info"s;
constexpr auto statedir_option        = "statedir"s;
constexpr auto statedir_default       = "state"s;
constexpr auto reset_option           = "reset"s;
constexpr auto reset_default          = false;
constexpr auto caller_option          = "caller,c"s;
constexpr auto initial_supply_option  = "initial-supply"s;
constexpr auto initial_supply_default = std::uint64_t( 0 );
constexpr auto deployer_option        = "deployer"s;
constexpr auto name_option            = "name"s;
constexpr auto symbol_option          = "symbol"s;
constexpr auto decimals_option        = "decimals"s;
constexpr auto command_option         = "command"s;
constexpr auto arguments_option       = "arguments"s;

constexpr auto ledger_section = "ledger";
constexpr auto global_section = "global";

} // namespace constants

using namespace boost;
using namespace fungible;

namespace {

std::string option_key( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

/**
 * Resolves an option from the command line, then the ledger section of the
 * config, then the global section, falling back to `default_value`.
 */
template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const program_options::variables_map& cli,
              const YAML::Node& ledger_config,
              const YAML::Node& global_config )
{
  const auto key = option_key( option );

  if( cli.count( key ) )
    return cli[ key ].as< T >();

  if( ledger_config && ledger_config[ key ] )
    return ledger_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

protocol::account parse_account( const std::string& str )
{
  auto account = protocol::account_from_string( str );
  if( !account )
    throw std::runtime_error( "invalid account '" + str + "': " + account.error().message() );

  return *account;
}

std::uint64_t parse_amount( const std::string& str )
{
  std::size_t pos = 0;
  auto value      = std::stoull( str, &pos );
  if( pos != str.size() || str.starts_with( '-' ) )
    throw std::runtime_error( "invalid amount '" + str + "'" );

  return value;
}

template< std::integral T >
void append_stdin( std::vector< std::byte >& input, T t )
{
  boost::endian::native_to_little_inplace( t );
  const auto bytes = memory::as_bytes( t );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

void append_stdin( std::vector< std::byte >& input, const protocol::account& account )
{
  input.insert( input.end(), account.begin(), account.end() );
}

template< typename... Args >
protocol::program_input make_input( program::token_program::instruction instr, const Args&... args )
{
  protocol::program_input input;
  append_stdin( input.stdin, std::to_underlying( instr ) );
  ( ( append_stdin( input.stdin, args ) ), ... );
  return input;
}

template< typename T >
T decode_result( const protocol::program_output& output )
{
  return boost::endian::little_to_native( memory::bit_cast< T >( output.stdout ) );
}

void print_event( const protocol::event& ev )
{
  std::cout << "event #" << ev.sequence << " " << ev.name;

  if( ev.name == token::event_name::transfer )
  {
    auto transfer = token::decode_transfer( ev );
    if( !transfer )
    {
      std::cout << " <" << transfer.error().message() << ">\n";
      return;
    }

    std::cout << " from: " << ( transfer->from ? protocol::to_string( *transfer->from ) : "none" )
              << " to: " << ( transfer->to ? protocol::to_string( *transfer->to ) : "none" )
              << " value: " << transfer->value << '\n';
  }
  else if( ev.name == token::event_name::approval )
  {
    auto approval = token::decode_approval( ev );
    if( !approval )
    {
      std::cout << " <" << approval.error().message() << ">\n";
      return;
    }

    std::cout << " owner: " << protocol::to_string( approval->owner )
              << " spender: " << protocol::to_string( approval->spender ) << " value: " << approval->value << '\n';
  }
  else
  {
    std::cout << '\n';
  }
}

void require_arguments( const std::string& command, const std::vector< std::string >& args, std::size_t count )
{
  if( args.size() != count )
    throw std::runtime_error( "'" + command + "' expects " + std::to_string( count ) + " argument(s)" );
}

int query( controller::controller& controller, const protocol::program_input& input, auto&& print )
{
  auto output = controller.read( input );
  if( !output )
  {
    LOG_ERROR( fungible::log::instance(), "Query failed: {}", output.error().message() );
    return EXIT_FAILURE;
  }

  if( output->code )
  {
    std::cerr << std::error_code( program::program_errc( output->code ) ).message() << '\n';
    return EXIT_FAILURE;
  }

  print( *output );
  return EXIT_SUCCESS;
}

int call( controller::controller& controller, const protocol::account& caller, const protocol::program_input& input )
{
  auto receipt = controller.execute( caller, input );
  if( !receipt )
  {
    LOG_ERROR( fungible::log::instance(), "Call failed: {}", receipt.error().message() );
    return EXIT_FAILURE;
  }

  if( receipt->output.code )
  {
    std::cerr << std::error_code( program::program_errc( receipt->output.code ) ).message() << '\n';
    return EXIT_FAILURE;
  }

  for( const auto& ev: receipt->events )
    print_event( ev );

  std::cout << "revision " << receipt->revision << '\n';
  return EXIT_SUCCESS;
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level, command;
  std::vector< std::string > arguments;
  std::filesystem::path statedir;
  std::optional< protocol::account > caller;
  controller::state::genesis_data genesis_data;
  bool reset = false;

  try
  {
    program_options::options_description options( "Options" );

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::basedir_option.data()       , program_options::value< std::string >()->default_value( constants::basedir_default ), "Base directory" )
      ( constants::log_level_option.data()     , program_options::value< std::string >()  , "The log filtering level" )
      ( constants::statedir_option.data()      , program_options::value< std::string >()  , "The location of the ledger state (absolute path or relative to basedir)" )
      ( constants::reset_option.data()         , program_options::value< bool >()         , "Reset the ledger state" )
      ( constants::caller_option.data()        , program_options::value< std::string >()  , "The account making the call" )
      ( constants::initial_supply_option.data(), program_options::value< std::uint64_t >(), "Total supply credited to the deployer of a new ledger" )
      ( constants::deployer_option.data()      , program_options::value< std::string >()  , "The account constructing a new ledger" )
      ( constants::name_option.data()          , program_options::value< std::string >()  , "Token name of a new ledger" )
      ( constants::symbol_option.data()        , program_options::value< std::string >()  , "Token symbol of a new ledger" )
      ( constants::decimals_option.data()      , program_options::value< std::uint32_t >(), "Token decimals of a new ledger" );
    // clang-format on

    program_options::options_description hidden;
    hidden.add_options()( constants::command_option.data(), program_options::value< std::string >() )(
      constants::arguments_option.data(),
      program_options::value< std::vector< std::string > >() );

    program_options::options_description all;
    all.add( options ).add( hidden );

    program_options::positional_options_description positional;
    positional.add( constants::command_option.data(), 1 );
    positional.add( constants::arguments_option.data(), -1 );

    program_options::variables_map args;
    program_options::store(
      program_options::command_line_parser( argc, argv ).options( all ).positional( positional ).run(),
      args );

    if( args.count( option_key( constants::help_option ) ) || !args.count( constants::command_option ) )
    {
      std::cout << "Usage: fungible_ledger [options] <command> [arguments...]\n\n"
                << "Commands:\n"
                << "  name | symbol | decimals | total-supply\n"
                << "  balance-of <account>\n"
                << "  allowance <owner> <spender>\n"
                << "  transfer <to> <value>\n"
                << "  approve <spender> <value>\n"
                << "  transfer-from <from> <to> <value>\n\n"
                << options << '\n';
      return args.count( option_key( constants::help_option ) ) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    command = args[ constants::command_option ].as< std::string >();
    if( args.count( constants::arguments_option ) )
      arguments = args[ constants::arguments_option ].as< std::vector< std::string > >();

    auto basedir = std::filesystem::path( args[ option_key( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node ledger_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ constants::global_section ];
      ledger_config = config[ constants::ledger_section ];
    }

    // clang-format off
    log_level                          = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, ledger_config, global_config );
    statedir                           = std::filesystem::path( get_option< std::string >( constants::statedir_option, constants::statedir_default, args, ledger_config, global_config ) );
    reset                              = get_option< bool >( constants::reset_option, constants::reset_default, args, ledger_config, global_config );
    genesis_data.initial_supply        = get_option< std::uint64_t >( constants::initial_supply_option, constants::initial_supply_default, args, ledger_config, global_config );
    genesis_data.metadata.name         = get_option< std::string >( constants::name_option, genesis_data.metadata.name, args, ledger_config, global_config );
    genesis_data.metadata.symbol       = get_option< std::string >( constants::symbol_option, genesis_data.metadata.symbol, args, ledger_config, global_config );
    genesis_data.metadata.decimals     = get_option< std::uint32_t >( constants::decimals_option, genesis_data.metadata.decimals, args, ledger_config, global_config );
    auto deployer                      = get_option< std::string >( constants::deployer_option, std::string{}, args, ledger_config, global_config );
    auto caller_str                    = get_option< std::string >( constants::caller_option, std::string{}, args, ledger_config, global_config );
    // clang-format on

    fungible::log::initialize( quill::loglevel_from_string( log_level ) );

    if( config.IsNull() )
      LOG_DEBUG( fungible::log::instance(), "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( !deployer.empty() )
      genesis_data.deployer = parse_account( deployer );

    if( !caller_str.empty() )
      caller = parse_account( caller_str );

    if( statedir.is_relative() )
      statedir = basedir / statedir;
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller;

  try
  {
    controller.open( statedir, genesis_data, reset );

    using instruction = program::token_program::instruction;

    auto require_caller = [ & ]() -> const protocol::account&
    {
      if( !caller )
        throw std::runtime_error( "'" + command + "' requires --caller" );
      return *caller;
    };

    auto print_string = []( const protocol::program_output& output )
    {
      std::cout << memory::as_string_view( output.stdout ) << '\n';
    };

    auto print_u64 = []( const protocol::program_output& output )
    {
      std::cout << decode_result< std::uint64_t >( output ) << '\n';
    };

    if( command == "name" )
    {
      require_arguments( command, arguments, 0 );
      retcode = query( controller, make_input( instruction::name ), print_string );
    }
    else if( command == "symbol" )
    {
      require_arguments( command, arguments, 0 );
      retcode = query( controller, make_input( instruction::symbol ), print_string );
    }
    else if( command == "decimals" )
    {
      require_arguments( command, arguments, 0 );
      retcode = query( controller,
                       make_input( instruction::decimals ),
                       []( const protocol::program_output& output )
                       {
                         std::cout << decode_result< std::uint32_t >( output ) << '\n';
                       } );
    }
    else if( command == "total-supply" )
    {
      require_arguments( command, arguments, 0 );
      retcode = query( controller, make_input( instruction::total_supply ), print_u64 );
    }
    else if( command == "balance-of" )
    {
      require_arguments( command, arguments, 1 );
      retcode = query( controller, make_input( instruction::balance_of, parse_account( arguments[ 0 ] ) ), print_u64 );
    }
    else if( command == "allowance" )
    {
      require_arguments( command, arguments, 2 );
      retcode =
        query( controller,
               make_input( instruction::allowance, parse_account( arguments[ 0 ] ), parse_account( arguments[ 1 ] ) ),
               print_u64 );
    }
    else if( command == "transfer" )
    {
      require_arguments( command, arguments, 2 );
      retcode = call(
        controller,
        require_caller(),
        make_input( instruction::transfer, parse_account( arguments[ 0 ] ), parse_amount( arguments[ 1 ] ) ) );
    }
    else if( command == "approve" )
    {
      require_arguments( command, arguments, 2 );
      retcode = call(
        controller,
        require_caller(),
        make_input( instruction::approve, parse_account( arguments[ 0 ] ), parse_amount( arguments[ 1 ] ) ) );
    }
    else if( command == "transfer-from" )
    {
      require_arguments( command, arguments, 3 );
      retcode = call( controller,
                      require_caller(),
                      make_input( instruction::transfer_from,
                                  parse_account( arguments[ 0 ] ),
                                  parse_account( arguments[ 1 ] ),
                                  parse_amount( arguments[ 2 ] ) ) );
    }
    else
    {
      throw std::runtime_error( "unknown command '" + command + "'" );
    }
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( fungible::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  controller.close();

  return retcode;
}
