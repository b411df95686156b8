#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <offchain/encode/decimal.hpp>
#include <offchain/encode/hex.hpp>
#include <offchain/indexer/offchain_transaction.hpp>
#include <offchain/log/log.hpp>
#include <offchain/storage/column.hpp>
#include <offchain/storage/database.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option           = "help,h"s;
constexpr auto basedir_option        = "basedir,d"s;
constexpr auto basedir_default       = "."s;
constexpr auto statedir_option       = "statedir"s;
constexpr auto statedir_default      = "offchain"s;
constexpr auto log_level_option      = "log-level,l"s;
constexpr auto log_level_default     = "info"s;
constexpr auto sync_writes_option    = "sync-writes"s;
constexpr auto sync_writes_default   = false;
constexpr auto list_columns_option   = "list-columns"s;
constexpr auto tx_count_option       = "tx-count"s;
constexpr auto reset_tx_count_option = "reset-tx-count"s;
constexpr auto tx_status_option      = "tx-status"s;
constexpr auto owned_txs_option      = "owned-transactions"s;
constexpr auto config_section        = "offchain"s;

} // namespace constants

using namespace offchain;

namespace {

std::string option_name( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

/**
 * Command line value, else the service section of the yaml config, else the
 * global section, else the default.
 */
template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& service_config,
              const YAML::Node& global_config )
{
  auto key = option_name( option );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

indexer::bytes32 parse_bytes32( const std::string& option, const std::string& text )
{
  auto decoded = encode::from_hex_array< indexer::bytes32_size >( text );
  if( !decoded )
    throw std::invalid_argument( option + " expects 32 bytes of hex: " + decoded.error().message() );

  return *decoded;
}

std::uint64_t parse_count( const std::string& option, const std::string& text )
{
  auto value = encode::from_decimal( text );
  if( !value )
    throw std::invalid_argument( option + " expects an unsigned decimal: " + value.error().message() );

  return *value;
}

void print_status( const indexer::transaction_status& status )
{
  if( const auto* submitted = std::get_if< indexer::submitted_status >( &status ) )
    std::cout << "submitted time=" << submitted->time << '\n';
  else if( const auto* success = std::get_if< indexer::success_status >( &status ) )
    std::cout << "success height=" << success->height << " time=" << success->time
              << " gas=" << success->total_gas << " fee=" << success->total_fee << '\n';
  else if( const auto* squeezed = std::get_if< indexer::squeezed_out_status >( &status ) )
    std::cout << "squeezed out reason=\"" << squeezed->reason << "\"\n";
  else if( const auto* failure = std::get_if< indexer::failure_status >( &status ) )
    std::cout << "failure height=" << failure->height << " time=" << failure->time << " reason=\""
              << failure->reason << "\" gas=" << failure->total_gas << " fee=" << failure->total_fee << '\n';
}

void list_columns()
{
  std::cout << "columns compiled into this build: " << storage::column_count << '\n';
  for( auto c: storage::columns )
    std::cout << storage::column_id( c ) << '\t' << storage::column_name( c ) << '\n';
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path statedir;
  bool sync_writes = false;
  std::optional< std::uint64_t > reset_tx_count;
  std::optional< indexer::tx_id > tx_status_id;
  std::optional< indexer::address > owned_txs_owner;

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::basedir_option.data()       , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Base directory" )
      ( constants::statedir_option.data()      , boost::program_options::value< std::string >(), "Location of the off-chain database (absolute or relative to basedir)" )
      ( constants::log_level_option.data()     , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::sync_writes_option.data()   , boost::program_options::value< bool >()       , "Sync every commit to disk" )
      ( constants::list_columns_option.data()  , "List the column catalog and exit" )
      ( constants::tx_count_option.data()      , "Print the total transaction count" )
      ( constants::reset_tx_count_option.data(), boost::program_options::value< std::string >(), "Overwrite the total transaction count" )
      ( constants::tx_status_option.data()     , boost::program_options::value< std::string >(), "Print the status of a transaction (hex id)" )
      ( constants::owned_txs_option.data()     , boost::program_options::value< std::string >(), "Print the transactions owned by an address (hex)" );
    // clang-format on

    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( option_name( constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( constants::list_columns_option ) )
    {
      list_columns();
      return EXIT_SUCCESS;
    }

    if( args.count( constants::reset_tx_count_option ) )
      reset_tx_count = parse_count( constants::reset_tx_count_option,
                                    args[ constants::reset_tx_count_option ].as< std::string >() );

    if( args.count( constants::tx_status_option ) )
      tx_status_id = parse_bytes32( constants::tx_status_option, args[ constants::tx_status_option ].as< std::string >() );

    if( args.count( constants::owned_txs_option ) )
      owned_txs_owner = parse_bytes32( constants::owned_txs_option,
                                       args[ constants::owned_txs_option ].as< std::string >() );

    auto basedir = std::filesystem::path( args[ option_name( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      global_config  = config[ "global" ];
      service_config = config[ constants::config_section ];
    }

    // clang-format off
    log_level   = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    statedir    = get_option< std::string >( constants::statedir_option, constants::statedir_default, args, service_config, global_config );
    sync_writes = get_option< bool >( constants::sync_writes_option, constants::sync_writes_default, args, service_config, global_config );
    // clang-format on

    if( statedir.is_relative() )
      statedir = basedir / statedir;

    log::initialize( log_level );

    if( config.IsNull() )
      LOG_WARNING( log::instance(), "Could not find config (config.yml or config.yaml expected), using default values" );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  storage::database db;
  if( auto opened = db.open( { .path = statedir, .create_if_missing = true, .sync_writes = sync_writes } ); !opened )
  {
    LOG_CRITICAL( log::instance(), "Unable to open database at {}: {}", statedir.string(), opened.error().message() );
    return EXIT_FAILURE;
  }

  indexer::offchain_transaction tx( db.make_transaction() );

  if( reset_tx_count )
  {
    if( auto reset = tx.reset_tx_count( *reset_tx_count ); !reset )
    {
      LOG_ERROR( log::instance(), "Unable to reset transaction count: {}", reset.error().message() );
      return EXIT_FAILURE;
    }
  }

  if( args.count( constants::tx_count_option ) )
  {
    auto count = tx.get_tx_count();
    if( !count )
    {
      LOG_ERROR( log::instance(), "Unable to read transaction count: {}", count.error().message() );
      return EXIT_FAILURE;
    }

    std::cout << indexer::tx_count_key << ": " << *count << '\n';
  }

  if( tx_status_id )
  {
    auto status = tx.get_tx_status( *tx_status_id );
    if( !status )
    {
      LOG_ERROR( log::instance(), "Unable to read transaction status: {}", status.error().message() );
      return EXIT_FAILURE;
    }

    std::cout << encode::to_hex( *tx_status_id ) << ": ";
    if( *status )
      print_status( **status );
    else
      std::cout << "unknown\n";
  }

  if( owned_txs_owner )
  {
    auto owned = tx.owned_transactions( *owned_txs_owner );
    if( !owned )
    {
      LOG_ERROR( log::instance(), "Unable to read owned transactions: {}", owned.error().message() );
      return EXIT_FAILURE;
    }

    for( const auto& [ key, id ]: *owned )
      std::cout << key.height << '\t' << key.index << '\t' << encode::to_hex( id ) << '\n';
  }

  if( auto committed = std::move( tx ).commit(); !committed )
  {
    LOG_ERROR( log::instance(), "Commit failed: {}", committed.error().message() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
