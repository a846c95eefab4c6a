/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <hashvault/app/call_replay.hpp>
#include <hashvault/app/database_api.hpp>
#include <hashvault/chain/database.hpp>
#include <hashvault/chain/escrow_ledger.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>

namespace bpo = boost::program_options;

using namespace hashvault::chain;
using hashvault::app::scripted_call;

fc::log_level string_to_level( const std::string& level )
{
   fc::log_level result;
   if( level == "info" )
      result = fc::log_level::info;
   else if( level == "debug" )
      result = fc::log_level::debug;
   else if( level == "warn" )
      result = fc::log_level::warn;
   else if( level == "error" )
      result = fc::log_level::error;
   else
      FC_THROW( "Log level not allowed. Allowed levels are debug, info, warn and error." );

   return result;
}

void setup_logging( const std::string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.stream = fc::console_appender::stream::std_error;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug,
         fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn,
         fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error,
         fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "stderr", "console",
                                                 fc::variant( console_appender_config, 20 ) ) );
   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( console_level );
   cfg.loggers.front().appenders = { "stderr" };

   fc::configure_logging( cfg );
}

genesis_state_type default_genesis()
{
   genesis_state_type genesis;
   genesis.initial_admin = address::from_name( "admin" );
   genesis.initial_timestamp = time_point_sec( fc::time_point::now() );
   return genesis;
}

int main( int argc, char** argv )
{
   try {
      bpo::options_description app_options( "HashVault Escrow Node" );
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(),
                    "File to read the genesis state from")
            ("calls-json", bpo::value<boost::filesystem::path>(),
                    "File with the calls to replay against the genesis state")
            ("log-level", bpo::value<std::string>()->default_value( "info" ),
                    "Console log level: debug, info, warn or error");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
         bpo::notify( options );
      }
      catch( const boost::program_options::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return EXIT_FAILURE;
      }

      if( options.count( "help" ) > 0 )
      {
         std::cout << app_options << "\n";
         return EXIT_SUCCESS;
      }

      setup_logging( options.at( "log-level" ).as<std::string>() );

      genesis_state_type genesis;
      if( options.count( "genesis-json" ) > 0 )
      {
         const auto genesis_file = options.at( "genesis-json" ).as<boost::filesystem::path>();
         ilog( "loading genesis state from ${f}", ("f",genesis_file.string()) );
         genesis = fc::json::from_file( genesis_file ).as<genesis_state_type>( HASHVAULT_MAX_NESTED_OBJECTS );
      }
      else
      {
         genesis = default_genesis();
         ilog( "no genesis file given, using admin ${a}", ("a",genesis.initial_admin) );
      }

      memory_ledger ledger;
      for( const auto& b : genesis.initial_balances )
         ledger.credit( b.owner, b.amount );

      database db;
      db.set_escrow_ledger( &ledger );
      db.init_genesis( genesis );

      hashvault::app::database_api api( db );

      vector<scripted_call> calls;
      if( options.count( "calls-json" ) > 0 )
      {
         const auto calls_file = options.at( "calls-json" ).as<boost::filesystem::path>();
         calls = fc::json::from_file( calls_file ).as<vector<scripted_call>>( HASHVAULT_MAX_NESTED_OBJECTS );
         ilog( "replaying ${n} calls from ${f}", ("n",calls.size())("f",calls_file.string()) );
      }

      size_t failed = 0;
      for( size_t i = 0; i < calls.size(); ++i )
      {
         if( !hashvault::app::replay_call( db, ledger, calls[i], i, std::cout ) )
            ++failed;
      }

      std::cout << "protocol state: "
                << fc::json::to_pretty_string( api.get_protocol_state() ) << "\n";
      std::cout << "escrow: " << ledger.escrow_balance().value << "\n";
      for( const auto& entry : ledger.balances() )
         std::cout << std::string( entry.first ) << ": " << entry.second.value << "\n";

      ilog( "${n} calls replayed, ${f} failed", ("n",calls.size())("f",failed) );
      return EXIT_SUCCESS;
   }
   catch( const fc::exception& e )
   {
      std::cerr << "Exiting with error:\n" << e.to_detail_string() << "\n";
   }
   return EXIT_FAILURE;
}
