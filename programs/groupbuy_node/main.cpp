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
#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/replay.hpp>
#include <groupbuy/chain/settlement.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

namespace groupbuy { namespace node {

   using namespace groupbuy::chain;

   /// the default ledger: administrator, fee collector and treasury accounts with some reward value
   genesis_state_type default_genesis()
   {
      genesis_state_type genesis;
      genesis.initial_timestamp = fc::time_point_sec( fc::time_point::now() );
      genesis.initial_parameters.fee_collector = account_id_type(3);
      genesis.initial_parameters.reward_treasury = account_id_type(4);
      genesis.initial_balances.push_back( { genesis.initial_parameters.reward_treasury,
                                            GROUPBUY_REWARD_ASSET, share_type(1000000) } );
      return genesis;
   }

} } // groupbuy::node

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

int main( int argc, char** argv )
{
   using namespace groupbuy::chain;

   try {
      bpo::options_description app_options("Group buying ledger node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(),
                    "File to read the genesis state from, built-in defaults are used when absent")
            ("replay-json", bpo::value<boost::filesystem::path>(),
                    "File with a JSON array of {advance_seconds, op} steps to apply")
            ("platform-fee-bps", bpo::value<uint16_t>(), "Override the platform fee of the genesis state")
            ("reward-bps", bpo::value<uint16_t>(), "Override the reward rate of the genesis state")
            ("event-history-limit", bpo::value<size_t>()->default_value(0),
                    "Keep at most this many events in memory and in the output, 0 keeps all")
            ("quiet,q", "Do not log to the console");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line(argc, argv, app_options), options );
         bpo::notify( options );
      }
      catch( const bpo::error& e )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      if( options.count("quiet") > 0 )
         disable_default_logging();

      genesis_state_type genesis;
      if( options.count("genesis-json") > 0 )
      {
         const auto genesis_file = options["genesis-json"].as<boost::filesystem::path>();
         ilog( "Loading genesis state from ${f}", ("f",genesis_file.string()) );
         genesis = fc::json::from_file( fc::path( genesis_file.string() ) )
                      .as<genesis_state_type>( GROUPBUY_MAX_NESTED_OBJECTS );
      }
      else
         genesis = groupbuy::node::default_genesis();

      if( options.count("platform-fee-bps") > 0 )
         genesis.initial_parameters.platform_fee_bps = options["platform-fee-bps"].as<uint16_t>();
      if( options.count("reward-bps") > 0 )
         genesis.initial_parameters.reward_bps = options["reward-bps"].as<uint16_t>();

      database db;
      db.init_genesis( genesis );
      db.install_default_services();
      db.set_event_history_limit( options["event-history-limit"].as<size_t>() );

      if( options.count("replay-json") > 0 )
      {
         const auto replay_file = options["replay-json"].as<boost::filesystem::path>();
         const auto steps = fc::json::from_file( fc::path( replay_file.string() ) )
                               .as<std::vector<replay_step>>( GROUPBUY_MAX_NESTED_OBJECTS );
         ilog( "Replaying ${n} steps from ${f}", ("n",steps.size())("f",replay_file.string()) );

         const replay_report report = replay( db, steps );
         ilog( "Replay finished, ${a} operations applied, ${r} rejected",
               ("a",report.applied)("r",report.rejected_steps.size()) );
         if( !report.rejected_steps.empty() )
            wlog( "Rejected steps: ${s}", ("s",report.rejected_steps) );
      }

      const auto& history = db.get_event_history();
      std::vector<groupbuy::protocol::ledger_event> events( history.begin(), history.end() );
      std::vector<group_order_object> orders;
      for( const auto& order : db.get_index_type<group_order_index>().indices() )
         orders.push_back( order );

      fc::mutable_variant_object result;
      result( "events", fc::variant( events, GROUPBUY_MAX_NESTED_OBJECTS ) )
            ( "orders", fc::variant( orders, GROUPBUY_MAX_NESTED_OBJECTS ) )
            ( "parameters", fc::variant( db.current_parameters(), GROUPBUY_MAX_NESTED_OBJECTS ) )
            ( "head_time", fc::variant( db.head_time(), 1 ) );
      std::cout << fc::json::to_pretty_string( result ) << "\n";

      return EXIT_SUCCESS;
   }
   catch( const fc::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e",e.to_detail_string()) );
   }
   return EXIT_FAILURE;
}
