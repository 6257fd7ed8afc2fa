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
#include <boost/test/unit_test.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/account_balance_object.hpp>

#include "../common/database_fixture.hpp"

using namespace groupbuy::chain;
using namespace groupbuy::chain::test;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_test )
{
   try {
      database db;
      auto ses = db._undo_db.start_undo_session();
      const auto& bal_obj1 = db.create<account_balance_object>( [&]( account_balance_object& obj ){
               /* no balances right now */
      });
      auto id1 = bal_obj1.id;
      // abandon changes
      ses.undo();
      BOOST_CHECK( db.find_object( id1 ) == nullptr );
      // start a new session
      ses = db._undo_db.start_undo_session();

      const auto& bal_obj2 = db.create<account_balance_object>( [&]( account_balance_object& obj ){
               /* no balances right now */
      });
      auto id2 = bal_obj2.id;
      BOOST_CHECK( id1 == id2 );
   } catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( undo_restores_modified_and_removed_objects )
{ try {
   database db;
   const auto& obj = db.create<account_balance_object>( []( account_balance_object& b ) {
      b.owner = account_id_type( 5 );
      b.balance = 42;
   });
   const object_id_type id = obj.id;

   {
      auto ses = db._undo_db.start_undo_session();
      db.modify( obj, []( account_balance_object& b ) {
         b.balance = 7;
      });
      BOOST_CHECK_EQUAL( db.get<account_balance_object>( id ).balance.value, 7 );
      // destroyed without commit
   }
   BOOST_CHECK_EQUAL( db.get<account_balance_object>( id ).balance.value, 42 );

   {
      auto ses = db._undo_db.start_undo_session();
      db.remove( db.get<account_balance_object>( id ) );
      BOOST_CHECK( db.find_object( id ) == nullptr );
   }
   BOOST_REQUIRE( db.find_object( id ) != nullptr );
   BOOST_CHECK_EQUAL( db.get<account_balance_object>( id ).balance.value, 42 );
   BOOST_CHECK( db.get<account_balance_object>( id ).owner == account_id_type( 5 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_sessions_fold_into_parent )
{ try {
   database db;
   auto outer = db._undo_db.start_undo_session();
   object_id_type id;
   {
      auto inner = db._undo_db.start_undo_session();
      BOOST_CHECK_EQUAL( db._undo_db.size(), 2u );
      id = db.create<account_balance_object>( []( account_balance_object& b ) {
         b.balance = 1;
      }).id;
      inner.commit();
   }
   BOOST_CHECK_EQUAL( db._undo_db.size(), 1u );
   BOOST_CHECK( db.find_object( id ) != nullptr );

   // undoing the parent takes the committed child with it
   outer.undo();
   BOOST_CHECK( db.find_object( id ) == nullptr );
   BOOST_CHECK( !db._undo_db.has_active_session() );
} FC_LOG_AND_RETHROW() }

/**
 * Check that database modify() functors that throw do not get caught by boost, which will remove the object
 */
BOOST_AUTO_TEST_CASE(failed_modify_test)
{ try {
   database db;
   // Create dummy object
   const auto& obj = db.create<account_balance_object>([](account_balance_object& obj) {
                     obj.owner = account_id_type(123);
                  });
   account_balance_id_type obj_id( obj.id );
   BOOST_CHECK_EQUAL(obj.owner.instance, 123u);

   // Modify dummy object, check that changes stick
   db.modify(obj, [](account_balance_object& obj) {
      obj.owner = account_id_type(234);
   });
   BOOST_CHECK_EQUAL(obj_id(db).owner.instance, 234u);

   // Throw exception when modifying object, check that object still exists after
   BOOST_CHECK_THROW(db.modify(obj, [](account_balance_object& obj) {
      throw 5;
   }), int);
   BOOST_CHECK( db.find(obj_id) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_test )
{ try {
   BOOST_CHECK( db.head_time() == fc::time_point_sec( GROUPBUY_TESTING_GENESIS_TIMESTAMP ) );
   BOOST_CHECK( db.get_global_properties().administrator == administrator );
   BOOST_CHECK( db.current_parameters().fee_collector == fee_collector );
   BOOST_CHECK( db.current_parameters().reward_treasury == treasury );
   BOOST_CHECK_EQUAL( payment_balance( alice ).value, initial_balance );
   BOOST_CHECK_EQUAL( reward_balance( treasury ).value, initial_treasury_balance );
   BOOST_CHECK_EQUAL( payment_balance( treasury ).value, 0 );
   BOOST_CHECK( db.payment_port().holder() == escrow_account );
   BOOST_CHECK( db.reward_port().holder() == escrow_account );

   GROUPBUY_REQUIRE_THROW( db.init_genesis( genesis_state ), fc::assert_exception );

   genesis_state_type bad;
   bad.initial_parameters.reward_bps = GROUPBUY_100_PERCENT + 1;
   database fresh;
   GROUPBUY_REQUIRE_THROW( fresh.init_genesis( bad ), invalid_parameters_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( services_unset_before_genesis )
{ try {
   database fresh;
   GROUPBUY_REQUIRE_THROW( fresh.payment_port(), service_not_configured_exception );
   GROUPBUY_REQUIRE_THROW( fresh.reward_port(), service_not_configured_exception );
   BOOST_CHECK( fresh.get_settlement_calculator() == nullptr );
   BOOST_CHECK( fresh.get_reward_distributor() == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( clock_test )
{ try {
   const auto start = db.head_time();
   advance_time( 10 );
   BOOST_CHECK( db.head_time() == start + 10 );
   db.set_head_time( start + 10 );
   GROUPBUY_REQUIRE_THROW( db.set_head_time( start ), fc::assert_exception );
   BOOST_CHECK( db.head_time() == start + 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( balance_test )
{ try {
   GROUPBUY_REQUIRE_THROW( db.adjust_balance( dave, GROUPBUY_PAYMENT_ASSET, -initial_balance - 1 ),
                           insufficient_funds_exception );
   GROUPBUY_REQUIRE_THROW( db.adjust_balance( account_id_type( 500 ), GROUPBUY_PAYMENT_ASSET, -1 ),
                           insufficient_funds_exception );
   BOOST_CHECK_EQUAL( db.get_balance( account_id_type( 500 ), GROUPBUY_PAYMENT_ASSET ).value, 0 );

   balance_transfer_port port( db, GROUPBUY_PAYMENT_ASSET, dave );
   BOOST_CHECK( port.transfer( carol, 0 ) );
   BOOST_CHECK( !port.transfer( carol, initial_balance + 1 ) );
   BOOST_CHECK_EQUAL( port.balance_of( dave ).value, initial_balance );
   BOOST_CHECK( port.transfer_from( carol, dave, 100 ) );
   BOOST_CHECK_EQUAL( port.balance_of( dave ).value, initial_balance + 100 );
   BOOST_CHECK_EQUAL( port.balance_of( carol ).value, initial_balance - 100 );
   GROUPBUY_REQUIRE_THROW( port.checked_transfer( carol, initial_balance * 2 ), insufficient_funds_exception );
   port.checked_transfer( carol, 100 );
   BOOST_CHECK_EQUAL( port.balance_of( carol ).value, initial_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( lookup_test )
{ try {
   GROUPBUY_REQUIRE_THROW( db.get_group_order( group_order_id_type( 3 ) ), invalid_parameters_exception );

   const group_order_id_type first = create_group_order( manufacturer, 10, 10 ).get_id();
   const group_order_id_type second = create_group_order( other_manufacturer, 10, 10 ).get_id();
   const group_order_id_type third = create_group_order( manufacturer, 10, 10 ).get_id();
   join( alice, third, 1 );
   join( bob, third, 2 );

   const auto mine = db.get_orders_by_manufacturer( manufacturer );
   BOOST_REQUIRE_EQUAL( mine.size(), 2u );
   BOOST_CHECK( mine[0].get_id() == first );
   BOOST_CHECK( mine[1].get_id() == third );
   BOOST_CHECK_EQUAL( db.get_orders_by_manufacturer( other_manufacturer ).size(), 1u );
   BOOST_CHECK( db.get_orders_by_manufacturer( other_manufacturer )[0].get_id() == second );

   const auto contributions = db.get_contributions( third );
   BOOST_REQUIRE_EQUAL( contributions.size(), 2u );
   BOOST_CHECK( contributions[0].retailer == alice );
   BOOST_CHECK( contributions[1].retailer == bob );
   BOOST_CHECK( db.get_contributions( first ).empty() );
   BOOST_CHECK( db.find_contribution( first, alice ) == nullptr );
   BOOST_CHECK( db.find_reward_pool( third ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().applied_operations, 5u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_are_published_after_commit )
{ try {
   vector<int> seen;
   uint32_t applied = 0;
   bool applying_while_notified = false;
   auto event_connection = db.applied_event.connect( [&]( const ledger_event& e ) {
      seen.push_back( e.which() );
      applying_while_notified |= db.is_applying();
   });
   auto op_connection = db.applied_operation.connect( [&]( const operation&, const operation_result& ) {
      ++applied;
   });

   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();
   join( alice, order_id, 10 );
   BOOST_CHECK( !applying_while_notified );
   BOOST_CHECK_EQUAL( applied, 2u );
   BOOST_CHECK( seen == event_tags_since( 0 ) );

   // rejected operations publish nothing
   GROUPBUY_REQUIRE_THROW( join( alice, order_id, 1 ), already_joined_exception );
   BOOST_CHECK_EQUAL( applied, 2u );
   BOOST_CHECK_EQUAL( seen.size(), db.get_event_history().size() );

   event_connection.disconnect();
   op_connection.disconnect();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( observers_may_push_operations )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();

   // fulfill as soon as the order is ready
   auto connection = db.applied_event.connect( [&]( const ledger_event& e ) {
      if( e.which() == ledger_event::tag<order_ready_for_processing_event>::value )
         fulfill( e.get<order_ready_for_processing_event>().order_id );
   });

   join( alice, order_id, 10 );
   connection.disconnect();

   BOOST_CHECK( db.get_group_order( order_id ).status() == group_order_status::fulfilled );
   BOOST_CHECK_EQUAL( events_of_type<order_processed_event>().size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reentrancy_is_rejected )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();

   auto port = std::make_shared<recording_transfer_port>( db,
         std::make_shared<balance_transfer_port>( db, GROUPBUY_PAYMENT_ASSET, GROUPBUY_ESCROW_ACCOUNT ) );
   db.set_payment_port( port );

   group_order_join_operation nested;
   nested.retailer = bob;
   nested.order_id = order_id;
   nested.units = 5;
   port->reenter_with = operation( nested );

   join( alice, order_id, 4 );

   BOOST_CHECK_EQUAL( port->reentrancy_rejections, 1u );
   BOOST_CHECK_EQUAL( port->transfers, 1u );
   BOOST_CHECK( db.find_contribution( order_id, alice ) != nullptr );
   BOOST_CHECK( db.find_contribution( order_id, bob ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_group_order( order_id ).total_units.value, 4 );
   BOOST_CHECK_EQUAL( payment_balance( bob ).value, initial_balance );
   BOOST_CHECK( !db.is_applying() );

   // the ledger accepts operations again afterwards
   join( bob, order_id, 6 );
   fulfill( order_id );
   BOOST_CHECK_EQUAL( port->transfers, 4u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_history_limit )
{ try {
   BOOST_CHECK_EQUAL( db.get_event_history_limit(), 0u );
   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();
   join( alice, order_id, 4 );
   join( bob, order_id, 6 );
   const std::deque<ledger_event> full = db.get_event_history();
   BOOST_REQUIRE_GT( full.size(), 3u );

   // the oldest events go first
   db.set_event_history_limit( 3 );
   BOOST_REQUIRE_EQUAL( db.get_event_history().size(), 3u );
   for( size_t i = 0; i < 3; ++i )
      BOOST_CHECK_EQUAL( db.get_event_history()[i].which(), full[full.size() - 3 + i].which() );

   // observers are not affected by the limit
   uint32_t seen = 0;
   auto connection = db.applied_event.connect( [&]( const ledger_event& ) { ++seen; } );
   fulfill( order_id );
   connection.disconnect();
   BOOST_CHECK_GT( seen, 0u );
   BOOST_CHECK_EQUAL( db.get_event_history().size(), 3u );
   BOOST_CHECK_EQUAL( db.get_event_history().back().which(), ledger_event::tag<order_processed_event>::value );

   db.set_event_history_limit( 0 );
   create_group_order( manufacturer, 10, 10 );
   BOOST_CHECK_EQUAL( db.get_event_history().size(), 4u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reentrant_claim_is_rejected )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 100, 10 ).get_id();
   join( alice, order_id, 100 );
   fulfill( order_id );

   auto port = std::make_shared<recording_transfer_port>( db,
         std::make_shared<balance_transfer_port>( db, GROUPBUY_REWARD_ASSET, distributor_account ) );
   db.set_reward_distributor( std::make_shared<reward_distributor>( db, port ) );

   reward_claim_operation nested;
   nested.claimer = alice;
   nested.order_id = order_id;
   port->reenter_with = operation( nested );

   const share_type before = reward_balance( alice );
   BOOST_CHECK_EQUAL( claim( order_id, alice ).value, 5 );

   BOOST_CHECK_EQUAL( port->reentrancy_rejections, 1u );
   BOOST_CHECK_EQUAL( port->transfers, 1u );
   BOOST_CHECK_EQUAL( events_of_type<reward_claimed_event>().size(), 1u );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, before.value + 5 );
   BOOST_CHECK( db.find_reward_record( order_id, alice )->claimed );

   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), already_claimed_exception );
   BOOST_CHECK_EQUAL( port->transfers, 1u );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, before.value + 5 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reentrant_fulfillment_is_rejected )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();
   join( alice, order_id, 10 );

   auto port = std::make_shared<recording_transfer_port>( db,
         std::make_shared<balance_transfer_port>( db, GROUPBUY_PAYMENT_ASSET, GROUPBUY_ESCROW_ACCOUNT ) );
   db.set_payment_port( port );

   group_order_fulfill_operation nested;
   nested.executor = bob;
   nested.order_id = order_id;
   port->reenter_with = operation( nested );

   fulfill( order_id, dave );

   BOOST_CHECK_EQUAL( port->reentrancy_rejections, 1u );
   BOOST_CHECK_EQUAL( events_of_type<order_processed_event>().size(), 1u );
   BOOST_CHECK_EQUAL( events_of_type<order_processed_event>()[0].final_price.value, 10 );
   BOOST_CHECK( db.get_group_order( order_id ).status() == group_order_status::fulfilled );

   // paid out exactly once
   BOOST_CHECK_EQUAL( payment_balance( escrow_account ).value, 0 );
   BOOST_CHECK_EQUAL( payment_balance( manufacturer ).value + payment_balance( fee_collector ).value,
                      initial_balance + 100 );
   BOOST_CHECK_EQUAL( payment_balance( alice ).value, initial_balance - 100 );
   BOOST_CHECK_EQUAL( payment_balance( bob ).value, initial_balance );
   BOOST_CHECK( !db.is_applying() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
