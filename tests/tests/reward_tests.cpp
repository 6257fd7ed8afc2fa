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
#include <groupbuy/chain/reward_distributor.hpp>

#include "../common/database_fixture.hpp"

using namespace groupbuy::chain;
using namespace groupbuy::chain::test;

namespace {

   discount_tier tier( int64_t threshold, basis_points_type bps )
   {
      discount_tier t;
      t.units_threshold = threshold;
      t.discount_bps = bps;
      return t;
   }

}

BOOST_FIXTURE_TEST_SUITE( reward_tests, database_fixture )

BOOST_AUTO_TEST_CASE( claim_test )
{ try {
   const group_order_id_type order_id =
         create_group_order( manufacturer, 100, 10, { tier( 50, 500 ), tier( 100, 1000 ) } ).get_id();
   join( alice, order_id, 60 );
   join( bob, order_id, 40 );

   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), no_reward_exception );
   fulfill( order_id );

   // pool of 4 split 60:40, one unit of dust
   const reward_pool_object* pool = db.find_reward_pool( order_id );
   BOOST_REQUIRE( pool != nullptr );
   BOOST_CHECK_EQUAL( pool->pool.value, 4 );
   BOOST_CHECK_EQUAL( pool->total_units.value, 100 );
   BOOST_CHECK_EQUAL( pool->distributed.value, 3 );
   BOOST_CHECK_EQUAL( pool->dust().value, 1 );

   const reward_record_object* alice_reward = db.find_reward_record( order_id, alice );
   const reward_record_object* bob_reward = db.find_reward_record( order_id, bob );
   BOOST_REQUIRE( alice_reward != nullptr );
   BOOST_REQUIRE( bob_reward != nullptr );
   BOOST_CHECK_EQUAL( alice_reward->amount.value, 2 );
   BOOST_CHECK_EQUAL( bob_reward->amount.value, 1 );
   BOOST_CHECK( !alice_reward->claimed );

   const auto recorded = events_of_type<rewards_recorded_event>();
   BOOST_REQUIRE_EQUAL( recorded.size(), 2u );
   BOOST_CHECK( recorded[0].retailer == alice );
   BOOST_CHECK_EQUAL( recorded[0].amount.value, 2 );
   BOOST_CHECK( recorded[1].retailer == bob );
   BOOST_CHECK_EQUAL( recorded[1].amount.value, 1 );

   BOOST_CHECK_EQUAL( claim( order_id, alice ).value, 2 );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, initial_balance + 2 );
   BOOST_CHECK_EQUAL( reward_balance( distributor_account ).value, 2 );
   BOOST_CHECK( db.find_reward_record( order_id, alice )->claimed );
   BOOST_CHECK_EQUAL( db.find_reward_pool( order_id )->claimed.value, 2 );

   const auto claimed = events_of_type<reward_claimed_event>();
   BOOST_REQUIRE_EQUAL( claimed.size(), 1u );
   BOOST_CHECK( claimed[0].order_id == order_id );
   BOOST_CHECK( claimed[0].retailer == alice );
   BOOST_CHECK_EQUAL( claimed[0].amount.value, 2 );

   // a second claim pays nothing
   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), already_claimed_exception );
   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), state_conflict_exception );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, initial_balance + 2 );
   BOOST_CHECK_EQUAL( events_of_type<reward_claimed_event>().size(), 1u );

   GROUPBUY_REQUIRE_THROW( claim( order_id, carol ), no_reward_exception );
   GROUPBUY_REQUIRE_THROW( claim( group_order_id_type( 77 ), alice ), invalid_parameters_exception );

   BOOST_CHECK_EQUAL( claim( order_id, bob ).value, 1 );
   // the dust stays with the distributor
   BOOST_CHECK_EQUAL( reward_balance( distributor_account ).value, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dust_stays_below_contributor_count )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 9, 1000 ).get_id();
   join( alice, order_id, 2 );
   join( bob, order_id, 3 );
   join( carol, order_id, 4 );
   fulfill( order_id );

   // 0.5% of 9000
   const reward_pool_object* pool = db.find_reward_pool( order_id );
   BOOST_REQUIRE( pool != nullptr );
   BOOST_CHECK_EQUAL( pool->pool.value, 45 );

   share_type sum;
   for( const auto& retailer : { alice, bob, carol } )
   {
      const reward_record_object* r = db.find_reward_record( order_id, retailer );
      BOOST_REQUIRE( r != nullptr );
      sum += r->amount;
   }
   BOOST_CHECK_EQUAL( db.find_reward_record( order_id, alice )->amount.value, 10 );
   BOOST_CHECK_EQUAL( db.find_reward_record( order_id, bob )->amount.value, 15 );
   BOOST_CHECK_EQUAL( db.find_reward_record( order_id, carol )->amount.value, 20 );
   BOOST_CHECK( sum <= pool->pool );
   BOOST_CHECK( pool->pool - sum < 3 );
   BOOST_CHECK_EQUAL( pool->distributed.value, sum.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( tiny_pool_records_nothing_for_small_shares )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 3, 100 ).get_id();
   join( alice, order_id, 1 );
   join( bob, order_id, 1 );
   join( carol, order_id, 1 );
   fulfill( order_id );

   // a pool of 1 split three ways
   const reward_pool_object* pool = db.find_reward_pool( order_id );
   BOOST_REQUIRE( pool != nullptr );
   BOOST_CHECK_EQUAL( pool->pool.value, 1 );
   BOOST_CHECK_EQUAL( pool->distributed.value, 0 );
   BOOST_CHECK( db.find_reward_record( order_id, alice ) == nullptr );
   BOOST_CHECK( events_of_type<rewards_recorded_event>().empty() );
   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), no_reward_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_pool_skips_rewards )
{ try {
   ledger_parameters p = db.current_parameters();
   p.reward_bps = 0;
   update_parameters( p );

   const group_order_id_type order_id = create_group_order( manufacturer, 10, 10 ).get_id();
   join( alice, order_id, 10 );
   fulfill( order_id );

   BOOST_CHECK( db.find_reward_pool( order_id ) == nullptr );
   BOOST_CHECK_EQUAL( reward_balance( treasury ).value, initial_treasury_balance );
   BOOST_CHECK_EQUAL( events_of_type<order_processed_event>().back().reward_pool.value, 0 );
   GROUPBUY_REQUIRE_THROW( claim( order_id, alice ), no_reward_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_treasury_rolls_back_fulfillment )
{ try {
   ledger_parameters p = db.current_parameters();
   p.reward_treasury = account_id_type( 99 );
   update_parameters( p );

   const group_order_id_type order_id = create_group_order( manufacturer, 100, 10, {}, 50 ).get_id();
   join( alice, order_id, 100 );

   const auto history_size = db.get_event_history().size();
   GROUPBUY_REQUIRE_THROW( fulfill( order_id ), insufficient_funds_exception );

   // nothing was paid out
   BOOST_CHECK( db.get_group_order( order_id ).is_open() );
   BOOST_CHECK_EQUAL( payment_balance( escrow_account ).value, 1000 );
   BOOST_CHECK_EQUAL( payment_balance( manufacturer ).value, initial_balance );
   BOOST_CHECK_EQUAL( payment_balance( fee_collector ).value, 0 );
   BOOST_CHECK_EQUAL( reward_balance( escrow_account ).value, 50 );
   BOOST_CHECK_EQUAL( db.get_event_history().size(), history_size );

   fund( account_id_type( 99 ), GROUPBUY_REWARD_ASSET, 5 );
   fulfill( order_id );
   BOOST_CHECK_EQUAL( reward_balance( account_id_type( 99 ) ).value, 0 );
   BOOST_CHECK_EQUAL( claim( order_id, alice ).value, 5 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( record_rewards_guards )
{ try {
   const group_order_id_type order_id = create_group_order( manufacturer, 100, 10 ).get_id();
   join( alice, order_id, 100 );
   fulfill( order_id );

   reward_distributor* distributor = db.get_reward_distributor();
   BOOST_REQUIRE( distributor != nullptr );
   BOOST_CHECK( distributor->holder() == distributor_account );
   const auto contributions = db.get_contributions( order_id );

   GROUPBUY_REQUIRE_THROW( distributor->record_rewards( order_id, 0, 100, contributions ), invalid_parameters_exception );
   GROUPBUY_REQUIRE_THROW( distributor->record_rewards( order_id, 5, 0, contributions ), invalid_parameters_exception );
   GROUPBUY_REQUIRE_THROW( distributor->record_rewards( order_id, 1000, 100, contributions ),
                           insufficient_funds_exception );
   // the pool of 5 is already recorded
   GROUPBUY_REQUIRE_THROW( distributor->record_rewards( order_id, 5, 100, contributions ), state_conflict_exception );

   GROUPBUY_REQUIRE_THROW( distributor->claimable_record( order_id, bob ), no_reward_exception );
   BOOST_CHECK_EQUAL( distributor->claimable_record( order_id, alice ).amount.value, 5 );

   // outside of an operation nothing is recorded
   const group_order_id_type open_id = create_group_order( manufacturer, 10, 10 ).get_id();
   join( bob, open_id, 10 );
   GROUPBUY_REQUIRE_THROW( distributor->record_rewards( open_id, 5, 10, db.get_contributions( open_id ) ),
                           state_conflict_exception );
   BOOST_CHECK( db.find_reward_pool( open_id ) == nullptr );
   BOOST_CHECK( db.find_reward_record( open_id, bob ) == nullptr );

   // nor paid
   const share_type alice_before = reward_balance( alice );
   const share_type held_before = reward_balance( distributor_account );
   GROUPBUY_REQUIRE_THROW( distributor->claim( order_id, alice ), state_conflict_exception );
   BOOST_CHECK( !db.find_reward_record( order_id, alice )->claimed );
   BOOST_CHECK_EQUAL( db.find_reward_pool( order_id )->claimed.value, 0 );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, alice_before.value );
   BOOST_CHECK_EQUAL( reward_balance( distributor_account ).value, held_before.value );
   BOOST_CHECK( events_of_type<reward_claimed_event>().empty() );

   // the operation still works afterwards
   BOOST_CHECK_EQUAL( claim( order_id, alice ).value, 5 );
   BOOST_CHECK_EQUAL( reward_balance( alice ).value, alice_before.value + 5 );
   BOOST_CHECK_EQUAL( events_of_type<reward_claimed_event>().size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_parameters_test )
{ try {
   ledger_parameters p = db.current_parameters();
   BOOST_CHECK_EQUAL( p.platform_fee_bps, GROUPBUY_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( p.reward_bps, GROUPBUY_DEFAULT_REWARD_BPS );

   const group_order_id_type order_id = create_group_order( manufacturer, 10, 100 ).get_id();
   join( alice, order_id, 10 );

   p.platform_fee_bps = 500;
   p.reward_bps = 200;
   GROUPBUY_REQUIRE_THROW( update_parameters( p, manufacturer ), unauthorized_exception );

   ledger_parameters bad = p;
   bad.platform_fee_bps = GROUPBUY_100_PERCENT + 1;
   GROUPBUY_REQUIRE_THROW( update_parameters( bad ), invalid_parameters_exception );

   update_parameters( p );
   BOOST_CHECK_EQUAL( db.current_parameters().platform_fee_bps, 500 );
   const auto updates = events_of_type<parameters_updated_event>();
   BOOST_REQUIRE_EQUAL( updates.size(), 1u );
   BOOST_CHECK_EQUAL( updates[0].old_parameters.platform_fee_bps, GROUPBUY_DEFAULT_PLATFORM_FEE_BPS );
   BOOST_CHECK_EQUAL( updates[0].new_parameters.platform_fee_bps, 500 );

   // the order created before the change settles with the new parameters
   fulfill( order_id );
   BOOST_CHECK_EQUAL( payment_balance( fee_collector ).value, 50 );
   BOOST_CHECK_EQUAL( payment_balance( manufacturer ).value, initial_balance + 950 );
   BOOST_CHECK_EQUAL( db.find_reward_pool( order_id )->pool.value, 20 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
