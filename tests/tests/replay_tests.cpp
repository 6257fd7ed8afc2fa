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
#include <groupbuy/chain/replay.hpp>

#include "../common/database_fixture.hpp"

using namespace groupbuy::chain;
using namespace groupbuy::chain::test;

namespace {

   replay_step step( const operation& op, uint32_t advance_seconds = 0 )
   {
      replay_step s;
      s.advance_seconds = advance_seconds;
      s.op = op;
      return s;
   }

}

BOOST_FIXTURE_TEST_SUITE( replay_tests, database_fixture )

BOOST_AUTO_TEST_CASE( replay_reports_rejected_steps )
{ try {
   const group_order_id_type order_id( 0 );

   group_order_join_operation join_op;
   join_op.retailer = alice;
   join_op.order_id = order_id;
   join_op.units = 10;

   group_order_fulfill_operation fulfill_op;
   fulfill_op.executor = bob;
   fulfill_op.order_id = order_id;

   group_order_cancel_operation cancel_op;
   cancel_op.canceller = manufacturer;
   cancel_op.order_id = order_id;

   const fc::time_point_sec start = db.head_time();
   const vector<replay_step> steps = {
      step( make_create_op( manufacturer, 10, 10 ) ),
      step( join_op, 60 ),
      step( join_op ),              // second join of the same retailer
      step( fulfill_op ),
      step( cancel_op, 100000 )     // already fulfilled
   };

   const replay_report report = replay( db, steps );

   BOOST_CHECK_EQUAL( report.applied, 3u );
   BOOST_CHECK( report.rejected_steps == ( vector<uint32_t>{ 2, 4 } ) );
   BOOST_CHECK( db.get_group_order( order_id ).status() == group_order_status::fulfilled );
   BOOST_CHECK_EQUAL( db.get_contributions( order_id ).size(), 1u );
   BOOST_CHECK_EQUAL( events_of_type<order_processed_event>().size(), 1u );
   BOOST_CHECK( events_of_type<order_cancelled_event>().empty() );
   BOOST_CHECK( db.head_time() == start + 100060 );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().applied_operations, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_replay )
{ try {
   const replay_report report = replay( db, vector<replay_step>() );
   BOOST_CHECK_EQUAL( report.applied, 0u );
   BOOST_CHECK( report.rejected_steps.empty() );
   BOOST_CHECK( db.get_event_history().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
