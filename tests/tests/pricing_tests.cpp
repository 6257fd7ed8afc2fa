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

#include <groupbuy/chain/pricing.hpp>

#include <fc/exception/exception.hpp>

#include <limits>

using namespace groupbuy::chain;

namespace {

   discount_tier tier( int64_t threshold, basis_points_type bps )
   {
      discount_tier t;
      t.units_threshold = threshold;
      t.discount_bps = bps;
      return t;
   }

}

BOOST_AUTO_TEST_SUITE( pricing_tests )

BOOST_AUTO_TEST_CASE( resolve_discount_picks_largest_covered_tier )
{ try {
   const vector<discount_tier> tiers = { tier( 50, 500 ), tier( 100, 1000 ) };

   BOOST_CHECK_EQUAL( resolve_discount( vector<discount_tier>(), 1000 ), 0u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 0 ), 0u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 49 ), 0u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 50 ), 500u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 99 ), 500u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 100 ), 1000u );
   BOOST_CHECK_EQUAL( resolve_discount( tiers, 1000000 ), 1000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_discount_ignores_tier_order )
{ try {
   // a later tier with a smaller discount never lowers the result
   const vector<discount_tier> unsorted = { tier( 100, 1000 ), tier( 10, 200 ), tier( 200, 700 ), tier( 50, 500 ) };

   BOOST_CHECK_EQUAL( resolve_discount( unsorted, 9 ), 0u );
   BOOST_CHECK_EQUAL( resolve_discount( unsorted, 10 ), 200u );
   BOOST_CHECK_EQUAL( resolve_discount( unsorted, 60 ), 500u );
   BOOST_CHECK_EQUAL( resolve_discount( unsorted, 150 ), 1000u );
   BOOST_CHECK_EQUAL( resolve_discount( unsorted, 250 ), 1000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( apply_discount_rounds_the_discount_down )
{ try {
   BOOST_CHECK_EQUAL( apply_discount( 10, 0 ).value, 10 );
   BOOST_CHECK_EQUAL( apply_discount( 10, 500 ).value, 10 );   // 5% of 10 rounds to nothing
   BOOST_CHECK_EQUAL( apply_discount( 10, 1000 ).value, 9 );
   BOOST_CHECK_EQUAL( apply_discount( 100, 1234 ).value, 88 );
   BOOST_CHECK_EQUAL( apply_discount( 999, 10000 ).value, 0 );
   BOOST_CHECK_EQUAL( apply_discount( 1, 9999 ).value, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cut_bps_test )
{ try {
   const int64_t max = std::numeric_limits<int64_t>::max();

   BOOST_CHECK_EQUAL( cut_bps( 900, 100 ).value, 9 );
   BOOST_CHECK_EQUAL( cut_bps( 900, 50 ).value, 4 );
   BOOST_CHECK_EQUAL( cut_bps( 0, 5000 ).value, 0 );
   BOOST_CHECK_EQUAL( cut_bps( 12345, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( cut_bps( 12345, GROUPBUY_100_PERCENT ).value, 12345 );

   // no intermediate overflow
   BOOST_CHECK_EQUAL( cut_bps( max, GROUPBUY_100_PERCENT ).value, max );
   BOOST_CHECK_EQUAL( cut_bps( max, 5000 ).value, max / 2 );
   BOOST_CHECK_EQUAL( cut_bps( max, 1 ).value, max / GROUPBUY_100_PERCENT );

   BOOST_CHECK_THROW( cut_bps( -1, 100 ), fc::assert_exception );
   BOOST_CHECK_THROW( cut_bps( 100, GROUPBUY_100_PERCENT + 1 ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
