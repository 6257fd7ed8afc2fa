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
#include <groupbuy/chain/reward_evaluator.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/reward_distributor.hpp>

namespace groupbuy { namespace chain {

void_result reward_claim_evaluator::do_evaluate( const reward_claim_operation& o )
{ try {
   const database& d = db();
   d.get_group_order( o.order_id );

   _distributor = d.get_reward_distributor();
   GROUPBUY_ASSERT( _distributor != nullptr, service_not_configured_exception,
                    "No reward distributor is configured" );
   _distributor->claimable_record( o.order_id, o.claimer );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

share_type reward_claim_evaluator::do_apply( const reward_claim_operation& o )
{ try {
   return _distributor->claim( o.order_id, o.claimer );
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // groupbuy::chain
