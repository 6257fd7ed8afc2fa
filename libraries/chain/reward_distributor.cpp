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
#include <groupbuy/chain/reward_distributor.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>

#include <fc/uint128.hpp>

namespace groupbuy { namespace chain {

reward_distributor::reward_distributor( database& db, std::shared_ptr<value_transfer_port> reward_port )
   : _db(db), _port(reward_port)
{
   FC_ASSERT( _port != nullptr, "A reward distributor needs a value transfer port" );
}

void reward_distributor::record_rewards( group_order_id_type order,
                                         share_type total_reward_pool,
                                         share_type total_units,
                                         const vector<contribution_object>& contributions )
{ try {
   GROUPBUY_ASSERT( total_reward_pool > 0 && total_units > 0, invalid_parameters_exception,
                    "Reward pool and units must be positive", ("pool",total_reward_pool)("units",total_units) );
   GROUPBUY_ASSERT( _port->balance_of( holder() ) >= total_reward_pool, insufficient_funds_exception,
                    "Distributor holds ${b}, less than the reward pool of ${p}",
                    ("b",_port->balance_of( holder() ))("p",total_reward_pool) );
   GROUPBUY_ASSERT( _db.find_reward_pool( order ) == nullptr, state_conflict_exception,
                    "Rewards of order ${o} were already recorded", ("o",order) );
   GROUPBUY_ASSERT( _db.is_applying(), state_conflict_exception,
                    "Rewards of order ${o} can only be recorded by a fulfillment", ("o",order) );

   share_type distributed;
   for( const auto& c : contributions )
   {
      if( c.units <= 0 )
         continue;

      fc::uint128_t r = total_reward_pool.value;
      r *= c.units.value;
      r /= total_units.value;
      const share_type reward = static_cast<int64_t>(r);
      if( reward == 0 )
         continue;

      _db.create<reward_record_object>( [&]( reward_record_object& rec ) {
         rec.order = order;
         rec.retailer = c.retailer;
         rec.amount = reward;
      });
      distributed += reward;
      _db.push_event( rewards_recorded_event{ order, c.retailer, reward } );
   }
   FC_ASSERT( distributed <= total_reward_pool, "Distributed rewards exceed the pool",
              ("distributed",distributed)("pool",total_reward_pool) );

   _db.create<reward_pool_object>( [&]( reward_pool_object& p ) {
      p.order = order;
      p.pool = total_reward_pool;
      p.total_units = total_units;
      p.distributed = distributed;
   });
} FC_CAPTURE_AND_RETHROW( (order)(total_reward_pool)(total_units) ) }

const reward_record_object& reward_distributor::claimable_record( group_order_id_type order, account_id_type claimer )const
{
   const auto* record = _db.find_reward_record( order, claimer );
   GROUPBUY_ASSERT( record != nullptr && record->amount > 0, no_reward_exception,
                    "${c} has no reward for order ${o}", ("c",claimer)("o",order) );
   GROUPBUY_ASSERT( !record->claimed, already_claimed_exception,
                    "${c} already claimed the reward for order ${o}", ("c",claimer)("o",order) );
   return *record;
}

share_type reward_distributor::claim( group_order_id_type order, account_id_type claimer )
{ try {
   GROUPBUY_ASSERT( _db.is_applying(), state_conflict_exception,
                    "Rewards can only be claimed through a reward_claim_operation", ("o",order)("c",claimer) );
   const auto& record = claimable_record( order, claimer );
   const share_type amount = record.amount;

   _db.modify( record, []( reward_record_object& r ) {
      r.claimed = true;
   });
   if( const auto* pool = _db.find_reward_pool( order ) )
      _db.modify( *pool, [amount]( reward_pool_object& p ) {
         p.claimed += amount;
      });

   _port->checked_transfer( claimer, amount );
   _db.push_event( reward_claimed_event{ order, claimer, amount } );
   return amount;
} FC_CAPTURE_AND_RETHROW( (order)(claimer) ) }

} } // groupbuy::chain
