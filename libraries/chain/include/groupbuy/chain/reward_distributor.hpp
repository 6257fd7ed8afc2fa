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
#pragma once

#include <groupbuy/chain/group_order_object.hpp>
#include <groupbuy/chain/reward_object.hpp>
#include <groupbuy/chain/value_transfer_port.hpp>

namespace groupbuy { namespace chain {

   class database;

   /**
    *  @class reward_distributor
    *  @brief records the reward pool of settled orders and pays out individual claims
    *
    *  The distributor holds reward value in the account of its own port.  Each pool is
    *  split in proportion to the units of every contribution, rounding down; what rounding
    *  leaves over stays with the distributor.
    */
   class reward_distributor
   {
      public:
         reward_distributor( database& db, std::shared_ptr<value_transfer_port> reward_port );

         account_id_type      holder()const { return _port->holder(); }
         value_transfer_port& port()const   { return *_port; }

         /**
          * Records one reward per contribution with a non-zero share of @p total_reward_pool.
          * Can be called only once per order, only from an operation being applied, and only
          * after the pool has been transferred to holder().
          */
         void record_rewards( group_order_id_type order,
                              share_type total_reward_pool,
                              share_type total_units,
                              const vector<contribution_object>& contributions );

         /**
          * @return the unclaimed reward of @p claimer for @p order
          * @throws no_reward_exception, already_claimed_exception
          */
         const reward_record_object& claimable_record( group_order_id_type order, account_id_type claimer )const;

         /**
          * Marks the reward of @p claimer as claimed and pays it out.  Only valid while an
          * operation is applied, so that a failure rolls back both.
          * @return the amount paid
          */
         share_type claim( group_order_id_type order, account_id_type claimer );

      private:
         database&                            _db;
         std::shared_ptr<value_transfer_port> _port;
   };

} } // groupbuy::chain
