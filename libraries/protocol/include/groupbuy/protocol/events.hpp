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
#include <groupbuy/protocol/ledger_parameters.hpp>

namespace groupbuy { namespace protocol {

   /**
    *  @defgroup events Ledger Events
    *  @brief Notifications published after an operation has been applied
    *
    *  Events are buffered while an operation executes and published only when it
    *  commits, so observers never see the effects of a rejected operation.
    *  @{
    */

   struct order_created_event
   {
      group_order_id_type order_id;
      account_id_type     manufacturer;
      string              product_id;
      share_type          min_units;
      share_type          initial_price;
      share_type          stake;
      time_point_sec      deadline;
   };

   struct retailer_joined_event
   {
      group_order_id_type order_id;
      account_id_type     retailer;
      share_type          units;
      share_type          amount_paid;
   };

   /// the unit price dropped after a join crossed a discount threshold
   struct price_updated_event
   {
      group_order_id_type order_id;
      share_type          old_price;
      share_type          new_price;
   };

   /// published on every join that leaves the order at or above its minimum
   struct order_ready_for_processing_event
   {
      group_order_id_type order_id;
      share_type          total_units;
   };

   struct order_processed_event
   {
      group_order_id_type order_id;
      share_type          final_price;
      share_type          net_to_manufacturer;
      share_type          platform_fee;
      share_type          total_refunds;
      share_type          reward_pool;
   };

   struct stake_returned_event
   {
      group_order_id_type order_id;
      account_id_type     manufacturer;
      share_type          amount;
   };

   struct order_cancelled_event
   {
      group_order_id_type order_id;
      account_id_type     canceller;
      share_type          total_refunded;
   };

   struct rewards_recorded_event
   {
      group_order_id_type order_id;
      account_id_type     retailer;
      share_type          amount;
   };

   struct reward_claimed_event
   {
      group_order_id_type order_id;
      account_id_type     retailer;
      share_type          amount;
   };

   struct parameters_updated_event
   {
      ledger_parameters   old_parameters;
      ledger_parameters   new_parameters;
   };

   typedef fc::static_variant<
            /* 0 */ order_created_event,
            /* 1 */ retailer_joined_event,
            /* 2 */ price_updated_event,
            /* 3 */ order_ready_for_processing_event,
            /* 4 */ order_processed_event,
            /* 5 */ stake_returned_event,
            /* 6 */ order_cancelled_event,
            /* 7 */ rewards_recorded_event,
            /* 8 */ reward_claimed_event,
            /* 9 */ parameters_updated_event
         > ledger_event;

   ///@}

} } // groupbuy::protocol

FC_REFLECT( groupbuy::protocol::order_created_event,
            (order_id)(manufacturer)(product_id)(min_units)(initial_price)(stake)(deadline) )
FC_REFLECT( groupbuy::protocol::retailer_joined_event, (order_id)(retailer)(units)(amount_paid) )
FC_REFLECT( groupbuy::protocol::price_updated_event, (order_id)(old_price)(new_price) )
FC_REFLECT( groupbuy::protocol::order_ready_for_processing_event, (order_id)(total_units) )
FC_REFLECT( groupbuy::protocol::order_processed_event,
            (order_id)(final_price)(net_to_manufacturer)(platform_fee)(total_refunds)(reward_pool) )
FC_REFLECT( groupbuy::protocol::stake_returned_event, (order_id)(manufacturer)(amount) )
FC_REFLECT( groupbuy::protocol::order_cancelled_event, (order_id)(canceller)(total_refunded) )
FC_REFLECT( groupbuy::protocol::rewards_recorded_event, (order_id)(retailer)(amount) )
FC_REFLECT( groupbuy::protocol::reward_claimed_event, (order_id)(retailer)(amount) )
FC_REFLECT( groupbuy::protocol::parameters_updated_event, (old_parameters)(new_parameters) )

FC_REFLECT_TYPENAME( groupbuy::protocol::ledger_event )
