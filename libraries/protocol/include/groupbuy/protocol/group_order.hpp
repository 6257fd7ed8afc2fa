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
#include <groupbuy/protocol/base.hpp>

namespace groupbuy { namespace protocol {

   /**
    * @brief a volume discount that applies once an order has collected @ref units_threshold units
    */
   struct discount_tier
   {
      share_type        units_threshold;
      basis_points_type discount_bps = 0;

      void validate()const;
   };

   /**
    * @brief Post a bulk order that retailers may join until the deadline
    * @ingroup operations
    *
    * The optional stake is collected from the manufacturer in the reward asset and is
    * returned when the order is fulfilled or cancelled.
    */
   struct group_order_create_operation : public base_operation
   {
      account_id_type       manufacturer;
      string                product_id;      ///< opaque product identifier
      share_type            min_units;       ///< units required before the order can be fulfilled
      share_type            initial_price;   ///< price per unit before any discount
      share_type            stake;           ///< deposit in the reward asset, may be zero
      vector<discount_tier> discount_tiers;
      uint32_t              duration = 0;    ///< seconds from creation until the fulfillment deadline

      account_id_type signer()const { return manufacturer; }
      void            validate()const override;
   };

   /**
    * @brief Commit units to an open order, prepaying them at the current price
    * @ingroup operations
    */
   struct group_order_join_operation : public base_operation
   {
      account_id_type      retailer;
      group_order_id_type  order_id;
      share_type           units;

      account_id_type signer()const { return retailer; }
      void            validate()const override;
   };

   /**
    * @brief Settle an order whose minimum was reached
    * @ingroup operations
    *
    * Anyone may execute the fulfillment once the threshold is met.
    */
   struct group_order_fulfill_operation : public base_operation
   {
      account_id_type      executor;
      group_order_id_type  order_id;

      account_id_type signer()const { return executor; }
   };

   /**
    * @brief Cancel an expired order that did not reach its minimum
    * @ingroup operations
    *
    * Only the manufacturer or the ledger administrator may cancel.
    */
   struct group_order_cancel_operation : public base_operation
   {
      account_id_type      canceller;
      group_order_id_type  order_id;

      account_id_type signer()const { return canceller; }
   };

   /**
    * @brief Claim the reward recorded for the claimer at the settlement of an order
    * @ingroup operations
    */
   struct reward_claim_operation : public base_operation
   {
      account_id_type      claimer;
      group_order_id_type  order_id;

      account_id_type signer()const { return claimer; }
   };

} } // groupbuy::protocol

FC_REFLECT( groupbuy::protocol::discount_tier, (units_threshold)(discount_bps) )
FC_REFLECT( groupbuy::protocol::group_order_create_operation,
            (manufacturer)(product_id)(min_units)(initial_price)(stake)(discount_tiers)(duration) )
FC_REFLECT( groupbuy::protocol::group_order_join_operation, (retailer)(order_id)(units) )
FC_REFLECT( groupbuy::protocol::group_order_fulfill_operation, (executor)(order_id) )
FC_REFLECT( groupbuy::protocol::group_order_cancel_operation, (canceller)(order_id) )
FC_REFLECT( groupbuy::protocol::reward_claim_operation, (claimer)(order_id) )
