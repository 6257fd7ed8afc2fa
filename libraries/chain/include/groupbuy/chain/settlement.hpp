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

namespace groupbuy { namespace chain {

   /**
    *  @brief how the value collected by an order is split at settlement
    *
    *  refund_recipients and refund_amounts are parallel and follow join order.
    */
   struct fulfillment_result
   {
      share_type              final_price;
      share_type              net_to_manufacturer;
      share_type              platform_fee;
      vector<account_id_type> refund_recipients;
      vector<share_type>      refund_amounts;
      share_type              total_value_for_reward_calc;

      share_type total_refunds()const;
   };

   /**
    *  Computes the settlement of @p order from its @p contributions.
    *
    *  The final price is the discount price for the order's total units; the gross value
    *  total_units * final_price is split into the platform fee and the manufacturer's net
    *  payment, and every retailer that paid more than units * final_price is refunded the
    *  difference.  Nothing is ever collected from a retailer that paid less.
    */
   fulfillment_result compute_settlement( const group_order_object& order,
                                          const vector<contribution_object>& contributions,
                                          basis_points_type platform_fee_bps );

   /**
    * @class settlement_calculator
    * @brief the settlement service the ledger consults when an order is fulfilled
    */
   class settlement_calculator
   {
      public:
         virtual ~settlement_calculator(){}

         virtual fulfillment_result compute( const group_order_object& order,
                                             const vector<contribution_object>& contributions,
                                             basis_points_type platform_fee_bps )const = 0;
   };

   class default_settlement_calculator : public settlement_calculator
   {
      public:
         fulfillment_result compute( const group_order_object& order,
                                     const vector<contribution_object>& contributions,
                                     basis_points_type platform_fee_bps )const override
         {
            return compute_settlement( order, contributions, platform_fee_bps );
         }
   };

} } // groupbuy::chain

FC_REFLECT( groupbuy::chain::fulfillment_result,
            (final_price)(net_to_manufacturer)(platform_fee)(refund_recipients)(refund_amounts)
            (total_value_for_reward_calc) )
