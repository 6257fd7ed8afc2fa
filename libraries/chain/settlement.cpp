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
#include <groupbuy/chain/settlement.hpp>
#include <groupbuy/chain/pricing.hpp>

namespace groupbuy { namespace chain {

share_type fulfillment_result::total_refunds()const
{
   share_type total;
   for( const auto& amount : refund_amounts )
      total += amount;
   return total;
}

fulfillment_result compute_settlement( const group_order_object& order,
                                       const vector<contribution_object>& contributions,
                                       basis_points_type platform_fee_bps )
{ try {
   fulfillment_result result;
   if( contributions.empty() )
      return result;

   result.final_price = apply_discount( order.initial_price, resolve_discount( order.discount_tiers, order.total_units ) );

   const share_type gross = order.total_units * result.final_price;
   result.platform_fee = cut_bps( gross, platform_fee_bps );
   result.net_to_manufacturer = gross - result.platform_fee;

   for( const auto& c : contributions )
   {
      const share_type ideal = c.units * result.final_price;
      if( c.amount_paid > ideal )
      {
         result.refund_recipients.push_back( c.retailer );
         result.refund_amounts.push_back( c.amount_paid - ideal );
      }
   }

   result.total_value_for_reward_calc = gross;
   return result;
} FC_CAPTURE_AND_RETHROW( (order.id)(platform_fee_bps) ) }

} } // groupbuy::chain
