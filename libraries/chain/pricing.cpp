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
#include <groupbuy/chain/pricing.hpp>

#include <fc/uint128.hpp>

namespace groupbuy { namespace chain {

basis_points_type resolve_discount( const vector<discount_tier>& tiers, share_type units_committed )
{
   basis_points_type best = 0;
   for( const auto& tier : tiers )
   {
      if( tier.units_threshold <= units_committed && tier.discount_bps > best )
         best = tier.discount_bps;
   }
   return best;
}

share_type cut_bps( share_type amount, basis_points_type bps )
{
   FC_ASSERT( amount >= 0, "Amount can not be negative", ("amount",amount) );
   FC_ASSERT( bps <= GROUPBUY_100_PERCENT, "Percentage out of range", ("bps",bps) );
   if( amount == 0 || bps == 0 )
      return 0;
   if( bps == GROUPBUY_100_PERCENT )
      return amount;

   fc::uint128_t r = amount.value;
   r *= bps;
   r /= GROUPBUY_100_PERCENT;
   return static_cast<int64_t>(r);
}

share_type apply_discount( share_type price, basis_points_type discount_bps )
{
   return price - cut_bps( price, discount_bps );
}

} } // groupbuy::chain
