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

#include <groupbuy/chain/types.hpp>
#include <groupbuy/protocol/group_order.hpp>

namespace groupbuy { namespace chain {

   /**
    * @return the largest discount among the tiers whose threshold is covered by
    * @p units_committed, 0 when none is.  Tier order does not matter.
    */
   basis_points_type resolve_discount( const vector<discount_tier>& tiers, share_type units_committed );

   /**
    * @return @p price less its @p discount_bps share, the share being rounded down
    */
   share_type apply_discount( share_type price, basis_points_type discount_bps );

   /**
    * @return floor( amount * bps / GROUPBUY_100_PERCENT ), computed without intermediate overflow
    */
   share_type cut_bps( share_type amount, basis_points_type bps );

} } // groupbuy::chain
