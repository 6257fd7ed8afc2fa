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
#include <groupbuy/protocol/group_order.hpp>

namespace groupbuy { namespace protocol {

void discount_tier::validate()const
{
   GROUPBUY_ASSERT( units_threshold > 0, invalid_parameters_exception,
                    "Discount tier threshold must be positive", ("tier",*this) );
   GROUPBUY_ASSERT( discount_bps <= GROUPBUY_100_PERCENT, invalid_parameters_exception,
                    "Discount can not exceed 100%", ("tier",*this) );
}

void group_order_create_operation::validate()const
{
   GROUPBUY_ASSERT( min_units > 0, invalid_parameters_exception, "Minimum units must be positive",
                    ("min_units",min_units) );
   GROUPBUY_ASSERT( initial_price > 0, invalid_parameters_exception, "Initial price must be positive",
                    ("initial_price",initial_price) );
   GROUPBUY_ASSERT( stake >= 0, invalid_parameters_exception, "Stake can not be negative", ("stake",stake) );
   GROUPBUY_ASSERT( duration > 0 && duration <= GROUPBUY_MAX_ORDER_DURATION, invalid_parameters_exception,
                    "Duration out of range", ("duration",duration)("max",GROUPBUY_MAX_ORDER_DURATION) );
   GROUPBUY_ASSERT( product_id.size() <= GROUPBUY_MAX_PRODUCT_ID_LENGTH, invalid_parameters_exception,
                    "Product id too long", ("length",product_id.size()) );
   GROUPBUY_ASSERT( discount_tiers.size() <= GROUPBUY_MAX_DISCOUNT_TIERS, invalid_parameters_exception,
                    "Too many discount tiers", ("count",discount_tiers.size()) );
   for( const auto& tier : discount_tiers )
      tier.validate();
}

void group_order_join_operation::validate()const
{
   GROUPBUY_ASSERT( units > 0, invalid_parameters_exception, "Units must be positive", ("units",units) );
}

} } // groupbuy::protocol
