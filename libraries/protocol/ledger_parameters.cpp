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
#include <groupbuy/protocol/ledger_parameters.hpp>

namespace groupbuy { namespace protocol {

void ledger_parameters::validate()const
{
   GROUPBUY_ASSERT( platform_fee_bps <= GROUPBUY_100_PERCENT, invalid_parameters_exception,
                    "Platform fee can not exceed 100%", ("platform_fee_bps",platform_fee_bps) );
   GROUPBUY_ASSERT( reward_bps <= GROUPBUY_100_PERCENT, invalid_parameters_exception,
                    "Reward share can not exceed 100%", ("reward_bps",reward_bps) );
}

void ledger_parameters_update_operation::validate()const
{
   new_parameters.validate();
}

} } // groupbuy::protocol
