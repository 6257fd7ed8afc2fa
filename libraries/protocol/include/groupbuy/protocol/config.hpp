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

#define GROUPBUY_MAX_NESTED_OBJECTS (200)

#define GROUPBUY_100_PERCENT                                    10000
#define GROUPBUY_1_PERCENT                                      (GROUPBUY_100_PERCENT/100)

#define GROUPBUY_DEFAULT_PLATFORM_FEE_BPS                       (1*GROUPBUY_1_PERCENT)
#define GROUPBUY_DEFAULT_REWARD_BPS                             (GROUPBUY_1_PERCENT/2)

#define GROUPBUY_MAX_DISCOUNT_TIERS                             32
#define GROUPBUY_MAX_PRODUCT_ID_LENGTH                          127
/// upper bound on the lifetime of a group order, in seconds
#define GROUPBUY_MAX_ORDER_DURATION                             (60*60*24*365)

/** Implementation-reserved participants */
///@{
/// Holds prepaid payments and stakes while orders are open
#define GROUPBUY_ESCROW_ACCOUNT (groupbuy::protocol::account_id_type(0))
/// Holds reward value on behalf of the built-in reward distributor
#define GROUPBUY_REWARD_DISTRIBUTOR_ACCOUNT (groupbuy::protocol::account_id_type(1))
/// Default administrator, fee collector and reward treasury
#define GROUPBUY_ADMINISTRATOR_ACCOUNT (groupbuy::protocol::account_id_type(2))
///@}

/// Denomination of order payments, refunds, manufacturer and fee payouts
#define GROUPBUY_PAYMENT_ASSET (groupbuy::protocol::asset_id_type(0))
/// Denomination of stakes and rewards
#define GROUPBUY_REWARD_ASSET (groupbuy::protocol::asset_id_type(1))
