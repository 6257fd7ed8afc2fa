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
#include <groupbuy/protocol/ledger_parameters.hpp>

namespace groupbuy { namespace chain {

struct genesis_state_type {
   struct initial_balance_type {
      account_id_type owner;
      asset_id_type   asset_type;
      share_type      amount;
   };

   time_point_sec                     initial_timestamp;
   account_id_type                    administrator = GROUPBUY_ADMINISTRATOR_ACCOUNT;
   ledger_parameters                  initial_parameters;
   vector<initial_balance_type>       initial_balances;
};

} } // namespace groupbuy::chain

FC_REFLECT( groupbuy::chain::genesis_state_type::initial_balance_type, (owner)(asset_type)(amount) )
FC_REFLECT( groupbuy::chain::genesis_state_type,
            (initial_timestamp)(administrator)(initial_parameters)(initial_balances) )
