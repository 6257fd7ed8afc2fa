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
#include <groupbuy/chain/exceptions.hpp>

namespace groupbuy { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_exception,                 chain_exception,          3010000, "ledger operation rejected" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,           ledger_exception,         3010100, "unauthorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( state_conflict_exception,         ledger_exception,         3010200, "state conflict" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( deadline_violation_exception,     ledger_exception,         3010300, "deadline violation" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_funds_exception,     ledger_exception,         3010400, "insufficient funds" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( service_not_configured_exception, ledger_exception,         3010500, "service not configured" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( already_joined_exception,         state_conflict_exception, 3010201, "retailer already joined the order" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_reward_exception,              state_conflict_exception, 3010202, "no reward to claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_claimed_exception,        state_conflict_exception, 3010203, "reward already claimed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( reentrancy_exception,             state_conflict_exception, 3010204, "re-entrant ledger call" )

} } // groupbuy::chain
