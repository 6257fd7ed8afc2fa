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

#include <fc/exception/exception.hpp>
#include <groupbuy/protocol/exceptions.hpp>
#include <groupbuy/chain/types.hpp>

namespace groupbuy { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception,                  chain_exception,                          3010000 )

   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,            groupbuy::chain::ledger_exception,        3010100 )
   FC_DECLARE_DERIVED_EXCEPTION( state_conflict_exception,          groupbuy::chain::ledger_exception,        3010200 )
   FC_DECLARE_DERIVED_EXCEPTION( deadline_violation_exception,      groupbuy::chain::ledger_exception,        3010300 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds_exception,      groupbuy::chain::ledger_exception,        3010400 )
   FC_DECLARE_DERIVED_EXCEPTION( service_not_configured_exception,  groupbuy::chain::ledger_exception,        3010500 )

   FC_DECLARE_DERIVED_EXCEPTION( already_joined_exception,          groupbuy::chain::state_conflict_exception, 3010201 )
   FC_DECLARE_DERIVED_EXCEPTION( no_reward_exception,               groupbuy::chain::state_conflict_exception, 3010202 )
   FC_DECLARE_DERIVED_EXCEPTION( already_claimed_exception,         groupbuy::chain::state_conflict_exception, 3010203 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrancy_exception,              groupbuy::chain::state_conflict_exception, 3010204 )

} } // groupbuy::chain
