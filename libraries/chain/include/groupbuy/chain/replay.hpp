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

#include <groupbuy/protocol/operations.hpp>
#include <groupbuy/chain/types.hpp>

namespace groupbuy { namespace chain {

   class database;

   /// one entry of a replay script: let time pass, then push an operation
   struct replay_step
   {
      uint32_t  advance_seconds = 0;
      operation op;
   };

   struct replay_report
   {
      uint32_t         applied = 0;
      /// indexes into the script of the steps the ledger rejected
      vector<uint32_t> rejected_steps;
   };

   /**
    * Applies @p steps in order.  A rejected step leaves the ledger unchanged and is logged
    * with its index; the remaining steps are still applied.
    */
   replay_report replay( database& db, const vector<replay_step>& steps );

} } // groupbuy::chain

FC_REFLECT( groupbuy::chain::replay_step, (advance_seconds)(op) )
FC_REFLECT( groupbuy::chain::replay_report, (applied)(rejected_steps) )
