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

#include <groupbuy/protocol/types.hpp>
#include <groupbuy/protocol/exceptions.hpp>

namespace groupbuy { namespace protocol {

   /**
    *  @defgroup operations Ledger Operations
    *  @brief A set of valid state transitions of the group-buying ledger
    *
    *  An operation names the account that submits it and carries everything the
    *  evaluator needs; authentication of that account is left to whoever hands the
    *  operation to the ledger.
    *
    *  Operations have two stages of validation. The first stage, validate(), checks
    *  that the operation is self-consistent without looking at ledger state; the
    *  second stage is the evaluator's do_evaluate(), which checks it against the
    *  current state.
    *
    *  @{
    */

   /// created object id for create operations, the paid amount for claims
   typedef fc::static_variant<void_result,object_id_type,share_type> operation_result;

   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const {}
   };

   ///@}

} } // groupbuy::protocol

FC_REFLECT_TYPENAME( groupbuy::protocol::operation_result )
