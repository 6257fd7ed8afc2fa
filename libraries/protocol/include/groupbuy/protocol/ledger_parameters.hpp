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
#include <groupbuy/protocol/base.hpp>

namespace groupbuy { namespace protocol {

   /**
    * Global settlement parameters. They are read when an order is fulfilled, so a change
    * applies to every settlement executed afterwards, including orders created before it.
    */
   struct ledger_parameters
   {
      basis_points_type platform_fee_bps = GROUPBUY_DEFAULT_PLATFORM_FEE_BPS; ///< share of the gross value paid to the fee collector
      basis_points_type reward_bps       = GROUPBUY_DEFAULT_REWARD_BPS;       ///< share of the gross value funded as reward pool
      account_id_type   fee_collector    = GROUPBUY_ADMINISTRATOR_ACCOUNT;
      account_id_type   reward_treasury  = GROUPBUY_ADMINISTRATOR_ACCOUNT;           ///< funds reward pools in the reward asset

      void validate()const;
   };

   /**
    * @brief Replace the global ledger parameters
    * @ingroup operations
    *
    * Only the ledger administrator may submit this operation.
    */
   struct ledger_parameters_update_operation : public base_operation
   {
      account_id_type   administrator;
      ledger_parameters new_parameters;

      account_id_type signer()const { return administrator; }
      void            validate()const override;
   };

} } // groupbuy::protocol

FC_REFLECT( groupbuy::protocol::ledger_parameters,
            (platform_fee_bps)(reward_bps)(fee_collector)(reward_treasury) )
FC_REFLECT( groupbuy::protocol::ledger_parameters_update_operation, (administrator)(new_parameters) )
