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

namespace groupbuy { namespace chain {

   class database;

   /**
    *  @class value_transfer_port
    *  @brief moves fungible value of one denomination between accounts
    *
    *  The ledger never touches balances directly; every payment, refund, stake and reward
    *  goes through a port.  A port reports a failed transfer by returning false, callers
    *  that can not continue without the transfer use the checked_ variants, which raise
    *  insufficient_funds_exception instead.
    */
   class value_transfer_port
   {
      public:
         virtual ~value_transfer_port(){}

         /// moves @p amount from @p from to @p to
         virtual bool            transfer_from( account_id_type from, account_id_type to, share_type amount ) = 0;
         /// moves @p amount from holder() to @p to
         virtual bool            transfer( account_id_type to, share_type amount ) = 0;
         virtual share_type      balance_of( account_id_type owner )const = 0;
         /// the account this port pays from in transfer()
         virtual account_id_type holder()const = 0;

         void checked_transfer_from( account_id_type from, account_id_type to, share_type amount );
         void checked_transfer( account_id_type to, share_type amount );
   };

   /**
    *  @class balance_transfer_port
    *  @brief transfers value kept as account_balance_object entries of the database
    *
    *  Balance changes made through this port are part of the operation being applied and
    *  are rolled back with it.
    */
   class balance_transfer_port : public value_transfer_port
   {
      public:
         balance_transfer_port( database& db, asset_id_type asset_type, account_id_type holder );

         bool            transfer_from( account_id_type from, account_id_type to, share_type amount ) override;
         bool            transfer( account_id_type to, share_type amount ) override;
         share_type      balance_of( account_id_type owner )const override;
         account_id_type holder()const override { return _holder; }

         asset_id_type   asset_type()const { return _asset_type; }

      private:
         database&       _db;
         asset_id_type   _asset_type;
         account_id_type _holder;
   };

} } // groupbuy::chain
