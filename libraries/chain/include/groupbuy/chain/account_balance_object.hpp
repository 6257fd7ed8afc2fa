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
#include <groupbuy/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace groupbuy { namespace chain {

   /**
    * @brief Tracks the balance of a single account/asset pair
    * @ingroup object
    *
    * Balances are only moved between accounts by operations; the sum over all accounts
    * of one asset changes only when value is issued at genesis or by the host.
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_account_balance_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         share_type        balance;
   };

   struct by_account_asset;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_asset>,
            composite_key< account_balance_object,
               member< account_balance_object, account_id_type, &account_balance_object::owner >,
               member< account_balance_object, asset_id_type, &account_balance_object::asset_type >
            >
         >
      >
   > account_balance_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

} } // groupbuy::chain

MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::account_balance_object )

FC_REFLECT_DERIVED( groupbuy::chain::account_balance_object, (groupbuy::db::object),
                    (owner)(asset_type)(balance) )
