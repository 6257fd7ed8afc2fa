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
    *  @brief the reward a retailer earned at the settlement of an order
    *  @ingroup object
    *
    *  Created once when the rewards of an order are recorded, @ref claimed flips to true
    *  exactly once; records are never removed.
    */
   class reward_record_object : public abstract_object<reward_record_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = reward_record_object_type;

         group_order_id_type    order;
         account_id_type        retailer;
         share_type             amount;
         bool                   claimed = false;
   };

   /**
    *  @brief tracks the reward pool funded for a settled order
    *  @ingroup object
    *
    *  @ref distributed is the sum of the recorded rewards; the difference to @ref pool is
    *  rounding dust that stays with the distributor.
    */
   class reward_pool_object : public abstract_object<reward_pool_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = reward_pool_object_type;

         group_order_id_type    order;
         share_type             pool;
         share_type             total_units;
         share_type             distributed;
         share_type             claimed;

         share_type dust()const { return pool - distributed; }
   };

   struct by_order_retailer;
   struct by_order;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      reward_record_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order_retailer>,
            composite_key< reward_record_object,
               member< reward_record_object, group_order_id_type, &reward_record_object::order >,
               member< reward_record_object, account_id_type, &reward_record_object::retailer >
            >
         >
      >
   > reward_record_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<reward_record_object, reward_record_multi_index_type> reward_record_index;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      reward_pool_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order>, member< reward_pool_object, group_order_id_type, &reward_pool_object::order > >
      >
   > reward_pool_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<reward_pool_object, reward_pool_multi_index_type> reward_pool_index;

} } // groupbuy::chain

MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::reward_record_object )
MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::reward_pool_object )

FC_REFLECT_DERIVED( groupbuy::chain::reward_record_object, (groupbuy::db::object),
                    (order)(retailer)(amount)(claimed) )
FC_REFLECT_DERIVED( groupbuy::chain::reward_pool_object, (groupbuy::db::object),
                    (order)(pool)(total_units)(distributed)(claimed) )
