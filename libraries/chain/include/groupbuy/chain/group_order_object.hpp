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
#include <groupbuy/protocol/group_order.hpp>
#include <groupbuy/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace groupbuy { namespace chain {

   enum class group_order_status
   {
      open,
      fulfilled,
      cancelled
   };

   /**
    *  @brief a manufacturer's bulk offer that retailers join until it is settled or cancelled
    *  @ingroup object
    *  @ingroup protocol
    *
    *  An order is open while @ref active is set. Fulfillment clears @ref active and sets
    *  @ref fulfilled, cancellation only clears @ref active; neither transition can be undone
    *  by a later operation.
    */
   class group_order_object : public abstract_object<group_order_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = group_order_object_type;

         account_id_type        manufacturer;
         string                 product_id;
         share_type             min_units;
         share_type             initial_price;
         share_type             current_price;         ///< never above initial_price
         share_type             total_units;           ///< sum of the units of every contribution
         share_type             total_value;           ///< sum of the amounts paid by every contribution
         share_type             stake;
         vector<discount_tier>  discount_tiers;        ///< frozen at creation
         time_point_sec         created;
         time_point_sec         deadline;
         bool                   active = true;
         bool                   fulfilled = false;

         group_order_id_type get_id()const { return group_order_id_type( id ); }

         group_order_status status()const
         {
            if( active ) return group_order_status::open;
            return fulfilled ? group_order_status::fulfilled : group_order_status::cancelled;
         }
         bool is_open()const { return active; }
         bool threshold_reached()const { return total_units >= min_units; }
   };

   /**
    *  @brief the units a retailer committed to an order and the amount it prepaid for them
    *  @ingroup object
    *
    *  There is at most one contribution per (order, retailer). Contributions are never
    *  modified; refunds paid at settlement or cancellation leave them untouched.
    */
   class contribution_object : public abstract_object<contribution_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = contribution_object_type;

         group_order_id_type    order;
         account_id_type        retailer;
         share_type             units;
         share_type             amount_paid;  ///< units times the order price at the time of joining
   };

   struct by_manufacturer;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      group_order_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_manufacturer>,
            composite_key< group_order_object,
               member< group_order_object, account_id_type, &group_order_object::manufacturer >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > group_order_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<group_order_object, group_order_multi_index_type> group_order_index;

   struct by_order;
   struct by_order_retailer;

   /**
    * @ingroup object_index
    *
    * by_order iterates the contributions of one order in join order, ids being sequential.
    */
   typedef multi_index_container<
      contribution_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order>,
            composite_key< contribution_object,
               member< contribution_object, group_order_id_type, &contribution_object::order >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_order_retailer>,
            composite_key< contribution_object,
               member< contribution_object, group_order_id_type, &contribution_object::order >,
               member< contribution_object, account_id_type, &contribution_object::retailer >
            >
         >
      >
   > contribution_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<contribution_object, contribution_multi_index_type> contribution_index;

} } // groupbuy::chain

MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::group_order_object )
MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::contribution_object )

FC_REFLECT_ENUM( groupbuy::chain::group_order_status, (open)(fulfilled)(cancelled) )

FC_REFLECT_DERIVED( groupbuy::chain::group_order_object, (groupbuy::db::object),
                    (manufacturer)(product_id)(min_units)(initial_price)(current_price)
                    (total_units)(total_value)(stake)(discount_tiers)(created)(deadline)
                    (active)(fulfilled) )

FC_REFLECT_DERIVED( groupbuy::chain::contribution_object, (groupbuy::db::object),
                    (order)(retailer)(units)(amount_paid) )
