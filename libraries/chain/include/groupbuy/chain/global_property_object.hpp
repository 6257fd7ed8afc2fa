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
#include <groupbuy/db/object.hpp>

namespace groupbuy { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the administrator and the current settlement parameters
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail. The parameters are changed by the administrator
    * through ledger_parameters_update_operation.
    */
   class global_property_object : public groupbuy::db::abstract_object<global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         account_id_type    administrator = GROUPBUY_ADMINISTRATOR_ACCOUNT;
         ledger_parameters  parameters;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state that changes as the ledger runs
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_dynamic_global_property_object_type;

         time_point_sec    time;
         uint64_t          applied_operations = 0;
   };

} } // groupbuy::chain

MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::global_property_object )
MAP_OBJECT_ID_TO_TYPE( groupbuy::chain::dynamic_global_property_object )

FC_REFLECT_DERIVED( groupbuy::chain::global_property_object, (groupbuy::db::object),
                    (administrator)(parameters) )
FC_REFLECT_DERIVED( groupbuy::chain::dynamic_global_property_object, (groupbuy::db::object),
                    (time)(applied_operations) )
