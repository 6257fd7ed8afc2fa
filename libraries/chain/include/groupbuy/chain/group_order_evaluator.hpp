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
#include <groupbuy/chain/evaluator.hpp>
#include <groupbuy/chain/group_order_object.hpp>

namespace groupbuy { namespace chain {

   class settlement_calculator;
   class reward_distributor;

   class group_order_create_evaluator : public evaluator<group_order_create_evaluator>
   {
      public:
         typedef group_order_create_operation operation_type;

         void_result    do_evaluate( const group_order_create_operation& o );
         object_id_type do_apply( const group_order_create_operation& o );
   };

   class group_order_join_evaluator : public evaluator<group_order_join_evaluator>
   {
      public:
         typedef group_order_join_operation operation_type;

         void_result    do_evaluate( const group_order_join_operation& o );
         object_id_type do_apply( const group_order_join_operation& o );

      private:
         const group_order_object* _order = nullptr;
         share_type                _cost;
   };

   class group_order_fulfill_evaluator : public evaluator<group_order_fulfill_evaluator>
   {
      public:
         typedef group_order_fulfill_operation operation_type;

         void_result do_evaluate( const group_order_fulfill_operation& o );
         void_result do_apply( const group_order_fulfill_operation& o );

      private:
         const group_order_object*    _order = nullptr;
         const settlement_calculator* _calculator = nullptr;
         reward_distributor*          _distributor = nullptr;
   };

   class group_order_cancel_evaluator : public evaluator<group_order_cancel_evaluator>
   {
      public:
         typedef group_order_cancel_operation operation_type;

         void_result do_evaluate( const group_order_cancel_operation& o );
         void_result do_apply( const group_order_cancel_operation& o );

      private:
         const group_order_object* _order = nullptr;
   };

} } // groupbuy::chain
