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
#include <groupbuy/chain/group_order_evaluator.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/pricing.hpp>
#include <groupbuy/chain/reward_distributor.hpp>
#include <groupbuy/chain/settlement.hpp>
#include <groupbuy/chain/value_transfer_port.hpp>

namespace groupbuy { namespace chain {

void_result group_order_create_evaluator::do_evaluate( const group_order_create_operation& o )
{ try {
   if( o.stake > 0 )
   {
      const auto& stakes = db().reward_port();
      GROUPBUY_ASSERT( stakes.balance_of( o.manufacturer ) >= o.stake, insufficient_funds_exception,
                       "Manufacturer ${m} can not deposit a stake of ${s}, balance is ${b}",
                       ("m",o.manufacturer)("s",o.stake)("b",stakes.balance_of( o.manufacturer )) );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type group_order_create_evaluator::do_apply( const group_order_create_operation& o )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   const group_order_object& order = d.create<group_order_object>( [&o,now]( group_order_object& obj ) {
      obj.manufacturer   = o.manufacturer;
      obj.product_id     = o.product_id;
      obj.min_units      = o.min_units;
      obj.initial_price  = o.initial_price;
      obj.current_price  = o.initial_price;
      obj.stake          = o.stake;
      obj.discount_tiers = o.discount_tiers;
      obj.created        = now;
      obj.deadline       = now + o.duration;
   });

   if( o.stake > 0 )
   {
      auto& stakes = d.reward_port();
      stakes.checked_transfer_from( o.manufacturer, stakes.holder(), o.stake );
   }

   d.push_event( order_created_event{ order.get_id(), o.manufacturer, o.product_id, o.min_units,
                                      o.initial_price, o.stake, order.deadline } );
   ilog( "Group order ${id} for ${p} created by ${m}, ${u} units at ${price} until ${d}",
         ("id",order.id)("p",o.product_id)("m",o.manufacturer)("u",o.min_units)("price",o.initial_price)
         ("d",order.deadline) );

   return order.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result group_order_join_evaluator::do_evaluate( const group_order_join_operation& o )
{ try {
   const database& d = db();
   _order = &d.get_group_order( o.order_id );

   GROUPBUY_ASSERT( _order->is_open(), state_conflict_exception,
                    "Group order ${id} is no longer open", ("id",o.order_id) );
   GROUPBUY_ASSERT( d.head_time() <= _order->deadline, deadline_violation_exception,
                    "Group order ${id} closed at ${d}", ("id",o.order_id)("d",_order->deadline)("now",d.head_time()) );
   GROUPBUY_ASSERT( d.find_contribution( o.order_id, o.retailer ) == nullptr, already_joined_exception,
                    "${r} already joined group order ${id}", ("r",o.retailer)("id",o.order_id) );

   _cost = o.units * _order->current_price;
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type group_order_join_evaluator::do_apply( const group_order_join_operation& o )
{ try {
   database& d = db();

   auto& payments = d.payment_port();
   payments.checked_transfer_from( o.retailer, payments.holder(), _cost );

   const contribution_object& contribution = d.create<contribution_object>( [&o,this]( contribution_object& c ) {
      c.order       = o.order_id;
      c.retailer    = o.retailer;
      c.units       = o.units;
      c.amount_paid = _cost;
   });

   const share_type old_price = _order->current_price;
   const share_type new_price = apply_discount( _order->initial_price,
                                                resolve_discount( _order->discount_tiers, _order->total_units + o.units ) );
   d.modify( *_order, [&o,this,new_price]( group_order_object& obj ) {
      obj.total_units += o.units;
      obj.total_value += _cost;
      if( new_price < obj.current_price )
         obj.current_price = new_price;
   });

   if( _order->current_price != old_price )
      d.push_event( price_updated_event{ o.order_id, old_price, _order->current_price } );
   d.push_event( retailer_joined_event{ o.order_id, o.retailer, o.units, _cost } );
   if( _order->threshold_reached() )
      d.push_event( order_ready_for_processing_event{ o.order_id, _order->total_units } );

   return contribution.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result group_order_fulfill_evaluator::do_evaluate( const group_order_fulfill_operation& o )
{ try {
   const database& d = db();
   _order = &d.get_group_order( o.order_id );

   GROUPBUY_ASSERT( _order->is_open(), state_conflict_exception,
                    "Group order ${id} is no longer open", ("id",o.order_id) );
   GROUPBUY_ASSERT( _order->threshold_reached(), state_conflict_exception,
                    "Group order ${id} has ${u} of the ${m} units it needs",
                    ("id",o.order_id)("u",_order->total_units)("m",_order->min_units) );

   _calculator = d.get_settlement_calculator();
   _distributor = d.get_reward_distributor();
   GROUPBUY_ASSERT( _calculator != nullptr, service_not_configured_exception,
                    "No settlement calculator is configured" );
   GROUPBUY_ASSERT( _distributor != nullptr, service_not_configured_exception,
                    "No reward distributor is configured" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result group_order_fulfill_evaluator::do_apply( const group_order_fulfill_operation& o )
{ try {
   database& d = db();
   const ledger_parameters params = d.current_parameters();

   // close the order before any value leaves the escrow
   d.modify( *_order, []( group_order_object& obj ) {
      obj.active = false;
      obj.fulfilled = true;
   });

   const vector<contribution_object> contributions = d.get_contributions( o.order_id );
   const fulfillment_result result = _calculator->compute( *_order, contributions, params.platform_fee_bps );
   FC_ASSERT( result.refund_recipients.size() == result.refund_amounts.size(),
              "Settlement produced mismatched refund lists" );
   FC_ASSERT( result.final_price <= _order->current_price,
              "Settlement price ${f} exceeds the last quoted price ${c}",
              ("f",result.final_price)("c",_order->current_price) );

   d.modify( *_order, [&result]( group_order_object& obj ) {
      obj.current_price = result.final_price;
   });

   auto& payments = d.payment_port();
   for( size_t i = 0; i < result.refund_recipients.size(); ++i )
   {
      if( result.refund_amounts[i] > 0 )
         payments.checked_transfer( result.refund_recipients[i], result.refund_amounts[i] );
   }
   if( result.net_to_manufacturer > 0 )
      payments.checked_transfer( _order->manufacturer, result.net_to_manufacturer );
   if( result.platform_fee > 0 )
      payments.checked_transfer( params.fee_collector, result.platform_fee );

   auto& rewards = d.reward_port();
   if( _order->stake > 0 )
   {
      rewards.checked_transfer( _order->manufacturer, _order->stake );
      d.push_event( stake_returned_event{ o.order_id, _order->manufacturer, _order->stake } );
   }

   const share_type pool = cut_bps( result.total_value_for_reward_calc, params.reward_bps );
   if( pool > 0 )
   {
      rewards.checked_transfer_from( params.reward_treasury, _distributor->holder(), pool );
      _distributor->record_rewards( o.order_id, pool, _order->total_units, contributions );
   }

   d.push_event( order_processed_event{ o.order_id, result.final_price, result.net_to_manufacturer,
                                        result.platform_fee, result.total_refunds(), pool } );
   ilog( "Group order ${id} fulfilled at ${price}: net ${n}, fee ${f}, refunds ${r}, reward pool ${p}",
         ("id",o.order_id)("price",result.final_price)("n",result.net_to_manufacturer)
         ("f",result.platform_fee)("r",result.total_refunds())("p",pool) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result group_order_cancel_evaluator::do_evaluate( const group_order_cancel_operation& o )
{ try {
   const database& d = db();
   _order = &d.get_group_order( o.order_id );

   GROUPBUY_ASSERT( o.canceller == _order->manufacturer || o.canceller == d.get_global_properties().administrator,
                    unauthorized_exception, "${c} may not cancel group order ${id}",
                    ("c",o.canceller)("id",o.order_id) );
   GROUPBUY_ASSERT( _order->is_open(), state_conflict_exception,
                    "Group order ${id} is no longer open", ("id",o.order_id) );
   GROUPBUY_ASSERT( d.head_time() > _order->deadline, deadline_violation_exception,
                    "Group order ${id} is open until ${d}", ("id",o.order_id)("d",_order->deadline)("now",d.head_time()) );
   GROUPBUY_ASSERT( !_order->threshold_reached(), deadline_violation_exception,
                    "Group order ${id} reached its minimum and can only be fulfilled",
                    ("id",o.order_id)("u",_order->total_units)("m",_order->min_units) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result group_order_cancel_evaluator::do_apply( const group_order_cancel_operation& o )
{ try {
   database& d = db();

   d.modify( *_order, []( group_order_object& obj ) {
      obj.active = false;
   });

   auto& payments = d.payment_port();
   share_type refunded;
   for( const auto& c : d.get_contributions( o.order_id ) )
   {
      if( c.amount_paid > 0 )
      {
         payments.checked_transfer( c.retailer, c.amount_paid );
         refunded += c.amount_paid;
      }
   }

   if( _order->stake > 0 )
   {
      d.reward_port().checked_transfer( _order->manufacturer, _order->stake );
      d.push_event( stake_returned_event{ o.order_id, _order->manufacturer, _order->stake } );
   }

   d.push_event( order_cancelled_event{ o.order_id, o.canceller, refunded } );
   ilog( "Group order ${id} cancelled by ${c}, ${r} refunded", ("id",o.order_id)("c",o.canceller)("r",refunded) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // groupbuy::chain
