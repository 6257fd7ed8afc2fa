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
#include <groupbuy/chain/database.hpp>

#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/value_transfer_port.hpp>

namespace groupbuy { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   return get( dynamic_global_property_id_type() );
}

const ledger_parameters& database::current_parameters()const
{
   return get_global_properties().parameters;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

void database::set_head_time( time_point_sec t )
{
   FC_ASSERT( t >= head_time(), "Ledger time can not move backwards", ("head",head_time())("new",t) );
   modify( get_dynamic_global_properties(), [t]( dynamic_global_property_object& dgp ) {
      dgp.time = t;
   });
}

void database::advance_time( uint32_t seconds )
{
   set_head_time( head_time() + seconds );
}

const group_order_object& database::get_group_order( group_order_id_type id )const
{
   const auto* order = find( id );
   GROUPBUY_ASSERT( order != nullptr, invalid_parameters_exception, "Unknown group order ${id}", ("id",id) );
   return *order;
}

vector<contribution_object> database::get_contributions( group_order_id_type order )const
{
   vector<contribution_object> result;
   const auto& idx = get_index_type<contribution_index>().indices().get<by_order>();
   auto range = idx.equal_range( boost::make_tuple( order ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

const contribution_object* database::find_contribution( group_order_id_type order, account_id_type retailer )const
{
   const auto& idx = get_index_type<contribution_index>().indices().get<by_order_retailer>();
   auto itr = idx.find( boost::make_tuple( order, retailer ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const reward_record_object* database::find_reward_record( group_order_id_type order, account_id_type retailer )const
{
   const auto& idx = get_index_type<reward_record_index>().indices().get<by_order_retailer>();
   auto itr = idx.find( boost::make_tuple( order, retailer ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const reward_pool_object* database::find_reward_pool( group_order_id_type order )const
{
   const auto& idx = get_index_type<reward_pool_index>().indices().get<by_order>();
   auto itr = idx.find( order );
   return itr == idx.end() ? nullptr : &*itr;
}

vector<group_order_object> database::get_orders_by_manufacturer( account_id_type manufacturer )const
{
   vector<group_order_object> result;
   const auto& idx = get_index_type<group_order_index>().indices().get<by_manufacturer>();
   auto range = idx.equal_range( boost::make_tuple( manufacturer ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

value_transfer_port& database::payment_port()const
{
   GROUPBUY_ASSERT( _payment_port != nullptr, service_not_configured_exception, "No payment port is configured" );
   return *_payment_port;
}

value_transfer_port& database::reward_port()const
{
   GROUPBUY_ASSERT( _reward_port != nullptr, service_not_configured_exception, "No reward port is configured" );
   return *_reward_port;
}

} } // groupbuy::chain
