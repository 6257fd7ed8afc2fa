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

#include <groupbuy/chain/account_balance_object.hpp>
#include <groupbuy/chain/global_property_object.hpp>
#include <groupbuy/chain/group_order_object.hpp>
#include <groupbuy/chain/reward_object.hpp>

#include <groupbuy/chain/group_order_evaluator.hpp>
#include <groupbuy/chain/reward_evaluator.hpp>
#include <groupbuy/chain/global_parameters_evaluator.hpp>

#include <groupbuy/chain/reward_distributor.hpp>
#include <groupbuy/chain/settlement.hpp>
#include <groupbuy/chain/value_transfer_port.hpp>

#include <groupbuy/db/generic_index.hpp>
#include <groupbuy/db/simple_index.hpp>

namespace groupbuy { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<group_order_create_evaluator>();
   register_evaluator<group_order_join_evaluator>();
   register_evaluator<group_order_fulfill_evaluator>();
   register_evaluator<group_order_cancel_evaluator>();
   register_evaluator<reward_claim_evaluator>();
   register_evaluator<ledger_parameters_update_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   //Protocol object indexes
   add_index< primary_index<group_order_index> >();
   add_index< primary_index<contribution_index> >();
   add_index< primary_index<reward_record_index> >();
   add_index< primary_index<reward_pool_index> >();

   //Implementation object indexes
   add_index< primary_index<simple_index<global_property_object        >> >();
   add_index< primary_index<simple_index<dynamic_global_property_object>> >();
   add_index< primary_index<account_balance_index> >();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( find( global_property_id_type() ) == nullptr, "Genesis state was already applied" );
   genesis_state.initial_parameters.validate();

   create<global_property_object>( [&genesis_state]( global_property_object& p ) {
      p.administrator = genesis_state.administrator;
      p.parameters = genesis_state.initial_parameters;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
   });

   for( const auto& balance : genesis_state.initial_balances )
   {
      FC_ASSERT( balance.amount >= 0, "Initial balance can not be negative", ("balance",balance) );
      adjust_balance( balance.owner, balance.asset_type, balance.amount );
   }

   _payment_port = std::make_shared<balance_transfer_port>( *this, GROUPBUY_PAYMENT_ASSET, GROUPBUY_ESCROW_ACCOUNT );
   _reward_port  = std::make_shared<balance_transfer_port>( *this, GROUPBUY_REWARD_ASSET, GROUPBUY_ESCROW_ACCOUNT );

   ilog( "Initialized ledger at ${t} administered by ${a}",
         ("t",genesis_state.initial_timestamp)("a",genesis_state.administrator) );
} FC_CAPTURE_AND_RETHROW() }

void database::install_default_services()
{
   _settlement_calculator = std::make_shared<default_settlement_calculator>();
   _reward_distributor = std::make_shared<reward_distributor>( *this,
         std::make_shared<balance_transfer_port>( *this, GROUPBUY_REWARD_ASSET, GROUPBUY_REWARD_DISTRIBUTOR_ACCOUNT ) );
}

} } // groupbuy::chain
