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

#include <groupbuy/chain/global_property_object.hpp>
#include <groupbuy/chain/group_order_object.hpp>
#include <groupbuy/chain/reward_object.hpp>
#include <groupbuy/chain/account_balance_object.hpp>
#include <groupbuy/chain/genesis_state.hpp>
#include <groupbuy/chain/evaluator.hpp>
#include <groupbuy/protocol/events.hpp>

#include <groupbuy/db/object_database.hpp>
#include <groupbuy/db/object.hpp>
#include <groupbuy/db/simple_index.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <deque>
#include <memory>

namespace groupbuy { namespace chain {
   using groupbuy::db::abstract_object;
   using groupbuy::db::object;
   class op_evaluator;
   class value_transfer_port;
   class settlement_calculator;
   class reward_distributor;

   /**
    *   @class database
    *   @brief tracks the state of the group-buying ledger
    *
    *   Every change of ledger state is an operation passed to push_operation(), which
    *   either applies it completely or leaves the state untouched.  The services the
    *   ledger delegates to (value transfer ports, settlement calculator, reward
    *   distributor) are wired by the host and may be replaced at any time between
    *   operations.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * Creates the global objects and the initial balances and wires the built-in value
          * transfer ports.  Must be called once, before the first operation.
          */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         /// wires the default settlement calculator and a reward distributor backed by the database
         void install_default_services();

         //////////////////// db_apply.cpp ////////////////////

         /**
          * Validates and applies @p op atomically.  Events raised by the operation are
          * published after it has been committed.
          *
          * @throws reentrancy_exception when called while another operation is being applied
          */
         operation_result push_operation( const operation& op );

         /// true while push_operation() is applying an operation
         bool is_applying()const { return _applying; }

         /// buffers @p e until the operation being applied commits
         void push_event( const ledger_event& e );

         /**
          *  The events of committed operations, oldest first.  The history is kept in memory
          *  only; without a limit it holds every event since genesis.
          */
         const std::deque<ledger_event>& get_event_history()const { return _event_history; }

         /// keep at most @p limit events in the history, dropping the oldest; 0 keeps all
         void set_event_history_limit( size_t limit );
         size_t get_event_history_limit()const { return _event_history_limit; }

         /**
          *  This signal is emitted for every event of an operation, after the operation has
          *  been committed and the ledger is ready to accept the next operation.
          */
         fc::signal<void(const ledger_event&)>                           applied_event;

         /**
          *  This signal is emitted after an operation has been committed and its events
          *  were published.
          */
         fc::signal<void(const operation&, const operation_result&)>     applied_operation;

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const ledger_parameters&               current_parameters()const;

         time_point_sec   head_time()const;
         /// sets the ledger clock; time never moves backwards
         void             set_head_time( time_point_sec t );
         void             advance_time( uint32_t seconds );

         /// @throws invalid_parameters_exception if @p id does not name an order
         const group_order_object&             get_group_order( group_order_id_type id )const;
         /// @return the contributions of @p order in join order
         vector<contribution_object>           get_contributions( group_order_id_type order )const;
         const contribution_object*            find_contribution( group_order_id_type order, account_id_type retailer )const;
         const reward_record_object*           find_reward_record( group_order_id_type order, account_id_type retailer )const;
         const reward_pool_object*             find_reward_pool( group_order_id_type order )const;
         vector<group_order_object>            get_orders_by_manufacturer( account_id_type manufacturer )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_type ID of the asset to get balance in
          * @return owner's balance in asset
          */
         share_type get_balance( account_id_type owner, asset_id_type asset_type )const;

         /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param asset_type ID of the asset to adjust
          * @param delta amount to add, negative to subtract
          * @throws insufficient_funds_exception if the balance would become negative
          */
         void adjust_balance( account_id_type account, asset_id_type asset_type, share_type delta );

         /// sum of all balances in @p asset_type
         share_type get_total_balance( asset_id_type asset_type )const;

         //////////////////// services ////////////////////

         void set_payment_port( std::shared_ptr<value_transfer_port> port )          { _payment_port = port; }
         void set_reward_port( std::shared_ptr<value_transfer_port> port )           { _reward_port = port; }
         void set_settlement_calculator( std::shared_ptr<settlement_calculator> c )  { _settlement_calculator = c; }
         void set_reward_distributor( std::shared_ptr<reward_distributor> d )        { _reward_distributor = d; }

         /// @throws service_not_configured_exception if no port is wired
         value_transfer_port&   payment_port()const;
         /// @throws service_not_configured_exception if no port is wired
         value_transfer_port&   reward_port()const;

         const settlement_calculator* get_settlement_calculator()const { return _settlement_calculator.get(); }
         reward_distributor*          get_reward_distributor()const    { return _reward_distributor.get(); }

         //////////////////// db_init.cpp ////////////////////

         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( static_cast<size_t>(op_type) < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

      private:
         operation_result apply_operation( const operation& op );
         void             trim_event_history();

         vector< unique_ptr<op_evaluator> >      _operation_evaluators;

         bool                                    _applying = false;
         vector<ledger_event>                    _pending_events;
         std::deque<ledger_event>                _event_history;
         size_t                                  _event_history_limit = 0;

         std::shared_ptr<value_transfer_port>    _payment_port;
         std::shared_ptr<value_transfer_port>    _reward_port;
         std::shared_ptr<settlement_calculator>  _settlement_calculator;
         std::shared_ptr<reward_distributor>     _reward_distributor;
   };

} }
