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

#include <fc/io/json.hpp>
#include <fc/optional.hpp>
#include <fc/variant_object.hpp>

#include <boost/test/unit_test.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>
#include <groupbuy/chain/reward_distributor.hpp>
#include <groupbuy/chain/settlement.hpp>
#include <groupbuy/chain/value_transfer_port.hpp>

#include <iostream>
#include <map>

using namespace groupbuy::db;

extern uint32_t GROUPBUY_TESTING_GENESIS_TIMESTAMP;

#define GROUPBUY_REQUIRE_THROW( expr, exc_type )          \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "GROUPBUY_REQUIRE_THROW begin "        \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "GROUPBUY_REQUIRE_THROW end "          \
         << req_throw_info << std::endl;                  \
}

#define GROUPBUY_CHECK_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "GROUPBUY_CHECK_THROW begin "          \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "GROUPBUY_CHECK_THROW end "            \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   GROUPBUY_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}

namespace groupbuy { namespace chain { namespace test {

/**
 * A ledger after genesis with funded participants and the default services installed.
 *
 * Every participant starts with the same amount of the payment and of the reward asset; the
 * reward treasury is funded with the reward asset only.  On destruction the fixture checks
 * that no value was created or destroyed and that the escrow accounts hold exactly what the
 * open orders owe.
 */
struct database_fixture {
   database db;
   genesis_state_type genesis_state;

   const account_id_type escrow_account      = GROUPBUY_ESCROW_ACCOUNT;
   const account_id_type distributor_account = GROUPBUY_REWARD_DISTRIBUTOR_ACCOUNT;
   const account_id_type administrator       = GROUPBUY_ADMINISTRATOR_ACCOUNT;
   const account_id_type fee_collector       = account_id_type(3);
   const account_id_type treasury            = account_id_type(4);
   const account_id_type manufacturer        = account_id_type(10);
   const account_id_type other_manufacturer  = account_id_type(11);
   const account_id_type alice               = account_id_type(20);
   const account_id_type bob                 = account_id_type(21);
   const account_id_type carol               = account_id_type(22);
   const account_id_type dave                = account_id_type(23);

   static const int64_t initial_balance          = 1000000;
   static const int64_t initial_treasury_balance = 10000000;

   /// every amount that was ever minted into the ledger, per asset
   std::map<asset_id_type, share_type> expected_supply;

   database_fixture();
   ~database_fixture();

   /// mints @p amount of @p asset_type to @p account outside of any operation
   void fund( account_id_type account, asset_id_type asset_type, share_type amount );

   share_type payment_balance( account_id_type account )const { return db.get_balance( account, GROUPBUY_PAYMENT_ASSET ); }
   share_type reward_balance( account_id_type account )const  { return db.get_balance( account, GROUPBUY_REWARD_ASSET ); }

   group_order_create_operation make_create_op( account_id_type maker, share_type min_units, share_type price,
                                                const vector<discount_tier>& tiers = vector<discount_tier>(),
                                                share_type stake = 0, uint32_t duration = 86400 )const;

   const group_order_object&  create_group_order( account_id_type maker, share_type min_units, share_type price,
                                                  const vector<discount_tier>& tiers = vector<discount_tier>(),
                                                  share_type stake = 0, uint32_t duration = 86400 );
   const contribution_object& join( account_id_type retailer, group_order_id_type order, share_type units );
   void                       fulfill( group_order_id_type order );
   void                       fulfill( group_order_id_type order, account_id_type executor );
   void                       cancel( group_order_id_type order, account_id_type canceller );
   share_type                 claim( group_order_id_type order, account_id_type claimer );
   void                       update_parameters( const ledger_parameters& p, account_id_type signer = GROUPBUY_ADMINISTRATOR_ACCOUNT );

   void advance_time( uint32_t seconds ) { db.advance_time( seconds ); }

   /// the events of type @p Event in the history, oldest first
   template<typename Event>
   vector<Event> events_of_type()const
   {
      vector<Event> result;
      for( const auto& e : db.get_event_history() )
         if( e.which() == ledger_event::tag<Event>::value )
            result.push_back( e.get<Event>() );
      return result;
   }

   /// the tags of the events published since the history had @p from entries
   vector<int> event_tags_since( size_t from )const;

   static void verify_value_conservation( const database& db, const std::map<asset_id_type, share_type>& supply );
};

/**
 * A port that forwards to another one and counts the calls, optionally re-entering the
 * ledger from inside a transfer.
 */
class recording_transfer_port : public value_transfer_port
{
   public:
      recording_transfer_port( database& db, std::shared_ptr<value_transfer_port> next )
         : _db(db), _next(next) {}

      bool transfer_from( account_id_type from, account_id_type to, share_type amount ) override
      {
         ++transfers;
         try_reenter();
         return _next->transfer_from( from, to, amount );
      }
      bool transfer( account_id_type to, share_type amount ) override
      {
         ++transfers;
         try_reenter();
         return _next->transfer( to, amount );
      }
      share_type      balance_of( account_id_type owner )const override { return _next->balance_of( owner ); }
      account_id_type holder()const override                            { return _next->holder(); }

      /// operation pushed back into the ledger from the next transfer
      fc::optional<operation> reenter_with;
      uint32_t                transfers = 0;
      uint32_t                reentrancy_rejections = 0;

   private:
      void try_reenter()
      {
         if( !reenter_with.valid() )
            return;
         const operation op = *reenter_with;
         reenter_with = fc::optional<operation>();
         try {
            _db.push_operation( op );
         } catch( const reentrancy_exception& ) {
            ++reentrancy_rejections;
         }
      }

      database&                            _db;
      std::shared_ptr<value_transfer_port> _next;
};

} } } // groupbuy::chain::test
