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
#include <groupbuy/chain/exceptions.hpp>

namespace groupbuy { namespace chain {

share_type database::get_balance( account_id_type owner, asset_id_type asset_type )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( owner, asset_type ) );
   if( itr == index.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type account, asset_id_type asset_type, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( account, asset_type ) );
   if( itr == index.end() )
   {
      GROUPBUY_ASSERT( delta > 0, insufficient_funds_exception,
                       "Insufficient Balance: ${a}'s balance of ${b} in ${t} is less than required ${r}",
                       ("a",account)("b",0)("t",asset_type)("r",-delta) );
      create<account_balance_object>( [account,asset_type,delta]( account_balance_object& b ) {
         b.owner = account;
         b.asset_type = asset_type;
         b.balance = delta;
      });
   }
   else
   {
      if( delta < 0 )
         GROUPBUY_ASSERT( itr->balance >= -delta, insufficient_funds_exception,
                          "Insufficient Balance: ${a}'s balance of ${b} in ${t} is less than required ${r}",
                          ("a",account)("b",itr->balance)("t",asset_type)("r",-delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.balance += delta;
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(asset_type)(delta) ) }

share_type database::get_total_balance( asset_id_type asset_type )const
{
   share_type total;
   const auto& index = get_index_type<account_balance_index>().indices().get<by_id>();
   for( const auto& b : index )
      if( b.asset_type == asset_type )
         total += b.balance;
   return total;
}

} } // groupbuy::chain
