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
#include <groupbuy/chain/value_transfer_port.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>

namespace groupbuy { namespace chain {

void value_transfer_port::checked_transfer_from( account_id_type from, account_id_type to, share_type amount )
{
   GROUPBUY_ASSERT( transfer_from( from, to, amount ), insufficient_funds_exception,
                    "Unable to transfer ${x} from ${f} to ${t}, balance is ${b}",
                    ("x",amount)("f",from)("t",to)("b",balance_of( from )) );
}

void value_transfer_port::checked_transfer( account_id_type to, share_type amount )
{
   GROUPBUY_ASSERT( transfer( to, amount ), insufficient_funds_exception,
                    "Unable to pay ${x} to ${t}, ${h} holds ${b}",
                    ("x",amount)("t",to)("h",holder())("b",balance_of( holder() )) );
}

balance_transfer_port::balance_transfer_port( database& db, asset_id_type asset_type, account_id_type holder )
   : _db(db), _asset_type(asset_type), _holder(holder)
{
}

bool balance_transfer_port::transfer_from( account_id_type from, account_id_type to, share_type amount )
{
   FC_ASSERT( amount >= 0, "Cannot transfer a negative amount", ("amount",amount) );
   if( amount == 0 )
      return true;
   if( _db.get_balance( from, _asset_type ) < amount )
      return false;
   _db.adjust_balance( from, _asset_type, -amount );
   _db.adjust_balance( to, _asset_type, amount );
   return true;
}

bool balance_transfer_port::transfer( account_id_type to, share_type amount )
{
   return transfer_from( _holder, to, amount );
}

share_type balance_transfer_port::balance_of( account_id_type owner )const
{
   return _db.get_balance( owner, _asset_type );
}

} } // groupbuy::chain
