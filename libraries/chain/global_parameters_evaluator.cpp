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
#include <groupbuy/chain/global_parameters_evaluator.hpp>

#include <groupbuy/chain/database.hpp>
#include <groupbuy/chain/exceptions.hpp>

namespace groupbuy { namespace chain {

void_result ledger_parameters_update_evaluator::do_evaluate( const ledger_parameters_update_operation& o )
{ try {
   GROUPBUY_ASSERT( o.administrator == db().get_global_properties().administrator, unauthorized_exception,
                    "Only the ledger administrator may change ledger parameters", ("account",o.administrator) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result ledger_parameters_update_evaluator::do_apply( const ledger_parameters_update_operation& o )
{ try {
   database& d = db();
   const ledger_parameters old_parameters = d.current_parameters();

   d.modify( d.get_global_properties(), [&o]( global_property_object& p ) {
      p.parameters = o.new_parameters;
   });

   d.push_event( parameters_updated_event{ old_parameters, o.new_parameters } );
   ilog( "Ledger parameters updated: ${p}", ("p",o.new_parameters) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // groupbuy::chain
