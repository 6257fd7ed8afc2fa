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

#include <groupbuy/chain/evaluator.hpp>
#include <groupbuy/chain/exceptions.hpp>

namespace groupbuy { namespace chain {

namespace detail {

/**
 * Marks the database as applying an operation for the lifetime of the guard, whether
 * the operation commits or throws.
 */
struct applying_flag_guard
{
   explicit applying_flag_guard( bool& flag ) : _flag( flag )
   {
      _flag = true;
   }

   ~applying_flag_guard()
   {
      _flag = false;
   }

   bool& _flag;
};

} // detail

operation_result database::push_operation( const operation& op )
{
   GROUPBUY_ASSERT( !_applying, reentrancy_exception,
                    "An operation was pushed while another one is being applied", ("op",op) );

   operation_result result;
   {
      detail::applying_flag_guard guard( _applying );
      try {
         auto session = _undo_db.start_undo_session();
         operation_validate( op );
         result = apply_operation( op );
         modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgpo ) {
            ++dgpo.applied_operations;
         });
         session.commit();
      }
      catch( const fc::exception& e )
      {
         _pending_events.clear();
         wlog( "Rejected operation ${op}: ${e}", ("op",op)("e",e.to_string()) );
         throw;
      }
   }

   // observers may push new operations from here on
   vector<ledger_event> events;
   events.swap( _pending_events );
   for( const auto& e : events )
      _event_history.push_back( e );
   trim_event_history();
   for( const auto& e : events )
      applied_event( e );
   applied_operation( op, result );

   return result;
}

void database::set_event_history_limit( size_t limit )
{
   _event_history_limit = limit;
   trim_event_history();
}

void database::trim_event_history()
{
   if( _event_history_limit == 0 )
      return;
   while( _event_history.size() > _event_history_limit )
      _event_history.pop_front();
}

void database::push_event( const ledger_event& e )
{
   FC_ASSERT( _applying, "Events can only be raised while an operation is applied" );
   _pending_events.push_back( e );
}

operation_result database::apply_operation( const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   return eval->evaluate( *this, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // groupbuy::chain
