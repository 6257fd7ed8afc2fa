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
#include <groupbuy/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace groupbuy { namespace db {

   using std::unordered_map;

   class object_database;

   /**
    * Everything needed to restore the database to the state it had when a session started.
    */
   struct undo_state
   {
      unordered_map<object_id_type, unique_ptr<object> > old_values;
      unordered_map<object_id_type, object_id_type>      old_index_next_ids;
      std::unordered_set<object_id_type>                 new_ids;
      unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Changes are only recorded while at least one session is active.  A session that is
    * destroyed without commit() reverts every change made since it was started; a committed
    * session discards its undo information, nested sessions fold into their parent.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session() {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch ( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string() ) );
                     throw; // maybe crash..
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }

               session& operator = ( session&& mv )
               { try {
                  if( this == &mv ) return *this;
                  if( _apply_undo ) _db.undo();
                  _apply_undo = mv._apply_undo;
                  mv._apply_undo = false;
                  return *this;
               } FC_CAPTURE_AND_RETHROW() }

            private:
               friend class undo_database;
               session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         session start_undo_session();

         bool has_active_session()const { return !_stack.empty(); }
         std::size_t size()const { return _stack.size(); }

         /**
          * This should be called just after an object is created
          */
         void on_create( const object& obj );
         /**
          * This should be called just before an object is modified
          *
          * If it's a new object as of this undo state, its pre-modification value is not stored, because prior to this
          * undo state, it did not exist.
          */
         void on_modify( const object& obj );
         /**
          * This should be called just before an object is removed.
          *
          * Removing an object created in the same undo state simply forgets that it was created.
          */
         void on_remove( const object& obj );

      private:
         void undo();
         void commit();

         bool                    _disabled = false;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // groupbuy::db
