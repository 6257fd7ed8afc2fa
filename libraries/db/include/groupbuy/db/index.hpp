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

#include <functional>

namespace groupbuy { namespace db {

   class object_database;

   /**
    * @class index
    * @brief abstract base class for accessing objects indexed in various ways.
    *
    * All indexes assume that there exists an object ID space that will grow
    * forever in a sequential manner.  These IDs are used to identify the
    * index, type, and instance of the object.
    *
    * Items in an index can only be modified via a call to modify and
    * all references to objects outside of the index are via object ID.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Used by the undo logic to restore an object to the index.
          */
         virtual const object& insert( object&& obj ) = 0;

         /**
          *  Opens the object for modification.  The index is allowed to re-sort the
          *  object afterwards.
          */
         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         /**
          *   When forming your lambda to modify obj, it is natural to have Object& be the signature, but
          *   that is not compatible with the type erasure required by the virtual method.  This method
          *   provides a helper to wrap the lambda in a form compatible with the virtual modify call.
          */
         template<typename Object, typename Lambda>
         void modify( const Object& obj, const Lambda& l ) {
            modify( static_cast<const object&>(obj), std::function<void(object&)>( [&]( object& o ){ l( static_cast<Object&>(o) ); } ) );
         }

         virtual const object* find( object_id_type id )const = 0;

         /**
          * This version will throw if the object is not found.
          */
         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",id) );
            return *maybe_found;
         }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

   /**
    * @class primary_index
    * @brief wraps an index to assign sequential ids and to report every change to the undo database
    *
    * Every index registered with the object_database is a primary_index, the wrapped index
    * only stores the objects.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex
   {
      public:
         typedef typename DerivedIndex::object_type object_type;

         primary_index( object_database& db )
         :_db(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         virtual uint8_t object_space_id()const override
         { return object_type::space_id; }

         virtual uint8_t object_type_id()const override
         { return object_type::type_id; }

         virtual object_id_type get_next_id()const override    { return _next_id; }
         virtual void           use_next_id() override         { ++_next_id.number; }
         virtual void           set_next_id( object_id_type id ) override { _next_id = id; }

         virtual const object& create( const std::function<void(object&)>& constructor ) override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         virtual const object& insert( object&& obj ) override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_add( result );
            return result;
         }

         virtual void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         void on_add( const object& obj );
         void on_remove( const object& obj );
         void save_undo( const object& obj );

         object_database& _db;
         object_id_type   _next_id;
   };

} } // groupbuy::db
