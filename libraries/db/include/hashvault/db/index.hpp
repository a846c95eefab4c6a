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
#include <hashvault/db/object.hpp>
#include <fc/exception/exception.hpp>

#include <functional>

namespace hashvault { namespace db {
   class object_database;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  for ever in a sequential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    *
    *  Index implementations need only worry about mapping object_id to the object
    *  and the undo database takes care of restoring state after a failed call.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          *  Builds a new object and assigns it the next available ID and then
          *  initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Used by the undo database to restore removed objects, the object must
          *  already carry its original ID.
          */
         virtual const object& insert( object&& obj ) = 0;

         /**
          *  Opens the object for modification, a copy is saved by the undo
          *  database before m is invoked.
          */
         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         /**
          *   When there is a need to examine an object, it is retrieved through find.
          *   @return nullptr if no object with that id is stored in the index.
          */
         virtual const object* find( object_id_type id )const = 0;

         /**
          *  This version will throw if the object with id doesn't exist.
          */
         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object ${id}", ("id",id) );
            return *maybe_found;
         }

         virtual size_t size()const = 0;
   };

   /**
    *  Routes the changes made through a primary index to the undo database.
    */
   class base_primary_index
   {
      public:
         base_primary_index( object_database& db ) : _db(db) {}

         /** called just before obj is modified */
         void save_undo( const object& obj );

         /** called just after the object is added */
         void on_add( const object& obj );

         /** called just before obj is removed */
         void on_remove( const object& obj );

      protected:
         object_database& _db;
   };

   /**
    *  @class primary_index
    *  @brief wraps a derived index to assign object ids and track changes for undo
    *
    *  Every index registered with the object_database is a primary_index<DerivedIndex>
    *  where DerivedIndex implements the storage of a single object type.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         typedef typename DerivedIndex::object_type object_type;

         primary_index( object_database& db )
         : base_primary_index(db), _next_id( object_type::space_id, object_type::type_id, 0 ) {}

         object_id_type get_next_id()const override         { return _next_id; }
         void           use_next_id()override               { ++_next_id; }
         void           set_next_id( object_id_type id )override { _next_id = id; }

         const object& insert( object&& obj )override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_add( result );
            return result;
         }

         const object& create( const std::function<void(object&)>& constructor )override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         void remove( const object& obj )override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         object_id_type _next_id;
   };

} } // hashvault::db
