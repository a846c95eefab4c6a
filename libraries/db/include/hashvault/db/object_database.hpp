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
#include <hashvault/db/index.hpp>
#include <hashvault/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace hashvault { namespace db {

   /**
    *   @class object_database
    *   @brief in memory store of indexed objects, every change goes through the undo database
    *
    *   Each (space, type) pair owns one primary index.  Indexes are registered once at
    *   start up with add_index() and live as long as the database.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index( T::space_id, T::type_id );
            return static_cast<const T&>( idx.create( [&constructor]( object& o ) {
               constructor( static_cast<T&>(o) );
            } ));
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            return static_cast<const IndexType&>( get_index( IndexType::object_type::space_id,
                                                             IndexType::object_type::type_id ) );
         }
         const index& get_index( uint8_t space_id, uint8_t type_id )const;

         const object& get_object( const object_id_type& id )const;
         /// @return nullptr if id has no index or no object
         const object* find_object( const object_id_type& id )const;

         template<typename T>
         const T& get( const object_id_type& id )const
         {
            return static_cast<const T&>( get_object( id ) );
         }

         /// Mutators, callers must not change objects any other way or undo will miss the change
         /// @{
         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id.space(), obj.id.type() ).modify( obj, [&m]( object& o ) {
               m( static_cast<T&>(o) );
            });
         }
         void remove( const object& obj ) { get_mutable_index( obj.id.space(), obj.id.type() ).remove( obj ); }
         /// @}

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            const uint16_t key = index_key( ObjectType::space_id, ObjectType::type_id );
            FC_ASSERT( _indexes.find( key ) == _indexes.end(), "Index ${s}.${t} already exists",
                       ("s",ObjectType::space_id)("t",ObjectType::type_id) );
            auto new_index = std::make_unique<IndexType>( *this );
            IndexType* result = new_index.get();
            _indexes.emplace( key, std::move( new_index ) );
            return result;
         }

         /** public for testing purposes only... should be private in practice. */
         undo_database _undo_db;

      protected:
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

      private:
         friend class base_primary_index;
         friend class undo_database;

         static uint16_t index_key( uint8_t space_id, uint8_t type_id )
         {
            return ( uint16_t(space_id) << 8 ) | type_id;
         }

         /// puts back an object removed inside an undone session
         const object& insert( object&& obj );

         std::map< uint16_t, std::unique_ptr<index> > _indexes;
   };

} } // hashvault::db
