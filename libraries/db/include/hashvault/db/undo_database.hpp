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
#include <fc/log/logger.hpp>

#include <unordered_map>
#include <unordered_set>

namespace hashvault { namespace db {

   using std::unordered_map;
   class object_database;

   /**
    *  What a single session changed, enough to put the database back the way
    *  the session found it.
    */
   struct undo_state
   {
      /// value of each pre-existing object before its first modification in the session
      unordered_map<object_id_type, unique_ptr<object> > prior_values;
      /// pre-existing objects that the session removed
      unordered_map<object_id_type, unique_ptr<object> > removed;
      /// objects the session created
      std::unordered_set<object_id_type>                 created;
      /// first id handed out by each index the session created objects in, keyed by space.type.0
      unordered_map<object_id_type, object_id_type>      prior_next_ids;
   };

   /**
    * @class undo_database
    * @brief records object changes so that a failed call leaves the database untouched
    *
    * Every call runs inside a session.  Destroying a session that was not committed
    * restores the objects it changed.  Committing a nested session hands its
    * changes to the enclosing session, committing the outermost one forgets them.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_active(mv._active)
               {
                  mv._active = false;
               }
               ~session()
               {
                  if( !_active )
                     return;
                  try
                  {
                     _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     // the database no longer matches any committed state
                     elog( "failed to undo session: ${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }

               void commit() { if( _active ) _db.commit(); _active = false; }
               void undo()   { if( _active ) _db.undo();   _active = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db, bool active ): _db(db),_active(active) {}
               undo_database& _db;
               bool           _active;
         };

         void enable()  { _enabled = true; }
         void disable() { _enabled = false; }

         /// A session that records nothing is returned while recording is disabled
         session start_undo_session();

         /// number of open sessions
         size_t depth()const { return _stack.size(); }

         void on_create( const object& obj );
         /// called before obj changes, only the first value seen in a session is kept
         void on_modify( const object& obj );
         void on_remove( const object& obj );

      private:
         void undo();
         void commit();
         void fold_into_parent();
         bool recording()const { return _enabled && !_stack.empty(); }

         bool                     _enabled = false;
         std::vector<undo_state>  _stack;
         object_database&         _db;
   };

} } // hashvault::db
