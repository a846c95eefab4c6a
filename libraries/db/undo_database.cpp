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
#include <hashvault/db/object_database.hpp>
#include <hashvault/db/undo_database.hpp>

namespace hashvault { namespace db {

undo_database::session undo_database::start_undo_session()
{
   if( !_enabled )
      return session( *this, false );

   _stack.emplace_back();
   return session( *this, true );
}

void undo_database::on_create( const object& obj )
{
   if( !recording() ) return;

   undo_state& state = _stack.back();
   const object_id_type index_id( obj.id.space(), obj.id.type(), 0 );
   state.prior_next_ids.emplace( index_id, obj.id );
   state.created.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( !recording() ) return;

   undo_state& state = _stack.back();
   // an object created by this session is simply removed on undo
   if( state.created.count( obj.id ) || state.prior_values.count( obj.id ) )
      return;
   state.prior_values.emplace( obj.id, obj.clone() );
}

void undo_database::on_remove( const object& obj )
{
   if( !recording() ) return;

   undo_state& state = _stack.back();
   if( state.created.erase( obj.id ) )
      return;
   if( state.removed.count( obj.id ) )
      return;

   auto prior = state.prior_values.find( obj.id );
   if( prior != state.prior_values.end() )
   {
      state.removed.emplace( obj.id, std::move( prior->second ) );
      state.prior_values.erase( prior );
      return;
   }
   state.removed.emplace( obj.id, obj.clone() );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_stack.empty(), "No session to undo" );

   // restoring objects must not record anything itself
   _enabled = false;
   undo_state& state = _stack.back();

   for( auto& item : state.prior_values )
      _db.modify( _db.get_object( item.first ), [&item]( object& obj ) { obj.move_from( *item.second ); } );

   for( const object_id_type& id : state.created )
      _db.remove( _db.get_object( id ) );

   for( const auto& item : state.prior_next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );

   _stack.pop_back();
   _enabled = true;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty(), "No session to commit" );
   if( _stack.size() > 1 )
      fold_into_parent();
   else
      _stack.pop_back();
}

void undo_database::fold_into_parent()
{
   undo_state& child  = _stack.back();
   undo_state& parent = _stack[ _stack.size() - 2 ];

   for( auto& item : child.prior_values )
   {
      // the parent keeps the oldest value it has seen, and nothing for objects it created
      if( parent.created.count( item.first ) == 0 )
         parent.prior_values.emplace( item.first, std::move( item.second ) );
   }

   for( const object_id_type& id : child.created )
      parent.created.insert( id );

   for( const auto& item : child.prior_next_ids )
      parent.prior_next_ids.emplace( item.first, item.second );

   for( auto& item : child.removed )
   {
      if( parent.created.erase( item.first ) )
         continue;
      auto prior = parent.prior_values.find( item.first );
      if( prior != parent.prior_values.end() )
      {
         parent.removed.emplace( item.first, std::move( prior->second ) );
         parent.prior_values.erase( prior );
      }
      else
         parent.removed.emplace( item.first, std::move( item.second ) );
   }

   _stack.pop_back();
}

} } // hashvault::db
