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

#include "database_api_impl.hxx"

#include <boost/tuple/tuple.hpp>

#include <algorithm>
#include <iterator>

namespace hashvault { namespace app {

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( hashvault::chain::database& db )
   : my( new database_api_impl( db ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( hashvault::chain::database& db )
:_db(db)
{
   dlog( "creating database api ${x}", ("x",int64_t(this)) );
   _applied_operation_connection = _db.applied_operation.connect( [this]( const operation_history& oh ) {
      on_operation_applied( oh );
   });
}

database_api_impl::~database_api_impl()
{
   dlog( "freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Objects                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::variants database_api::get_objects( const vector<object_id_type>& ids )const
{
   return my->get_objects( ids );
}

fc::variants database_api_impl::get_objects( const vector<object_id_type>& ids )const
{
   fc::variants result;
   result.reserve( ids.size() );

   std::transform( ids.begin(), ids.end(), std::back_inserter(result),
                   [this]( object_id_type id ) -> fc::variant {
      if( auto obj = _db.find_object(id) )
         return obj->to_variant();
      return {};
   });

   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Subscriptions                                                    //
//                                                                  //
//////////////////////////////////////////////////////////////////////

void database_api::set_operation_applied_callback( std::function<void(const variant&)> cb )
{
   my->set_operation_applied_callback( cb );
}

void database_api_impl::set_operation_applied_callback( std::function<void(const variant&)> cb )
{
   _operation_applied_callback = cb;
}

void database_api::cancel_all_subscriptions()
{
   my->cancel_all_subscriptions();
}

void database_api_impl::cancel_all_subscriptions()
{
   _operation_applied_callback = std::function<void(const fc::variant&)>();
}

void database_api_impl::on_operation_applied( const operation_history& oh )
{
   if( !_operation_applied_callback )
      return;
   _operation_applied_callback( fc::variant( oh, HASHVAULT_MAX_NESTED_OBJECTS ) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Globals                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

protocol_state_object database_api::get_protocol_state()const
{
   return my->_db.get_protocol_state();
}

dynamic_global_property_object database_api::get_dynamic_global_properties()const
{
   return my->_db.get_dynamic_global_properties();
}

address database_api::get_admin()const
{
   return my->_db.get_admin();
}

basis_points_type database_api::get_fee_rate()const
{
   return my->_db.get_fee_rate();
}

share_type database_api::get_accumulated_fees()const
{
   return my->_db.get_accumulated_fees();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Orders                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<order_object> database_api::get_order( const order_id_type& order_id )const
{
   const order_object* order = my->_db.find_order( order_id );
   if( order == nullptr )
      return optional<order_object>();
   return *order;
}

bool database_api::order_exists( const order_id_type& order_id )const
{
   return my->_db.order_exists( order_id );
}

share_type database_api::get_remaining_amount( const order_id_type& order_id )const
{
   return my->_db.get_remaining_amount( order_id );
}

bool database_api::is_order_complete( const order_id_type& order_id )const
{
   return my->_db.is_order_complete( order_id );
}

vector<fill_id_type> database_api::get_order_fills( const order_id_type& order_id )const
{
   return my->_db.get_order_fills( order_id );
}

vector<order_object> database_api::get_orders_by_maker( const address& maker, uint32_t limit )const
{
   return my->get_orders_by_maker( maker, limit );
}

vector<order_object> database_api_impl::get_orders_by_maker( const address& maker, uint32_t limit )const
{
   FC_ASSERT( limit <= database_api::max_query_limit, "limit can not be greater than ${l}",
              ("l",database_api::max_query_limit) );

   vector<order_object> result;
   const auto& idx = _db.get_index_type<order_index>().indices().get<by_maker>();
   auto itr = idx.lower_bound( boost::make_tuple( maker ) );
   auto end = idx.upper_bound( boost::make_tuple( maker ) );
   while( itr != end && result.size() < limit )
   {
      result.push_back( *itr );
      ++itr;
   }
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Fills                                                            //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<fill_object> database_api::get_fill( const fill_id_type& fill_id )const
{
   const fill_object* fill = my->_db.find_fill( fill_id );
   if( fill == nullptr )
      return optional<fill_object>();
   return *fill;
}

optional<preimage_type> database_api::get_fill_secret( const fill_id_type& fill_id )const
{
   return my->_db.get_fill_secret( fill_id );
}

vector<fill_object> database_api::get_fills_by_taker( const address& taker, uint32_t limit )const
{
   return my->get_fills_by_taker( taker, limit );
}

vector<fill_object> database_api_impl::get_fills_by_taker( const address& taker, uint32_t limit )const
{
   FC_ASSERT( limit <= database_api::max_query_limit, "limit can not be greater than ${l}",
              ("l",database_api::max_query_limit) );

   vector<fill_object> result;
   const auto& idx = _db.get_index_type<fill_index>().indices().get<by_taker>();
   auto itr = idx.lower_bound( boost::make_tuple( taker ) );
   auto end = idx.upper_bound( boost::make_tuple( taker ) );
   while( itr != end && result.size() < limit )
   {
      result.push_back( *itr );
      ++itr;
   }
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// History                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<operation_history> database_api::get_applied_operations( uint64_t start, uint32_t limit )const
{
   return my->get_applied_operations( start, limit );
}

vector<operation_history> database_api_impl::get_applied_operations( uint64_t start, uint32_t limit )const
{
   FC_ASSERT( limit <= database_api::max_query_limit, "limit can not be greater than ${l}",
              ("l",database_api::max_query_limit) );

   const auto& history = _db.get_applied_operations();
   vector<operation_history> result;
   for( uint64_t i = start; i < history.size() && result.size() < limit; ++i )
      result.push_back( history[i] );
   return result;
}

} } // hashvault::app
