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

#include <hashvault/chain/database.hpp>

namespace hashvault { namespace chain {

const protocol_state_object& database::get_protocol_state()const
{
   return get<protocol_state_object>( object_id_type( implementation_ids, impl_protocol_state_object_type, 0 ) );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get<dynamic_global_property_object>(
            object_id_type( implementation_ids, impl_dynamic_global_property_object_type, 0 ) );
}

block_num_type database::head_block_num()const
{
   return get_dynamic_global_properties().head_block_number;
}

time_point_sec database::head_block_time()const
{
   return get_dynamic_global_properties().time;
}

const order_object* database::find_order( const order_id_type& order_id )const
{
   const auto& idx = get_index_type<order_index>().indices().get<by_order_id>();
   auto itr = idx.find( order_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const order_object& database::get_order( const order_id_type& order_id )const
{
   const order_object* order = find_order( order_id );
   HASHVAULT_ASSERT( order != nullptr, order_not_found, "Order ${id} does not exist", ("id",order_id) );
   return *order;
}

const fill_object* database::find_fill( const fill_id_type& fill_id )const
{
   const auto& idx = get_index_type<fill_index>().indices().get<by_fill_id>();
   auto itr = idx.find( fill_id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const fill_object& database::get_fill( const fill_id_type& fill_id )const
{
   const fill_object* fill = find_fill( fill_id );
   HASHVAULT_ASSERT( fill != nullptr, fill_not_found, "Fill ${id} does not exist", ("id",fill_id) );
   return *fill;
}

vector<fill_id_type> database::get_order_fills( const order_id_type& order_id )const
{
   const order_object* order = find_order( order_id );
   if( order == nullptr )
      return vector<fill_id_type>();
   return order->fills;
}

bool database::order_exists( const order_id_type& order_id )const
{
   return find_order( order_id ) != nullptr;
}

share_type database::get_remaining_amount( const order_id_type& order_id )const
{
   const order_object* order = find_order( order_id );
   if( order == nullptr || order->cancelled || order->is_complete() )
      return 0;
   return order->remaining_amount();
}

bool database::is_order_complete( const order_id_type& order_id )const
{
   const order_object* order = find_order( order_id );
   return order != nullptr && order->is_complete();
}

optional<preimage_type> database::get_fill_secret( const fill_id_type& fill_id )const
{
   const fill_object* fill = find_fill( fill_id );
   if( fill == nullptr )
      return optional<preimage_type>();
   return fill->preimage;
}

const address& database::get_admin()const
{
   return get_protocol_state().admin;
}

basis_points_type database::get_fee_rate()const
{
   return get_protocol_state().fee_rate_bps;
}

share_type database::get_accumulated_fees()const
{
   return get_protocol_state().accumulated_fees;
}

} }
