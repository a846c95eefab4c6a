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
#include <hashvault/chain/id_generator.hpp>
#include <hashvault/chain/database.hpp>

#include <boost/endian/buffers.hpp>

namespace hashvault { namespace chain {

namespace {

   // buffers hold their value in little endian byte order on every host
   template<typename Buffer>
   void write_le( fc::sha256::encoder& enc, const Buffer& buf )
   {
      enc.write( reinterpret_cast<const char*>( buf.data() ), sizeof( buf ) );
   }

   void write_raw( fc::sha256::encoder& enc, const fc::sha256& h )
   {
      enc.write( h.data(), h.data_size() );
   }

   void write_raw( fc::sha256::encoder& enc, const address& a )
   {
      enc.write( a.addr.data(), a.addr.data_size() );
   }

}

order_id_type derive_order_id( const address& maker, share_type net_amount, const hashlock_type& hashlock,
                               block_num_type timelock, const swap_id_type& swap_id, uint64_t counter )
{
   fc::sha256::encoder enc;
   write_raw( enc, maker );
   write_le( enc, boost::endian::little_int64_buf_t( net_amount.value ) );
   write_raw( enc, hashlock );
   write_le( enc, boost::endian::little_uint32_buf_t( timelock ) );
   write_raw( enc, swap_id );
   write_le( enc, boost::endian::little_uint64_buf_t( counter ) );
   return enc.result();
}

fill_id_type derive_fill_id( const order_id_type& order_id, const address& taker, share_type fill_amount,
                             time_point_sec timestamp, block_num_type height )
{
   fc::sha256::encoder enc;
   write_raw( enc, order_id );
   write_raw( enc, taker );
   write_le( enc, boost::endian::little_int64_buf_t( fill_amount.value ) );
   write_le( enc, boost::endian::little_uint64_buf_t( timestamp.sec_since_epoch() ) );
   write_le( enc, boost::endian::little_uint32_buf_t( height ) );
   return enc.result();
}

escrow_id_type derive_escrow_id( const order_id_type& order_id, const fill_id_type& fill_id,
                                 time_point_sec timestamp, uint64_t counter )
{
   fc::sha256::encoder enc;
   write_raw( enc, order_id );
   write_raw( enc, fill_id );
   write_le( enc, boost::endian::little_uint64_buf_t( timestamp.sec_since_epoch() ) );
   write_le( enc, boost::endian::little_uint64_buf_t( counter ) );
   return enc.result();
}

order_id_type next_order_id( database& db, const address& maker, share_type net_amount,
                             const hashlock_type& hashlock, block_num_type timelock, const swap_id_type& swap_id )
{
   const auto& state = db.get_protocol_state();
   db.modify( state, []( protocol_state_object& s ) {
      ++s.order_counter;
   });
   return derive_order_id( maker, net_amount, hashlock, timelock, swap_id, state.order_counter );
}

fill_id_type next_fill_id( const database& db, const order_id_type& order_id, const address& taker,
                           share_type fill_amount )
{
   return derive_fill_id( order_id, taker, fill_amount, db.head_block_time(), db.head_block_num() );
}

escrow_id_type next_escrow_id( database& db, const order_id_type& order_id, const fill_id_type& fill_id )
{
   const auto& state = db.get_protocol_state();
   db.modify( state, []( protocol_state_object& s ) {
      ++s.fill_counter;
   });
   return derive_escrow_id( order_id, fill_id, db.head_block_time(), state.fill_counter );
}

} } // hashvault::chain
