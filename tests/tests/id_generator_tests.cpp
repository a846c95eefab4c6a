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

#include <boost/test/unit_test.hpp>
#include <boost/endian/conversion.hpp>

#include <hashvault/chain/database.hpp>
#include <hashvault/chain/id_generator.hpp>

#include "../common/database_fixture.hpp"

using namespace hashvault::chain;
using namespace hashvault::chain::test;

BOOST_FIXTURE_TEST_SUITE( id_generator_tests, database_fixture )

BOOST_AUTO_TEST_CASE( order_id_encoding )
{ try {
   const address maker = address::from_name( "maker" );
   const hashlock_type lock = fc::sha256::hash( string( "lock" ) );
   const swap_id_type swap = fc::sha256::hash( string( "swap" ) );

   fc::sha256::encoder enc;
   enc.write( maker.addr.data(), maker.addr.data_size() );
   const int64_t net = boost::endian::native_to_little( int64_t( 997 ) );
   enc.write( reinterpret_cast<const char*>( &net ), sizeof( net ) );
   enc.write( lock.data(), lock.data_size() );
   const uint32_t timelock = boost::endian::native_to_little( uint32_t( 1001 ) );
   enc.write( reinterpret_cast<const char*>( &timelock ), sizeof( timelock ) );
   enc.write( swap.data(), swap.data_size() );
   const uint64_t counter = boost::endian::native_to_little( uint64_t( 7 ) );
   enc.write( reinterpret_cast<const char*>( &counter ), sizeof( counter ) );

   BOOST_CHECK( derive_order_id( maker, 997, lock, 1001, swap, 7 ) == enc.result() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( order_id_integers_are_little_endian_bytes )
{ try {
   const address maker = address::from_name( "maker" );
   const hashlock_type lock = fc::sha256::hash( string( "lock" ) );
   const swap_id_type swap = fc::sha256::hash( string( "swap" ) );

   // 997 = 0x03e5, 1001 = 0x03e9, counter 0x0102
   const char net[8]      = { '\xe5', '\x03', 0, 0, 0, 0, 0, 0 };
   const char timelock[4] = { '\xe9', '\x03', 0, 0 };
   const char counter[8]  = { '\x02', '\x01', 0, 0, 0, 0, 0, 0 };

   fc::sha256::encoder enc;
   enc.write( maker.addr.data(), maker.addr.data_size() );
   enc.write( net, sizeof( net ) );
   enc.write( lock.data(), lock.data_size() );
   enc.write( timelock, sizeof( timelock ) );
   enc.write( swap.data(), swap.data_size() );
   enc.write( counter, sizeof( counter ) );

   BOOST_CHECK( derive_order_id( maker, 997, lock, 1001, swap, 0x0102 ) == enc.result() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ids_depend_on_every_input )
{ try {
   const address maker = address::from_name( "maker" );
   const address other = address::from_name( "other" );
   const hashlock_type lock = fc::sha256::hash( string( "lock" ) );
   const swap_id_type swap = fc::sha256::hash( string( "swap" ) );
   const time_point_sec now( HASHVAULT_TESTING_GENESIS_TIMESTAMP );

   const order_id_type base = derive_order_id( maker, 997, lock, 1001, swap, 1 );
   BOOST_CHECK( base == derive_order_id( maker, 997, lock, 1001, swap, 1 ) );
   BOOST_CHECK( base != derive_order_id( other, 997, lock, 1001, swap, 1 ) );
   BOOST_CHECK( base != derive_order_id( maker, 996, lock, 1001, swap, 1 ) );
   BOOST_CHECK( base != derive_order_id( maker, 997, swap, 1001, swap, 1 ) );
   BOOST_CHECK( base != derive_order_id( maker, 997, lock, 1002, swap, 1 ) );
   BOOST_CHECK( base != derive_order_id( maker, 997, lock, 1001, lock, 1 ) );
   BOOST_CHECK( base != derive_order_id( maker, 997, lock, 1001, swap, 2 ) );

   const fill_id_type fill = derive_fill_id( base, maker, 200, now, 5 );
   BOOST_CHECK( fill == derive_fill_id( base, maker, 200, now, 5 ) );
   BOOST_CHECK( fill != derive_fill_id( base, other, 200, now, 5 ) );
   BOOST_CHECK( fill != derive_fill_id( base, maker, 201, now, 5 ) );
   BOOST_CHECK( fill != derive_fill_id( base, maker, 200, now + 1, 5 ) );
   BOOST_CHECK( fill != derive_fill_id( base, maker, 200, now, 6 ) );

   const escrow_id_type escrow = derive_escrow_id( base, fill, now, 1 );
   BOOST_CHECK( escrow == derive_escrow_id( base, fill, now, 1 ) );
   BOOST_CHECK( escrow != derive_escrow_id( base, fill, now, 2 ) );
   BOOST_CHECK( escrow != derive_escrow_id( base, fill, now + 6, 1 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( counter_separates_identical_orders )
{ try {
   ACTOR( alice );
   const preimage_type secret = make_preimage( "secret" );
   const order_create_operation op = make_order( 1000, secret );

   const order_id_type first = create_order( alice, op );
   const order_id_type second = create_order( alice, op );

   BOOST_CHECK( first != second );
   BOOST_CHECK_EQUAL( db.get_protocol_state().order_counter, 2u );
   BOOST_CHECK( first == derive_order_id( alice, 997, op.hashlock, op.timelock, op.swap_id, 1 ) );
   BOOST_CHECK( second == derive_order_id( alice, 997, op.hashlock, op.timelock, op.swap_id, 2 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_and_escrow_ids_follow_head_block )
{ try {
   ACTORS( (alice)(bob) );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "secret" ) );

   generate_blocks( 3 );
   const fill_id_type fill_id = fill( bob, order_id, 200 );

   BOOST_CHECK( fill_id == derive_fill_id( order_id, bob, 200, db.head_block_time(), db.head_block_num() ) );
   const fill_object& f = get_fill( fill_id );
   BOOST_CHECK( f.escrow_id == derive_escrow_id( order_id, fill_id, db.head_block_time(), 1 ) );
   BOOST_CHECK_EQUAL( db.get_protocol_state().fill_counter, 1u );
   BOOST_CHECK( f.created_at == db.head_block_time() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_id_collision_is_rejected )
{ try {
   ACTORS( (alice)(bob) );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "secret" ) );

   fill( bob, order_id, 100 );
   // same taker, amount and block derive the same fill id
   HASHVAULT_REQUIRE_THROW( fill( bob, order_id, 100 ), fill_already_exists );
   HASHVAULT_REQUIRE_THROW( fill( bob, order_id, 100 ), already_exists_exception );

   const order_object& order = get_order( order_id );
   BOOST_CHECK_EQUAL( order.filled_amount.value, 100 );
   BOOST_CHECK_EQUAL( order.current_fills, 1u );
   BOOST_CHECK_EQUAL( db.get_protocol_state().fill_counter, 1u );

   // a different amount or a later block is a different fill
   fill( bob, order_id, 101 );
   generate_blocks( 1 );
   fill( bob, order_id, 100 );
   BOOST_CHECK_EQUAL( get_order( order_id ).current_fills, 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
