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

#include <hashvault/app/database_api.hpp>
#include <hashvault/chain/fill_object.hpp>
#include <hashvault/chain/order_object.hpp>

#include "../common/database_fixture.hpp"

using namespace hashvault::app;
using namespace hashvault::chain;
using namespace hashvault::chain::test;

BOOST_FIXTURE_TEST_SUITE( database_api_tests, database_fixture )

BOOST_AUTO_TEST_CASE( unknown_ids )
{ try {
   database_api db_api( db );
   const order_id_type no_order = fc::sha256::hash( string( "no order" ) );
   const fill_id_type no_fill = fc::sha256::hash( string( "no fill" ) );

   BOOST_CHECK( !db_api.order_exists( no_order ) );
   BOOST_CHECK( !db_api.get_order( no_order ).valid() );
   BOOST_CHECK_EQUAL( db_api.get_remaining_amount( no_order ).value, 0 );
   BOOST_CHECK( !db_api.is_order_complete( no_order ) );
   BOOST_CHECK( db_api.get_order_fills( no_order ).empty() );

   BOOST_CHECK( !db_api.get_fill( no_fill ).valid() );
   BOOST_CHECK( !db_api.get_fill_secret( no_fill ).valid() );

   HASHVAULT_REQUIRE_THROW( db.get_order( no_order ), order_not_found );
   HASHVAULT_REQUIRE_THROW( db.get_fill( no_fill ), fill_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( globals )
{ try {
   database_api db_api( db );
   BOOST_CHECK( db_api.get_admin() == admin );
   BOOST_CHECK_EQUAL( db_api.get_fee_rate(), HASHVAULT_DEFAULT_FEE_RATE_BPS );
   BOOST_CHECK_EQUAL( db_api.get_accumulated_fees().value, 0 );
   BOOST_CHECK_EQUAL( db_api.get_dynamic_global_properties().head_block_number, 1u );
   BOOST_CHECK( db_api.get_dynamic_global_properties().time == time_point_sec( HASHVAULT_TESTING_GENESIS_TIMESTAMP ) );

   ACTOR( alice );
   create_order( alice, 1000, make_preimage( "s" ) );
   BOOST_CHECK_EQUAL( db_api.get_accumulated_fees().value, 3 );
   BOOST_CHECK_EQUAL( db_api.get_protocol_state().order_counter, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( order_queries )
{ try {
   database_api db_api( db );
   ACTORS( (alice)(bob)(carol) );
   const preimage_type secret = make_preimage( "s" );
   const order_id_type a1 = create_order( alice, 1000, secret );
   const order_id_type b1 = create_order( bob, 2000, secret );
   const order_id_type a2 = create_order( alice, 3000, secret );

   const fill_id_type f1 = fill( carol, a1, 997 );
   const fill_id_type f2 = fill( carol, a2, 100 );

   BOOST_CHECK( db_api.order_exists( a1 ) );
   BOOST_CHECK( db_api.is_order_complete( a1 ) );
   BOOST_CHECK_EQUAL( db_api.get_remaining_amount( a1 ).value, 0 );
   BOOST_CHECK_EQUAL( db_api.get_remaining_amount( a2 ).value, 2991 - 100 );

   const auto by_alice = db_api.get_orders_by_maker( alice, 10 );
   BOOST_REQUIRE_EQUAL( by_alice.size(), 2u );
   BOOST_CHECK( by_alice[0].order_id == a1 );
   BOOST_CHECK( by_alice[1].order_id == a2 );
   BOOST_CHECK_EQUAL( db_api.get_orders_by_maker( alice, 1 ).size(), 1u );
   BOOST_REQUIRE_EQUAL( db_api.get_orders_by_maker( bob, 10 ).size(), 1u );
   BOOST_CHECK( db_api.get_orders_by_maker( bob, 10 ).front().order_id == b1 );
   BOOST_CHECK( db_api.get_orders_by_maker( carol, 10 ).empty() );

   const auto by_carol = db_api.get_fills_by_taker( carol, 10 );
   BOOST_REQUIRE_EQUAL( by_carol.size(), 2u );
   BOOST_CHECK( by_carol[0].fill_id == f1 );
   BOOST_CHECK( by_carol[1].fill_id == f2 );
   BOOST_CHECK( db_api.get_fills_by_taker( alice, 10 ).empty() );

   BOOST_REQUIRE_EQUAL( db_api.get_order_fills( a2 ).size(), 1u );
   BOOST_CHECK( db_api.get_order_fills( a2 ).front() == f2 );

   withdraw( carol, f1, secret );
   BOOST_REQUIRE( db_api.get_fill_secret( f1 ).valid() );
   BOOST_CHECK( *db_api.get_fill_secret( f1 ) == secret );
   BOOST_CHECK( !db_api.get_fill_secret( f2 ).valid() );

   HASHVAULT_REQUIRE_THROW( db_api.get_orders_by_maker( alice, database_api::max_query_limit + 1 ), fc::exception );
   HASHVAULT_REQUIRE_THROW( db_api.get_fills_by_taker( carol, database_api::max_query_limit + 1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancelled_order_has_nothing_remaining )
{ try {
   database_api db_api( db );
   ACTOR( alice );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   cancel( alice, order_id );

   BOOST_CHECK( db_api.order_exists( order_id ) );
   BOOST_CHECK_EQUAL( db_api.get_remaining_amount( order_id ).value, 0 );
   BOOST_CHECK( !db_api.is_order_complete( order_id ) );
   BOOST_REQUIRE( db_api.get_order( order_id ).valid() );
   BOOST_CHECK( db_api.get_order( order_id )->cancelled );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( history_paging )
{ try {
   database_api db_api( db );
   ACTORS( (alice)(bob) );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   fill( bob, order_id, 100 );
   fill( bob, order_id, 100 );

   BOOST_CHECK_EQUAL( db_api.get_applied_operations( 0, 100 ).size(), 5u );

   const auto page = db_api.get_applied_operations( 1, 2 );
   BOOST_REQUIRE_EQUAL( page.size(), 2u );
   BOOST_CHECK_EQUAL( page[0].sequence, 1u );
   BOOST_CHECK( page[0].op.is_type<order_fill_operation>() );
   BOOST_CHECK_EQUAL( page[1].sequence, 2u );
   BOOST_CHECK( page[1].op.is_type<order_filled_operation>() );
   BOOST_CHECK( page[1].is_virtual );

   BOOST_CHECK_EQUAL( db_api.get_applied_operations( 4, 10 ).size(), 1u );
   BOOST_CHECK( db_api.get_applied_operations( 5, 10 ).empty() );
   HASHVAULT_REQUIRE_THROW( db_api.get_applied_operations( 0, database_api::max_query_limit + 1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operation_applied_callback )
{ try {
   database_api db_api( db );
   ACTORS( (alice)(bob) );

   vector<fc::variant> seen;
   db_api.set_operation_applied_callback( [&seen]( const fc::variant& v ) {
      seen.push_back( v );
   });

   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   BOOST_REQUIRE_EQUAL( seen.size(), 1u );
   BOOST_CHECK_EQUAL( seen[0]["sequence"].as_uint64(), 0u );
   BOOST_CHECK( !seen[0]["is_virtual"].as_bool() );

   fill( bob, order_id, 100 );
   BOOST_REQUIRE_EQUAL( seen.size(), 3u );
   BOOST_CHECK( seen[2]["is_virtual"].as_bool() );

   // failed calls publish nothing
   HASHVAULT_REQUIRE_THROW( fill( bob, order_id, 0 ), invalid_fill_amount );
   BOOST_CHECK_EQUAL( seen.size(), 3u );

   db_api.cancel_all_subscriptions();
   fill( bob, order_id, 100 );
   BOOST_CHECK_EQUAL( seen.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( observer_failure_does_not_undo_call )
{ try {
   database_api db_api( db );
   ACTOR( alice );
   db_api.set_operation_applied_callback( []( const fc::variant& ) {
      FC_THROW( "observer failed" );
   });

   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   BOOST_CHECK( db.order_exists( order_id ) );
   BOOST_CHECK_EQUAL( db.get_applied_operations().size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( get_objects )
{ try {
   database_api db_api( db );
   ACTOR( alice );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   const object_id_type order_object_id = get_order( order_id ).id;

   const auto objects = db_api.get_objects( { order_object_id,
                                              object_id_type( order_object_id.space(), order_object_id.type(), 7 ),
                                              object_id_type( implementation_ids, impl_protocol_state_object_type, 0 ) } );
   BOOST_REQUIRE_EQUAL( objects.size(), 3u );
   BOOST_CHECK_EQUAL( objects[0]["total_amount"].as_int64(), 997 );
   BOOST_CHECK( objects[1].is_null() );
   BOOST_CHECK_EQUAL( objects[2]["fee_rate_bps"].as_uint64(), HASHVAULT_DEFAULT_FEE_RATE_BPS );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
