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

#include <hashvault/chain/database.hpp>
#include <hashvault/chain/fill_object.hpp>
#include <hashvault/chain/order_object.hpp>

#include "../common/database_fixture.hpp"

using namespace hashvault::chain;
using namespace hashvault::chain::test;

BOOST_FIXTURE_TEST_SUITE( atomicity_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_withdraw_changes_nothing )
{ try {
   ACTORS( (alice)(bob) );
   const preimage_type secret = make_preimage( "s" );
   const order_id_type order_id = create_order( alice, 1000, secret );
   const fill_id_type fill_id = fill( bob, order_id, 200 );
   const size_t history_size = db.get_applied_operations().size();

   ledger.reject_transfers_to( bob );
   HASHVAULT_REQUIRE_THROW( withdraw( bob, fill_id, secret ), transfer_failure_exception );

   const fill_object& f = get_fill( fill_id );
   BOOST_CHECK( !f.withdrawn );
   BOOST_CHECK( !f.preimage.valid() );
   BOOST_CHECK( !db.get_fill_secret( fill_id ).valid() );
   BOOST_CHECK_EQUAL( ledger.balance( bob ).value, initial_actor_balance.value );
   BOOST_CHECK_EQUAL( db.get_applied_operations().size(), history_size );

   ledger.reject_transfers_to( bob, false );
   withdraw( bob, fill_id, secret );
   BOOST_CHECK( get_fill( fill_id ).withdrawn );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_refund_changes_nothing )
{ try {
   ACTORS( (alice)(bob) );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );
   const fill_id_type fill_id = fill( bob, order_id, 200 );
   generate_blocks_until( get_order( order_id ).timelock );

   ledger.reject_transfers_to( alice );
   HASHVAULT_REQUIRE_THROW( refund( alice, fill_id ), transfer_failure_exception );

   BOOST_CHECK( !get_fill( fill_id ).refunded );
   const order_object& order = get_order( order_id );
   BOOST_CHECK_EQUAL( order.filled_amount.value, 200 );
   BOOST_CHECK_EQUAL( order.refunded_amount.value, 0 );
   BOOST_CHECK_EQUAL( order.current_fills, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_cancel_changes_nothing )
{ try {
   ACTORS( (alice) );
   const order_id_type order_id = create_order( alice, 1000, make_preimage( "s" ) );

   ledger.reject_transfers_to( alice );
   HASHVAULT_REQUIRE_THROW( cancel( alice, order_id ), transfer_failure_exception );
   BOOST_CHECK( !get_order( order_id ).cancelled );
   BOOST_CHECK_EQUAL( db.get_remaining_amount( order_id ).value, 997 );

   ledger.reject_transfers_to( alice, false );
   cancel( alice, order_id );
   BOOST_CHECK( get_order( order_id ).cancelled );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_surplus_return_undoes_order )
{ try {
   ACTORS( (alice) );
   ledger.reject_transfers_to( alice );

   HASHVAULT_REQUIRE_THROW( create_order( alice, make_order( 1000, make_preimage( "s" ) ), 1500 ),
                            transfer_failure_exception );

   BOOST_CHECK_EQUAL( db.get_index_type<order_index>().indices().size(), 0u );
   BOOST_CHECK_EQUAL( db.get_protocol_state().order_counter, 0u );
   BOOST_CHECK_EQUAL( db.get_accumulated_fees().value, 0 );
   BOOST_CHECK_EQUAL( ledger.balance( alice ).value, initial_actor_balance.value );
   BOOST_CHECK_EQUAL( ledger.escrow_balance().value, 0 );

   // an exact deposit needs no transfer back
   create_order( alice, make_order( 1000, make_preimage( "s" ) ), 1000 );
   BOOST_CHECK_EQUAL( db.get_protocol_state().order_counter, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( overflow_undoes_fill )
{ try {
   ACTORS( (alice)(bob) );
   ledger.credit( alice, 2000000000000ll );

   order_create_operation op = make_order( 2000000000000ll, make_preimage( "s" ) );
   op.dest_amount_per_unit = std::numeric_limits<int64_t>::max();
   const order_id_type order_id = create_order( alice, op );

   // the dest amount of a fill does not fit an amount
   HASHVAULT_REQUIRE_THROW( fill( bob, order_id, 1900000000000ll ), arithmetic_overflow_exception );

   const order_object& order = get_order( order_id );
   BOOST_CHECK_EQUAL( order.filled_amount.value, 0 );
   BOOST_CHECK_EQUAL( order.current_fills, 0u );
   BOOST_CHECK( order.fills.empty() );
   BOOST_CHECK_EQUAL( db.get_protocol_state().fill_counter, 0u );
   BOOST_CHECK_EQUAL( db.get_index_type<fill_index>().indices().size(), 0u );

   fill( bob, order_id, 1000 );
   BOOST_CHECK_EQUAL( get_order( order_id ).current_fills, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_session_restores_objects )
{ try {
   {
      auto session = db._undo_db.start_undo_session();
      db.modify( db.get_protocol_state(), []( protocol_state_object& s ) {
         s.fee_rate_bps = 77;
      });
      BOOST_CHECK_EQUAL( db.get_fee_rate(), 77 );
   }
   BOOST_CHECK_EQUAL( db.get_fee_rate(), HASHVAULT_DEFAULT_FEE_RATE_BPS );

   {
      auto session = db._undo_db.start_undo_session();
      db.modify( db.get_protocol_state(), []( protocol_state_object& s ) {
         s.fee_rate_bps = 77;
      });
      session.commit();
   }
   BOOST_CHECK_EQUAL( db.get_fee_rate(), 77 );

   {
      auto outer = db._undo_db.start_undo_session();
      {
         auto inner = db._undo_db.start_undo_session();
         BOOST_CHECK_EQUAL( db._undo_db.depth(), 2u );
         db.modify( db.get_protocol_state(), []( protocol_state_object& s ) {
            s.fee_rate_bps = 55;
         });
         inner.commit();
      }
      BOOST_CHECK_EQUAL( db._undo_db.depth(), 1u );
      BOOST_CHECK_EQUAL( db.get_fee_rate(), 55 );
   }
   // the committed inner session was folded into the outer one and undone with it
   BOOST_CHECK_EQUAL( db.get_fee_rate(), 77 );
   BOOST_CHECK_EQUAL( db._undo_db.depth(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_session_removes_created_objects )
{ try {
   const auto& idx = db.get_index_type<order_index>();
   {
      auto session = db._undo_db.start_undo_session();
      const order_object& order = db.create<order_object>( []( order_object& o ) {
         o.order_id = fc::sha256::hash( string( "temporary" ) );
         o.total_amount = 10;
      });
      BOOST_CHECK_EQUAL( order.id.instance(), 0u );
      BOOST_CHECK_EQUAL( idx.size(), 1u );
   }
   BOOST_CHECK_EQUAL( idx.size(), 0u );
   BOOST_CHECK( !db.order_exists( fc::sha256::hash( string( "temporary" ) ) ) );

   // the instance counter is rolled back as well
   const order_object& order = db.create<order_object>( []( order_object& o ) {
      o.order_id = fc::sha256::hash( string( "kept" ) );
   });
   BOOST_CHECK_EQUAL( order.id.instance(), 0u );
   db.remove( order );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_session_restores_removed_objects )
{ try {
   const order_id_type key = fc::sha256::hash( string( "removed" ) );
   const object_id_type id = db.create<order_object>( [&key]( order_object& o ) {
      o.order_id = key;
      o.total_amount = 10;
   }).id;

   {
      auto outer = db._undo_db.start_undo_session();
      db.modify( db.get<order_object>( id ), []( order_object& o ) {
         o.total_amount = 20;
      });
      {
         auto inner = db._undo_db.start_undo_session();
         db.remove( db.get<order_object>( id ) );
         inner.commit();
      }
      BOOST_CHECK( !db.order_exists( key ) );
   }

   // the value from before the outer session comes back
   BOOST_REQUIRE( db.order_exists( key ) );
   BOOST_CHECK_EQUAL( db.get_order( key ).total_amount.value, 10 );
   db.remove( db.get_order( key ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( memory_ledger_failures )
{ try {
   ACTORS( (alice)(bob) );
   memory_ledger l;
   l.credit( alice, 100 );

   HASHVAULT_REQUIRE_THROW( l.attach_value( alice, 101 ), fc::exception );
   l.attach_value( alice, 60 );
   BOOST_CHECK_EQUAL( l.balance( alice ).value, 40 );
   BOOST_CHECK_EQUAL( l.escrow_balance().value, 60 );

   HASHVAULT_REQUIRE_THROW( l.transfer( bob, 61 ), fc::exception );
   HASHVAULT_REQUIRE_THROW( l.transfer( bob, 0 ), fc::exception );
   l.reject_transfers_to( bob );
   HASHVAULT_REQUIRE_THROW( l.transfer( bob, 10 ), fc::exception );
   l.reject_transfers_to( bob, false );
   l.transfer( bob, 10 );
   BOOST_CHECK_EQUAL( l.balance( bob ).value, 10 );

   l.return_value( alice, 50 );
   BOOST_CHECK_EQUAL( l.balance( alice ).value, 90 );
   BOOST_CHECK_EQUAL( l.escrow_balance().value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
