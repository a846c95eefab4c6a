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

#include <hashvault/app/call_replay.hpp>
#include <hashvault/chain/order_object.hpp>

#include <fc/io/json.hpp>

#include "../common/database_fixture.hpp"

#include <sstream>

using namespace hashvault::app;
using namespace hashvault::chain;
using namespace hashvault::chain::test;

BOOST_FIXTURE_TEST_SUITE( call_replay_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_call_hands_value_back )
{ try {
   ACTOR( alice );

   vector<scripted_call> script( 2 );
   script[0].caller = alice;
   script[0].value  = 1000;
   script[0].op     = make_order( 1000, make_preimage( "s" ) );

   order_create_operation bad = make_order( 1000, make_preimage( "t" ) );
   bad.min_fill_amount = 998;
   script[1].caller = alice;
   script[1].value  = 1000;
   script[1].block  = db.head_block_num() + 5;
   script[1].op     = bad;

   // the script goes through the same json form the node reads
   script = fc::json::from_string( fc::json::to_string( script ) )
               .as<vector<scripted_call>>( HASHVAULT_MAX_NESTED_OBJECTS );

   std::ostringstream out;
   BOOST_CHECK( replay_call( db, ledger, script[0], 0, out ) );
   BOOST_CHECK( !replay_call( db, ledger, script[1], 1, out ) );

   std::istringstream lines( out.str() );
   string first, second;
   std::getline( lines, first );
   std::getline( lines, second );
   BOOST_CHECK_EQUAL( first.compare( 0, 19, "#0 order_create ok " ), 0 );
   BOOST_CHECK_EQUAL( second.compare( 0, 23, "#1 order_create failed:" ), 0 );

   const auto& orders = db.get_index_type<order_index>().indices();
   BOOST_REQUIRE_EQUAL( orders.size(), 1u );
   const order_object& order = *orders.begin();
   BOOST_CHECK( first.find( order.order_id.str() ) != string::npos );
   BOOST_CHECK_EQUAL( order.total_amount.value, 997 );

   // the block advance happens before the call and stays after it fails
   BOOST_CHECK_EQUAL( db.head_block_num(), *script[1].block );
   BOOST_CHECK_EQUAL( db.get_protocol_state().order_counter, 1u );
   BOOST_CHECK_EQUAL( ledger.balance( alice ).value, initial_actor_balance.value - 1000 );
   BOOST_CHECK_EQUAL( ledger.escrow_balance().value, 1000 );
   verify_escrow_balance();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unfunded_call_is_not_submitted )
{ try {
   const address nobody = address::from_name( "nobody" );

   scripted_call call;
   call.caller = nobody;
   call.value  = 1000;
   call.op     = make_order( 1000, make_preimage( "s" ) );

   std::ostringstream out;
   BOOST_CHECK( !replay_call( db, ledger, call, 3, out ) );
   BOOST_CHECK_EQUAL( out.str().compare( 0, 30, "#3 order_create not submitted:" ), 0 );

   BOOST_CHECK_EQUAL( ledger.balance( nobody ).value, 0 );
   BOOST_CHECK_EQUAL( ledger.escrow_balance().value, 0 );
   BOOST_CHECK_EQUAL( db.get_index_type<order_index>().indices().size(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
