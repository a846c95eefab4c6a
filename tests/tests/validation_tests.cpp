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

#include <hashvault/chain/fill_object.hpp>
#include <hashvault/chain/order_object.hpp>
#include <hashvault/chain/swap_validation.hpp>
#include <hashvault/protocol/operations.hpp>

#include "../common/database_fixture.hpp"

using namespace hashvault::chain;
using namespace hashvault::chain::test;

namespace {

   order_object make_order_object( share_type total, share_type filled, share_type min_fill, bool partial )
   {
      order_object order;
      order.order_id            = fc::sha256::hash( string( "order" ) );
      order.maker               = address::from_name( "maker" );
      order.total_amount        = total;
      order.filled_amount       = filled;
      order.min_fill_amount     = min_fill;
      order.timelock            = 500;
      order.allow_partial_fills = partial;
      order.max_fills           = 3;
      order.current_fills       = 0;
      return order;
   }

   fill_object make_fill_object( const order_object& order )
   {
      fill_object fill;
      fill.fill_id     = fc::sha256::hash( string( "fill" ) );
      fill.order_id    = order.order_id;
      fill.taker       = address::from_name( "taker" );
      fill.fill_amount = 100;
      return fill;
   }

}

BOOST_AUTO_TEST_SUITE( validation_tests )

BOOST_AUTO_TEST_CASE( timelock_bounds )
{ try {
   // now = 1000, allowed duration [100, 14400]
   validate_timelock( 1100, 1000, 100, 14400 );
   validate_timelock( 15400, 1000, 100, 14400 );

   HASHVAULT_REQUIRE_THROW( validate_timelock( 1000, 1000, 100, 14400 ), invalid_timelock );
   HASHVAULT_REQUIRE_THROW( validate_timelock( 999, 1000, 100, 14400 ), invalid_timelock );
   HASHVAULT_REQUIRE_THROW( validate_timelock( 1099, 1000, 100, 14400 ), timelock_too_short );
   HASHVAULT_REQUIRE_THROW( validate_timelock( 15401, 1000, 100, 14400 ), timelock_too_long );

   HASHVAULT_CHECK_THROW( validate_timelock( 1099, 1000, 100, 14400 ), invalid_parameter_exception );
   HASHVAULT_CHECK_THROW( validate_timelock( 15401, 1000, 100, 14400 ), invalid_parameter_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( chain_pair )
{ try {
   validate_chain_pair( 1, 2 );
   HASHVAULT_REQUIRE_THROW( validate_chain_pair( 7, 7 ), invalid_chain_pair );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_bounds )
{ try {
   validate_fill_bounds( 997, 1, 1 );
   validate_fill_bounds( 997, 997, 10 );

   HASHVAULT_REQUIRE_THROW( validate_fill_bounds( 997, 0, 1 ), invalid_fill_bounds );
   HASHVAULT_REQUIRE_THROW( validate_fill_bounds( 997, -1, 1 ), invalid_fill_bounds );
   HASHVAULT_REQUIRE_THROW( validate_fill_bounds( 997, 998, 1 ), invalid_fill_bounds );
   HASHVAULT_REQUIRE_THROW( validate_fill_bounds( 997, 1, 0 ), invalid_fill_bounds );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_eligibility )
{ try {
   order_object order = make_order_object( 1000, 0, 10, true );
   validate_fill_eligibility( order, 1, 499 );

   HASHVAULT_REQUIRE_THROW( validate_fill_eligibility( order, 0, 499 ), invalid_fill_amount );
   HASHVAULT_REQUIRE_THROW( validate_fill_eligibility( order, 10, 500 ), timelock_expired );
   HASHVAULT_CHECK_THROW( validate_fill_eligibility( order, 10, 500 ), timing_violation_exception );

   order.current_fills = 3;
   HASHVAULT_REQUIRE_THROW( validate_fill_eligibility( order, 10, 499 ), max_fills_reached );

   order.filled_amount = 1000;
   HASHVAULT_REQUIRE_THROW( validate_fill_eligibility( order, 10, 499 ), order_complete );

   // cancellation is reported ahead of every other condition
   order.cancelled = true;
   HASHVAULT_REQUIRE_THROW( validate_fill_eligibility( order, 10, 600 ), order_cancelled );
   HASHVAULT_CHECK_THROW( validate_fill_eligibility( order, 10, 600 ), state_conflict_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_size_clamps_to_remaining )
{ try {
   order_object order = make_order_object( 1000, 400, 10, true );

   BOOST_CHECK_EQUAL( determine_fill_amount( order, 250 ).value, 250 );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 600 ).value, 600 );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 601 ).value, 600 );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 1000000 ).value, 600 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_size_minimum_and_dust )
{ try {
   order_object order = make_order_object( 1000, 400, 10, true );

   BOOST_CHECK_EQUAL( determine_fill_amount( order, 10 ).value, 10 );
   HASHVAULT_REQUIRE_THROW( determine_fill_amount( order, 9 ), fill_amount_too_small );

   // with less than the minimum left, the last fill may be smaller than the minimum
   order.filled_amount = 995;
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 3 ).value, 3 );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 50 ).value, 5 );

   // exactly the minimum left is not dust
   order.filled_amount = 990;
   HASHVAULT_REQUIRE_THROW( determine_fill_amount( order, 9 ), fill_amount_too_small );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 10 ).value, 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_size_without_partial_fills )
{ try {
   order_object order = make_order_object( 997, 0, 1, false );

   HASHVAULT_REQUIRE_THROW( determine_fill_amount( order, 500 ), partial_fills_not_allowed );
   HASHVAULT_CHECK_THROW( determine_fill_amount( order, 500 ), state_conflict_exception );
   HASHVAULT_REQUIRE_THROW( determine_fill_amount( order, 996 ), partial_fills_not_allowed );
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 997 ).value, 997 );
   // a request above the remainder is clamped and takes the whole order
   BOOST_CHECK_EQUAL( determine_fill_amount( order, 5000 ).value, 997 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( withdrawal_authorization )
{ try {
   const order_object order = make_order_object( 1000, 100, 1, true );
   fill_object fill = make_fill_object( order );
   const address taker = fill.taker;

   validate_withdrawal( fill, order, taker, 499 );

   HASHVAULT_REQUIRE_THROW( validate_withdrawal( fill, order, order.maker, 499 ), not_taker );
   HASHVAULT_CHECK_THROW( validate_withdrawal( fill, order, order.maker, 499 ), unauthorized_exception );
   HASHVAULT_REQUIRE_THROW( validate_withdrawal( fill, order, taker, 500 ), timelock_expired );

   fill.withdrawn = true;
   HASHVAULT_REQUIRE_THROW( validate_withdrawal( fill, order, taker, 499 ), fill_closed );
   fill.withdrawn = false;
   fill.refunded = true;
   HASHVAULT_REQUIRE_THROW( validate_withdrawal( fill, order, taker, 499 ), fill_closed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( refund_authorization )
{ try {
   const order_object order = make_order_object( 1000, 100, 1, true );
   fill_object fill = make_fill_object( order );

   validate_refund( fill, order, order.maker, 500 );
   validate_refund( fill, order, order.maker, 501 );

   HASHVAULT_REQUIRE_THROW( validate_refund( fill, order, fill.taker, 500 ), not_maker );
   HASHVAULT_REQUIRE_THROW( validate_refund( fill, order, order.maker, 499 ), timelock_not_expired );
   HASHVAULT_CHECK_THROW( validate_refund( fill, order, order.maker, 499 ), timing_violation_exception );

   fill.withdrawn = true;
   HASHVAULT_REQUIRE_THROW( validate_refund( fill, order, order.maker, 500 ), fill_closed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( secret_correctness )
{ try {
   const preimage_type secret = database_fixture::make_preimage( "secret" );
   order_object order = make_order_object( 1000, 0, 1, true );
   order.hashlock = database_fixture::hashlock_of( secret );

   BOOST_CHECK( preimage_matches( order.hashlock, secret ) );
   validate_preimage( order, secret );

   preimage_type wrong = secret;
   wrong.back() ^= 1;
   BOOST_CHECK( !preimage_matches( order.hashlock, wrong ) );
   HASHVAULT_REQUIRE_THROW( validate_preimage( order, wrong ), secret_mismatch_exception );

   // the hashlock is compared, not the secret itself
   order.hashlock = database_fixture::hashlock_of( wrong );
   HASHVAULT_REQUIRE_THROW( validate_preimage( order, secret ), secret_mismatch_exception );
   validate_preimage( order, wrong );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operation_validation )
{ try {
   order_create_operation create;
   create.total_amount = 1000;
   create.validate();

   create.total_amount = 0;
   HASHVAULT_REQUIRE_THROW( create.validate(), invalid_parameter_exception );
   create.total_amount = HASHVAULT_MAX_SHARE_SUPPLY + 1;
   HASHVAULT_REQUIRE_THROW( create.validate(), invalid_parameter_exception );
   create.total_amount = 1000;
   create.dest_amount_per_unit = -1;
   HASHVAULT_REQUIRE_THROW( create.validate(), invalid_parameter_exception );

   order_fill_operation fill;
   fill.fill_amount = 0;
   fill.validate();
   fill.fill_amount = -1;
   HASHVAULT_REQUIRE_THROW( fill.validate(), invalid_fill_amount );

   fill_withdraw_operation withdraw;
   withdraw.preimage = database_fixture::make_preimage( "secret" );
   withdraw.validate();
   withdraw.preimage.push_back( 0 );
   HASHVAULT_REQUIRE_THROW( withdraw.validate(), invalid_preimage_size );
   withdraw.preimage.clear();
   HASHVAULT_REQUIRE_THROW( withdraw.validate(), invalid_preimage_size );

   admin_update_operation update;
   HASHVAULT_REQUIRE_THROW( update.validate(), invalid_parameter_exception );
   update.new_admin = address::from_name( "next" );
   update.validate();

   HASHVAULT_REQUIRE_THROW( operation_validate( order_cancelled_operation() ), invalid_operation );
   BOOST_CHECK( is_virtual_operation( order_filled_operation() ) );
   BOOST_CHECK( !is_virtual_operation( order_cancel_operation() ) );
   BOOST_CHECK_EQUAL( operation_name( fee_sweep_operation() ), "fee_sweep" );
   BOOST_CHECK_EQUAL( operation_name( fill_withdrawn_operation() ), "fill_withdrawn" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
