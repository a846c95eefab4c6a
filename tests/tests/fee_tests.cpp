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

#include <limits>

#include <hashvault/protocol/fee.hpp>
#include <hashvault/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace hashvault::protocol;

BOOST_AUTO_TEST_SUITE( fee_tests )

BOOST_AUTO_TEST_CASE( fee_is_floored_basis_points )
{ try {
   fee_split s = compute_fee( 1000, 30 );
   BOOST_CHECK_EQUAL( s.fee.value, 3 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 997 );

   // 333 * 30 / 10000 = 0.999
   s = compute_fee( 333, 30 );
   BOOST_CHECK_EQUAL( s.fee.value, 0 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 333 );

   s = compute_fee( 334, 30 );
   BOOST_CHECK_EQUAL( s.fee.value, 1 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 333 );

   s = compute_fee( 123456789, HASHVAULT_MAX_FEE_RATE_BPS );
   BOOST_CHECK_EQUAL( s.fee.value, 12345678 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 111111111 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fee_boundaries )
{ try {
   fee_split s = compute_fee( 1000, 0 );
   BOOST_CHECK_EQUAL( s.fee.value, 0 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 1000 );

   s = compute_fee( 0, 30 );
   BOOST_CHECK_EQUAL( s.fee.value, 0 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 0 );

   s = compute_fee( 1000, HASHVAULT_100_PERCENT );
   BOOST_CHECK_EQUAL( s.fee.value, 1000 );
   BOOST_CHECK_EQUAL( s.net_amount.value, 0 );

   // the product does not fit 64 bits but the fee does
   const int64_t max = std::numeric_limits<int64_t>::max();
   s = compute_fee( max, HASHVAULT_MAX_FEE_RATE_BPS );
   BOOST_CHECK_EQUAL( s.fee.value, max / 10 );
   BOOST_CHECK_EQUAL( s.net_amount.value, max - max / 10 );
   BOOST_CHECK_EQUAL( ( s.fee + s.net_amount ).value, max );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fee_rejects_negative_amount )
{ try {
   HASHVAULT_REQUIRE_THROW( compute_fee( -1, 30 ), arithmetic_overflow_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dest_amount_uses_fixed_point_rate )
{ try {
   const int64_t one = int64_t( HASHVAULT_RATE_PRECISION );

   BOOST_CHECK_EQUAL( compute_dest_amount( 200, one ).value, 200 );
   BOOST_CHECK_EQUAL( compute_dest_amount( 200, one * 5 / 2 ).value, 500 );
   BOOST_CHECK_EQUAL( compute_dest_amount( 3, one / 2 ).value, 1 );
   BOOST_CHECK_EQUAL( compute_dest_amount( 200, 0 ).value, 0 );

   // intermediate product exceeds 64 bits
   BOOST_CHECK_EQUAL( compute_dest_amount( 4000000000000ll, one ).value, 4000000000000ll );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dest_amount_overflow )
{ try {
   const int64_t max = std::numeric_limits<int64_t>::max();
   const int64_t one = int64_t( HASHVAULT_RATE_PRECISION );

   HASHVAULT_REQUIRE_THROW( compute_dest_amount( max, one * 2 ), arithmetic_overflow_exception );
   HASHVAULT_REQUIRE_THROW( compute_dest_amount( -5, one ), arithmetic_overflow_exception );
   BOOST_CHECK_EQUAL( compute_dest_amount( max, one ).value, max );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
