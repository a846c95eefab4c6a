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
#include <hashvault/protocol/fee.hpp>
#include <hashvault/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

#include <limits>

namespace hashvault { namespace protocol {

namespace {

   share_type narrow( const fc::uint128_t& r )
   {
      HASHVAULT_ASSERT( r <= fc::uint128_t( static_cast<uint64_t>( std::numeric_limits<int64_t>::max() ) ),
                        arithmetic_overflow_exception, "Result does not fit an amount", );
      return static_cast<int64_t>( static_cast<uint64_t>( r ) );
   }

}

fee_split compute_fee( share_type gross_amount, basis_points_type fee_rate_bps )
{ try {
   HASHVAULT_ASSERT( gross_amount >= 0, arithmetic_overflow_exception,
                     "Negative amount ${a}", ("a",gross_amount) );

   fc::uint128_t r = static_cast<uint64_t>( gross_amount.value );
   r *= fee_rate_bps;
   r /= HASHVAULT_100_PERCENT;

   fee_split result;
   result.fee = narrow( r );
   result.net_amount = gross_amount - result.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (gross_amount)(fee_rate_bps) ) }

share_type compute_dest_amount( share_type amount, share_type rate )
{ try {
   HASHVAULT_ASSERT( amount >= 0 && rate >= 0, arithmetic_overflow_exception,
                     "Negative input", ("amount",amount)("rate",rate) );

   fc::uint128_t r = static_cast<uint64_t>( amount.value );
   r *= static_cast<uint64_t>( rate.value );
   r /= HASHVAULT_RATE_PRECISION;
   return narrow( r );
} FC_CAPTURE_AND_RETHROW( (amount)(rate) ) }

} } // hashvault::protocol
