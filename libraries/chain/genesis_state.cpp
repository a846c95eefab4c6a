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

#include <hashvault/chain/genesis_state.hpp>
#include <hashvault/protocol/exceptions.hpp>

namespace hashvault { namespace chain {

void genesis_state_type::validate()const
{ try {
   HASHVAULT_ASSERT( !initial_admin.is_null(), invalid_parameter_exception, "Genesis needs an admin", );
   HASHVAULT_ASSERT( initial_fee_rate_bps <= HASHVAULT_MAX_FEE_RATE_BPS, invalid_fee_rate,
                     "Initial fee rate ${r} exceeds ${max}", ("r",initial_fee_rate_bps)("max",HASHVAULT_MAX_FEE_RATE_BPS) );
   HASHVAULT_ASSERT( min_timelock > 0, invalid_timelock, "Minimum timelock must be positive", );
   HASHVAULT_ASSERT( min_timelock <= max_timelock, invalid_timelock,
                     "Minimum timelock ${min} exceeds maximum ${max}", ("min",min_timelock)("max",max_timelock) );
   for( const auto& b : initial_balances )
      HASHVAULT_ASSERT( b.amount >= 0, invalid_parameter_exception,
                        "Negative initial balance for ${o}", ("o",b.owner) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // hashvault::chain
