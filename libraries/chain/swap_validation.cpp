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
#include <hashvault/chain/swap_validation.hpp>

#include <algorithm>

namespace hashvault { namespace chain {

void validate_timelock( block_num_type timelock, block_num_type now,
                        block_num_type min_timelock, block_num_type max_timelock )
{
   HASHVAULT_ASSERT( timelock > now, invalid_timelock,
                     "Timelock ${t} is not after the head block ${n}", ("t",timelock)("n",now) );
   const block_num_type duration = timelock - now;
   HASHVAULT_ASSERT( duration >= min_timelock, timelock_too_short,
                     "Timelock duration ${d} is below the minimum ${min}", ("d",duration)("min",min_timelock) );
   HASHVAULT_ASSERT( duration <= max_timelock, timelock_too_long,
                     "Timelock duration ${d} exceeds the maximum ${max}", ("d",duration)("max",max_timelock) );
}

void validate_chain_pair( chain_code_type source_chain, chain_code_type dest_chain )
{
   HASHVAULT_ASSERT( source_chain != dest_chain, invalid_chain_pair,
                     "Source and destination chain are both ${c}", ("c",source_chain) );
}

void validate_fill_bounds( share_type total_amount, share_type min_fill_amount, uint32_t max_fills )
{
   HASHVAULT_ASSERT( min_fill_amount > 0, invalid_fill_bounds,
                     "Minimum fill amount must be positive", ("min_fill_amount",min_fill_amount) );
   HASHVAULT_ASSERT( min_fill_amount <= total_amount, invalid_fill_bounds,
                     "Minimum fill amount ${m} exceeds the order amount ${t}",
                     ("m",min_fill_amount)("t",total_amount) );
   HASHVAULT_ASSERT( max_fills > 0, invalid_fill_bounds, "An order must allow at least one fill", );
}

void validate_fill_eligibility( const order_object& order, share_type requested_amount, block_num_type now )
{
   HASHVAULT_ASSERT( !order.cancelled, order_cancelled, "Order ${o} is cancelled", ("o",order.order_id) );
   HASHVAULT_ASSERT( now < order.timelock, timelock_expired,
                     "Order ${o} expired at block ${t}", ("o",order.order_id)("t",order.timelock) );
   HASHVAULT_ASSERT( !order.is_complete(), order_complete, "Order ${o} is completely filled", ("o",order.order_id) );
   HASHVAULT_ASSERT( order.current_fills < order.max_fills, max_fills_reached,
                     "Order ${o} already has ${n} fills", ("o",order.order_id)("n",order.current_fills) );
   HASHVAULT_ASSERT( requested_amount > 0, invalid_fill_amount,
                     "Fill amount must be positive", ("requested",requested_amount) );
}

share_type determine_fill_amount( const order_object& order, share_type requested_amount )
{
   const share_type remaining = order.remaining_amount();
   const share_type amount = std::min( requested_amount, remaining );

   HASHVAULT_ASSERT( amount >= order.min_fill_amount || remaining < order.min_fill_amount, fill_amount_too_small,
                     "Fill of ${a} is below the minimum ${m} while ${r} remains",
                     ("a",amount)("m",order.min_fill_amount)("r",remaining) );
   HASHVAULT_ASSERT( order.allow_partial_fills || amount == remaining, partial_fills_not_allowed,
                     "Order ${o} must be filled completely, ${r} remains",
                     ("o",order.order_id)("r",remaining)("requested",requested_amount) );
   return amount;
}

void validate_withdrawal( const fill_object& fill, const order_object& order, const address& caller,
                          block_num_type now )
{
   HASHVAULT_ASSERT( caller == fill.taker, not_taker,
                     "Only the taker may withdraw the fill", ("caller",caller)("taker",fill.taker) );
   HASHVAULT_ASSERT( !fill.is_closed(), fill_closed, "Fill ${f} is already closed", ("f",fill.fill_id) );
   HASHVAULT_ASSERT( now < order.timelock, timelock_expired,
                     "Order ${o} expired at block ${t}", ("o",order.order_id)("t",order.timelock) );
}

void validate_refund( const fill_object& fill, const order_object& order, const address& caller,
                      block_num_type now )
{
   HASHVAULT_ASSERT( caller == order.maker, not_maker,
                     "Only the maker may refund the fill", ("caller",caller)("maker",order.maker) );
   HASHVAULT_ASSERT( !fill.is_closed(), fill_closed, "Fill ${f} is already closed", ("f",fill.fill_id) );
   HASHVAULT_ASSERT( now >= order.timelock, timelock_not_expired,
                     "Order ${o} does not expire before block ${t}", ("o",order.order_id)("t",order.timelock) );
}

bool preimage_matches( const hashlock_type& hashlock, const preimage_type& preimage )
{
   const fc::sha256 digest = fc::sha256::hash( preimage.data(), static_cast<uint32_t>( preimage.size() ) );
   const char* a = digest.data();
   const char* b = hashlock.data();
   uint8_t diff = 0;
   for( size_t i = 0; i < digest.data_size(); ++i )
      diff |= static_cast<uint8_t>( a[i] ^ b[i] );
   return diff == 0;
}

void validate_preimage( const order_object& order, const preimage_type& preimage )
{
   HASHVAULT_ASSERT( preimage_matches( order.hashlock, preimage ), secret_mismatch_exception,
                     "Provided preimage does not generate the hashlock of order ${o}", ("o",order.order_id) );
}

} } // hashvault::chain
