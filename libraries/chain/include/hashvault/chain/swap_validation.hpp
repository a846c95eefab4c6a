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
#pragma once

#include <hashvault/chain/order_object.hpp>
#include <hashvault/chain/fill_object.hpp>

namespace hashvault { namespace chain {

   /**
    *  @defgroup swap_validation Escrow preconditions
    *
    *  Pure checks over the arguments and the stored records.  Each throws the specific
    *  exception of the failed condition and none of them modifies state.
    *
    *  @{
    */

   /**
    *  Requires now < timelock and min_timelock <= timelock - now <= max_timelock.
    *  @throws invalid_timelock, timelock_too_short, timelock_too_long
    */
   void validate_timelock( block_num_type timelock, block_num_type now,
                           block_num_type min_timelock, block_num_type max_timelock );

   /** @throws invalid_chain_pair if both chains are the same */
   void validate_chain_pair( chain_code_type source_chain, chain_code_type dest_chain );

   /**
    *  Requires 0 < min_fill_amount <= total_amount and max_fills > 0.
    *  @throws invalid_fill_bounds
    */
   void validate_fill_bounds( share_type total_amount, share_type min_fill_amount, uint32_t max_fills );

   /**
    *  Checks, in order: not cancelled, now before the timelock, not complete, fill capacity left,
    *  positive request.
    */
   void validate_fill_eligibility( const order_object& order, share_type requested_amount, block_num_type now );

   /**
    *  Applies the fill size policy to an eligible request and returns the amount to fill.
    *
    *  A request above the remainder is clamped to the remainder.  A clamped amount below
    *  min_fill_amount is refused while the remainder is at least min_fill_amount, so only
    *  the final fill of an order may be smaller than the minimum.  An order that does not
    *  allow partial fills only accepts the whole remainder.
    *
    *  @throws fill_amount_too_small, partial_fills_not_allowed
    */
   share_type determine_fill_amount( const order_object& order, share_type requested_amount );

   /**
    *  @throws not_taker, fill_closed, timelock_expired
    */
   void validate_withdrawal( const fill_object& fill, const order_object& order, const address& caller,
                             block_num_type now );

   /**
    *  @throws not_maker, fill_closed, timelock_not_expired
    */
   void validate_refund( const fill_object& fill, const order_object& order, const address& caller,
                         block_num_type now );

   /**
    *  Compares sha256( preimage ) with the hashlock over every byte.
    */
   bool preimage_matches( const hashlock_type& hashlock, const preimage_type& preimage );

   /** @throws secret_mismatch_exception */
   void validate_preimage( const order_object& order, const preimage_type& preimage );

   ///@}

} } // hashvault::chain
