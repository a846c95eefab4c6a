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

#include <hashvault/chain/types.hpp>

namespace hashvault { namespace chain {

   class database;

   /**
    *  @defgroup id_generator Identifier derivation
    *
    *  All identifiers are SHA-256 digests of a fixed field order.  Addresses and digests
    *  are hashed as their raw bytes, integers as little endian of their fixed width.
    *
    *  @{
    */

   /** sha256( maker | net_amount | hashlock | timelock | swap_id | counter ) */
   order_id_type derive_order_id( const address& maker, share_type net_amount, const hashlock_type& hashlock,
                                  block_num_type timelock, const swap_id_type& swap_id, uint64_t counter );

   /** sha256( order_id | taker | fill_amount | timestamp | height ) */
   fill_id_type derive_fill_id( const order_id_type& order_id, const address& taker, share_type fill_amount,
                                time_point_sec timestamp, block_num_type height );

   /** sha256( order_id | fill_id | timestamp | counter ) */
   escrow_id_type derive_escrow_id( const order_id_type& order_id, const fill_id_type& fill_id,
                                    time_point_sec timestamp, uint64_t counter );

   /**
    *  Increments the order counter of the protocol state, then derives the order id from it.
    */
   order_id_type next_order_id( database& db, const address& maker, share_type net_amount,
                                const hashlock_type& hashlock, block_num_type timelock, const swap_id_type& swap_id );

   /**
    *  Derives the id of a fill created at the current head block.  No counter is involved,
    *  the caller must treat an id that is already in use as an error.
    */
   fill_id_type next_fill_id( const database& db, const order_id_type& order_id, const address& taker,
                              share_type fill_amount );

   /**
    *  Increments the fill counter of the protocol state, then derives the escrow id from it.
    */
   escrow_id_type next_escrow_id( database& db, const order_id_type& order_id, const fill_id_type& fill_id );

   ///@}

} } // hashvault::chain
