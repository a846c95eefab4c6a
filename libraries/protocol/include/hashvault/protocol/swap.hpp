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

#include <hashvault/protocol/base.hpp>

namespace hashvault { namespace protocol {

   /**
    *  @brief lock value under a hashlock and a timelock and offer it for filling
    *
    *  The gross deposit must be attached to the call.  The protocol fee is taken
    *  from it and the remainder becomes the order's total_amount.
    *
    *  Result: the derived order id.
    */
   struct order_create_operation : public base_operation
   {
      /// gross amount to escrow, fee included
      share_type              total_amount;
      /// smallest amount a fill may claim unless it clears the remainder
      share_type              min_fill_amount;
      hashlock_type           hashlock;
      /// absolute block number
      block_num_type          timelock = 0;
      swap_id_type            swap_id;
      chain_code_type         source_chain = 0;
      chain_code_type         dest_chain = 0;
      /// destination amount per source unit, scaled by HASHVAULT_RATE_PRECISION
      share_type              dest_amount_per_unit;
      bool                    allow_partial_fills = true;
      uint32_t                max_fills = 1;

      optional<cross_address_type> sender_cross_address;
      optional<cross_address_type> receiver_cross_address;

      void validate()const;
   };

   /**
    *  @brief claim a portion of an order
    *
    *  Requests larger than the remainder are clamped to it.
    *
    *  Result: the derived fill id.
    */
   struct order_fill_operation : public base_operation
   {
      order_id_type                order_id;
      share_type                   fill_amount;
      /// destination side receiver, passed through
      optional<cross_address_type> receiver;

      void validate()const;
   };

   /**
    *  @brief reveal the secret and collect a fill before the timelock
    */
   struct fill_withdraw_operation : public base_operation
   {
      fill_id_type   fill_id;
      preimage_type  preimage;

      void validate()const;
   };

   /**
    *  @brief return a fill to the maker once the timelock has passed
    */
   struct fill_refund_operation : public base_operation
   {
      fill_id_type   fill_id;
   };

   /**
    *  @brief stop accepting fills and return the unclaimed remainder to the maker
    */
   struct order_cancel_operation : public base_operation
   {
      order_id_type  order_id;
   };

   /**
    * virtual op generated when a fill is created
    */
   struct order_filled_operation : public virtual_operation
   {
      order_filled_operation(){}
      order_filled_operation( const order_id_type& order, const fill_id_type& fill, const address& t,
                              share_type amount, share_type dest, const escrow_id_type& escrow,
                              const optional<cross_address_type>& recv )
      : order_id(order), fill_id(fill), taker(t), fill_amount(amount), dest_amount(dest),
        escrow_id(escrow), receiver(recv) {}

      order_id_type                order_id;
      fill_id_type                 fill_id;
      address                      taker;
      share_type                   fill_amount;
      /// informational equivalent on the destination chain
      share_type                   dest_amount;
      escrow_id_type               escrow_id;
      optional<cross_address_type> receiver;
   };

   /**
    * virtual op generated when the secret of a fill is revealed
    */
   struct fill_withdrawn_operation : public virtual_operation
   {
      fill_withdrawn_operation(){}
      fill_withdrawn_operation( const fill_id_type& fill, const order_id_type& order, const address& t,
                                share_type amt, const preimage_type& secret )
      : fill_id(fill), order_id(order), taker(t), amount(amt), preimage(secret) {}

      fill_id_type   fill_id;
      order_id_type  order_id;
      address        taker;
      share_type     amount;
      preimage_type  preimage;
   };

   /**
    * virtual op generated when a fill is returned to the maker
    */
   struct fill_refunded_operation : public virtual_operation
   {
      fill_refunded_operation(){}
      fill_refunded_operation( const fill_id_type& fill, const order_id_type& order, const address& m,
                               share_type amt )
      : fill_id(fill), order_id(order), maker(m), amount(amt) {}

      fill_id_type   fill_id;
      order_id_type  order_id;
      address        maker;
      share_type     amount;
   };

   /**
    * virtual op generated when an order is cancelled
    */
   struct order_cancelled_operation : public virtual_operation
   {
      order_cancelled_operation(){}
      order_cancelled_operation( const order_id_type& order, const address& m, share_type returned )
      : order_id(order), maker(m), refunded(returned) {}

      order_id_type  order_id;
      address        maker;
      /// the never claimed remainder sent back to the maker
      share_type     refunded;
   };

} } // hashvault::protocol

FC_REFLECT( hashvault::protocol::order_create_operation,
            (total_amount)(min_fill_amount)(hashlock)(timelock)(swap_id)(source_chain)(dest_chain)
            (dest_amount_per_unit)(allow_partial_fills)(max_fills)(sender_cross_address)(receiver_cross_address) )
FC_REFLECT( hashvault::protocol::order_fill_operation, (order_id)(fill_amount)(receiver) )
FC_REFLECT( hashvault::protocol::fill_withdraw_operation, (fill_id)(preimage) )
FC_REFLECT( hashvault::protocol::fill_refund_operation, (fill_id) )
FC_REFLECT( hashvault::protocol::order_cancel_operation, (order_id) )
FC_REFLECT( hashvault::protocol::order_filled_operation,
            (order_id)(fill_id)(taker)(fill_amount)(dest_amount)(escrow_id)(receiver) )
FC_REFLECT( hashvault::protocol::fill_withdrawn_operation, (fill_id)(order_id)(taker)(amount)(preimage) )
FC_REFLECT( hashvault::protocol::fill_refunded_operation, (fill_id)(order_id)(maker)(amount) )
FC_REFLECT( hashvault::protocol::order_cancelled_operation, (order_id)(maker)(refunded) )
