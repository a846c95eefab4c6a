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
#include <hashvault/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace hashvault { namespace chain {

   /**
    * @brief an escrowed deposit offered for filling
    * @ingroup object
    * @ingroup protocol
    *
    * Orders are created by order_create_operation, updated by fills, refunds and cancellation,
    * and never removed.
    */
   class order_object : public hashvault::db::abstract_object<order_object, protocol_ids, order_object_type>
   {
      public:
         order_id_type           order_id;
         address                 maker;
         /// net escrowed amount, gross deposit minus fee
         share_type              total_amount;
         /// sum of the fill amounts of all fills that were not refunded
         share_type              filled_amount;
         /// value of refunded fills, already returned to the maker
         share_type              refunded_amount;
         share_type              min_fill_amount;
         hashlock_type           hashlock;
         block_num_type          timelock = 0;
         bool                    cancelled = false;
         swap_id_type            swap_id;
         chain_code_type         source_chain = 0;
         chain_code_type         dest_chain = 0;
         share_type              dest_amount_per_unit;
         share_type              fee;
         bool                    allow_partial_fills = true;
         uint32_t                max_fills = 1;
         uint32_t                current_fills = 0;

         optional<cross_address_type> sender_cross_address;
         optional<cross_address_type> receiver_cross_address;

         /// fills created against this order, in creation order
         vector<fill_id_type>    fills;

         share_type remaining_amount()const { return total_amount - filled_amount; }
         bool       is_complete()const      { return filled_amount >= total_amount; }
         /// part of the order still held in escrow and not claimed by any fill
         share_type unreleased_amount()const { return total_amount - filled_amount - refunded_amount; }
   };

   struct by_order_id;
   struct by_maker;
   struct by_timelock;

   using order_multi_index_type = multi_index_container<
      order_object,
      indexed_by<
         ordered_unique< tag<hashvault::db::by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order_id>, member< order_object, order_id_type, &order_object::order_id > >,
         ordered_unique< tag<by_maker>,
            composite_key< order_object,
               member< order_object, address, &order_object::maker >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_timelock>,
            composite_key< order_object,
               member< order_object, block_num_type, &order_object::timelock >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using order_index = hashvault::db::generic_index< order_object, order_multi_index_type >;

} } // hashvault::chain

FC_REFLECT_DERIVED( hashvault::chain::order_object, (hashvault::db::object),
                    (order_id)
                    (maker)
                    (total_amount)
                    (filled_amount)
                    (refunded_amount)
                    (min_fill_amount)
                    (hashlock)
                    (timelock)
                    (cancelled)
                    (swap_id)
                    (source_chain)
                    (dest_chain)
                    (dest_amount_per_unit)
                    (fee)
                    (allow_partial_fills)
                    (max_fills)
                    (current_fills)
                    (sender_cross_address)
                    (receiver_cross_address)
                    (fills)
                  )
