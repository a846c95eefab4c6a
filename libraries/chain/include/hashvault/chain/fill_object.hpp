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
    * @brief a claim on part of an order
    * @ingroup object
    * @ingroup protocol
    *
    * A fill is open until its taker withdraws it with the secret or, once the
    * order's timelock has passed, the maker refunds it.  Closed fills stay in the
    * database so their revealed secret can be read back.
    */
   class fill_object : public hashvault::db::abstract_object<fill_object, protocol_ids, fill_object_type>
   {
      public:
         fill_id_type            fill_id;
         /// key of the owning order
         order_id_type           order_id;
         address                 taker;
         share_type              fill_amount;
         /// correlates the fill with the lock record on the other ledger
         escrow_id_type          escrow_id;
         bool                    withdrawn = false;
         bool                    refunded = false;
         /// set on withdrawal
         optional<preimage_type> preimage;
         time_point_sec          created_at;
         optional<cross_address_type> receiver;

         bool is_closed()const { return withdrawn || refunded; }
   };

   struct by_fill_id;
   struct by_order;
   struct by_taker;
   struct by_escrow_id;

   using fill_multi_index_type = multi_index_container<
      fill_object,
      indexed_by<
         ordered_unique< tag<hashvault::db::by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_fill_id>, member< fill_object, fill_id_type, &fill_object::fill_id > >,
         ordered_unique< tag<by_order>,
            composite_key< fill_object,
               member< fill_object, order_id_type, &fill_object::order_id >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_taker>,
            composite_key< fill_object,
               member< fill_object, address, &fill_object::taker >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_non_unique< tag<by_escrow_id>, member< fill_object, escrow_id_type, &fill_object::escrow_id > >
      >
   >;

   using fill_index = hashvault::db::generic_index< fill_object, fill_multi_index_type >;

} } // hashvault::chain

FC_REFLECT_DERIVED( hashvault::chain::fill_object, (hashvault::db::object),
                    (fill_id)
                    (order_id)
                    (taker)
                    (fill_amount)
                    (escrow_id)
                    (withdrawn)
                    (refunded)
                    (preimage)
                    (created_at)
                    (receiver)
                  )
