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
#include <hashvault/db/object.hpp>
#include <hashvault/db/generic_index.hpp>

namespace hashvault { namespace chain {

   /**
    * @class protocol_state_object
    * @brief Maintains the escrow protocol configuration and accounting
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one instance of this object, created from the genesis state.
    */
   class protocol_state_object : public hashvault::db::abstract_object<protocol_state_object,
                                         implementation_ids, impl_protocol_state_object_type>
   {
      public:
         /// identity authorized for configuration and fee sweep
         address           admin;
         basis_points_type fee_rate_bps = HASHVAULT_DEFAULT_FEE_RATE_BPS;
         /// fees collected and owed to the admin
         share_type        accumulated_fees;
         /// bounds on timelock - head_block_num at order creation
         block_num_type    min_timelock = HASHVAULT_DEFAULT_MIN_TIMELOCK;
         block_num_type    max_timelock = HASHVAULT_DEFAULT_MAX_TIMELOCK;

         uint64_t          order_counter = 0;
         uint64_t          fill_counter = 0;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains the ledger time supplied by the host
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public hashvault::db::abstract_object<dynamic_global_property_object,
                                                  implementation_ids, impl_dynamic_global_property_object_type>
   {
      public:
         block_num_type    head_block_number = 0;
         time_point_sec    time;
   };

   using protocol_state_index = hashvault::db::generic_index< protocol_state_object,
         multi_index_container< protocol_state_object,
            indexed_by< ordered_unique< tag<hashvault::db::by_id>,
                                        member< object, object_id_type, &object::id > > > > >;

   using dynamic_global_property_index = hashvault::db::generic_index< dynamic_global_property_object,
         multi_index_container< dynamic_global_property_object,
            indexed_by< ordered_unique< tag<hashvault::db::by_id>,
                                        member< object, object_id_type, &object::id > > > > >;

}}

FC_REFLECT_DERIVED( hashvault::chain::protocol_state_object, (hashvault::db::object),
                    (admin)
                    (fee_rate_bps)
                    (accumulated_fees)
                    (min_timelock)
                    (max_timelock)
                    (order_counter)
                    (fill_counter)
                  )

FC_REFLECT_DERIVED( hashvault::chain::dynamic_global_property_object, (hashvault::db::object),
                    (head_block_number)
                    (time)
                  )
