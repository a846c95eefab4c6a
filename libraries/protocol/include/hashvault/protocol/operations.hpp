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
#include <hashvault/protocol/swap.hpp>
#include <hashvault/protocol/admin.hpp>

namespace hashvault { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ order_create_operation,
            /*  1 */ order_fill_operation,
            /*  2 */ fill_withdraw_operation,
            /*  3 */ fill_refund_operation,
            /*  4 */ order_cancel_operation,
            /*  5 */ fee_rate_update_operation,
            /*  6 */ fee_sweep_operation,
            /*  7 */ admin_update_operation,
            /*  8 */ order_filled_operation,        // VIRTUAL
            /*  9 */ fill_withdrawn_operation,      // VIRTUAL
            /* 10 */ fill_refunded_operation,       // VIRTUAL
            /* 11 */ order_cancelled_operation      // VIRTUAL
         > operation;

   /// @} // operations group

   /**
    *  Performs the stateless checks of op, throws if op is malformed or virtual.
    */
   void operation_validate( const operation& op );

   bool is_virtual_operation( const operation& op );

   /// human readable name of the operation, "order_create" for order_create_operation
   string operation_name( const operation& op );

} } // hashvault::protocol

FC_REFLECT_TYPENAME( hashvault::protocol::operation )
