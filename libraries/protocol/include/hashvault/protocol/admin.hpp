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
    *  @brief change the fee rate applied to future orders
    *
    *  Only the admin may submit this operation.  Rates above
    *  HASHVAULT_MAX_FEE_RATE_BPS are rejected.
    */
   struct fee_rate_update_operation : public base_operation
   {
      basis_points_type new_fee_rate_bps = 0;
   };

   /**
    *  @brief transfer the accumulated protocol fees to the admin
    */
   struct fee_sweep_operation : public base_operation
   {
   };

   /**
    *  @brief hand the admin role over to another identity
    */
   struct admin_update_operation : public base_operation
   {
      address new_admin;

      void validate()const;
   };

} } // hashvault::protocol

FC_REFLECT( hashvault::protocol::fee_rate_update_operation, (new_fee_rate_bps) )
FC_REFLECT( hashvault::protocol::fee_sweep_operation, )
FC_REFLECT( hashvault::protocol::admin_update_operation, (new_admin) )
