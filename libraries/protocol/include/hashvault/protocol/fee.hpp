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

#include <hashvault/protocol/types.hpp>

namespace hashvault { namespace protocol {

   /**
    *  The split of a gross deposit into the protocol fee and the net escrowed amount.
    */
   struct fee_split
   {
      share_type net_amount;
      share_type fee;
   };

   /**
    *  fee = floor( gross_amount * fee_rate_bps / HASHVAULT_100_PERCENT ), net_amount = gross_amount - fee.
    *
    *  The rate is trusted, callers bound it when it is stored.
    *  @throws arithmetic_overflow_exception if the gross amount is negative or a result does not fit share_type
    */
   fee_split compute_fee( share_type gross_amount, basis_points_type fee_rate_bps );

   /**
    *  dest_amount = amount * rate / HASHVAULT_RATE_PRECISION, rounded down.
    *  @throws arithmetic_overflow_exception if the result does not fit share_type
    */
   share_type compute_dest_amount( share_type amount, share_type rate );

} } // hashvault::protocol

FC_REFLECT( hashvault::protocol::fee_split, (net_amount)(fee) )
