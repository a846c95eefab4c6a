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
#include <hashvault/protocol/swap.hpp>

namespace hashvault { namespace protocol {

   void order_create_operation::validate()const
   {
      HASHVAULT_ASSERT( total_amount > 0, invalid_parameter_exception,
                        "Order amount should be greater than zero", ("total_amount",total_amount) );
      HASHVAULT_ASSERT( total_amount <= HASHVAULT_MAX_SHARE_SUPPLY, invalid_parameter_exception,
                        "Order amount exceeds the maximum supply", ("total_amount",total_amount) );
      HASHVAULT_ASSERT( dest_amount_per_unit >= 0, invalid_parameter_exception,
                        "Exchange rate should not be negative", ("rate",dest_amount_per_unit) );
   }

   void order_fill_operation::validate()const
   {
      HASHVAULT_ASSERT( fill_amount >= 0, invalid_fill_amount,
                        "Fill amount should not be negative", ("fill_amount",fill_amount) );
   }

   void fill_withdraw_operation::validate()const
   {
      HASHVAULT_ASSERT( preimage.size() == HASHVAULT_PREIMAGE_SIZE, invalid_preimage_size,
                        "Preimage must be ${n} bytes", ("n",HASHVAULT_PREIMAGE_SIZE)("size",preimage.size()) );
   }

} }
