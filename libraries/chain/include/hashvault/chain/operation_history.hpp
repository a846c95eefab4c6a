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
#include <hashvault/protocol/operations.hpp>

namespace hashvault { namespace chain {

   /**
    * @brief tracks an operation that was applied by a committed call
    *
    * Submitted operations and the virtual operations they produced are recorded in
    * the order they were applied.  A failed call leaves no record.
    */
   struct operation_history
   {
      operation_history() = default;
      operation_history( const operation& o ) : op(o) {}

      /// position in the history of this database
      uint64_t          sequence = 0;
      block_num_type    block_num = 0;
      time_point_sec    time;
      /// identity that submitted the call which produced this operation
      address           caller;
      operation         op;
      operation_result  result;
      bool              is_virtual = false;
   };

} } // hashvault::chain

FC_REFLECT( hashvault::chain::operation_history,
            (sequence)(block_num)(time)(caller)(op)(result)(is_virtual) )
