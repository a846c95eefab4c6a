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
#include <hashvault/protocol/address.hpp>
#include <hashvault/protocol/exceptions.hpp>

namespace hashvault { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief The set of calls that mutate the escrow state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  escrow state.  The members of each struct are like function arguments and
    *  each operation can potentially generate a return value.  The identity of the
    *  caller and the value attached to the call are supplied by the host alongside
    *  the operation, never inside it.
    *
    *  Operations with a virtual_operation base are never submitted by callers.  They
    *  are produced while another operation is applied in order to notify observers.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,fc::sha256> operation_result;

   struct base_operation
   {
      void validate()const{}
   };

   struct virtual_operation : public base_operation
   {
      void validate()const
      {
         FC_THROW_EXCEPTION( invalid_operation, "virtual operations cannot be submitted" );
      }
   };

   ///@}

} } // hashvault::protocol

FC_REFLECT_TYPENAME( hashvault::protocol::operation_result )
FC_REFLECT( hashvault::protocol::void_result, )
