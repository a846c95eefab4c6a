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

namespace hashvault { namespace chain {

   using namespace hashvault::protocol;

   enum object_space_id
   {
      relative_protocol_ids = 0,
      protocol_ids          = 1,
      implementation_ids    = 2
   };

   /**
    *  List all object types from all namespaces here so they can
    *  be easily reflected and displayed in debug output.
    */
   enum object_type
   {
      null_object_type,
      order_object_type,
      fill_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   enum impl_object_type
   {
      impl_protocol_state_object_type,
      impl_dynamic_global_property_object_type
   };

} } // hashvault::chain

FC_REFLECT_ENUM( hashvault::chain::object_type,
                 (null_object_type)
                 (order_object_type)
                 (fill_object_type)
                 (OBJECT_TYPE_COUNT)
               )
FC_REFLECT_ENUM( hashvault::chain::impl_object_type,
                 (impl_protocol_state_object_type)
                 (impl_dynamic_global_property_object_type)
               )
