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
   class database;

   /**
    *  What the host knows about a call that the operation itself does not carry.
    */
   struct call_context
   {
      call_context() = default;
      call_context( const address& c, share_type value = 0 ) : caller( c ), attached_value( value ) {}

      /// identity that invoked the call
      address    caller;
      /// native value bundled with the call, already held in escrow
      share_type attached_value;
   };

   /**
    *  Place holder for state tracked while processing a call.  This class provides the
    *  caller and the attached value to evaluators.
    */
   class transaction_evaluation_state
   {
      public:
         transaction_evaluation_state( database* db, const call_context& ctx )
         :_db(db),_ctx(ctx){}

         database& db()const { assert( _db ); return *_db; }

         const address&    caller()const         { return _ctx.caller; }
         share_type        attached_value()const { return _ctx.attached_value; }

         operation_result  result;

      private:
         database*         _db = nullptr;
         call_context      _ctx;
   };
} } // namespace hashvault::chain

FC_REFLECT( hashvault::chain::call_context, (caller)(attached_value) )
