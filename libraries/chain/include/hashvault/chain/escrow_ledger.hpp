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

namespace hashvault { namespace chain {

   /**
    *  @brief value movement provided by the hosting ledger
    *
    *  The database never holds balances itself.  Releasing escrowed value is the
    *  last step of an operation and a throwing transfer aborts the whole operation.
    */
   class escrow_ledger
   {
      public:
         virtual ~escrow_ledger() = default;

         /**
          *  Moves amount from the escrow held by the engine to the recipient.
          *  Throws if the recipient refuses the value or the escrow cannot cover it.
          */
         virtual void transfer( const address& to, share_type amount ) = 0;

         /// value currently held in escrow
         virtual share_type escrow_balance()const = 0;
   };

   /**
    *  @brief an in process ledger for hosts and tests
    *
    *  attach_value() and return_value() model the host moving the value bundled
    *  with a call into the escrow and handing it back when the call fails.
    */
   class memory_ledger : public escrow_ledger
   {
      public:
         void transfer( const address& to, share_type amount ) override;
         share_type escrow_balance()const override { return _escrow; }

         /// credits an account with value created outside of the engine
         void credit( const address& who, share_type amount );

         /// moves value from an account into escrow before a call
         void attach_value( const address& from, share_type amount );
         /// gives the value attached to a failed call back to its sender
         void return_value( const address& to, share_type amount );

         share_type balance( const address& who )const;

         /// makes every transfer to who fail until called again with reject = false
         void reject_transfers_to( const address& who, bool reject = true );

         const std::map<address, share_type>& balances()const { return _balances; }

      private:
         std::map<address, share_type> _balances;
         std::set<address>             _rejecting;
         share_type                    _escrow;
   };

} } // hashvault::chain
