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
#include <hashvault/chain/escrow_ledger.hpp>

#include <fc/log/logger.hpp>

namespace hashvault { namespace chain {

void memory_ledger::transfer( const address& to, share_type amount )
{
   FC_ASSERT( amount > 0, "Transfer amount must be positive", ("amount",amount) );
   FC_ASSERT( _rejecting.find( to ) == _rejecting.end(), "Recipient ${to} refuses transfers", ("to",to) );
   FC_ASSERT( _escrow >= amount, "Escrow balance ${b} cannot cover ${a}", ("b",_escrow)("a",amount) );
   _escrow -= amount;
   _balances[to] += amount;
   dlog( "released ${a} to ${to}", ("a",amount)("to",to) );
}

void memory_ledger::credit( const address& who, share_type amount )
{
   FC_ASSERT( amount >= 0 );
   _balances[who] += amount;
}

void memory_ledger::attach_value( const address& from, share_type amount )
{
   FC_ASSERT( amount >= 0 );
   if( amount == 0 )
      return;
   auto& balance = _balances[from];
   FC_ASSERT( balance >= amount, "Insufficient balance: ${b} < ${a}", ("b",balance)("a",amount)("from",from) );
   balance -= amount;
   _escrow += amount;
}

void memory_ledger::return_value( const address& to, share_type amount )
{
   FC_ASSERT( amount >= 0 && _escrow >= amount );
   if( amount == 0 )
      return;
   _escrow -= amount;
   _balances[to] += amount;
}

share_type memory_ledger::balance( const address& who )const
{
   auto itr = _balances.find( who );
   if( itr == _balances.end() )
      return 0;
   return itr->second;
}

void memory_ledger::reject_transfers_to( const address& who, bool reject )
{
   if( reject )
      _rejecting.insert( who );
   else
      _rejecting.erase( who );
}

} } // hashvault::chain
