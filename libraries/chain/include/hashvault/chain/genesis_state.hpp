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

#include <string>
#include <vector>

namespace hashvault { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_balance_type {
      initial_balance_type( const address& owner = address(), share_type amount = 0 )
         : owner(owner), amount(amount) {}
      address    owner;
      share_type amount;
   };

   address                          initial_admin;
   basis_points_type                initial_fee_rate_bps = HASHVAULT_DEFAULT_FEE_RATE_BPS;
   block_num_type                   min_timelock = HASHVAULT_DEFAULT_MIN_TIMELOCK;
   block_num_type                   max_timelock = HASHVAULT_DEFAULT_MAX_TIMELOCK;
   block_num_type                   initial_head_block_num = 0;
   time_point_sec                   initial_timestamp;
   /// funds the host ledger, the engine itself holds no balances
   vector<initial_balance_type>     initial_balances;

   /**
    * Checks the parameters the database is initialized from.
    * Throws invalid_parameter_exception (or one of its causes) on a bad value.
    */
   void validate()const;
};

} } // namespace hashvault::chain

FC_REFLECT( hashvault::chain::genesis_state_type::initial_balance_type, (owner)(amount) )

FC_REFLECT( hashvault::chain::genesis_state_type,
            (initial_admin)(initial_fee_rate_bps)(min_timelock)(max_timelock)
            (initial_head_block_num)(initial_timestamp)(initial_balances) )
