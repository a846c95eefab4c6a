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

#include <hashvault/chain/database.hpp>
#include <hashvault/chain/escrow_ledger.hpp>

#include <fc/reflect/reflect.hpp>

#include <iosfwd>

namespace hashvault { namespace app {

using namespace hashvault::chain;

/**
 *  One entry of a call script.  block and time, when present, advance the ledger time
 *  before the call is pushed.
 */
struct scripted_call
{
   address                   caller;
   share_type                value;
   optional<block_num_type>  block;
   optional<time_point_sec>  time;
   operation                 op;
};

/**
 * @brief Applies one scripted call and writes its outcome to out as one line
 *
 * The call's value moves from the caller's ledger balance into escrow before the call is
 * pushed.  When the call fails the value is handed back to the caller.
 *
 * @return true when the call was applied
 */
bool replay_call( database& db, memory_ledger& ledger, const scripted_call& call, size_t n, std::ostream& out );

} } // hashvault::app

FC_REFLECT( hashvault::app::scripted_call, (caller)(value)(block)(time)(op) )
