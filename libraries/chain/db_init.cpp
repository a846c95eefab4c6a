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

#include <hashvault/chain/database.hpp>

#include <hashvault/chain/admin_evaluator.hpp>
#include <hashvault/chain/swap_evaluator.hpp>

#include <hashvault/chain/fill_object.hpp>
#include <hashvault/chain/order_object.hpp>
#include <hashvault/chain/protocol_state_object.hpp>

namespace hashvault { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database()
{
   _pending_ops.clear();
}

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<order_create_evaluator>();
   register_evaluator<order_fill_evaluator>();
   register_evaluator<fill_withdraw_evaluator>();
   register_evaluator<fill_refund_evaluator>();
   register_evaluator<order_cancel_evaluator>();
   register_evaluator<fee_rate_update_evaluator>();
   register_evaluator<fee_sweep_evaluator>();
   register_evaluator<admin_update_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< primary_index<order_index> >();
   add_index< primary_index<fill_index> >();

   //Implementation object indexes
   add_index< primary_index<protocol_state_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   genesis_state.validate();
   FC_ASSERT( get_index_type< primary_index<protocol_state_index> >().size() == 0,
              "Genesis state has already been applied" );

   _undo_db.disable();

   create<protocol_state_object>( [&genesis_state]( protocol_state_object& s ) {
      s.admin            = genesis_state.initial_admin;
      s.fee_rate_bps     = genesis_state.initial_fee_rate_bps;
      s.accumulated_fees = 0;
      s.min_timelock     = genesis_state.min_timelock;
      s.max_timelock     = genesis_state.max_timelock;
      s.order_counter    = 0;
      s.fill_counter     = 0;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.head_block_number = genesis_state.initial_head_block_num;
      p.time              = genesis_state.initial_timestamp;
   });

   _undo_db.enable();

   ilog( "genesis applied: admin ${a}, fee rate ${f} bps, timelock range [${min}, ${max}]",
         ("a",genesis_state.initial_admin)("f",genesis_state.initial_fee_rate_bps)
         ("min",genesis_state.min_timelock)("max",genesis_state.max_timelock) );
} FC_CAPTURE_AND_RETHROW() }

} }
