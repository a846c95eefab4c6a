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
#include <hashvault/chain/admin_evaluator.hpp>
#include <hashvault/chain/database.hpp>

namespace hashvault { namespace chain {

namespace {

   void verify_admin( const database& d, const address& caller )
   {
      const address& admin = d.get_protocol_state().admin;
      HASHVAULT_ASSERT( caller == admin, not_admin, "Only the admin may do this", ("caller",caller)("admin",admin) );
   }

}

void_result fee_rate_update_evaluator::do_evaluate( const fee_rate_update_operation& o )
{ try {
   verify_admin( db(), caller() );
   HASHVAULT_ASSERT( o.new_fee_rate_bps <= HASHVAULT_MAX_FEE_RATE_BPS, invalid_fee_rate,
                     "Fee rate ${r} exceeds the maximum of ${max} basis points",
                     ("r",o.new_fee_rate_bps)("max",HASHVAULT_MAX_FEE_RATE_BPS) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fee_rate_update_evaluator::do_apply( const fee_rate_update_operation& o )
{ try {
   database& d = db();
   d.modify( d.get_protocol_state(), [&o]( protocol_state_object& s ) {
      s.fee_rate_bps = o.new_fee_rate_bps;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fee_sweep_evaluator::do_evaluate( const fee_sweep_operation& o )
{ try {
   const database& d = db();
   verify_admin( d, caller() );
   HASHVAULT_ASSERT( d.get_protocol_state().accumulated_fees > 0, no_fees_to_sweep, "No fees have accumulated", );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fee_sweep_evaluator::do_apply( const fee_sweep_operation& o )
{ try {
   database& d = db();
   const auto& state = d.get_protocol_state();
   const share_type fees = state.accumulated_fees;

   d.modify( state, []( protocol_state_object& s ) {
      s.accumulated_fees = 0;
   });
   try
   {
      d.release_escrow( state.admin, fees );
   }
   catch( const transfer_failure_exception& e )
   {
      // restore the record of the fees before reporting the failed transfer
      d.modify( state, [fees]( protocol_state_object& s ) {
         s.accumulated_fees = fees;
      });
      elog( "sweeping ${f} to ${a} failed, fees restored", ("f",fees)("a",state.admin) );
      throw;
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result admin_update_evaluator::do_evaluate( const admin_update_operation& o )
{ try {
   verify_admin( db(), caller() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result admin_update_evaluator::do_apply( const admin_update_operation& o )
{ try {
   database& d = db();
   ilog( "admin changes from ${old} to ${new}", ("old",d.get_protocol_state().admin)("new",o.new_admin) );
   d.modify( d.get_protocol_state(), [&o]( protocol_state_object& s ) {
      s.admin = o.new_admin;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hashvault::chain
