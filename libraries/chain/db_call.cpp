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
#include <hashvault/chain/evaluator.hpp>
#include <hashvault/chain/transaction_evaluation_state.hpp>

#include <hashvault/protocol/exceptions.hpp>

namespace hashvault { namespace chain {

operation_result database::push_call( const call_context& ctx, const operation& op )
{
   try
   {
      return _apply_call( ctx, op );
   }
   catch( const fc::exception& e )
   {
      // operations of a call that did not commit are discarded
      _pending_ops.clear();
      wlog( "${op} from ${caller} rejected: ${e}",
            ("op",operation_name(op))("caller",ctx.caller)("e",e.to_detail_string()) );
      throw;
   }
}

operation_result database::_apply_call( const call_context& ctx, const operation& op )
{ try {
   FC_ASSERT( _ledger != nullptr, "No escrow ledger has been attached to the database" );
   FC_ASSERT( _undo_db.depth() == 0, "A call cannot be pushed while another call is being applied" );

   HASHVAULT_ASSERT( !is_virtual_operation( op ), invalid_operation,
                     "${op} is produced by the engine and cannot be submitted", ("op",operation_name(op)) );
   HASHVAULT_ASSERT( ctx.attached_value >= 0, unexpected_value,
                     "Attached value cannot be negative", ("value",ctx.attached_value) );
   HASHVAULT_ASSERT( op.is_type<order_create_operation>() || ctx.attached_value == 0, unexpected_value,
                     "${op} does not accept attached value", ("op",operation_name(op))("value",ctx.attached_value) );

   operation_validate( op );

   _pending_ops.clear();
   _current_caller = ctx.caller;

   transaction_evaluation_state eval_state( this, ctx );
   operation_result result;
   try
   {
      auto session = _undo_db.start_undo_session();
      result = apply_operation( eval_state, op );
      session.commit();
   }
   HASHVAULT_RECODE_EXC( fc::overflow_exception, arithmetic_overflow_exception )
   HASHVAULT_RECODE_EXC( fc::underflow_exception, arithmetic_overflow_exception )

   publish_applied_operations();
   return result;
} FC_CAPTURE_AND_RETHROW( (ctx)(op) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   const auto which = op.which();
   FC_ASSERT( which >= 0 && size_t(which) < _operation_evaluators.size() && _operation_evaluators[which],
              "No registered evaluator for this operation", ("which",which) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ which ];

   // the submitted operation is recorded ahead of the virtual operations it produces
   const size_t op_index = _pending_ops.size();
   push_applied_operation( op );
   _pending_ops[op_index].is_virtual = false;

   auto result = eval->evaluate( eval_state, op, true );
   _pending_ops[op_index].result = result;
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::push_applied_operation( const operation& op )
{
   _pending_ops.emplace_back( op );
   operation_history& oh = _pending_ops.back();
   oh.block_num  = head_block_num();
   oh.time       = head_block_time();
   oh.caller     = _current_caller;
   oh.is_virtual = true;
}

void database::publish_applied_operations()
{
   vector<operation_history> applied;
   std::swap( applied, _pending_ops );

   for( auto& oh : applied )
   {
      oh.sequence = _history.size();
      _history.push_back( oh );

      if( !oh.is_virtual )
         ilog( "${op} from ${caller} applied at block ${b}, result ${r}",
               ("op",operation_name(oh.op))("caller",oh.caller)("b",oh.block_num)("r",oh.result) );

      try
      {
         applied_operation( _history.back() );
      }
      catch( const fc::exception& e )
      {
         elog( "Caught exception in applied_operation observer: ${e}", ("e",e.to_detail_string()) );
      }
      catch( const std::exception& e )
      {
         elog( "Caught exception in applied_operation observer: ${e}", ("e",e.what()) );
      }
   }
}

void database::release_escrow( const address& to, share_type amount )
{ try {
   FC_ASSERT( _ledger != nullptr, "No escrow ledger has been attached to the database" );
   try
   {
      _ledger->transfer( to, amount );
   }
   HASHVAULT_RECODE_EXC( fc::exception, transfer_failure_exception )
   catch( const std::exception& e )
   {
      FC_THROW_EXCEPTION( transfer_failure_exception, "Transfer of ${a} to ${to} failed: ${e}",
                          ("a",amount)("to",to)("e",e.what()) );
   }
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database::set_head_block( block_num_type block_num, time_point_sec time )
{ try {
   const auto& dgp = get_dynamic_global_properties();
   HASHVAULT_ASSERT( block_num >= dgp.head_block_number, invalid_block,
                     "Block number cannot move backwards from ${h} to ${n}",
                     ("h",dgp.head_block_number)("n",block_num) );
   HASHVAULT_ASSERT( time >= dgp.time, invalid_block,
                     "Block time cannot move backwards from ${h} to ${t}", ("h",dgp.time)("t",time) );

   // ledger time is not part of any call and is never undone
   modify( dgp, [block_num, time]( dynamic_global_property_object& p ) {
      p.head_block_number = block_num;
      p.time              = time;
   });
} FC_CAPTURE_AND_RETHROW( (block_num)(time) ) }

} }
