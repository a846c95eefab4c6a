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
#include <hashvault/chain/id_generator.hpp>
#include <hashvault/chain/swap_evaluator.hpp>
#include <hashvault/chain/swap_validation.hpp>

namespace hashvault { namespace chain {

void_result order_create_evaluator::do_evaluate( const order_create_operation& o )
{ try {
   const database& d = db();
   const auto& state = d.get_protocol_state();

   const share_type deposit = trx_state->attached_value();
   HASHVAULT_ASSERT( deposit > 0, insufficient_deposit, "No value attached to the order", );
   HASHVAULT_ASSERT( deposit >= o.total_amount, insufficient_deposit,
                     "Attached ${d} does not cover the order amount ${t}", ("d",deposit)("t",o.total_amount) );

   validate_timelock( o.timelock, d.head_block_num(), state.min_timelock, state.max_timelock );
   validate_chain_pair( o.source_chain, o.dest_chain );

   split = compute_fee( o.total_amount, state.fee_rate_bps );
   HASHVAULT_ASSERT( split.net_amount > 0, insufficient_deposit,
                     "Nothing left to escrow after a fee of ${f}", ("f",split.fee) );
   // the bounds apply to what the order escrows, not to the gross deposit
   validate_fill_bounds( split.net_amount, o.min_fill_amount, o.max_fills );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

operation_result order_create_evaluator::do_apply( const order_create_operation& o )
{ try {
   database& d = db();
   const address& maker = caller();

   const order_id_type order_id = next_order_id( d, maker, split.net_amount, o.hashlock, o.timelock, o.swap_id );
   HASHVAULT_ASSERT( d.find_order( order_id ) == nullptr, order_already_exists,
                     "Order ${id} already exists", ("id",order_id) );

   d.create<order_object>( [&]( order_object& obj ) {
      obj.order_id               = order_id;
      obj.maker                  = maker;
      obj.total_amount           = split.net_amount;
      obj.filled_amount          = 0;
      obj.min_fill_amount        = o.min_fill_amount;
      obj.hashlock               = o.hashlock;
      obj.timelock               = o.timelock;
      obj.cancelled              = false;
      obj.swap_id                = o.swap_id;
      obj.source_chain           = o.source_chain;
      obj.dest_chain             = o.dest_chain;
      obj.dest_amount_per_unit   = o.dest_amount_per_unit;
      obj.fee                    = split.fee;
      obj.allow_partial_fills    = o.allow_partial_fills;
      obj.max_fills              = o.max_fills;
      obj.current_fills          = 0;
      obj.sender_cross_address   = o.sender_cross_address;
      obj.receiver_cross_address = o.receiver_cross_address;
   });

   d.modify( d.get_protocol_state(), [this]( protocol_state_object& s ) {
      s.accumulated_fees += split.fee;
   });

   // anything attached above the order amount goes back to the maker
   const share_type change = trx_state->attached_value() - o.total_amount;
   if( change > 0 )
      d.release_escrow( maker, change );

   dlog( "order ${id} escrows ${net} after a fee of ${fee}", ("id",order_id)("net",split.net_amount)("fee",split.fee) );
   return order_id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result order_fill_evaluator::do_evaluate( const order_fill_operation& o )
{ try {
   const database& d = db();
   order = &d.get_order( o.order_id );

   validate_fill_eligibility( *order, o.fill_amount, d.head_block_num() );
   fill_amount = determine_fill_amount( *order, o.fill_amount );
   if( fill_amount != o.fill_amount )
      dlog( "fill request of ${r} clamped to ${a}", ("r",o.fill_amount)("a",fill_amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

operation_result order_fill_evaluator::do_apply( const order_fill_operation& o )
{ try {
   database& d = db();
   const address& taker = caller();

   const fill_id_type fill_id = next_fill_id( d, o.order_id, taker, fill_amount );
   HASHVAULT_ASSERT( d.find_fill( fill_id ) == nullptr, fill_already_exists,
                     "Fill ${id} already exists", ("id",fill_id) );
   const escrow_id_type escrow_id = next_escrow_id( d, o.order_id, fill_id );

   d.create<fill_object>( [&]( fill_object& obj ) {
      obj.fill_id     = fill_id;
      obj.order_id    = o.order_id;
      obj.taker       = taker;
      obj.fill_amount = fill_amount;
      obj.escrow_id   = escrow_id;
      obj.withdrawn   = false;
      obj.refunded    = false;
      obj.created_at  = d.head_block_time();
      obj.receiver    = o.receiver;
   });

   d.modify( *order, [&]( order_object& obj ) {
      obj.filled_amount += fill_amount;
      obj.current_fills += 1;
      obj.fills.push_back( fill_id );
   });

   const share_type dest_amount = compute_dest_amount( fill_amount, order->dest_amount_per_unit );
   d.push_applied_operation( order_filled_operation( o.order_id, fill_id, taker, fill_amount, dest_amount,
                                                     escrow_id, o.receiver ) );
   return fill_id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fill_withdraw_evaluator::do_evaluate( const fill_withdraw_operation& o )
{ try {
   const database& d = db();
   fill = &d.get_fill( o.fill_id );
   order = &d.get_order( fill->order_id );

   validate_withdrawal( *fill, *order, caller(), d.head_block_num() );
   validate_preimage( *order, o.preimage );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fill_withdraw_evaluator::do_apply( const fill_withdraw_operation& o )
{ try {
   database& d = db();

   d.modify( *fill, [&o]( fill_object& obj ) {
      obj.withdrawn = true;
      obj.preimage  = o.preimage;
   });

   d.push_applied_operation( fill_withdrawn_operation( fill->fill_id, fill->order_id, fill->taker,
                                                       fill->fill_amount, o.preimage ) );
   d.release_escrow( fill->taker, fill->fill_amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fill_refund_evaluator::do_evaluate( const fill_refund_operation& o )
{ try {
   const database& d = db();
   fill = &d.get_fill( o.fill_id );
   order = &d.get_order( fill->order_id );

   validate_refund( *fill, *order, caller(), d.head_block_num() );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fill_refund_evaluator::do_apply( const fill_refund_operation& o )
{ try {
   database& d = db();
   const share_type amount = fill->fill_amount;

   d.modify( *fill, []( fill_object& obj ) {
      obj.refunded = true;
   });

   // the refunded amount becomes available to new fills again
   d.modify( *order, [amount]( order_object& obj ) {
      obj.filled_amount -= amount;
      obj.refunded_amount += amount;
      obj.current_fills -= 1;
   });

   d.push_applied_operation( fill_refunded_operation( fill->fill_id, fill->order_id, order->maker, amount ) );
   d.release_escrow( order->maker, amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result order_cancel_evaluator::do_evaluate( const order_cancel_operation& o )
{ try {
   order = &db().get_order( o.order_id );

   HASHVAULT_ASSERT( caller() == order->maker, not_maker,
                     "Only the maker may cancel the order", ("caller",caller())("maker",order->maker) );
   HASHVAULT_ASSERT( !order->cancelled, order_cancelled, "Order ${o} is already cancelled", ("o",o.order_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result order_cancel_evaluator::do_apply( const order_cancel_operation& o )
{ try {
   database& d = db();
   // refunded fills already went back to the maker and are not released twice
   const share_type unreleased = order->unreleased_amount();

   d.modify( *order, []( order_object& obj ) {
      obj.cancelled = true;
   });

   d.push_applied_operation( order_cancelled_operation( o.order_id, order->maker,
                                                        unreleased > 0 ? unreleased : share_type(0) ) );
   if( unreleased > 0 )
      d.release_escrow( order->maker, unreleased );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hashvault::chain
