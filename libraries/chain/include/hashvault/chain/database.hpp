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

#include <hashvault/chain/evaluator.hpp>
#include <hashvault/chain/escrow_ledger.hpp>
#include <hashvault/chain/fill_object.hpp>
#include <hashvault/chain/genesis_state.hpp>
#include <hashvault/chain/operation_history.hpp>
#include <hashvault/chain/order_object.hpp>
#include <hashvault/chain/protocol_state_object.hpp>
#include <hashvault/chain/transaction_evaluation_state.hpp>

#include <hashvault/db/object_database.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

namespace hashvault { namespace chain {

   /**
    *   @class database
    *   @ingroup object
    *
    *   Holds the orders, fills and protocol accounting of the escrow engine and applies
    *   the calls a host submits against them.  Every call is applied atomically: either
    *   all of its effects are kept or none are.
    */
   class database : public db::object_database
   {
      public:
         //////////////////// db_init.cpp ////////////////////

         database();
         ~database() override;

         /**
          * @brief Creates the protocol singletons from a genesis state
          *
          * Must be called exactly once, before any call is pushed.
          */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         /// The ledger releases escrowed value; it must outlive the database
         void set_escrow_ledger( escrow_ledger* ledger ) { _ledger = ledger; }
         escrow_ledger* get_escrow_ledger()const { return _ledger; }

         void initialize_indexes(); // Mark as public since it is used in tests
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0 && size_t(op_type) < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         //////////////////// db_call.cpp ////////////////////

         /**
          *  Validates and applies a single operation on behalf of ctx.caller.  The value
          *  attached to the call must already be held in escrow by the ledger.  On any
          *  exception every change made by the call is undone and the caller remains
          *  responsible for returning the attached value.
          *
          *  @return the id of the created order or fill, or void_result
          */
         operation_result push_call( const call_context& ctx, const operation& op );

         /**
          *  Advances the ledger time.  The block number and time may stay the same but
          *  never move backwards.
          */
         void set_head_block( block_num_type block_num, time_point_sec time );

         /// Releases value held in escrow, reporting any failure as transfer_failure_exception
         void release_escrow( const address& to, share_type amount );

         /**
          *  Records an operation produced while applying the current call.  It becomes part
          *  of the history only if the call commits.
          */
         void push_applied_operation( const operation& op );

         /// Every operation applied by a committed call, oldest first
         const vector<operation_history>& get_applied_operations()const { return _history; }

         /**
          *  This signal is emitted for each operation, submitted or virtual, after the call
          *  that applied it has committed.
          */
         fc::signal<void(const operation_history&)>      applied_operation;

         //////////////////// db_getter.cpp ////////////////////

         const protocol_state_object&           get_protocol_state()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;

         block_num_type   head_block_num()const;
         time_point_sec   head_block_time()const;

         const order_object* find_order( const order_id_type& order_id )const;
         /// @throws order_not_found
         const order_object& get_order( const order_id_type& order_id )const;
         const fill_object*  find_fill( const fill_id_type& fill_id )const;
         /// @throws fill_not_found
         const fill_object&  get_fill( const fill_id_type& fill_id )const;

         /// Fill ids of an order in creation order, empty for an unknown order
         vector<fill_id_type>    get_order_fills( const order_id_type& order_id )const;
         bool                    order_exists( const order_id_type& order_id )const;
         /// 0 for unknown, cancelled or complete orders
         share_type              get_remaining_amount( const order_id_type& order_id )const;
         /// false for unknown orders
         bool                    is_order_complete( const order_id_type& order_id )const;
         /// The revealed preimage, present only after a withdrawal
         optional<preimage_type> get_fill_secret( const fill_id_type& fill_id )const;

         const address&          get_admin()const;
         basis_points_type       get_fee_rate()const;
         share_type              get_accumulated_fees()const;

      private:
         operation_result _apply_call( const call_context& ctx, const operation& op );
         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );
         void             publish_applied_operations();

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         escrow_ledger*                         _ledger = nullptr;

         /// operations of the call being applied
         vector<operation_history>              _pending_ops;
         vector<operation_history>              _history;
         /// identity of the call being applied
         address                                _current_caller;
   };

} }
