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
#include <hashvault/protocol/exceptions.hpp>

namespace hashvault { namespace protocol {

FC_IMPLEMENT_EXCEPTION( swap_exception, 5000000, "swap exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,           swap_exception, 5010000, "not found" )
FC_IMPLEMENT_DERIVED_EXCEPTION( already_exists_exception,      swap_exception, 5020000, "already exists" )
FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,        swap_exception, 5030000, "unauthorized" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameter_exception,   swap_exception, 5040000, "invalid parameter" )
FC_IMPLEMENT_DERIVED_EXCEPTION( state_conflict_exception,      swap_exception, 5050000, "state conflict" )
FC_IMPLEMENT_DERIVED_EXCEPTION( timing_violation_exception,    swap_exception, 5060000, "timing violation" )
FC_IMPLEMENT_DERIVED_EXCEPTION( secret_mismatch_exception,     swap_exception, 5070000,
                                "preimage does not hash to the hashlock" )
FC_IMPLEMENT_DERIVED_EXCEPTION( arithmetic_overflow_exception, swap_exception, 5080000, "arithmetic overflow" )
FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_failure_exception,    swap_exception, 5090000, "transfer failed" )

FC_IMPLEMENT_DERIVED_EXCEPTION( order_not_found,           not_found_exception, 5010001, "order not found" )
FC_IMPLEMENT_DERIVED_EXCEPTION( fill_not_found,            not_found_exception, 5010002, "fill not found" )

FC_IMPLEMENT_DERIVED_EXCEPTION( order_already_exists,      already_exists_exception, 5020001, "order already exists" )
FC_IMPLEMENT_DERIVED_EXCEPTION( fill_already_exists,       already_exists_exception, 5020002, "fill already exists" )

FC_IMPLEMENT_DERIVED_EXCEPTION( not_taker,                 unauthorized_exception, 5030001, "caller is not the taker" )
FC_IMPLEMENT_DERIVED_EXCEPTION( not_maker,                 unauthorized_exception, 5030002, "caller is not the maker" )
FC_IMPLEMENT_DERIVED_EXCEPTION( not_admin,                 unauthorized_exception, 5030003, "caller is not the admin" )

FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_timelock,          invalid_parameter_exception, 5040001,
                                "timelock is not in the future" )
FC_IMPLEMENT_DERIVED_EXCEPTION( timelock_too_short,        invalid_parameter_exception, 5040002, "timelock too short" )
FC_IMPLEMENT_DERIVED_EXCEPTION( timelock_too_long,         invalid_parameter_exception, 5040003, "timelock too long" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_chain_pair,        invalid_parameter_exception, 5040004,
                                "source and destination chain must differ" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_fill_bounds,       invalid_parameter_exception, 5040005, "invalid fill bounds" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_fill_amount,       invalid_parameter_exception, 5040006, "invalid fill amount" )
FC_IMPLEMENT_DERIVED_EXCEPTION( fill_amount_too_small,     invalid_parameter_exception, 5040007,
                                "fill amount below the order minimum" )
FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_deposit,      invalid_parameter_exception, 5040008, "insufficient deposit" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_fee_rate,          invalid_parameter_exception, 5040009, "invalid fee rate" )
FC_IMPLEMENT_DERIVED_EXCEPTION( unexpected_value,          invalid_parameter_exception, 5040010,
                                "value attached to a call that does not accept it" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_preimage_size,     invalid_parameter_exception, 5040011, "invalid preimage size" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_block,             invalid_parameter_exception, 5040012, "invalid head block" )
FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_operation,         invalid_parameter_exception, 5040013, "invalid operation" )

FC_IMPLEMENT_DERIVED_EXCEPTION( order_cancelled,           state_conflict_exception, 5050001, "order cancelled" )
FC_IMPLEMENT_DERIVED_EXCEPTION( order_complete,            state_conflict_exception, 5050002, "order complete" )
FC_IMPLEMENT_DERIVED_EXCEPTION( max_fills_reached,         state_conflict_exception, 5050003, "max fills reached" )
FC_IMPLEMENT_DERIVED_EXCEPTION( fill_closed,               state_conflict_exception, 5050004,
                                "fill already withdrawn or refunded" )
FC_IMPLEMENT_DERIVED_EXCEPTION( partial_fills_not_allowed, state_conflict_exception, 5050005,
                                "partial fills not allowed" )
FC_IMPLEMENT_DERIVED_EXCEPTION( no_fees_to_sweep,          state_conflict_exception, 5050006, "no fees to sweep" )

FC_IMPLEMENT_DERIVED_EXCEPTION( timelock_expired,          timing_violation_exception, 5060001, "timelock expired" )
FC_IMPLEMENT_DERIVED_EXCEPTION( timelock_not_expired,      timing_violation_exception, 5060002, "timelock not expired" )

} } // hashvault::protocol
