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

#include <fc/exception/exception.hpp>

#define HASHVAULT_ASSERT( expr, exc_type, FORMAT, ... )               \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define HASHVAULT_RECODE_EXC( cause_type, effect_type )               \
   catch( const cause_type& e )                                       \
   { throw( effect_type( e.what(), e.get_log() ) ); }

namespace hashvault { namespace protocol {

   /**
    *  Every failure reported by the engine derives from swap_exception.  The
    *  direct children are the error kinds callers match on, the leaves name
    *  the specific cause.
    */
   FC_DECLARE_EXCEPTION( swap_exception, 5000000 )

   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,           hashvault::protocol::swap_exception, 5010000 )
   FC_DECLARE_DERIVED_EXCEPTION( already_exists_exception,      hashvault::protocol::swap_exception, 5020000 )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,        hashvault::protocol::swap_exception, 5030000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameter_exception,   hashvault::protocol::swap_exception, 5040000 )
   FC_DECLARE_DERIVED_EXCEPTION( state_conflict_exception,      hashvault::protocol::swap_exception, 5050000 )
   FC_DECLARE_DERIVED_EXCEPTION( timing_violation_exception,    hashvault::protocol::swap_exception, 5060000 )
   FC_DECLARE_DERIVED_EXCEPTION( secret_mismatch_exception,     hashvault::protocol::swap_exception, 5070000 )
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow_exception, hashvault::protocol::swap_exception, 5080000 )
   FC_DECLARE_DERIVED_EXCEPTION( transfer_failure_exception,    hashvault::protocol::swap_exception, 5090000 )

   FC_DECLARE_DERIVED_EXCEPTION( order_not_found,           hashvault::protocol::not_found_exception, 5010001 )
   FC_DECLARE_DERIVED_EXCEPTION( fill_not_found,            hashvault::protocol::not_found_exception, 5010002 )

   FC_DECLARE_DERIVED_EXCEPTION( order_already_exists,      hashvault::protocol::already_exists_exception, 5020001 )
   FC_DECLARE_DERIVED_EXCEPTION( fill_already_exists,       hashvault::protocol::already_exists_exception, 5020002 )

   FC_DECLARE_DERIVED_EXCEPTION( not_taker,                 hashvault::protocol::unauthorized_exception, 5030001 )
   FC_DECLARE_DERIVED_EXCEPTION( not_maker,                 hashvault::protocol::unauthorized_exception, 5030002 )
   FC_DECLARE_DERIVED_EXCEPTION( not_admin,                 hashvault::protocol::unauthorized_exception, 5030003 )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_timelock,          hashvault::protocol::invalid_parameter_exception, 5040001 )
   FC_DECLARE_DERIVED_EXCEPTION( timelock_too_short,        hashvault::protocol::invalid_parameter_exception, 5040002 )
   FC_DECLARE_DERIVED_EXCEPTION( timelock_too_long,         hashvault::protocol::invalid_parameter_exception, 5040003 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_chain_pair,        hashvault::protocol::invalid_parameter_exception, 5040004 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_fill_bounds,       hashvault::protocol::invalid_parameter_exception, 5040005 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_fill_amount,       hashvault::protocol::invalid_parameter_exception, 5040006 )
   FC_DECLARE_DERIVED_EXCEPTION( fill_amount_too_small,     hashvault::protocol::invalid_parameter_exception, 5040007 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_deposit,      hashvault::protocol::invalid_parameter_exception, 5040008 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_fee_rate,          hashvault::protocol::invalid_parameter_exception, 5040009 )
   FC_DECLARE_DERIVED_EXCEPTION( unexpected_value,          hashvault::protocol::invalid_parameter_exception, 5040010 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_preimage_size,     hashvault::protocol::invalid_parameter_exception, 5040011 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_block,             hashvault::protocol::invalid_parameter_exception, 5040012 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_operation,         hashvault::protocol::invalid_parameter_exception, 5040013 )

   FC_DECLARE_DERIVED_EXCEPTION( order_cancelled,           hashvault::protocol::state_conflict_exception, 5050001 )
   FC_DECLARE_DERIVED_EXCEPTION( order_complete,            hashvault::protocol::state_conflict_exception, 5050002 )
   FC_DECLARE_DERIVED_EXCEPTION( max_fills_reached,         hashvault::protocol::state_conflict_exception, 5050003 )
   FC_DECLARE_DERIVED_EXCEPTION( fill_closed,               hashvault::protocol::state_conflict_exception, 5050004 )
   FC_DECLARE_DERIVED_EXCEPTION( partial_fills_not_allowed, hashvault::protocol::state_conflict_exception, 5050005 )
   FC_DECLARE_DERIVED_EXCEPTION( no_fees_to_sweep,          hashvault::protocol::state_conflict_exception, 5050006 )

   FC_DECLARE_DERIVED_EXCEPTION( timelock_expired,          hashvault::protocol::timing_violation_exception, 5060001 )
   FC_DECLARE_DERIVED_EXCEPTION( timelock_not_expired,      hashvault::protocol::timing_violation_exception, 5060002 )

} } // hashvault::protocol
