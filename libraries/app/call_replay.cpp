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
#include <hashvault/app/call_replay.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <ostream>

namespace hashvault { namespace app {

bool replay_call( database& db, memory_ledger& ledger, const scripted_call& call, size_t n, std::ostream& out )
{
   try
   {
      if( call.block.valid() || call.time.valid() )
         db.set_head_block( call.block.valid() ? *call.block : db.head_block_num(),
                            call.time.valid() ? *call.time : db.head_block_time() );

      ledger.attach_value( call.caller, call.value );
   }
   catch( const fc::exception& e )
   {
      wlog( "call ${n} not submitted: ${e}", ("n",n)("e",e.to_detail_string()) );
      out << "#" << n << " " << operation_name( call.op ) << " not submitted: " << e.to_string() << "\n";
      return false;
   }

   try
   {
      const operation_result result = db.push_call( call_context( call.caller, call.value ), call.op );
      out << "#" << n << " " << operation_name( call.op ) << " ok "
          << fc::json::to_string( result ) << "\n";
      return true;
   }
   catch( const fc::exception& e )
   {
      ledger.return_value( call.caller, call.value );
      out << "#" << n << " " << operation_name( call.op ) << " failed: " << e.to_string() << "\n";
      return false;
   }
}

} } // hashvault::app
