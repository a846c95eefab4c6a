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

namespace hashvault { namespace chain {

   class fee_rate_update_evaluator : public evaluator<fee_rate_update_evaluator>
   {
      public:
         typedef fee_rate_update_operation operation_type;

         void_result do_evaluate( const fee_rate_update_operation& o );
         void_result do_apply( const fee_rate_update_operation& o );
   };

   class fee_sweep_evaluator : public evaluator<fee_sweep_evaluator>
   {
      public:
         typedef fee_sweep_operation operation_type;

         void_result do_evaluate( const fee_sweep_operation& o );
         void_result do_apply( const fee_sweep_operation& o );
   };

   class admin_update_evaluator : public evaluator<admin_update_evaluator>
   {
      public:
         typedef admin_update_operation operation_type;

         void_result do_evaluate( const admin_update_operation& o );
         void_result do_apply( const admin_update_operation& o );
   };

} } // hashvault::chain
