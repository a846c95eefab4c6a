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
#include <hashvault/chain/order_object.hpp>
#include <hashvault/chain/fill_object.hpp>

namespace hashvault { namespace chain {

   class order_create_evaluator : public evaluator<order_create_evaluator>
   {
      public:
         typedef order_create_operation operation_type;

         void_result      do_evaluate( const order_create_operation& o );
         operation_result do_apply( const order_create_operation& o );

         fee_split        split;
   };

   class order_fill_evaluator : public evaluator<order_fill_evaluator>
   {
      public:
         typedef order_fill_operation operation_type;

         void_result      do_evaluate( const order_fill_operation& o );
         operation_result do_apply( const order_fill_operation& o );

         const order_object* order = nullptr;
         share_type          fill_amount;
   };

   class fill_withdraw_evaluator : public evaluator<fill_withdraw_evaluator>
   {
      public:
         typedef fill_withdraw_operation operation_type;

         void_result do_evaluate( const fill_withdraw_operation& o );
         void_result do_apply( const fill_withdraw_operation& o );

         const fill_object*  fill = nullptr;
         const order_object* order = nullptr;
   };

   class fill_refund_evaluator : public evaluator<fill_refund_evaluator>
   {
      public:
         typedef fill_refund_operation operation_type;

         void_result do_evaluate( const fill_refund_operation& o );
         void_result do_apply( const fill_refund_operation& o );

         const fill_object*  fill = nullptr;
         const order_object* order = nullptr;
   };

   class order_cancel_evaluator : public evaluator<order_cancel_evaluator>
   {
      public:
         typedef order_cancel_operation operation_type;

         void_result do_evaluate( const order_cancel_operation& o );
         void_result do_apply( const order_cancel_operation& o );

         const order_object* order = nullptr;
   };

} } // hashvault::chain
