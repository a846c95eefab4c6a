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

#include <hashvault/app/database_api.hpp>

namespace hashvault { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      explicit database_api_impl( hashvault::chain::database& db );
      virtual ~database_api_impl();

      // Objects
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      // Subscriptions
      void set_operation_applied_callback( std::function<void(const variant&)> cb );
      void cancel_all_subscriptions();

      // Orders
      vector<order_object> get_orders_by_maker( const address& maker, uint32_t limit )const;

      // Fills
      vector<fill_object> get_fills_by_taker( const address& taker, uint32_t limit )const;

      // History
      vector<operation_history> get_applied_operations( uint64_t start, uint32_t limit )const;

      hashvault::chain::database& _db;

   private:
      void on_operation_applied( const operation_history& oh );

      std::function<void(const fc::variant&)> _operation_applied_callback;

      boost::signals2::scoped_connection      _applied_operation_connection;
};

} }
