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

#include <hashvault/chain/database.hpp>

#include <fc/variant_object.hpp>

#include <functional>
#include <memory>

namespace hashvault { namespace app {

using namespace hashvault::chain;

class database_api_impl;

/**
 * @brief The database_api class implements the read-only API of the escrow database.
 *
 * This API exposes accessors on the database which query the orders, fills and protocol
 * accounting.  All modifications to the database must be performed via
 * database::push_call().
 */
class database_api
{
   public:
      explicit database_api( hashvault::chain::database& db );
      ~database_api();

      /// Maximum number of entries returned by one paged query
      static constexpr uint32_t max_query_limit = 100;

      /////////////
      // Objects //
      /////////////

      /**
       * @brief Get the objects corresponding to the provided IDs
       * @param ids IDs of the objects to retrieve
       * @return The objects retrieved, in the order they are mentioned in ids
       *
       * If any of the provided IDs does not map to an object, a null variant is returned in its position.
       */
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      ///////////////////
      // Subscriptions //
      ///////////////////

      /**
       * @brief Register a callback handle which will get notified of every operation applied by a
       *        committed call, virtual operations included
       * @param cb The callback handle to register, it receives the operation_history as a variant
       */
      void set_operation_applied_callback( std::function<void(const variant&)> cb );
      void cancel_all_subscriptions();

      /////////////
      // Globals //
      /////////////

      /**
       * @brief Retrieve the current protocol_state_object
       */
      protocol_state_object get_protocol_state()const;

      /**
       * @brief Retrieve the current dynamic_global_property_object
       */
      dynamic_global_property_object get_dynamic_global_properties()const;

      address           get_admin()const;
      basis_points_type get_fee_rate()const;
      share_type        get_accumulated_fees()const;

      ////////////
      // Orders //
      ////////////

      /**
       * @brief Get an order by id
       * @return the order, or null if no such order exists
       */
      optional<order_object> get_order( const order_id_type& order_id )const;

      bool order_exists( const order_id_type& order_id )const;

      /// @return 0 for unknown, cancelled or complete orders
      share_type get_remaining_amount( const order_id_type& order_id )const;

      bool is_order_complete( const order_id_type& order_id )const;

      /**
       * @brief Get the fills of an order in the order they were created
       * @return an empty list for an unknown order
       */
      vector<fill_id_type> get_order_fills( const order_id_type& order_id )const;

      /**
       * @brief Get the orders created by a maker, oldest first
       * @param maker the maker address
       * @param limit maximum number of orders, at most max_query_limit
       */
      vector<order_object> get_orders_by_maker( const address& maker, uint32_t limit )const;

      ///////////
      // Fills //
      ///////////

      /**
       * @brief Get a fill by id
       * @return the fill, or null if no such fill exists
       */
      optional<fill_object> get_fill( const fill_id_type& fill_id )const;

      /**
       * @brief Get the secret revealed by the withdrawal of a fill
       * @return null until the fill has been withdrawn
       */
      optional<preimage_type> get_fill_secret( const fill_id_type& fill_id )const;

      /**
       * @brief Get the fills taken by an address, oldest first
       * @param taker the taker address
       * @param limit maximum number of fills, at most max_query_limit
       */
      vector<fill_object> get_fills_by_taker( const address& taker, uint32_t limit )const;

      /////////////
      // History //
      /////////////

      /**
       * @brief Get applied operations
       * @param start sequence number of the first operation to return
       * @param limit maximum number of operations, at most max_query_limit
       */
      vector<operation_history> get_applied_operations( uint64_t start, uint32_t limit )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} }
