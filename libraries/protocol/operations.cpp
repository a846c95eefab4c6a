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
#include <hashvault/protocol/operations.hpp>

#include <fc/reflect/typename.hpp>

namespace hashvault { namespace protocol {

struct operation_validator
{
   typedef void result_type;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct virtual_operation_checker
{
   typedef bool result_type;
   template<typename T>
   bool operator()( const T& )const { return std::is_base_of<virtual_operation, T>::value; }
};

struct operation_namer
{
   typedef string result_type;
   template<typename T>
   string operator()( const T& )const
   {
      string name = fc::get_typename<T>::name();
      auto pos = name.rfind( "::" );
      if( pos != string::npos )
         name = name.substr( pos + 2 );
      const string suffix( "_operation" );
      if( name.size() > suffix.size() && name.compare( name.size() - suffix.size(), suffix.size(), suffix ) == 0 )
         name.resize( name.size() - suffix.size() );
      return name;
   }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

bool is_virtual_operation( const operation& op )
{
   return op.visit( virtual_operation_checker() );
}

string operation_name( const operation& op )
{
   return op.visit( operation_namer() );
}

} } // namespace hashvault::protocol
