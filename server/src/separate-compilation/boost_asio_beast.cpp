//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Compiles Boost.Asio and Boost.Beast once, for the server and the tests.
// Requires BOOST_ASIO_SEPARATE_COMPILATION and BOOST_BEAST_SEPARATE_COMPILATION
// to be defined for every translation unit that includes them.

#include <boost/asio/impl/src.hpp>
#include <boost/beast/src.hpp>
