//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVER_HPP
#define LANCHAT_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

namespace lanchat {

// Forward declaration
class shared_state;

// Creates an acceptor listening on the given endpoint. Throws an exception
// if the listener is unable to launch (e.g. the port to bind to is not available).
boost::asio::ip::tcp::acceptor open_acceptor(
    boost::asio::any_io_executor ex,
    boost::asio::ip::tcp::endpoint listening_endpoint
);

// Runs the chat server. It will accept connections in a loop until
// the underlying I/O context is stopped.
boost::asio::awaitable<void> run_server(
    boost::asio::ip::tcp::acceptor acceptor,
    std::shared_ptr<shared_state> state
);

}  // namespace lanchat

#endif
