//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "server.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>

#include <exception>
#include <memory>
#include <sstream>

#include "error.hpp"
#include "http_session.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace lanchat;

static void log_exception(std::exception_ptr ptr)
{
    try
    {
        // Rethrowing is the only way to access the underlying exception object
        std::rethrow_exception(ptr);
    }
    catch (const std::exception& exc)
    {
        log_error(errc::uncaught_exception, "Uncaught exception in HTTP session", exc.what());
    }
}

asio::ip::tcp::acceptor lanchat::open_acceptor(
    asio::any_io_executor ex,
    asio::ip::tcp::endpoint listening_endpoint
)
{
    // Failing here is fatal, so these functions throw
    asio::ip::tcp::acceptor acceptor(ex);
    acceptor.open(listening_endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(listening_endpoint);
    acceptor.listen();

    std::ostringstream oss;
    oss << "Chat server listening on " << acceptor.local_endpoint();
    log_info(oss.str());

    return acceptor;
}

asio::awaitable<void> lanchat::run_server(asio::ip::tcp::acceptor acceptor, std::shared_ptr<shared_state> st)
{
    auto ex = co_await asio::this_coro::executor;

    // Accept connections until the io_context is stopped
    while (true)
    {
        asio::ip::tcp::socket sock = co_await acceptor.async_accept();

        // Each connection runs in its own coroutine. An exception escaping
        // a session is logged and only ends that session
        asio::co_spawn(ex, run_http_session(std::move(sock), st), [](std::exception_ptr exc) {
            if (exc)
                log_exception(exc);
        });
    }
}
