//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace lanchat;

static void main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    if (argc != 3)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port>\n"
                  << "Example:\n"
                  << "    " << argv[0] << " 0.0.0.0 3000\n";
        exit(EXIT_FAILURE);
    }

    const char* ip = argv[1];                                     // IP where the server will listen
    auto port = static_cast<unsigned short>(std::atoi(argv[2]));  // Port

    // The admin token and the default room name come from the environment
    auto config = application_config::from_env();

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Singleton objects shared by all connections
    auto st = std::make_shared<shared_state>(std::move(config));

    // The physical endpoint where our server will listen
    asio::ip::tcp::endpoint listening_endpoint(asio::ip::make_address(ip), port);

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Bind the port. This throws if the port is not available
    auto acceptor = open_acceptor(ctx.get_executor(), listening_endpoint);

    // Start listening for HTTP connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(std::move(acceptor), st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([&ctx](boost::system::error_code, int) {
        log_info("Shutting down");
        ctx.stop();
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal.
    ctx.run();
}

int main(int argc, char* argv[])
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
