//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_TEST_INTEGRATION_CLIENT_HPP
#define LANCHAT_SERVER_TEST_INTEGRATION_CLIENT_HPP

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json/value.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "config.hpp"
#include "shared_state.hpp"

namespace lanchat {
namespace test {

class websocket_client
{
public:
    struct impl;

    websocket_client(impl*) noexcept;
    websocket_client(const websocket_client&) = delete;
    websocket_client(websocket_client&&) noexcept;
    websocket_client& operator=(const websocket_client&) = delete;
    websocket_client& operator=(websocket_client&&) noexcept;
    ~websocket_client();

    // Contents point into an internal buffer, valid until the next read
    std::string_view read();

    // Reads an event and parses it
    boost::json::value read_json();

    // Reads events until one of the given type arrives, returning its payload
    boost::json::value read_until(std::string_view type);

    void write(std::string_view buffer);

    // Sends a client event
    void send_event(std::string_view type, boost::json::value payload);

    // Closes the connection
    void close();

private:
    std::unique_ptr<impl> impl_;
};

// Runs a server instance in a separate thread, listening on a random port
class server_runner
{
    boost::asio::io_context ctx_{1};
    std::shared_ptr<shared_state> st_;
    unsigned short port_{};
    std::thread runner_;

public:
    explicit server_runner(application_config cfg = {});
    server_runner(const server_runner&) = delete;
    server_runner(server_runner&&) = delete;
    server_runner& operator=(const server_runner&) = delete;
    server_runner& operator=(server_runner&&) = delete;
    ~server_runner();

    websocket_client connect_websocket();

    // Issues a single HTTP request to the server. If token is not empty,
    // it's sent as a bearer token
    boost::beast::http::response<boost::beast::http::string_body> request(
        boost::beast::http::verb method,
        std::string_view target,
        std::string_view body = {},
        std::string_view token = {}
    );
};

}  // namespace test
}  // namespace lanchat

#endif
