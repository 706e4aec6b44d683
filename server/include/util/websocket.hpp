//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP
#define LANCHAT_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace lanchat {

// A wrapper around beast's websocket stream that reduces build times
// by keeping Beast instantiations in a separate .cpp file.
// Only a single read and a single write may be outstanding at each time.
class websocket
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructors, assignments, destructor
    websocket(
        boost::asio::ip::tcp::socket sock,
        upgrade_request_type&& upgrade_request,
        boost::beast::flat_buffer buffer,
        std::string remote_address
    );
    websocket(const websocket&) = delete;
    websocket(websocket&&) noexcept;
    websocket& operator=(const websocket&) = delete;
    websocket& operator=(websocket&&) noexcept;
    ~websocket();

    // The source address of the connection, as passed on construction
    const std::string& remote_address() const noexcept;

    boost::asio::any_io_executor get_executor();

    // Runs the websocket handshake. Must be called before any other operation
    boost::asio::awaitable<boost::system::error_code> accept();

    // Reads a message from the client. The returned view is valid until the next
    // read is performed.
    boost::asio::awaitable<boost::system::result<std::string_view>> read();

    // Writes a text message to the client.
    boost::asio::awaitable<boost::system::error_code> write(std::string_view buff);

    // Closes the underlying socket without a closing handshake. Any outstanding
    // read or write completes with an error.
    void abort() noexcept;
};

}  // namespace lanchat

#endif
