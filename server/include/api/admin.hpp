//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_API_ADMIN_HPP
#define LANCHAT_SERVER_INCLUDE_API_ADMIN_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

// API handler functions for the administrative REST endpoints.
// Endpoints that modify rooms or moderation state require admin credentials,
// except for room creation.

namespace lanchat {

class shared_state;

// GET /health
boost::asio::awaitable<response_builder::response_type> handle_health(request_context& ctx, shared_state& st);

// GET /users
boost::asio::awaitable<response_builder::response_type> handle_list_users(
    request_context& ctx,
    shared_state& st
);

// GET /rooms
boost::asio::awaitable<response_builder::response_type> handle_list_rooms(
    request_context& ctx,
    shared_state& st
);

// POST /rooms
boost::asio::awaitable<response_builder::response_type> handle_create_room(
    request_context& ctx,
    shared_state& st
);

// DELETE /rooms/{id}
boost::asio::awaitable<response_builder::response_type> handle_delete_room(
    request_context& ctx,
    shared_state& st
);

// POST /rooms/{id}/kick-users
boost::asio::awaitable<response_builder::response_type> handle_kick_users(
    request_context& ctx,
    shared_state& st
);

// POST /mute-ip
boost::asio::awaitable<response_builder::response_type> handle_mute_ip(request_context& ctx, shared_state& st);

// POST /unmute-ip
boost::asio::awaitable<response_builder::response_type> handle_unmute_ip(
    request_context& ctx,
    shared_state& st
);

// GET /muted-ips
boost::asio::awaitable<response_builder::response_type> handle_list_muted_ips(
    request_context& ctx,
    shared_state& st
);

// POST /broadcast
boost::asio::awaitable<response_builder::response_type> handle_broadcast(
    request_context& ctx,
    shared_state& st
);

}  // namespace lanchat

#endif
