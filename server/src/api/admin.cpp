//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/admin.hpp"

#include <boost/beast/http/status.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/chat_service.hpp"
#include "services/moderation_registry.hpp"
#include "services/room_store.hpp"
#include "services/session_registry.hpp"
#include "shared_state.hpp"
#include "timestamp.hpp"

using namespace lanchat;
namespace http = boost::beast::http;
namespace asio = boost::asio;

// Whether the request carries the configured admin token
static bool has_admin_token(const request_context& ctx, const shared_state& st)
{
    const auto& token = st.config().admin_token;
    return !token.empty() && ctx.bearer_token() == token;
}

// Whether the request may call an admin endpoint. If no token is configured,
// anyone on the network can
static bool is_authorized(const request_context& ctx, const shared_state& st)
{
    return st.config().admin_token.empty() || has_admin_token(ctx, st);
}

// Maps a chat service error to a JSON error response
static response_builder::response_type error_response(response_builder& resp, const error_with_message& err)
{
    if (err.ec == errc::validation_error || err.ec == errc::invalid_operation)
        return resp.bad_request_json(err.msg);
    else if (err.ec == errc::forbidden)
        return resp.json_error(http::status::forbidden, api_error_id::forbidden, err.msg);
    else if (err.ec == errc::not_found)
        return resp.json_error(http::status::not_found, api_error_id::not_found, err.msg);
    else if (err.ec == errc::conflict)
        return resp.json_error(http::status::conflict, api_error_id::room_exists, err.msg);
    else if (err.ec == errc::room_not_empty)
        return resp.json_error(http::status::conflict, api_error_id::room_not_empty, err.msg);
    else
        return resp.internal_server_error(err);
}

asio::awaitable<response_builder::response_type> lanchat::handle_health(request_context& ctx, shared_state& st)
{
    health_response res{
        st.sessions().size(),
        st.rooms().size(),
        st.moderation().size(),
        timestamp_t::clock::now(),
        ctx.local_address(),
    };
    co_return ctx.response().json_response(res);
}

asio::awaitable<response_builder::response_type> lanchat::handle_list_users(
    request_context& ctx,
    shared_state& st
)
{
    auto users = st.sessions().list();
    co_return ctx.response().json_response(users_response{users});
}

asio::awaitable<response_builder::response_type> lanchat::handle_list_rooms(
    request_context& ctx,
    shared_state& st
)
{
    auto rooms = st.rooms().list();
    co_return ctx.response().json_response(rooms_response{rooms});
}

asio::awaitable<response_builder::response_type> lanchat::handle_create_room(
    request_context& ctx,
    shared_state& st
)
{
    // Parse params
    auto parse_result = ctx.parse_json_body<create_room_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");
    const auto& req_params = parse_result.value();

    // Admins may create rooms even from a muted address
    auto res = st.chat().admin_create_room(
        req_params.roomId,
        req_params.roomName.value_or(""),
        ctx.remote_address(),
        has_admin_token(ctx, st)
    );
    if (res.has_error())
        co_return error_response(ctx.response(), res.error());

    std::string message = "Room \"" + res->name + "\" created";
    co_return ctx.response().json_response(room_created_response{message, *res});
}

asio::awaitable<response_builder::response_type> lanchat::handle_delete_room(
    request_context& ctx,
    shared_state& st
)
{
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json();

    bool force = ctx.query_param("force") == "true";
    auto res = st.chat().admin_delete_room(ctx.path_param(0), force);
    if (res.has_error())
    {
        auto err = res.error();

        // Tell the administrator who is still in the room
        if (err.ec == errc::room_not_empty)
        {
            auto usernames = st.sessions().usernames_in(ctx.path_param(0));
            co_return ctx.response().json_response(
                room_not_empty_error{err.msg, usernames},
                http::status::conflict
            );
        }
        co_return error_response(ctx.response(), err);
    }

    std::string message = "Room \"" + res->room_name + "\" deleted";
    if (force)
        message += " (all users were moved to the default room)";
    co_return ctx.response().json_response(room_deleted_response{message, force, res->num_evicted});
}

asio::awaitable<response_builder::response_type> lanchat::handle_kick_users(
    request_context& ctx,
    shared_state& st
)
{
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json();

    auto res = st.chat().kick_room_members(ctx.path_param(0));
    if (res.has_error())
        co_return error_response(ctx.response(), res.error());

    std::string message = "Kicked " + std::to_string(res->num_evicted) + " users from room \"" +
                          res->room_name + "\"";
    co_return ctx.response().json_response(kick_users_response{message, res->num_evicted});
}

asio::awaitable<response_builder::response_type> lanchat::handle_mute_ip(request_context& ctx, shared_state& st)
{
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json();

    auto parse_result = ctx.parse_json_body<address_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    auto err = st.chat().mute_address(parse_result->ip);
    if (err.ec)
        co_return error_response(ctx.response(), err);

    std::string message = "IP " + parse_result->ip + " muted";
    co_return ctx.response().json_response(success_response{message});
}

asio::awaitable<response_builder::response_type> lanchat::handle_unmute_ip(
    request_context& ctx,
    shared_state& st
)
{
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json();

    auto parse_result = ctx.parse_json_body<address_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    auto err = st.chat().unmute_address(parse_result->ip);
    if (err.ec)
        co_return error_response(ctx.response(), err);

    std::string message = "IP " + parse_result->ip + " unmuted";
    co_return ctx.response().json_response(success_response{message});
}

asio::awaitable<response_builder::response_type> lanchat::handle_list_muted_ips(
    request_context& ctx,
    shared_state& st
)
{
    auto addresses = st.moderation().list();
    co_return ctx.response().json_response(muted_addresses_response{addresses});
}

asio::awaitable<response_builder::response_type> lanchat::handle_broadcast(
    request_context& ctx,
    shared_state& st
)
{
    if (!is_authorized(ctx, st))
        co_return ctx.response().unauthorized_json();

    auto parse_result = ctx.parse_json_body<broadcast_request>();
    if (parse_result.has_error())
        co_return ctx.response().bad_request_json("Invalid body provided");

    auto err = st.chat().broadcast_admin(parse_result->message);
    if (err.ec)
        co_return error_response(ctx.response(), err);

    co_return ctx.response().json_response(success_response{"Broadcast sent"});
}
