//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_CHAT_SERVICE_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_CHAT_SERVICE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

namespace lanchat {

class room_store;
class session_registry;
class moderation_registry;
class broadcast_coordinator;
class id_generator;
class timestamp_clock;
class content_renderer;

// The services a chat_service operates on. None of them is owned
struct chat_service_deps
{
    room_store& rooms;
    session_registry& sessions;
    moderation_registry& moderation;
    broadcast_coordinator& coordinator;
    id_generator& ids;
    timestamp_clock& clock;
    content_renderer& renderer;
};

// Returned by room deletion and kick operations
struct room_eviction
{
    // Display name of the affected room
    std::string room_name;

    // Number of users moved to the default room
    std::size_t num_evicted{};
};

// The protocol state machine. Validates every client request, mutates
// the stores and emits the resulting events through the broadcast_coordinator.
// Both the websocket API and the REST API go through this class.
//
// Every function runs synchronously. Errors carry a message that can be
// shown to clients, and leave state untouched.
class chat_service
{
    chat_service_deps deps_;

    message make_message(
        message_kind kind,
        std::string_view username,
        std::string content,
        std::string_view room_id,
        std::string_view author_address
    );
    message make_system_message(message_kind kind, std::string content, std::string_view room_id);

    // Appends msg to its room and sends it to the room members
    void post_message(message msg, std::optional<connection_id> except = {});

    void send_history(connection_id conn, std::string_view room_id);
    void send_history(connection_id conn, const std::vector<message>& history);

    std::optional<std::string> try_render(std::string_view content);

public:
    explicit chat_service(chat_service_deps deps) noexcept : deps_(deps) {}

    //
    // Websocket operations. conn identifies the calling connection
    //

    // Binds a new user to conn and places it in the requested room,
    // creating the room if needed. Defaults to the default room
    error_with_message join(
        connection_id conn,
        std::string_view address,
        std::string_view username,
        std::optional<std::string_view> room_id
    );

    // Moves the user to another existing room
    error_with_message join_room(connection_id conn, std::string_view room_id);

    // Sends a text message to room_id, or to the user's current room if unset.
    // Messages that are empty after trimming are silently discarded
    error_with_message send_message(
        connection_id conn,
        std::string_view content,
        std::optional<std::string_view> room_id
    );

    // Creates a room without entering it
    error_with_message create_room(
        connection_id conn,
        std::string_view room_id,
        std::optional<std::string_view> room_name
    );

    // Deletes an empty room
    error_with_message delete_room(connection_id conn, std::string_view room_id);

    // Relays a typing indicator to the other members of the room
    void typing(connection_id conn, bool is_typing, std::optional<std::string_view> room_id);

    // Sends the room list to the caller
    void get_rooms(connection_id conn);

    // Revokes all state associated to conn. Must be called exactly once
    // when the connection ends, whether it joined or not
    void disconnect(connection_id conn);

    //
    // Administrative operations. Mute checks don't apply to these
    //

    // Creates a room. The mute check applies to caller_address unless is_admin is set
    result_with_message<room_summary> admin_create_room(
        std::string_view room_id,
        std::string_view room_name,
        std::string_view caller_address,
        bool is_admin
    );

    // Deletes a room. If force is set, members are moved to the default room
    result_with_message<room_eviction> admin_delete_room(std::string_view room_id, bool force);

    // Moves all the members of a room to the default room, keeping the room
    result_with_message<room_eviction> kick_room_members(std::string_view room_id);

    error_with_message mute_address(std::string_view address);
    error_with_message unmute_address(std::string_view address);

    // Posts an admin message to every room
    error_with_message broadcast_admin(std::string_view content);
};

// Returns whether s has between 2 and 20 characters. Characters are UTF-8 code points
bool is_valid_name_length(std::string_view s) noexcept;

}  // namespace lanchat

#endif
