//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define LANCHAT_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "timestamp.hpp"

// This file contains business object definitions

namespace lanchat {

// Identifies a live websocket connection. Assigned by the broadcast_coordinator
using connection_id = std::uint64_t;

// The ID of the room that always exists and can't be deleted
inline constexpr std::string_view default_room_id = "default";

// The number of messages retained per room, and replayed to joining users
inline constexpr std::size_t history_size = 50u;

// The kind of a chat message
enum class message_kind
{
    text,   // sent by a user
    join,   // system notice: a user entered the room
    leave,  // system notice: a user left the room
    admin,  // sent by an administrator or by the system on behalf of one
};

// A chat message. Immutable once appended to a room's history
struct message
{
    // Message ID
    std::string id;

    // What kind of message this is
    message_kind kind{message_kind::text};

    // Display name of the author. System messages use a fixed name
    std::string username;

    // The content, as typed by the user
    std::string content;

    // The rendered content, if the renderer detected any markup
    std::optional<std::string> rendered_content;

    // UTC timestamp when the server received the message
    timestamp_t timestamp;

    // ID of the room this message belongs to
    std::string room_id;

    // Source address of the author. Empty for system-authored messages
    std::string author_address;

    // true if rendering was applied to the content
    bool is_rendered() const noexcept { return rendered_content.has_value(); }
};

// An application user. One exists per joined connection
struct user
{
    // User ID
    std::string id;

    // Display name
    std::string username;

    // The connection this user is bound to
    connection_id conn_id{};

    // The source address of the connection
    std::string address;

    // When the user joined
    timestamp_t join_time;

    // The room the user is currently in. Only updated by session_registry
    std::string current_room;

    // Mirrors the moderation_registry state for the user's address
    bool is_muted{};
};

// A snapshot of a room, as broadcast in room lists
struct room_summary
{
    std::string id;
    std::string name;
    std::size_t user_count{};
    timestamp_t created;
    bool is_public{true};
};

// A snapshot of a user, as broadcast in user lists
struct user_summary
{
    std::string id;
    std::string username;
    timestamp_t join_time;
    std::string address;
    bool is_muted{};
};

}  // namespace lanchat

#endif
