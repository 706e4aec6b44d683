//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_API_API_TYPES_HPP
#define LANCHAT_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>
#include <boost/variant2/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// This file contains type definitions for HTTP and websocket API objects.
// Types for incoming requests are owning, since they're used after parsing,
// and match exactly the types and field names in the API.
// Types for responses and outgoing events are non-owning and lightweight,
// since they are only used as intermediate types for serialization.
// They do not have the exact same field names and types as the actual
// API messages, but instead contain enough information to produce them.
// This saves copies.

namespace lanchat {

//
// Incoming messages (HTTP requests and websocket client events)
//

// The request for POST /api/rooms
struct create_room_request
{
    std::string roomId;
    std::optional<std::string> roomName;

    // Parses a request from a JSON string
    static result<create_room_request> from_json(std::string_view from);
};

// The request for POST /api/mute-ip and POST /api/unmute-ip
struct address_request
{
    std::string ip;

    static result<address_request> from_json(std::string_view from);
};

// The request for POST /api/broadcast
struct broadcast_request
{
    std::string message;

    static result<broadcast_request> from_json(std::string_view from);
};

// Sent by the client to bind a user to its connection
struct join_event
{
    std::string username;

    // Defaults to the default room
    std::optional<std::string> roomId;
};

// Sent by a joined client to switch rooms
struct join_room_event
{
    std::string roomId;
};

// Sent by a joined client to create a room, without entering it
struct create_room_event
{
    std::string roomId;

    // Defaults to roomId
    std::optional<std::string> roomName;
};

// Sent by a joined client to delete an empty room
struct delete_room_event
{
    std::string roomId;
};

// Sent by the client to broadcast a message to other clients in a room
struct send_message_event
{
    std::string content;

    // Defaults to the user's current room
    std::optional<std::string> roomId;
};

// Sent by the client while the user is typing
struct typing_event
{
    bool isTyping{};

    // Defaults to the user's current room
    std::optional<std::string> roomId;
};

// Sent by the client to request a room list. Has no payload.
struct get_rooms_event
{
};

// A variant that can represent any event that may be received from the client,
// or an error_code, if the client sent an invalid message
using any_client_event = boost::variant2::variant<
    error_code,  // Invalid, used to report errors
    join_event,
    join_room_event,
    create_room_event,
    delete_room_event,
    send_message_event,
    typing_event,
    get_rooms_event>;

// Parses a message received from the websocket client into a variant
// holding any of the valid client-side events.
any_client_event parse_client_event(std::string_view from);

//
// Outgoing messages (HTTP responses and server events)
//

// Used within api_error, as a way to communicate specific error conditions
// to the client.
enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // Admin credentials missing or invalid
    unauthorized,

    // The caller's address is muted
    forbidden,

    // The target room doesn't exist
    not_found,

    // The room already exists
    room_exists,

    // The room has members and force wasn't specified
    room_not_empty,
};

// A REST API error. Used within HTTP error responses.
struct api_error
{
    // An identifier for the error that occurred.
    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// The error body for a non-forced DELETE /api/rooms/{id} on a room with members.
// Carries the room's usernames, so the administrator knows who is affected
struct room_not_empty_error
{
    std::string_view error_message;
    boost::span<const std::string> usernames;

    std::string to_json() const;
};

// GET /api/users
struct users_response
{
    boost::span<const user_summary> users;

    std::string to_json() const;
};

// GET /api/rooms
struct rooms_response
{
    boost::span<const room_summary> rooms;

    std::string to_json() const;
};

// GET /api/muted-ips
struct muted_addresses_response
{
    boost::span<const std::string> addresses;

    std::string to_json() const;
};

// GET /api/health
struct health_response
{
    std::size_t num_users;
    std::size_t num_rooms;
    std::size_t num_muted;
    timestamp_t timestamp;

    // The local address the client reached us on
    std::string_view server_address;

    std::string to_json() const;
};

// Generic success response for admin operations
struct success_response
{
    // A human-readable description of what was done
    std::string_view message;

    std::string to_json() const;
};

// POST /api/rooms
struct room_created_response
{
    std::string_view message;
    const room_summary& summary;

    std::string to_json() const;
};

// DELETE /api/rooms/{id}
struct room_deleted_response
{
    std::string_view message;
    bool force;
    std::size_t kicked_users;

    std::string to_json() const;
};

// POST /api/rooms/{id}/kick-users
struct kick_users_response
{
    std::string_view message;
    std::size_t kicked_count;

    std::string to_json() const;
};

// A single chat message
struct message_event
{
    const message& msg;

    std::string to_json() const;
};

// Room history, oldest first
struct message_history_event
{
    boost::span<const message> messages;

    std::string to_json() const;
};

// The users in a room
struct user_list_event
{
    boost::span<const user_summary> users;

    std::string to_json() const;
};

// All rooms
struct room_list_event
{
    boost::span<const room_summary> rooms;

    std::string to_json() const;
};

// Sent to a client after its create_room request succeeded
struct room_created_event
{
    std::string_view room_id;
    std::string_view room_name;

    std::string to_json() const;
};

// Sent to a client after its delete_room request succeeded, or to the
// members of a room deleted by an administrator
struct room_deleted_event
{
    std::string_view room_id;
    std::string_view room_name;

    // Omitted if empty
    std::string_view reason;

    std::string to_json() const;
};

// Sent to the members of a room when an administrator kicks them out
struct kicked_from_room_event
{
    std::string_view room_id;
    std::string_view room_name;
    std::string_view reason;

    std::string to_json() const;
};

// Sent to a client after switching rooms
struct room_joined_event
{
    std::string_view room_id;
    std::string_view room_name;
    std::size_t user_count;

    std::string to_json() const;
};

// Relayed to other room members while a user types
struct user_typing_event
{
    std::string_view username;
    bool is_typing;

    std::string to_json() const;
};

// Sent to a client when one of its requests failed
struct error_event
{
    std::string_view message;

    std::string to_json() const;
};

}  // namespace lanchat

#endif
