//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_BROADCAST_COORDINATOR_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_BROADCAST_COORDINATOR_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"

// Fan-out of serialized events to live connections.

namespace lanchat {

class room_store;
class session_registry;

// Any live connection must implement this interface to receive events.
class connection_sink
{
public:
    virtual ~connection_sink() {}

    // Enqueues a serialized event for delivery. Must not block, and must
    // preserve the order of successive calls. Payloads are shared between
    // all the recipients of a broadcast.
    virtual void deliver(std::shared_ptr<const std::string> payload) = 0;
};

// Owns the connection table, and delivers events to single connections,
// to all members of a room, or to everyone.
// A failure delivering to one connection doesn't prevent delivery to others.
class broadcast_coordinator
{
    const room_store* rooms_;
    const session_registry* sessions_;
    std::map<connection_id, std::shared_ptr<connection_sink>> conns_;
    connection_id next_id_{1};

    void deliver_to(connection_id conn, const std::shared_ptr<const std::string>& payload);

public:
    broadcast_coordinator(const room_store& rooms, const session_registry& sessions) noexcept
        : rooms_(&rooms), sessions_(&sessions)
    {
    }
    broadcast_coordinator(const broadcast_coordinator&) = delete;
    broadcast_coordinator& operator=(const broadcast_coordinator&) = delete;

    // Registers a live connection, returning its ID. IDs are never reused
    connection_id add_connection(std::shared_ptr<connection_sink> sink);

    // Removes a connection. Events sent to it afterwards are dropped.
    void remove_connection(connection_id conn) noexcept;

    // Number of live connections, including the ones without a user
    std::size_t num_connections() const noexcept { return conns_.size(); }

    // Sends a serialized event to a single connection
    void send_to(connection_id conn, std::string payload);

    // Sends a serialized event to all members of a room, optionally excluding one
    void send_to_room(std::string_view room_id, std::string payload, std::optional<connection_id> except = {});

    // Sends a serialized event to every live connection
    void send_to_all(std::string payload);

    // The room list snapshot, with current user counts
    std::vector<room_summary> room_list() const;

    // The users in a room, in join order
    std::vector<user_summary> user_list(std::string_view room_id) const;

    // Sends the room list to everyone
    void broadcast_room_list();

    // Sends a room's user list to its members. No-op if the room doesn't exist
    void broadcast_user_list(std::string_view room_id);
};

}  // namespace lanchat

#endif
