//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/room_store.hpp"

namespace lanchat {

// Maps connections to the users bound to them. This is the single source
// of truth for "who is connected and what room are they in".
//
// Each user caches the room they're in. Room membership proper lives in the
// room_store. Every operation that changes membership goes through this class,
// and updates both sides in a single synchronous step.
class session_registry
{
    room_store* rooms_;

    // Ordered by connection ID, which matches connection order
    std::map<connection_id, user> users_;

    user* find_user(connection_id conn);

public:
    explicit session_registry(room_store& rooms) noexcept : rooms_(&rooms) {}
    session_registry(const session_registry&) = delete;
    session_registry& operator=(const session_registry&) = delete;

    // Binds a user to a connection and adds it to u.current_room's members.
    // Fails with errc::invalid_operation if the connection already has a user
    // and with errc::not_found if the room doesn't exist.
    error_code bind(connection_id conn, user u);

    // Removes the user bound to conn from every room and from the registry.
    // Returns the removed user, or an empty optional if conn had no user.
    std::optional<user> unbind(connection_id conn);

    // Returns nullptr if conn has no bound user
    const user* get(connection_id conn) const;

    // Moves the user bound to conn to another room. Returns the ID of the
    // room the user was in. Fails with errc::not_authenticated if conn has
    // no user, and with errc::not_found if the room doesn't exist.
    result<std::string> switch_room(connection_id conn, std::string_view new_room_id);

    // Removes a room. If force is false, this is room_store::remove. Otherwise,
    // members are relocated to the default room before removal. The returned
    // room holds the members it had before removal.
    result<room> remove_room(std::string_view room_id, bool force);

    // Relocates every member of a room to the default room, keeping the room.
    // Returns the relocated connections. No-op for the default room.
    std::vector<connection_id> evict_room(std::string_view room_id);

    // Users connected from the given address, in connection order
    std::vector<const user*> list_by_address(std::string_view address) const;

    // The usernames of a room's members, in membership order.
    // Empty if the room doesn't exist
    std::vector<std::string> usernames_in(std::string_view room_id) const;

    // Sets the muted flag of every user connected from address.
    // Returns the rooms those users are in, without duplicates.
    std::vector<std::string> set_muted(std::string_view address, bool muted);

    // A snapshot of all users, in connection order
    std::vector<user_summary> list() const;

    std::size_t size() const noexcept { return users_.size(); }
};

}  // namespace lanchat

#endif
