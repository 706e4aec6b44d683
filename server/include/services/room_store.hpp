//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_ROOM_STORE_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_ROOM_STORE_HPP

#include <boost/circular_buffer.hpp>
#include <boost/core/span.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

// In-memory storage for chat rooms, their membership and their message history.

namespace lanchat {

// A chat room
struct room
{
    // Room ID
    std::string id;

    // User-facing room name
    std::string name;

    // When the room was created
    timestamp_t created;

    // Whether the room appears in room lists. All rooms are public for now
    bool is_public{true};

    // Connections currently in the room, in join order.
    // This is the authoritative membership relation.
    std::vector<connection_id> members;

    // The most recent messages, oldest first
    boost::circular_buffer<message> history = boost::circular_buffer<message>(history_size);

    std::string_view id_sv() const noexcept { return id; }
};

class session_registry;

// Owns room lifecycle. The default room is created on construction and
// can't be removed.
// Membership is only mutated through session_registry, which keeps each
// user's cached current room in sync. This is why the membership functions
// are private.
class room_store
{
    // Rooms are listed in creation order, and looked up by ID.
    // clang-format off
    using container_type = boost::multi_index::multi_index_container<
        room,
        boost::multi_index::indexed_by<
            // Creation order
            boost::multi_index::sequenced<>,
            // Index by room ID
            boost::multi_index::hashed_unique<
                boost::multi_index::const_mem_fun<room, std::string_view, &room::id_sv>,
                std::hash<std::string_view>
            >
        >
    >;
    // clang-format on

    container_type ct_;

    template <class Fn>
    bool modify_room(std::string_view room_id, Fn&& fn);

    // Membership. These don't check whether the connection is in another room
    bool add_member(std::string_view room_id, connection_id conn);
    bool move_member(connection_id conn, std::string_view from_room_id, std::string_view to_room_id);
    std::vector<std::string> remove_member_everywhere(connection_id conn);

    // Removes a room, appending its members to the default room
    result<room> remove_evicting(std::string_view room_id);

    // Moves all members of a room to the default room. Returns the moved connections
    std::vector<connection_id> evict_members(std::string_view room_id);

    friend class session_registry;

public:
    explicit room_store(std::string default_room_name);
    room_store(const room_store&) = delete;
    room_store& operator=(const room_store&) = delete;

    // Returns the room with the given ID, creating it if it doesn't exist.
    // If display_name is empty, the room ID is used as name.
    // The second member is true if the room was created by this call.
    std::pair<const room*, bool> get_or_create(std::string_view room_id, std::string_view display_name = {});

    // Creates a room. Fails with errc::conflict if it already exists
    result<const room*> create(std::string_view room_id, std::string_view display_name = {});

    // Removes an empty room and its history. Fails with errc::invalid_operation
    // for the default room, errc::not_found if it doesn't exist, and
    // errc::room_not_empty if it has members. Returns the removed room
    result<room> remove(std::string_view room_id);

    // Returns nullptr if the room doesn't exist
    const room* find(std::string_view room_id) const;

    bool contains(std::string_view room_id) const { return find(room_id) != nullptr; }

    // Returns an empty span if the room doesn't exist
    boost::span<const connection_id> members(std::string_view room_id) const;

    // Appends a message to msg.room_id's history, discarding the oldest one
    // if the room is full. If the room no longer exists, the message is dropped
    // and false is returned.
    bool append_message(message msg);

    // Returns the last limit messages of a room, oldest first
    std::vector<message> recent_history(std::string_view room_id, std::size_t limit = history_size) const;

    // A snapshot of all rooms, in creation order
    std::vector<room_summary> list() const;

    std::size_t size() const noexcept { return ct_.size(); }
};

}  // namespace lanchat

#endif
