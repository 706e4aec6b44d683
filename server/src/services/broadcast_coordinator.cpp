//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/broadcast_coordinator.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "services/room_store.hpp"
#include "services/session_registry.hpp"

using namespace lanchat;

connection_id broadcast_coordinator::add_connection(std::shared_ptr<connection_sink> sink)
{
    auto id = next_id_++;
    conns_.emplace(id, std::move(sink));
    return id;
}

void broadcast_coordinator::remove_connection(connection_id conn) noexcept { conns_.erase(conn); }

void broadcast_coordinator::deliver_to(connection_id conn, const std::shared_ptr<const std::string>& payload)
{
    auto it = conns_.find(conn);
    if (it == conns_.end())
        return;

    try
    {
        it->second->deliver(payload);
    }
    catch (const std::exception& err)
    {
        log_error(make_error_code(errc::uncaught_exception), "Delivering event", err.what());
    }
}

void broadcast_coordinator::send_to(connection_id conn, std::string payload)
{
    deliver_to(conn, std::make_shared<const std::string>(std::move(payload)));
}

void broadcast_coordinator::send_to_room(
    std::string_view room_id,
    std::string payload,
    std::optional<connection_id> except
)
{
    // Place the string into a shared object, to avoid making an individual
    // copy per recipient
    auto msg_ptr = std::make_shared<const std::string>(std::move(payload));

    for (auto conn : rooms_->members(room_id))
    {
        if (except && *except == conn)
            continue;
        deliver_to(conn, msg_ptr);
    }
}

void broadcast_coordinator::send_to_all(std::string payload)
{
    auto msg_ptr = std::make_shared<const std::string>(std::move(payload));
    for (const auto& [conn, sink] : conns_)
        deliver_to(conn, msg_ptr);
}

std::vector<room_summary> broadcast_coordinator::room_list() const { return rooms_->list(); }

std::vector<user_summary> broadcast_coordinator::user_list(std::string_view room_id) const
{
    std::vector<user_summary> res;
    for (auto conn : rooms_->members(room_id))
    {
        const auto* u = sessions_->get(conn);
        if (u)
            res.push_back(user_summary{u->id, u->username, u->join_time, u->address, u->is_muted});
    }
    return res;
}

void broadcast_coordinator::broadcast_room_list()
{
    auto rooms = room_list();
    send_to_all(room_list_event{rooms}.to_json());
}

void broadcast_coordinator::broadcast_user_list(std::string_view room_id)
{
    if (!rooms_->contains(room_id))
        return;
    auto users = user_list(room_id);
    send_to_room(room_id, user_list_event{users}.to_json());
}
