//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/session_registry.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "services/room_store.hpp"

using namespace lanchat;

static user_summary to_summary(const user& u)
{
    return user_summary{u.id, u.username, u.join_time, u.address, u.is_muted};
}

user* session_registry::find_user(connection_id conn)
{
    auto it = users_.find(conn);
    return it == users_.end() ? nullptr : &it->second;
}

error_code session_registry::bind(connection_id conn, user u)
{
    if (users_.count(conn))
        LANCHAT_RETURN_ERROR(errc::invalid_operation)
    if (!rooms_->contains(u.current_room))
        LANCHAT_RETURN_ERROR(errc::not_found)

    u.conn_id = conn;
    rooms_->add_member(u.current_room, conn);
    users_.emplace(conn, std::move(u));
    return error_code();
}

std::optional<user> session_registry::unbind(connection_id conn)
{
    auto it = users_.find(conn);
    if (it == users_.end())
        return std::nullopt;

    // Remove membership from every room the user belonged to
    rooms_->remove_member_everywhere(conn);
    user res = std::move(it->second);
    users_.erase(it);
    return res;
}

const user* session_registry::get(connection_id conn) const
{
    auto it = users_.find(conn);
    return it == users_.end() ? nullptr : &it->second;
}

result<std::string> session_registry::switch_room(connection_id conn, std::string_view new_room_id)
{
    auto* u = find_user(conn);
    if (!u)
        LANCHAT_RETURN_ERROR(errc::not_authenticated)
    if (!rooms_->move_member(conn, u->current_room, new_room_id))
        LANCHAT_RETURN_ERROR(errc::not_found)
    return std::exchange(u->current_room, std::string(new_room_id));
}

result<room> session_registry::remove_room(std::string_view room_id, bool force)
{
    if (!force)
        return rooms_->remove(room_id);

    auto res = rooms_->remove_evicting(room_id);
    if (res.has_error())
        return res;

    // Members are now in the default room. Update the cached pointers
    for (auto conn : res->members)
    {
        if (auto* u = find_user(conn))
            u->current_room = default_room_id;
    }
    return res;
}

std::vector<connection_id> session_registry::evict_room(std::string_view room_id)
{
    auto res = rooms_->evict_members(room_id);
    for (auto conn : res)
    {
        if (auto* u = find_user(conn))
            u->current_room = default_room_id;
    }
    return res;
}

std::vector<const user*> session_registry::list_by_address(std::string_view address) const
{
    std::vector<const user*> res;
    for (const auto& [conn, u] : users_)
    {
        if (u.address == address)
            res.push_back(&u);
    }
    return res;
}

std::vector<std::string> session_registry::usernames_in(std::string_view room_id) const
{
    std::vector<std::string> res;
    for (auto conn : rooms_->members(room_id))
    {
        if (const auto* u = get(conn))
            res.push_back(u->username);
    }
    return res;
}

std::vector<std::string> session_registry::set_muted(std::string_view address, bool muted)
{
    std::vector<std::string> res;
    for (auto& [conn, u] : users_)
    {
        if (u.address != address)
            continue;
        u.is_muted = muted;
        if (std::find(res.begin(), res.end(), u.current_room) == res.end())
            res.push_back(u.current_room);
    }
    return res;
}

std::vector<user_summary> session_registry::list() const
{
    std::vector<user_summary> res;
    res.reserve(users_.size());
    for (const auto& [conn, u] : users_)
        res.push_back(to_summary(u));
    return res;
}
