//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/room_store.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

using namespace lanchat;

static room make_room(std::string_view room_id, std::string_view display_name)
{
    room res;
    res.id = room_id;
    res.name = display_name.empty() ? room_id : display_name;
    res.created = timestamp_t::clock::now();
    return res;
}

static bool erase_member(std::vector<connection_id>& members, connection_id conn)
{
    auto it = std::find(members.begin(), members.end(), conn);
    if (it == members.end())
        return false;
    members.erase(it);
    return true;
}

room_store::room_store(std::string default_room_name)
{
    ct_.push_back(make_room(default_room_id, default_room_name));
}

template <class Fn>
bool room_store::modify_room(std::string_view room_id, Fn&& fn)
{
    auto& idx = ct_.get<1>();
    auto it = idx.find(room_id);
    if (it == idx.end())
        return false;

    // We never modify the ID, so this can't fail
    idx.modify(it, std::forward<Fn>(fn));
    return true;
}

std::pair<const room*, bool> room_store::get_or_create(std::string_view room_id, std::string_view display_name)
{
    if (const auto* existing = find(room_id))
        return {existing, false};
    auto [it, inserted] = ct_.push_back(make_room(room_id, display_name));
    return {&*it, inserted};
}

result<const room*> room_store::create(std::string_view room_id, std::string_view display_name)
{
    auto [r, created] = get_or_create(room_id, display_name);
    if (!created)
        LANCHAT_RETURN_ERROR(errc::conflict)
    return r;
}

result<room> room_store::remove(std::string_view room_id)
{
    if (room_id == default_room_id)
        LANCHAT_RETURN_ERROR(errc::invalid_operation)

    auto& idx = ct_.get<1>();
    auto it = idx.find(room_id);
    if (it == idx.end())
        LANCHAT_RETURN_ERROR(errc::not_found)
    if (!it->members.empty())
        LANCHAT_RETURN_ERROR(errc::room_not_empty)

    room res = *it;
    idx.erase(it);
    return res;
}

result<room> room_store::remove_evicting(std::string_view room_id)
{
    if (room_id == default_room_id)
        LANCHAT_RETURN_ERROR(errc::invalid_operation)

    auto& idx = ct_.get<1>();
    auto it = idx.find(room_id);
    if (it == idx.end())
        LANCHAT_RETURN_ERROR(errc::not_found)

    // Relocate members before discarding the room
    room res = *it;
    idx.erase(it);
    modify_room(default_room_id, [&res](room& def) {
        def.members.insert(def.members.end(), res.members.begin(), res.members.end());
    });
    return res;
}

std::vector<connection_id> room_store::evict_members(std::string_view room_id)
{
    std::vector<connection_id> res;
    if (room_id == default_room_id)
        return res;
    modify_room(room_id, [&res](room& r) { res = std::exchange(r.members, {}); });
    modify_room(default_room_id, [&res](room& def) {
        def.members.insert(def.members.end(), res.begin(), res.end());
    });
    return res;
}

const room* room_store::find(std::string_view room_id) const
{
    const auto& idx = ct_.get<1>();
    auto it = idx.find(room_id);
    return it == idx.end() ? nullptr : &*it;
}

boost::span<const connection_id> room_store::members(std::string_view room_id) const
{
    const auto* r = find(room_id);
    if (!r)
        return {};
    return r->members;
}

bool room_store::add_member(std::string_view room_id, connection_id conn)
{
    return modify_room(room_id, [conn](room& r) {
        if (std::find(r.members.begin(), r.members.end(), conn) == r.members.end())
            r.members.push_back(conn);
    });
}

bool room_store::move_member(connection_id conn, std::string_view from_room_id, std::string_view to_room_id)
{
    if (!contains(to_room_id))
        return false;
    modify_room(from_room_id, [conn](room& r) { erase_member(r.members, conn); });
    return add_member(to_room_id, conn);
}

std::vector<std::string> room_store::remove_member_everywhere(connection_id conn)
{
    std::vector<std::string> res;
    for (auto it = ct_.begin(); it != ct_.end(); ++it)
    {
        ct_.modify(it, [&](room& r) {
            if (erase_member(r.members, conn))
                res.push_back(r.id);
        });
    }
    return res;
}

bool room_store::append_message(message msg)
{
    // Copy the ID, since msg is moved inside the lambda
    std::string room_id = msg.room_id;
    return modify_room(room_id, [&msg](room& r) { r.history.push_back(std::move(msg)); });
}

std::vector<message> room_store::recent_history(std::string_view room_id, std::size_t limit) const
{
    const auto* r = find(room_id);
    if (!r)
        return {};

    // Return the last limit messages
    auto count = (std::min)(limit, r->history.size());
    return std::vector<message>(r->history.end() - static_cast<std::ptrdiff_t>(count), r->history.end());
}

std::vector<room_summary> room_store::list() const
{
    std::vector<room_summary> res;
    res.reserve(ct_.size());
    for (const auto& r : ct_)
        res.push_back(room_summary{r.id, r.name, r.members.size(), r.created, r.is_public});
    return res;
}
