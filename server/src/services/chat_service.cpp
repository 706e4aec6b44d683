//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/chat_service.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "services/broadcast_coordinator.hpp"
#include "services/content_renderer.hpp"
#include "services/id_generator.hpp"
#include "services/moderation_registry.hpp"
#include "services/room_store.hpp"
#include "services/session_registry.hpp"
#include "timestamp.hpp"

using namespace lanchat;

// Display names for messages not authored by a user
static constexpr std::string_view system_username = "System";
static constexpr std::string_view admin_username = "Admin";

static bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

static bool is_member(const room_store& rooms, std::string_view room_id, connection_id conn)
{
    auto members = rooms.members(room_id);
    return std::find(members.begin(), members.end(), conn) != members.end();
}

bool lanchat::is_valid_name_length(std::string_view s) noexcept
{
    // Count code points by skipping UTF-8 continuation bytes
    std::size_t num_chars = 0;
    for (char c : s)
    {
        if ((static_cast<unsigned char>(c) & 0xc0u) != 0x80u)
            ++num_chars;
    }
    return num_chars >= 2u && num_chars <= 20u;
}

message chat_service::make_message(
    message_kind kind,
    std::string_view username,
    std::string content,
    std::string_view room_id,
    std::string_view author_address
)
{
    return message{
        deps_.ids.next_id(),
        kind,
        std::string(username),
        std::move(content),
        std::nullopt,
        deps_.clock.now(),
        std::string(room_id),
        std::string(author_address),
    };
}

message chat_service::make_system_message(message_kind kind, std::string content, std::string_view room_id)
{
    return make_message(kind, system_username, std::move(content), room_id, "");
}

void chat_service::post_message(message msg, std::optional<connection_id> except)
{
    auto payload = message_event{msg}.to_json();
    std::string room_id = msg.room_id;
    deps_.rooms.append_message(std::move(msg));
    deps_.coordinator.send_to_room(room_id, std::move(payload), except);
}

void chat_service::send_history(connection_id conn, std::string_view room_id)
{
    send_history(conn, deps_.rooms.recent_history(room_id));
}

void chat_service::send_history(connection_id conn, const std::vector<message>& history)
{
    deps_.coordinator.send_to(conn, message_history_event{history}.to_json());
}

std::optional<std::string> chat_service::try_render(std::string_view content)
{
    try
    {
        return deps_.renderer.render(content);
    }
    catch (const std::exception& err)
    {
        log_error(make_error_code(errc::uncaught_exception), "Rendering message content", err.what());
        return std::nullopt;
    }
}

//
// Websocket operations
//

error_with_message chat_service::join(
    connection_id conn,
    std::string_view address,
    std::string_view username,
    std::optional<std::string_view> room_id
)
{
    // Surrounding whitespace is not part of names
    username = trim(username);
    if (room_id)
        room_id = trim(*room_id);

    // Validate
    if (deps_.sessions.get(conn))
        LANCHAT_RETURN_ERROR_MSG(errc::invalid_operation, "You have already joined the chat")
    if (!is_valid_name_length(username))
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Username must be between 2 and 20 characters")
    std::string_view target = room_id ? *room_id : default_room_id;
    if (!deps_.rooms.contains(target) && !is_valid_name_length(target))
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID must be between 2 and 20 characters")

    // Create the user and place it in the room
    bool muted = deps_.moderation.is_muted(address);
    deps_.rooms.get_or_create(target);
    auto ec = deps_.sessions.bind(
        conn,
        user{
            deps_.ids.next_id(),
            std::string(username),
            conn,
            std::string(address),
            deps_.clock.now(),
            std::string(target),
            muted,
        }
    );
    if (ec)
        return error_with_message{ec, "Could not join the room"};

    // The joining user gets the join notice as a message, so it's not
    // included in the history they get
    auto history = deps_.rooms.recent_history(target);

    std::string content(username);
    content += " (IP: ";
    content += address;
    content += ") joined the chat";
    if (muted)
        content += " [muted]";
    auto join_msg = make_system_message(message_kind::join, std::move(content), target);
    auto join_payload = message_event{join_msg}.to_json();
    deps_.rooms.append_message(std::move(join_msg));

    // Private notice for muted users
    if (muted)
    {
        auto notice = make_system_message(
            message_kind::admin,
            "Your address is muted. You can't send messages or create rooms",
            target
        );
        deps_.coordinator.send_to(conn, message_event{notice}.to_json());
    }

    // Notify the joining user and everyone else
    deps_.coordinator.send_to(conn, join_payload);
    send_history(conn, history);
    deps_.coordinator.send_to_room(target, std::move(join_payload), conn);
    deps_.coordinator.broadcast_user_list(target);
    deps_.coordinator.broadcast_room_list();

    log_info(
        "User " + std::string(username) + " (IP: " + std::string(address) + ") joined room " +
        std::string(target) + (muted ? " [muted]" : "")
    );
    return {};
}

error_with_message chat_service::join_room(connection_id conn, std::string_view room_id)
{
    const auto* u = deps_.sessions.get(conn);
    if (!u)
        LANCHAT_RETURN_ERROR_MSG(errc::not_authenticated, "Join the chat first")
    if (!deps_.rooms.contains(room_id))
        LANCHAT_RETURN_ERROR_MSG(errc::not_found, "Room doesn't exist")

    // Switch rooms
    std::string username = u->username;
    auto old_room = deps_.sessions.switch_room(conn, room_id);
    if (old_room.has_error())
        return error_with_message{old_room.error(), "Could not switch rooms"};

    // Tell the old room that the user left
    post_message(make_system_message(message_kind::leave, username + " left the room", *old_room), conn);

    // Tell the new room that the user joined
    auto history = deps_.rooms.recent_history(room_id);
    post_message(make_system_message(message_kind::join, username + " joined the room", room_id));
    send_history(conn, history);

    // Update lists
    deps_.coordinator.broadcast_user_list(*old_room);
    deps_.coordinator.broadcast_user_list(room_id);
    deps_.coordinator.broadcast_room_list();

    // Reply
    const auto* r = deps_.rooms.find(room_id);
    deps_.coordinator.send_to(conn, room_joined_event{r->id, r->name, r->members.size()}.to_json());

    log_info("User " + username + " switched to room " + r->name);
    return {};
}

error_with_message chat_service::send_message(
    connection_id conn,
    std::string_view content,
    std::optional<std::string_view> room_id
)
{
    const auto* u = deps_.sessions.get(conn);
    if (!u)
        LANCHAT_RETURN_ERROR_MSG(errc::not_authenticated, "Join the chat first")
    auto trimmed = trim(content);
    if (trimmed.empty())
        return {};
    if (u->is_muted || deps_.moderation.is_muted(u->address))
        LANCHAT_RETURN_ERROR_MSG(errc::forbidden, "You are muted and can't send messages")
    std::string_view target = room_id ? *room_id : std::string_view(u->current_room);
    if (!deps_.rooms.contains(target))
        LANCHAT_RETURN_ERROR_MSG(errc::not_found, "Room doesn't exist")

    // Compose the message
    auto msg = make_message(message_kind::text, u->username, std::string(trimmed), target, u->address);
    msg.rendered_content = try_render(msg.content);
    auto payload = message_event{msg}.to_json();
    deps_.rooms.append_message(std::move(msg));

    // The sender gets the message even if it's not a member of the target room
    if (!is_member(deps_.rooms, target, conn))
        deps_.coordinator.send_to(conn, payload);
    deps_.coordinator.send_to_room(target, std::move(payload));
    return {};
}

error_with_message chat_service::create_room(
    connection_id conn,
    std::string_view room_id,
    std::optional<std::string_view> room_name
)
{
    const auto* u = deps_.sessions.get(conn);
    if (!u)
        LANCHAT_RETURN_ERROR_MSG(errc::not_authenticated, "Join the chat first")
    room_id = trim(room_id);
    if (room_id.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID can't be empty")
    if (u->is_muted)
        LANCHAT_RETURN_ERROR_MSG(errc::forbidden, "You are muted and can't create rooms")
    if (deps_.moderation.is_muted(u->address))
        LANCHAT_RETURN_ERROR_MSG(errc::forbidden, "Your address is muted and can't create rooms")
    if (!is_valid_name_length(room_id))
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID must be between 2 and 20 characters")

    auto res = deps_.rooms.create(room_id, room_name ? trim(*room_name) : std::string_view());
    if (res.has_error())
        LANCHAT_RETURN_ERROR_MSG(errc::conflict, "Room already exists")
    const room& r = **res;

    deps_.coordinator.send_to(conn, room_created_event{r.id, r.name}.to_json());
    deps_.coordinator.broadcast_room_list();

    log_info("User " + u->username + " created room " + r.name + " (" + r.id + ")");
    return {};
}

error_with_message chat_service::delete_room(connection_id conn, std::string_view room_id)
{
    const auto* u = deps_.sessions.get(conn);
    if (!u)
        LANCHAT_RETURN_ERROR_MSG(errc::not_authenticated, "Join the chat first")
    if (room_id.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID can't be empty")
    if (room_id == default_room_id)
        LANCHAT_RETURN_ERROR_MSG(errc::invalid_operation, "The default room can't be deleted")
    const auto* r = deps_.rooms.find(room_id);
    if (!r)
        LANCHAT_RETURN_ERROR_MSG(errc::not_found, "Room doesn't exist")
    if (!r->members.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::room_not_empty, "The room still has users in it")

    auto res = deps_.rooms.remove(room_id);
    if (res.has_error())
        return error_with_message{res.error(), "Could not delete the room"};

    deps_.coordinator.send_to(conn, room_deleted_event{res->id, res->name, ""}.to_json());
    deps_.coordinator.broadcast_room_list();

    log_info("User " + u->username + " deleted room " + res->name + " (" + res->id + ")");
    return {};
}

void chat_service::typing(connection_id conn, bool is_typing, std::optional<std::string_view> room_id)
{
    const auto* u = deps_.sessions.get(conn);
    if (!u || u->is_muted)
        return;
    std::string_view target = room_id ? *room_id : std::string_view(u->current_room);
    deps_.coordinator.send_to_room(target, user_typing_event{u->username, is_typing}.to_json(), conn);
}

void chat_service::get_rooms(connection_id conn)
{
    auto rooms = deps_.coordinator.room_list();
    deps_.coordinator.send_to(conn, room_list_event{rooms}.to_json());
}

void chat_service::disconnect(connection_id conn)
{
    auto u = deps_.sessions.unbind(conn);
    if (u)
    {
        // Tell the remaining members of the user's room
        post_message(make_system_message(
            message_kind::leave,
            u->username + " (IP: " + u->address + ") left the chat",
            u->current_room
        ));
        deps_.coordinator.broadcast_user_list(u->current_room);
        deps_.coordinator.broadcast_room_list();
        log_info("User disconnected: " + u->username + " (IP: " + u->address + ")");
    }
    deps_.coordinator.remove_connection(conn);
}

//
// Administrative operations
//

result_with_message<room_summary> chat_service::admin_create_room(
    std::string_view room_id,
    std::string_view room_name,
    std::string_view caller_address,
    bool is_admin
)
{
    room_id = trim(room_id);
    if (room_id.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID can't be empty")
    if (!is_admin && deps_.moderation.is_muted(caller_address))
        LANCHAT_RETURN_ERROR_MSG(errc::forbidden, "Your address is muted and can't create rooms")
    if (!is_valid_name_length(room_id))
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Room ID must be between 2 and 20 characters")

    auto res = deps_.rooms.create(room_id, trim(room_name));
    if (res.has_error())
        LANCHAT_RETURN_ERROR_MSG(errc::conflict, "Room already exists")
    const room& r = **res;

    deps_.coordinator.broadcast_room_list();

    log_info("Room created through the API: " + r.name + " (" + r.id + ")");
    return room_summary{r.id, r.name, r.members.size(), r.created, r.is_public};
}

result_with_message<room_eviction> chat_service::admin_delete_room(std::string_view room_id, bool force)
{
    if (room_id == default_room_id)
        LANCHAT_RETURN_ERROR_MSG(errc::invalid_operation, "The default room can't be deleted")
    const auto* r = deps_.rooms.find(room_id);
    if (!r)
        LANCHAT_RETURN_ERROR_MSG(errc::not_found, "Room doesn't exist")
    if (!force && !r->members.empty())
        LANCHAT_RETURN_ERROR_MSG(
            errc::room_not_empty,
            "The room still has users in it. Use force=true to delete it"
        )

    // Remove the room. When forced, this relocates members to the default room
    auto res = deps_.sessions.remove_room(room_id, force);
    if (res.has_error())
        return error_with_message{res.error(), "Could not delete the room"};
    const room& removed = *res;

    for (auto conn : removed.members)
    {
        const auto* u = deps_.sessions.get(conn);
        if (!u)
            continue;

        // Private notices
        auto notice = make_system_message(
            message_kind::admin,
            "Room \"" + removed.name + "\" was deleted by an administrator. You have been moved out of it",
            removed.id
        );
        deps_.coordinator.send_to(conn, message_event{notice}.to_json());
        deps_.coordinator.send_to(
            conn,
            room_deleted_event{removed.id, removed.name, "Room deleted by an administrator"}.to_json()
        );
        send_history(conn, default_room_id);

        // Tell the default room. The relocated user is already a member
        post_message(make_system_message(
            message_kind::join,
            u->username + " was moved to the default room",
            default_room_id
        ));
    }

    if (!removed.members.empty())
        deps_.coordinator.broadcast_user_list(default_room_id);
    deps_.coordinator.broadcast_room_list();

    log_info(
        "Room deleted through the API: " + removed.name + " (" + removed.id + "), " +
        std::to_string(removed.members.size()) + " users relocated"
    );
    return room_eviction{removed.name, removed.members.size()};
}

result_with_message<room_eviction> chat_service::kick_room_members(std::string_view room_id)
{
    if (room_id == default_room_id)
        LANCHAT_RETURN_ERROR_MSG(errc::invalid_operation, "Users can't be kicked from the default room")
    const auto* r = deps_.rooms.find(room_id);
    if (!r)
        LANCHAT_RETURN_ERROR_MSG(errc::not_found, "Room doesn't exist")
    if (r->members.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "The room has no users")
    std::string room_name = r->name;

    auto evicted = deps_.sessions.evict_room(room_id);
    for (auto conn : evicted)
    {
        auto notice = make_system_message(
            message_kind::admin,
            "You were kicked out of room \"" + room_name + "\" by an administrator",
            room_id
        );
        deps_.coordinator.send_to(conn, message_event{notice}.to_json());
        deps_.coordinator.send_to(
            conn,
            kicked_from_room_event{room_id, room_name, "Administrator action"}.to_json()
        );
        send_history(conn, default_room_id);
    }

    deps_.coordinator.broadcast_user_list(room_id);
    deps_.coordinator.broadcast_user_list(default_room_id);
    deps_.coordinator.broadcast_room_list();

    log_info(
        "Kicked " + std::to_string(evicted.size()) + " users from room " + room_name + " (" +
        std::string(room_id) + ")"
    );
    return room_eviction{std::move(room_name), evicted.size()};
}

error_with_message chat_service::mute_address(std::string_view address)
{
    if (address.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "IP address can't be empty")
    for (const auto& room_id : deps_.moderation.mute(address))
        deps_.coordinator.broadcast_user_list(room_id);
    log_info("Address muted: " + std::string(address));
    return {};
}

error_with_message chat_service::unmute_address(std::string_view address)
{
    if (address.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "IP address can't be empty")
    for (const auto& room_id : deps_.moderation.unmute(address))
        deps_.coordinator.broadcast_user_list(room_id);
    log_info("Address unmuted: " + std::string(address));
    return {};
}

error_with_message chat_service::broadcast_admin(std::string_view content)
{
    auto trimmed = trim(content);
    if (trimmed.empty())
        LANCHAT_RETURN_ERROR_MSG(errc::validation_error, "Message can't be empty")

    for (const auto& r : deps_.rooms.list())
        post_message(make_message(message_kind::admin, admin_username, std::string(trimmed), r.id, ""));

    log_info("Admin broadcast: " + std::string(trimmed));
    return {};
}
