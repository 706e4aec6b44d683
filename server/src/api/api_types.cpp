//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <string_view>

#include "business_types.hpp"
#include "timestamp.hpp"

using namespace lanchat;

namespace lanchat {

//
// BOOST_DESCRIBE_STRUCT is used to add reflection capabilities to structs.
// It's used by boost::json::value_to, value_from and try_value_from to
// automatically generate JSON parsing/serializing code.
//
// Describe metadata is defined in this .cpp file to reduce build times.
// Care must be taken to not redefine this metadata in other files, which is
// an ODR violation.
//
// We only need such metadata on incoming types, since these are an exact
// representation of the wire format used by the client.
// Optional members may be missing from the JSON.
//

BOOST_DESCRIBE_STRUCT(create_room_request, (), (roomId, roomName))
BOOST_DESCRIBE_STRUCT(address_request, (), (ip))
BOOST_DESCRIBE_STRUCT(broadcast_request, (), (message))
BOOST_DESCRIBE_STRUCT(join_event, (), (username, roomId))
BOOST_DESCRIBE_STRUCT(join_room_event, (), (roomId))
BOOST_DESCRIBE_STRUCT(create_room_event, (), (roomId, roomName))
BOOST_DESCRIBE_STRUCT(delete_room_event, (), (roomId))
BOOST_DESCRIBE_STRUCT(send_message_event, (), (content, roomId))
BOOST_DESCRIBE_STRUCT(typing_event, (), (isTyping, roomId))

}  // namespace lanchat

namespace {

// We also define some helper structs with Describe metadata for outgoing
// types. This makes serialization code easier.

// API error wire format
struct wire_api_error
{
    std::string_view id;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_api_error, (), (id, message))

// User list entry wire format
struct wire_user
{
    std::string_view id;
    std::string_view username;
    std::int64_t joinTime;
    std::string_view ip;
    bool isMuted;
};
BOOST_DESCRIBE_STRUCT(wire_user, (), (id, username, joinTime, ip, isMuted))

// Room list entry wire format
struct wire_room
{
    std::string_view id;
    std::string_view name;
    std::size_t userCount;
    std::int64_t created;
    bool isPublic;
};
BOOST_DESCRIBE_STRUCT(wire_room, (), (id, name, userCount, created, isPublic))

}  // namespace

//
// Incoming types (HTTP requests, websocket client events)
//

// Helper for HTTP requests
template <class RequestType>
static result<RequestType> parse_generic_request(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto msg = boost::json::parse(from, ec);
    if (ec)
        LANCHAT_RETURN_ERROR(ec)

    // Parse into the struct
    return boost::json::try_value_to<RequestType>(msg);
}

result<create_room_request> create_room_request::from_json(std::string_view from)
{
    return parse_generic_request<create_room_request>(from);
}

result<address_request> address_request::from_json(std::string_view from)
{
    return parse_generic_request<address_request>(from);
}

result<broadcast_request> broadcast_request::from_json(std::string_view from)
{
    return parse_generic_request<broadcast_request>(from);
}

// Helper for websocket events
template <class EventType>
static any_client_event parse_payload(const boost::json::value* payload)
{
    if (!payload)
        LANCHAT_RETURN_ERROR(errc::websocket_parse_error)
    auto parsed_payload = boost::json::try_value_to<EventType>(*payload);
    if (parsed_payload.has_error())
        LANCHAT_RETURN_ERROR(parsed_payload.error())
    return std::move(parsed_payload).value();
}

any_client_event lanchat::parse_client_event(std::string_view from)
{
    error_code ec;

    // Parse the JSON
    auto msg = boost::json::parse(from, ec);
    if (ec)
        LANCHAT_RETURN_ERROR(ec)

    // Get the message type
    const auto* obj = msg.if_object();
    if (!obj)
        LANCHAT_RETURN_ERROR(errc::websocket_parse_error)
    auto it = obj->find("type");
    if (it == obj->end())
        LANCHAT_RETURN_ERROR(errc::websocket_parse_error)
    const auto* type = it->value().if_string();
    if (!type)
        LANCHAT_RETURN_ERROR(errc::websocket_parse_error)

    // Get the payload. Events without parameters may omit it
    it = obj->find("payload");
    const boost::json::value* payload = it == obj->end() ? nullptr : &it->value();

    // Parse the message, depending on its type
    if (*type == "join")
        return parse_payload<join_event>(payload);
    else if (*type == "join_room")
        return parse_payload<join_room_event>(payload);
    else if (*type == "create_room")
        return parse_payload<create_room_event>(payload);
    else if (*type == "delete_room")
        return parse_payload<delete_room_event>(payload);
    else if (*type == "send_message")
        return parse_payload<send_message_event>(payload);
    else if (*type == "typing")
        return parse_payload<typing_event>(payload);
    else if (*type == "get_rooms")
        return get_rooms_event{};
    else
    {
        // Unknown type
        LANCHAT_RETURN_ERROR(errc::websocket_parse_error)
    }
}

//
// Outgoing types (HTTP responses, websocket server events)
//

static std::string_view to_string(api_error_id input)
{
    switch (input)
    {
    case api_error_id::unauthorized: return "UNAUTHORIZED";
    case api_error_id::forbidden: return "FORBIDDEN";
    case api_error_id::not_found: return "NOT_FOUND";
    case api_error_id::room_exists: return "ROOM_EXISTS";
    case api_error_id::room_not_empty: return "ROOM_NOT_EMPTY";
    case api_error_id::bad_request:
    default: return "BAD_REQUEST";
    }
}

static std::string_view to_string(message_kind input)
{
    switch (input)
    {
    case message_kind::join: return "join";
    case message_kind::leave: return "leave";
    case message_kind::admin: return "admin";
    case message_kind::text:
    default: return "text";
    }
}

static boost::json::value serialize_message(const message& input)
{
    boost::json::object res({
        {"id",         input.id                              },
        {"type",       to_string(input.kind)                 },
        {"username",   input.username                        },
        {"content",    input.content                         },
        {"isMarkdown", input.is_rendered()                   },
        {"timestamp",  serialize_timestamp(input.timestamp)  },
        {"room",       input.room_id                         },
        {"userIP",     input.author_address                  },
    });
    if (input.rendered_content)
        res.emplace("processedContent", *input.rendered_content);
    return res;
}

static boost::json::array serialize_messages(boost::span<const message> messages)
{
    boost::json::array res;
    res.reserve(messages.size());
    for (const auto& msg : messages)
        res.push_back(serialize_message(msg));
    return res;
}

static boost::json::array serialize_users(boost::span<const user_summary> users)
{
    boost::json::array res;
    res.reserve(users.size());
    for (const auto& u : users)
    {
        res.push_back(boost::json::value_from(
            wire_user{u.id, u.username, serialize_timestamp(u.join_time), u.address, u.is_muted}
        ));
    }
    return res;
}

static boost::json::value serialize_room(const room_summary& r)
{
    return boost::json::value_from(
        wire_room{r.id, r.name, r.user_count, serialize_timestamp(r.created), r.is_public}
    );
}

static boost::json::array serialize_rooms(boost::span<const room_summary> rooms)
{
    boost::json::array res;
    res.reserve(rooms.size());
    for (const auto& r : rooms)
        res.push_back(serialize_room(r));
    return res;
}

static std::string serialize_event(std::string_view type, boost::json::value payload)
{
    boost::json::object evt;
    evt.emplace("type", type);
    evt.emplace("payload", std::move(payload));
    return boost::json::serialize(evt);
}

std::string api_error::to_json() const
{
    wire_api_error err{to_string(error_id), error_message};
    return boost::json::serialize(boost::json::value_from(err));
}

std::string room_not_empty_error::to_json() const
{
    boost::json::array users;
    users.reserve(usernames.size());
    for (const auto& name : usernames)
        users.push_back(boost::json::string(name));

    boost::json::object res({
        {"id",        to_string(api_error_id::room_not_empty)},
        {"message",   error_message                         },
        {"userCount", usernames.size()                      },
        {"users",     std::move(users)                      },
    });
    return boost::json::serialize(res);
}

std::string users_response::to_json() const { return boost::json::serialize(serialize_users(users)); }

std::string rooms_response::to_json() const { return boost::json::serialize(serialize_rooms(rooms)); }

std::string muted_addresses_response::to_json() const
{
    boost::json::array res;
    res.reserve(addresses.size());
    for (const auto& addr : addresses)
        res.push_back(boost::json::string(addr));
    return boost::json::serialize(res);
}

std::string health_response::to_json() const
{
    boost::json::object res({
        {"status",    "ok"                          },
        {"users",     num_users                     },
        {"rooms",     num_rooms                     },
        {"mutedIPs",  num_muted                     },
        {"timestamp", serialize_timestamp(timestamp)},
        {"serverIP",  server_address                },
    });
    return boost::json::serialize(res);
}

std::string success_response::to_json() const
{
    boost::json::object res({
        {"success", true   },
        {"message", message},
    });
    return boost::json::serialize(res);
}

std::string room_created_response::to_json() const
{
    boost::json::object res({
        {"success", true   },
        {"message", message},
    });
    res.emplace("room", serialize_room(summary));
    return boost::json::serialize(res);
}

std::string room_deleted_response::to_json() const
{
    boost::json::object res({
        {"success",     true        },
        {"message",     message     },
        {"force",       force       },
        {"kickedUsers", kicked_users},
    });
    return boost::json::serialize(res);
}

std::string kick_users_response::to_json() const
{
    boost::json::object res({
        {"success",     true        },
        {"message",     message     },
        {"kickedCount", kicked_count},
    });
    return boost::json::serialize(res);
}

std::string message_event::to_json() const { return serialize_event("message", serialize_message(msg)); }

std::string message_history_event::to_json() const
{
    return serialize_event("message_history", serialize_messages(messages));
}

std::string user_list_event::to_json() const { return serialize_event("user_list", serialize_users(users)); }

std::string room_list_event::to_json() const { return serialize_event("room_list", serialize_rooms(rooms)); }

std::string room_created_event::to_json() const
{
    boost::json::object payload({
        {"roomId",   room_id  },
        {"roomName", room_name},
    });
    return serialize_event("room_created", std::move(payload));
}

std::string room_deleted_event::to_json() const
{
    boost::json::object payload({
        {"roomId",   room_id  },
        {"roomName", room_name},
    });
    if (!reason.empty())
        payload.emplace("reason", reason);
    return serialize_event("room_deleted", std::move(payload));
}

std::string kicked_from_room_event::to_json() const
{
    boost::json::object payload({
        {"roomId",   room_id  },
        {"roomName", room_name},
        {"reason",   reason   },
    });
    return serialize_event("kicked_from_room", std::move(payload));
}

std::string room_joined_event::to_json() const
{
    boost::json::object payload({
        {"roomId",    room_id   },
        {"roomName",  room_name },
        {"userCount", user_count},
    });
    return serialize_event("room_joined", std::move(payload));
}

std::string user_typing_event::to_json() const
{
    boost::json::object payload({
        {"username", username },
        {"isTyping", is_typing},
    });
    return serialize_event("user_typing", std::move(payload));
}

std::string error_event::to_json() const
{
    boost::json::object payload({
        {"message", message},
    });
    return serialize_event("error", std::move(payload));
}
