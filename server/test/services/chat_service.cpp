//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/chat_service.hpp"

#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "recording_sink.hpp"
#include "services/broadcast_coordinator.hpp"
#include "services/content_renderer.hpp"
#include "services/moderation_registry.hpp"
#include "services/room_store.hpp"
#include "services/session_registry.hpp"
#include "shared_state.hpp"

using namespace lanchat;
using lanchat::test::recording_sink;

using string_vector = std::vector<std::string>;

namespace {

// A renderer that wraps content between asterisks in bold tags
class bold_renderer final : public content_renderer
{
public:
    std::optional<std::string> render(std::string_view raw) override final
    {
        if (raw.size() < 2u || raw.front() != '*' || raw.back() != '*')
            return std::nullopt;
        return "<b>" + std::string(raw.substr(1, raw.size() - 2)) + "</b>";
    }
};

// A renderer that always fails
class throwing_renderer final : public content_renderer
{
public:
    std::optional<std::string> render(std::string_view) override final
    {
        throw std::runtime_error("renderer failed");
    }
};

// A connected client, as seen by the chat service
struct client
{
    connection_id conn;
    std::shared_ptr<recording_sink> sink;
};

struct fixture
{
    shared_state st;

    fixture(std::unique_ptr<content_renderer> renderer = nullptr) : st(application_config{}, std::move(renderer))
    {
    }

    chat_service& chat() { return st.chat(); }

    client connect()
    {
        auto sink = std::make_shared<recording_sink>();
        auto conn = st.coordinator().add_connection(sink);
        return client{conn, sink};
    }

    // Connects a client and joins the chat, which must succeed.
    // Clears the events the client got while joining
    client join(std::string_view username, std::string_view address, std::optional<std::string_view> room = {})
    {
        auto res = connect();
        auto err = chat().join(res.conn, address, username, room);
        BOOST_TEST_REQUIRE(err.ec == error_code());
        res.sink->clear();
        return res;
    }

    std::vector<connection_id> members(std::string_view room_id)
    {
        auto res = st.rooms().members(room_id);
        return std::vector<connection_id>(res.begin(), res.end());
    }

    // Every user is a member of exactly its current room
    void check_membership()
    {
        std::size_t total_members = 0;
        for (const auto& r : st.rooms().list())
        {
            total_members += r.user_count;
            for (auto conn : st.rooms().members(r.id))
            {
                const auto* u = st.sessions().get(conn);
                BOOST_TEST_REQUIRE(u != nullptr);
                BOOST_TEST(u->current_room == r.id);
            }
        }
        BOOST_TEST(total_members == st.sessions().size());
    }
};

struct bold_fixture : fixture
{
    bold_fixture() : fixture(std::make_unique<bold_renderer>()) {}
};

struct throwing_fixture : fixture
{
    throwing_fixture() : fixture(std::make_unique<throwing_renderer>()) {}
};

}  // namespace

BOOST_AUTO_TEST_SUITE(chat_service_)

//
// join
//

BOOST_FIXTURE_TEST_CASE(join_first_user, fixture)
{
    auto alice = connect();

    auto err = chat().join(alice.conn, "10.0.0.5", "alice", {});
    BOOST_TEST_REQUIRE(err.ec == error_code());

    // The joining user gets their join notice, the (empty) history, and the lists
    BOOST_TEST(alice.sink->types() == string_vector({"message", "message_history", "user_list", "room_list"}));
    auto msg = alice.sink->payloads("message").at(0);
    BOOST_TEST(msg.at("type").as_string() == "join");
    BOOST_TEST(msg.at("content").as_string() == "alice (IP: 10.0.0.5) joined the chat");
    BOOST_TEST(msg.at("room").as_string() == "default");
    BOOST_TEST(alice.sink->payloads("message_history").at(0).as_array().empty());

    auto users = alice.sink->payloads("user_list").at(0).as_array();
    BOOST_TEST_REQUIRE(users.size() == 1u);
    BOOST_TEST(users[0].at("username").as_string() == "alice");

    auto rooms = alice.sink->payloads("room_list").at(0).as_array();
    BOOST_TEST_REQUIRE(rooms.size() == 1u);
    BOOST_TEST(rooms[0].at("userCount").to_number<int>() == 1);

    BOOST_TEST(st.sessions().get(alice.conn)->current_room == "default");
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(join_and_chat, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto bob = connect();

    // Bob joins. Bob's history contains Alice's join notice
    BOOST_TEST_REQUIRE(chat().join(bob.conn, "10.0.0.6", "bob", {}).ec == error_code());
    auto history = bob.sink->payloads("message_history").at(0).as_array();
    BOOST_TEST_REQUIRE(history.size() == 1u);
    BOOST_TEST(history[0].at("content").as_string() == "alice (IP: 10.0.0.5) joined the chat");

    // Alice gets Bob's join notice and the updated lists
    BOOST_TEST(alice.sink->types() == string_vector({"message", "user_list", "room_list"}));
    BOOST_TEST(
        alice.sink->payloads("message").at(0).at("content").as_string() == "bob (IP: 10.0.0.6) joined the chat"
    );
    BOOST_TEST(alice.sink->payloads("user_list").at(0).as_array().size() == 2u);

    // Alice says hi. Both get the message
    alice.sink->clear();
    bob.sink->clear();
    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "hi", {}).ec == error_code());
    for (const auto& c : {alice, bob})
    {
        BOOST_TEST(c.sink->types() == string_vector{"message"});
        auto msg = c.sink->payloads("message").at(0);
        BOOST_TEST(msg.at("type").as_string() == "text");
        BOOST_TEST(msg.at("username").as_string() == "alice");
        BOOST_TEST(msg.at("content").as_string() == "hi");
        BOOST_TEST(msg.at("userIP").as_string() == "10.0.0.5");
        BOOST_TEST(msg.at("room").as_string() == "default");
        BOOST_TEST(msg.at("isMarkdown").as_bool() == false);
    }
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(join_creates_room, fixture)
{
    auto alice = join("alice", "10.0.0.5", "team");

    const auto* r = st.rooms().find("team");
    BOOST_TEST_REQUIRE(r != nullptr);
    BOOST_TEST(r->name == "team");
    BOOST_TEST(members("team") == std::vector<connection_id>{alice.conn});
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(join_errors, fixture)
{
    auto alice = connect();

    // Username too short or too long
    BOOST_TEST(chat().join(alice.conn, "10.0.0.5", "a", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(
        chat().join(alice.conn, "10.0.0.5", "abcdefghijklmnopqrstu", {}).ec ==
        error_code(errc::validation_error)
    );

    // Surrounding whitespace doesn't count towards the length
    BOOST_TEST(chat().join(alice.conn, "10.0.0.5", "  ", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(chat().join(alice.conn, "10.0.0.5", " a ", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(
        chat().join(alice.conn, "10.0.0.5", "alice", std::string_view(" x ")).ec ==
        error_code(errc::validation_error)
    );

    // Room IDs for rooms to be created are validated, too
    BOOST_TEST(
        chat().join(alice.conn, "10.0.0.5", "alice", std::string_view("x")).ec ==
        error_code(errc::validation_error)
    );
    BOOST_TEST(!st.rooms().contains("x"));
    BOOST_TEST(st.sessions().size() == 0u);
    BOOST_TEST(alice.sink->events.empty());

    // Joining twice
    BOOST_TEST_REQUIRE(chat().join(alice.conn, "10.0.0.5", "alice", {}).ec == error_code());
    BOOST_TEST(chat().join(alice.conn, "10.0.0.5", "alice", {}).ec == error_code(errc::invalid_operation));
    BOOST_TEST(st.sessions().size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(join_trims_names, fixture)
{
    auto alice = connect();

    BOOST_TEST_REQUIRE(
        chat().join(alice.conn, "10.0.0.5", "  alice\t", std::string_view(" team ")).ec == error_code()
    );

    const auto* u = st.sessions().get(alice.conn);
    BOOST_TEST_REQUIRE(u != nullptr);
    BOOST_TEST(u->username == "alice");
    BOOST_TEST(u->current_room == "team");
    BOOST_TEST(st.rooms().contains("team"));
    BOOST_TEST(!st.rooms().contains(" team "));
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(join_muted_address, fixture)
{
    BOOST_TEST_REQUIRE(chat().mute_address("10.0.0.5").ec == error_code());
    auto alice = connect();

    BOOST_TEST_REQUIRE(chat().join(alice.conn, "10.0.0.5", "alice", {}).ec == error_code());

    // A private notice comes first
    BOOST_TEST(
        alice.sink->types() == string_vector({"message", "message", "message_history", "user_list", "room_list"})
    );
    auto notice = alice.sink->payloads("message").at(0);
    BOOST_TEST(notice.at("type").as_string() == "admin");
    auto join_msg = alice.sink->payloads("message").at(1);
    BOOST_TEST(join_msg.at("content").as_string() == "alice (IP: 10.0.0.5) joined the chat [muted]");
    BOOST_TEST(st.sessions().get(alice.conn)->is_muted);

    // The notice is not part of the history
    BOOST_TEST(st.rooms().recent_history(default_room_id).size() == 1u);
}

//
// join_room
//

BOOST_FIXTURE_TEST_CASE(join_room_success, fixture)
{
    st.rooms().create("team", "Team").value();
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6");
    bob.sink->clear();

    BOOST_TEST_REQUIRE(chat().join_room(alice.conn, "team").ec == error_code());

    // Alice gets the join notice, the history, the lists and the reply
    BOOST_TEST(
        alice.sink->types() ==
        string_vector({"message", "message_history", "user_list", "room_list", "room_joined"})
    );
    auto reply = alice.sink->payloads("room_joined").at(0);
    BOOST_TEST(reply.at("roomId").as_string() == "team");
    BOOST_TEST(reply.at("roomName").as_string() == "Team");
    BOOST_TEST(reply.at("userCount").to_number<int>() == 1);

    // Bob is told that Alice left
    auto msgs = bob.sink->payloads("message");
    BOOST_TEST_REQUIRE(msgs.size() == 1u);
    BOOST_TEST(msgs[0].at("type").as_string() == "leave");
    BOOST_TEST(msgs[0].at("content").as_string() == "alice left the room");

    BOOST_TEST(members("team") == std::vector<connection_id>{alice.conn});
    BOOST_TEST(members(default_room_id) == std::vector<connection_id>{bob.conn});
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(join_room_errors, fixture)
{
    auto anon = connect();
    BOOST_TEST(chat().join_room(anon.conn, "default").ec == error_code(errc::not_authenticated));

    auto alice = join("alice", "10.0.0.5");
    BOOST_TEST(chat().join_room(alice.conn, "nonexistent").ec == error_code(errc::not_found));
    BOOST_TEST(st.sessions().get(alice.conn)->current_room == "default");
    check_membership();
}

//
// send_message
//

BOOST_FIXTURE_TEST_CASE(send_message_not_joined, fixture)
{
    auto anon = connect();
    BOOST_TEST(chat().send_message(anon.conn, "hello", {}).ec == error_code(errc::not_authenticated));
}

BOOST_FIXTURE_TEST_CASE(send_message_whitespace, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto num_messages = st.rooms().recent_history(default_room_id).size();

    BOOST_TEST(chat().send_message(alice.conn, "  \t\n ", {}).ec == error_code());
    BOOST_TEST(alice.sink->events.empty());
    BOOST_TEST(st.rooms().recent_history(default_room_id).size() == num_messages);
}

BOOST_FIXTURE_TEST_CASE(send_message_trimmed, fixture)
{
    auto alice = join("alice", "10.0.0.5");

    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "  hello  ", {}).ec == error_code());
    BOOST_TEST(alice.sink->payloads("message").at(0).at("content").as_string() == "hello");
}

BOOST_FIXTURE_TEST_CASE(send_message_nonexistent_room, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    BOOST_TEST(
        chat().send_message(alice.conn, "hello", std::string_view("nonexistent")).ec ==
        error_code(errc::not_found)
    );
}

// The sender gets their message even when posting to a room they're not in
BOOST_FIXTURE_TEST_CASE(send_message_other_room, fixture)
{
    st.rooms().create("team").value();
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6", "team");
    alice.sink->clear();

    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "hello team", std::string_view("team")).ec == error_code());
    BOOST_TEST(alice.sink->count("message") == 1u);
    BOOST_TEST(bob.sink->count("message") == 1u);
    BOOST_TEST(bob.sink->payloads("message").at(0).at("room").as_string() == "team");
}

BOOST_FIXTURE_TEST_CASE(send_message_muted, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6");
    auto num_messages = st.rooms().recent_history(default_room_id).size();

    BOOST_TEST(chat().mute_address("10.0.0.5").ec == error_code());
    alice.sink->clear();
    bob.sink->clear();

    BOOST_TEST(chat().send_message(alice.conn, "spam", {}).ec == error_code(errc::forbidden));
    BOOST_TEST(bob.sink->events.empty());
    BOOST_TEST(st.rooms().recent_history(default_room_id).size() == num_messages);

    // After unmuting, messages go through again
    BOOST_TEST(chat().unmute_address("10.0.0.5").ec == error_code());
    BOOST_TEST(chat().send_message(alice.conn, "sorry", {}).ec == error_code());
    BOOST_TEST(bob.sink->count("message") == 1u);
}

BOOST_FIXTURE_TEST_CASE(send_message_rendered, bold_fixture)
{
    auto alice = join("alice", "10.0.0.5");

    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "*important*", {}).ec == error_code());
    auto msg = alice.sink->payloads("message").at(0);
    BOOST_TEST(msg.at("content").as_string() == "*important*");
    BOOST_TEST(msg.at("isMarkdown").as_bool() == true);
    BOOST_TEST(msg.at("processedContent").as_string() == "<b>important</b>");

    // Plain messages aren't rendered
    alice.sink->clear();
    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "plain", {}).ec == error_code());
    msg = alice.sink->payloads("message").at(0);
    BOOST_TEST(msg.at("isMarkdown").as_bool() == false);
    BOOST_TEST(!msg.as_object().contains("processedContent"));
}

// A renderer failure falls back to the raw content
BOOST_FIXTURE_TEST_CASE(send_message_renderer_throws, throwing_fixture)
{
    auto alice = join("alice", "10.0.0.5");

    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "*important*", {}).ec == error_code());
    auto msg = alice.sink->payloads("message").at(0);
    BOOST_TEST(msg.at("content").as_string() == "*important*");
    BOOST_TEST(msg.at("isMarkdown").as_bool() == false);
    BOOST_TEST(st.rooms().recent_history(default_room_id).back().content == "*important*");
}

BOOST_FIXTURE_TEST_CASE(history_bounded, fixture)
{
    auto alice = join("alice", "10.0.0.5");

    // Alice's join notice plus 51 messages
    for (std::size_t i = 0; i <= history_size; ++i)
        BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "m" + std::to_string(i), {}).ec == error_code());

    // Bob only gets the last 50 messages
    auto bob = connect();
    BOOST_TEST_REQUIRE(chat().join(bob.conn, "10.0.0.6", "bob", {}).ec == error_code());
    auto history = bob.sink->payloads("message_history").at(0).as_array();
    BOOST_TEST_REQUIRE(history.size() == history_size);
    BOOST_TEST(history.front().at("content").as_string() == "m1");
    BOOST_TEST(history.back().at("content").as_string() == "m50");
}

// Replaying history to successive joiners yields the same messages in the same order
BOOST_FIXTURE_TEST_CASE(history_replay_consistent, fixture)
{
    auto alice = join("alice", "10.0.0.5", "team");
    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "m1", {}).ec == error_code());
    BOOST_TEST_REQUIRE(chat().send_message(alice.conn, "m2", {}).ec == error_code());

    // Bob and Carol join in turn. Nothing is posted in between
    auto bob = connect();
    BOOST_TEST_REQUIRE(chat().join(bob.conn, "10.0.0.6", "bob", std::string_view("team")).ec == error_code());
    auto bob_history = bob.sink->payloads("message_history").at(0).as_array();

    auto carol = connect();
    BOOST_TEST_REQUIRE(chat().join(carol.conn, "10.0.0.7", "carol", std::string_view("team")).ec == error_code());
    auto carol_history = carol.sink->payloads("message_history").at(0).as_array();

    // Carol's history is Bob's, followed by Bob's join notice
    BOOST_TEST_REQUIRE(carol_history.size() == bob_history.size() + 1u);
    for (std::size_t i = 0; i < bob_history.size(); ++i)
        BOOST_TEST(carol_history[i] == bob_history[i]);
    BOOST_TEST(carol_history.back().at("content").as_string() == "bob (IP: 10.0.0.6) joined the chat");

    // Reading the history doesn't change it
    auto history1 = st.rooms().recent_history("team");
    auto history2 = st.rooms().recent_history("team");
    BOOST_TEST_REQUIRE(history1.size() == history2.size());
    for (std::size_t i = 0; i < history1.size(); ++i)
        BOOST_TEST(history1[i].id == history2[i].id);
}

//
// typing
//

BOOST_FIXTURE_TEST_CASE(typing, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6");
    alice.sink->clear();

    chat().typing(alice.conn, true, {});

    BOOST_TEST(alice.sink->events.empty());
    auto payloads = bob.sink->payloads("user_typing");
    BOOST_TEST_REQUIRE(payloads.size() == 1u);
    BOOST_TEST(payloads[0].at("username").as_string() == "alice");
    BOOST_TEST(payloads[0].at("isTyping").as_bool() == true);

    // Muted users and anonymous connections don't relay typing indicators
    BOOST_TEST_REQUIRE(chat().mute_address("10.0.0.5").ec == error_code());
    bob.sink->clear();
    chat().typing(alice.conn, true, {});
    chat().typing(connect().conn, true, {});
    BOOST_TEST(bob.sink->count("user_typing") == 0u);
}

//
// create_room and delete_room
//

BOOST_FIXTURE_TEST_CASE(create_room_success, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6");
    alice.sink->clear();
    auto num_rooms = st.rooms().list().size();

    BOOST_TEST_REQUIRE(chat().create_room(alice.conn, "team", std::string_view("Team room")).ec == error_code());

    // The creator gets a reply, everyone gets the room list
    BOOST_TEST(alice.sink->types() == string_vector({"room_created", "room_list"}));
    auto reply = alice.sink->payloads("room_created").at(0);
    BOOST_TEST(reply.at("roomId").as_string() == "team");
    BOOST_TEST(reply.at("roomName").as_string() == "Team room");
    BOOST_TEST(bob.sink->types() == string_vector{"room_list"});

    // The room list grows by exactly one
    BOOST_TEST(bob.sink->payloads("room_list").at(0).as_array().size() == num_rooms + 1u);
    BOOST_TEST(st.rooms().list().size() == num_rooms + 1u);

    // The creator doesn't enter the room
    BOOST_TEST(st.sessions().get(alice.conn)->current_room == "default");
    BOOST_TEST(members("team").empty());

    // Creating it again is a conflict, and the room list doesn't change
    bob.sink->clear();
    BOOST_TEST(chat().create_room(bob.conn, "team", {}).ec == error_code(errc::conflict));
    BOOST_TEST(st.rooms().list().size() == num_rooms + 1u);
    BOOST_TEST(bob.sink->count("room_list") == 0u);
}

BOOST_FIXTURE_TEST_CASE(create_room_errors, fixture)
{
    auto anon = connect();
    BOOST_TEST(chat().create_room(anon.conn, "team", {}).ec == error_code(errc::not_authenticated));

    auto alice = join("alice", "10.0.0.5");
    BOOST_TEST(chat().create_room(alice.conn, "", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(chat().create_room(alice.conn, "t", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(chat().create_room(alice.conn, "  ", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(chat().create_room(alice.conn, " a ", {}).ec == error_code(errc::validation_error));
    BOOST_TEST(st.rooms().size() == 1u);
    BOOST_TEST(chat().create_room(alice.conn, "default", {}).ec == error_code(errc::conflict));

    // Creating an existing room leaves the original untouched
    BOOST_TEST_REQUIRE(chat().create_room(alice.conn, "team", std::string_view("Team")).ec == error_code());
    BOOST_TEST(chat().create_room(alice.conn, "team", std::string_view("Other")).ec == error_code(errc::conflict));
    BOOST_TEST(st.rooms().find("team")->name == "Team");
}

BOOST_FIXTURE_TEST_CASE(create_room_muted, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    BOOST_TEST_REQUIRE(chat().mute_address("10.0.0.5").ec == error_code());

    BOOST_TEST(chat().create_room(alice.conn, "team", {}).ec == error_code(errc::forbidden));
    BOOST_TEST(!st.rooms().contains("team"));
}

BOOST_FIXTURE_TEST_CASE(delete_room_success, fixture)
{
    st.rooms().create("team", "Team").value();
    auto alice = join("alice", "10.0.0.5");

    BOOST_TEST_REQUIRE(chat().delete_room(alice.conn, "team").ec == error_code());

    BOOST_TEST(alice.sink->types() == string_vector({"room_deleted", "room_list"}));
    auto reply = alice.sink->payloads("room_deleted").at(0);
    BOOST_TEST(reply.at("roomId").as_string() == "team");
    BOOST_TEST(!reply.as_object().contains("reason"));
    BOOST_TEST(!st.rooms().contains("team"));
}

BOOST_FIXTURE_TEST_CASE(delete_room_errors, fixture)
{
    auto anon = connect();
    BOOST_TEST(chat().delete_room(anon.conn, "team").ec == error_code(errc::not_authenticated));

    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6", "team");
    BOOST_TEST(chat().delete_room(alice.conn, "").ec == error_code(errc::validation_error));
    BOOST_TEST(chat().delete_room(alice.conn, "default").ec == error_code(errc::invalid_operation));
    BOOST_TEST(chat().delete_room(alice.conn, "nonexistent").ec == error_code(errc::not_found));
    BOOST_TEST(chat().delete_room(alice.conn, "team").ec == error_code(errc::room_not_empty));
    BOOST_TEST(st.rooms().contains("team"));
    BOOST_TEST(members("team") == std::vector<connection_id>{bob.conn});
}

BOOST_FIXTURE_TEST_CASE(get_rooms, fixture)
{
    auto anon = connect();
    auto other = connect();

    chat().get_rooms(anon.conn);

    BOOST_TEST(anon.sink->types() == string_vector{"room_list"});
    BOOST_TEST(other.sink->events.empty());
}

//
// disconnect
//

BOOST_FIXTURE_TEST_CASE(disconnect_joined, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6");
    bob.sink->clear();

    chat().disconnect(alice.conn);

    BOOST_TEST(bob.sink->types() == string_vector({"message", "user_list", "room_list"}));
    auto msg = bob.sink->payloads("message").at(0);
    BOOST_TEST(msg.at("type").as_string() == "leave");
    BOOST_TEST(msg.at("content").as_string() == "alice (IP: 10.0.0.5) left the chat");
    BOOST_TEST(bob.sink->payloads("user_list").at(0).as_array().size() == 1u);

    BOOST_TEST(st.sessions().get(alice.conn) == nullptr);
    BOOST_TEST(members(default_room_id) == std::vector<connection_id>{bob.conn});
    BOOST_TEST(st.coordinator().num_connections() == 1u);
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(disconnect_not_joined, fixture)
{
    auto alice = join("alice", "10.0.0.5");
    auto anon = connect();

    chat().disconnect(anon.conn);

    BOOST_TEST(alice.sink->events.empty());
    BOOST_TEST(st.coordinator().num_connections() == 1u);
}

//
// Administrative operations
//

BOOST_FIXTURE_TEST_CASE(admin_create_room, fixture)
{
    auto alice = join("alice", "10.0.0.5");

    auto res = chat().admin_create_room("team", "Team", "10.0.0.9", false);
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "team");
    BOOST_TEST(res->name == "Team");
    BOOST_TEST(res->user_count == 0u);
    BOOST_TEST(alice.sink->types() == string_vector{"room_list"});

    // Conflict
    res = chat().admin_create_room("team", "", "10.0.0.9", false);
    BOOST_TEST(res.error().ec == error_code(errc::conflict));

    // Validation
    res = chat().admin_create_room("", "", "10.0.0.9", false);
    BOOST_TEST(res.error().ec == error_code(errc::validation_error));
    res = chat().admin_create_room("t", "", "10.0.0.9", false);
    BOOST_TEST(res.error().ec == error_code(errc::validation_error));
    res = chat().admin_create_room("  ", "", "10.0.0.9", false);
    BOOST_TEST(res.error().ec == error_code(errc::validation_error));

    // IDs are stored trimmed
    res = chat().admin_create_room(" squad ", " Squad ", "10.0.0.9", false);
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->id == "squad");
    BOOST_TEST(res->name == "Squad");
}

// Admins can create rooms from muted addresses
BOOST_FIXTURE_TEST_CASE(admin_create_room_muted, fixture)
{
    BOOST_TEST_REQUIRE(chat().mute_address("10.0.0.9").ec == error_code());

    auto res = chat().admin_create_room("team", "", "10.0.0.9", false);
    BOOST_TEST(res.error().ec == error_code(errc::forbidden));

    res = chat().admin_create_room("team", "", "10.0.0.9", true);
    BOOST_TEST(res.has_value());
}

BOOST_FIXTURE_TEST_CASE(admin_delete_room_forced, fixture)
{
    auto carol = join("carol", "10.0.0.7");
    auto alice = join("alice", "10.0.0.5", "team");
    auto bob = join("bob", "10.0.0.6", "team");
    carol.sink->clear();
    alice.sink->clear();

    auto res = chat().admin_delete_room("team", true);
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->room_name == "team");
    BOOST_TEST(res->num_evicted == 2u);
    BOOST_TEST(!st.rooms().contains("team"));

    // Relocated users are told why, and get the default room's history
    auto types = alice.sink->types();
    BOOST_TEST_REQUIRE(types.size() >= 3u);
    BOOST_TEST(types[0] == "message");
    BOOST_TEST(types[1] == "room_deleted");
    BOOST_TEST(types[2] == "message_history");
    auto notice = alice.sink->payloads("message").at(0);
    BOOST_TEST(notice.at("type").as_string() == "admin");
    auto deleted = alice.sink->payloads("room_deleted").at(0);
    BOOST_TEST(deleted.at("roomId").as_string() == "team");
    BOOST_TEST(deleted.at("reason").as_string() == "Room deleted by an administrator");

    // The default room is told about the arrivals
    std::size_t num_join_notices = 0;
    for (const auto& msg : carol.sink->payloads("message"))
    {
        if (msg.at("type").as_string() == "join")
            ++num_join_notices;
    }
    BOOST_TEST(num_join_notices == 2u);
    BOOST_TEST(carol.sink->count("user_list") == 1u);
    BOOST_TEST(carol.sink->count("room_list") == 1u);

    BOOST_TEST(members(default_room_id) == std::vector<connection_id>({carol.conn, alice.conn, bob.conn}));
    BOOST_TEST(st.sessions().get(bob.conn)->current_room == "default");
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(admin_delete_room_not_forced, fixture)
{
    auto alice = join("alice", "10.0.0.5", "team");

    auto res = chat().admin_delete_room("team", false);
    BOOST_TEST(res.error().ec == error_code(errc::room_not_empty));
    BOOST_TEST(st.rooms().contains("team"));
    BOOST_TEST(st.sessions().get(alice.conn)->current_room == "team");

    // Empty rooms can be deleted without force
    st.rooms().create("empty").value();
    res = chat().admin_delete_room("empty", false);
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->num_evicted == 0u);
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(admin_delete_room_errors, fixture)
{
    BOOST_TEST(chat().admin_delete_room("default", true).error().ec == error_code(errc::invalid_operation));
    BOOST_TEST(chat().admin_delete_room("nonexistent", true).error().ec == error_code(errc::not_found));
    BOOST_TEST(st.rooms().contains(default_room_id));
}

BOOST_FIXTURE_TEST_CASE(kick_room_members, fixture)
{
    auto alice = join("alice", "10.0.0.5", "team");
    auto bob = join("bob", "10.0.0.6", "team");
    alice.sink->clear();

    auto res = chat().kick_room_members("team");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->num_evicted == 2u);

    // The room survives, empty
    BOOST_TEST(st.rooms().contains("team"));
    BOOST_TEST(members("team").empty());
    BOOST_TEST(members(default_room_id) == std::vector<connection_id>({alice.conn, bob.conn}));

    auto kicked = alice.sink->payloads("kicked_from_room");
    BOOST_TEST_REQUIRE(kicked.size() == 1u);
    BOOST_TEST(kicked[0].at("roomId").as_string() == "team");
    BOOST_TEST(kicked[0].at("reason").as_string() == "Administrator action");
    BOOST_TEST(alice.sink->count("message_history") == 1u);
    check_membership();
}

BOOST_FIXTURE_TEST_CASE(kick_room_members_errors, fixture)
{
    st.rooms().create("empty").value();
    BOOST_TEST(chat().kick_room_members("default").error().ec == error_code(errc::invalid_operation));
    BOOST_TEST(chat().kick_room_members("nonexistent").error().ec == error_code(errc::not_found));
    BOOST_TEST(chat().kick_room_members("empty").error().ec == error_code(errc::validation_error));
}

BOOST_FIXTURE_TEST_CASE(mute_address_updates_user_list, fixture)
{
    auto alice = join("alice", "10.0.0.5");

    BOOST_TEST_REQUIRE(chat().mute_address("10.0.0.5").ec == error_code());
    auto users = alice.sink->payloads("user_list");
    BOOST_TEST_REQUIRE(users.size() == 1u);
    BOOST_TEST(users[0].as_array().at(0).at("isMuted").as_bool() == true);
    BOOST_TEST(st.moderation().is_muted("10.0.0.5"));

    BOOST_TEST(chat().mute_address("").ec == error_code(errc::validation_error));
    BOOST_TEST(chat().unmute_address("").ec == error_code(errc::validation_error));
}

BOOST_FIXTURE_TEST_CASE(broadcast_admin, fixture)
{
    st.rooms().create("team").value();
    auto alice = join("alice", "10.0.0.5");
    auto bob = join("bob", "10.0.0.6", "team");
    alice.sink->clear();
    bob.sink->clear();

    BOOST_TEST_REQUIRE(chat().broadcast_admin("  Server restarting  ").ec == error_code());

    // One message per room
    for (const auto& c : {alice, bob})
    {
        auto msgs = c.sink->payloads("message");
        BOOST_TEST_REQUIRE(msgs.size() == 1u);
        BOOST_TEST(msgs[0].at("type").as_string() == "admin");
        BOOST_TEST(msgs[0].at("username").as_string() == "Admin");
        BOOST_TEST(msgs[0].at("content").as_string() == "Server restarting");
    }
    BOOST_TEST((st.rooms().recent_history("team").back().kind == message_kind::admin));

    BOOST_TEST(chat().broadcast_admin("   ").ec == error_code(errc::validation_error));
}

BOOST_AUTO_TEST_CASE(name_length)
{
    BOOST_TEST(is_valid_name_length("ab"));
    BOOST_TEST(!is_valid_name_length("a"));
    BOOST_TEST(!is_valid_name_length(""));
    BOOST_TEST(is_valid_name_length("abcdefghijklmnopqrst"));
    BOOST_TEST(!is_valid_name_length("abcdefghijklmnopqrstu"));

    // Characters, not bytes
    BOOST_TEST(is_valid_name_length("\xc3\xb1\xc3\xb1"));
    BOOST_TEST(!is_valid_name_length("\xc3\xb1"));
}

BOOST_AUTO_TEST_SUITE_END()
