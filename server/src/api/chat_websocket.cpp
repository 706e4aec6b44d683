//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/chat_websocket.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/variant2/variant.hpp>

#include <deque>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "services/broadcast_coordinator.hpp"
#include "services/chat_service.hpp"
#include "shared_state.hpp"
#include "util/websocket.hpp"

using namespace lanchat;
namespace asio = boost::asio;

namespace {

static void log_exception(std::exception_ptr ptr)
{
    try
    {
        std::rethrow_exception(ptr);
    }
    catch (const std::exception& exc)
    {
        log_error(errc::uncaught_exception, "Uncaught exception in chat websocket writer", exc.what());
    }
}

static std::optional<std::string_view> to_optional_sv(const std::optional<std::string>& from)
{
    return from ? std::optional<std::string_view>(*from) : std::nullopt;
}

// Dispatches client events to the chat service. Errors are reported
// back to the client and don't end the session
struct event_handler_visitor
{
    connection_id conn;
    const std::string& remote_address;
    shared_state& st;

    // Parsing error
    error_with_message operator()(error_code ec) const
    {
        return error_with_message{ec, "Invalid message format"};
    }

    error_with_message operator()(const join_event& evt) const
    {
        return st.chat().join(conn, remote_address, evt.username, to_optional_sv(evt.roomId));
    }

    error_with_message operator()(const join_room_event& evt) const
    {
        return st.chat().join_room(conn, evt.roomId);
    }

    error_with_message operator()(const create_room_event& evt) const
    {
        return st.chat().create_room(conn, evt.roomId, to_optional_sv(evt.roomName));
    }

    error_with_message operator()(const delete_room_event& evt) const
    {
        return st.chat().delete_room(conn, evt.roomId);
    }

    error_with_message operator()(const send_message_event& evt) const
    {
        return st.chat().send_message(conn, evt.content, to_optional_sv(evt.roomId));
    }

    error_with_message operator()(const typing_event& evt) const
    {
        st.chat().typing(conn, evt.isTyping, to_optional_sv(evt.roomId));
        return {};
    }

    error_with_message operator()(const get_rooms_event&) const
    {
        st.chat().get_rooms(conn);
        return {};
    }
};

// Each websocket session is registered in the broadcast_coordinator as
// a connection_sink. Events are queued by deliver() and written by
// a dedicated writer coroutine, in order.
class chat_websocket_session final : public connection_sink,
                                     public std::enable_shared_from_this<chat_websocket_session>
{
    websocket ws_;
    std::shared_ptr<shared_state> st_;

    // Events pending to be written
    std::deque<std::shared_ptr<const std::string>> write_queue_;

    // Wakes the writer up when there is something to do
    asio::experimental::channel<void(error_code)> write_notify_;

    // Set when the session ends. No more writes will be issued after this
    bool closed_{false};

    void notify_writer() noexcept { write_notify_.try_send(error_code()); }

    // Writes queued events until the session is closed or a write fails
    asio::awaitable<void> run_writer()
    {
        while (!closed_)
        {
            // Drain the queue
            while (!write_queue_.empty() && !closed_)
            {
                auto payload = std::move(write_queue_.front());
                write_queue_.pop_front();
                auto ec = co_await ws_.write(*payload);
                if (ec)
                {
                    // Writing failed. End the session by making the reader fail
                    log_error(ec, "Writing to chat websocket");
                    closed_ = true;
                    ws_.abort();
                    co_return;
                }
            }

            // Wait until there is more to do
            auto [ec] = co_await write_notify_.async_receive(asio::as_tuple);
            if (ec)
                co_return;
        }
    }

    // Reads client events until the client disconnects or an I/O error occurs
    asio::awaitable<error_with_message> run_reader(connection_id conn)
    {
        while (true)
        {
            // Read a message
            auto raw_msg = co_await ws_.read();
            if (raw_msg.has_error())
                co_return error_with_message{raw_msg.error()};

            // Deserialize it
            auto msg = parse_client_event(raw_msg.value());

            // Dispatch. Errors are sent to the client as an error event
            auto err = boost::variant2::visit(event_handler_visitor{conn, ws_.remote_address(), *st_}, msg);
            if (err.ec)
                deliver(std::make_shared<const std::string>(error_event{err.msg}.to_json()));
        }
    }

public:
    chat_websocket_session(websocket socket, std::shared_ptr<shared_state> state)
        : ws_(std::move(socket)), st_(std::move(state)), write_notify_(ws_.get_executor(), 1)
    {
    }

    void deliver(std::shared_ptr<const std::string> payload) override final
    {
        if (closed_)
            return;
        write_queue_.push_back(std::move(payload));
        notify_writer();
    }

    // Runs the session until completion
    asio::awaitable<error_with_message> run()
    {
        // Register the connection, so it can receive events
        auto conn = st_->coordinator().add_connection(shared_from_this());

        // Launch the writer. It keeps the session alive until it exits
        asio::co_spawn(
            ws_.get_executor(),
            [self = shared_from_this()]() { return self->run_writer(); },
            [](std::exception_ptr exc) {
                if (exc)
                    log_exception(exc);
            }
        );

        // Read and dispatch events. Make sure the connection's state is revoked,
        // even if an exception is thrown
        error_with_message res;
        try
        {
            res = co_await run_reader(conn);
        }
        catch (...)
        {
            st_->chat().disconnect(conn);
            closed_ = true;
            notify_writer();
            throw;
        }

        st_->chat().disconnect(conn);
        closed_ = true;
        notify_writer();
        co_return res;
    }
};

}  // namespace

asio::awaitable<error_with_message> lanchat::handle_chat_websocket(
    websocket socket,
    std::shared_ptr<shared_state> state
)
{
    auto sess = std::make_shared<chat_websocket_session>(std::move(socket), std::move(state));
    co_return co_await sess->run();
}
