//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SHARED_STATE_HPP
#define LANCHAT_SERVER_INCLUDE_SHARED_STATE_HPP

#include <memory>

#include "config.hpp"

namespace lanchat {

// Forward declaration
class room_store;
class session_registry;
class moderation_registry;
class broadcast_coordinator;
class id_generator;
class timestamp_clock;
class content_renderer;
class chat_service;

// Contains singleton objects shared by all sessions in the server.
// Not thread-safe: all sessions must run on the same thread
class shared_state
{
    struct
    {
        application_config config_;
        std::unique_ptr<room_store> rooms_;
        std::unique_ptr<session_registry> sessions_;
        std::unique_ptr<moderation_registry> moderation_;
        std::unique_ptr<broadcast_coordinator> coordinator_;
        std::unique_ptr<id_generator> ids_;
        std::unique_ptr<timestamp_clock> clock_;
        std::unique_ptr<content_renderer> renderer_;
        std::unique_ptr<chat_service> chat_;
    } impl_;

public:
    // If renderer is null, a plain text renderer is used
    explicit shared_state(application_config config, std::unique_ptr<content_renderer> renderer = nullptr);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    const application_config& config() const noexcept { return impl_.config_; }
    room_store& rooms() noexcept { return *impl_.rooms_; }
    session_registry& sessions() noexcept { return *impl_.sessions_; }
    moderation_registry& moderation() noexcept { return *impl_.moderation_; }
    broadcast_coordinator& coordinator() noexcept { return *impl_.coordinator_; }
    chat_service& chat() noexcept { return *impl_.chat_; }
};

}  // namespace lanchat

#endif
