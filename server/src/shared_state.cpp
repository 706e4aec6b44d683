//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <memory>

#include "config.hpp"
#include "services/broadcast_coordinator.hpp"
#include "services/chat_service.hpp"
#include "services/content_renderer.hpp"
#include "services/id_generator.hpp"
#include "services/moderation_registry.hpp"
#include "services/room_store.hpp"
#include "services/session_registry.hpp"
#include "timestamp.hpp"

using namespace lanchat;

shared_state::shared_state(application_config config, std::unique_ptr<content_renderer> renderer)
{
    // Services reference each other, so they're created in dependency order
    impl_.rooms_ = std::make_unique<room_store>(config.default_room_name);
    impl_.sessions_ = std::make_unique<session_registry>(*impl_.rooms_);
    impl_.moderation_ = std::make_unique<moderation_registry>(*impl_.sessions_);
    impl_.coordinator_ = std::make_unique<broadcast_coordinator>(*impl_.rooms_, *impl_.sessions_);
    impl_.ids_ = std::make_unique<id_generator>();
    impl_.clock_ = std::make_unique<timestamp_clock>();
    impl_.renderer_ = renderer ? std::move(renderer) : create_plain_text_renderer();
    impl_.chat_ = std::make_unique<chat_service>(chat_service_deps{
        *impl_.rooms_,
        *impl_.sessions_,
        *impl_.moderation_,
        *impl_.coordinator_,
        *impl_.ids_,
        *impl_.clock_,
        *impl_.renderer_,
    });
    impl_.config_ = std::move(config);
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
