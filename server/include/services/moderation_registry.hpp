//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_MODERATION_REGISTRY_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_MODERATION_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lanchat {

class session_registry;

// The set of muted source addresses. Every current and future user
// connected from a muted address is muted.
class moderation_registry
{
    session_registry* sessions_;
    std::set<std::string, std::less<>> muted_;

public:
    explicit moderation_registry(session_registry& sessions) noexcept : sessions_(&sessions) {}
    moderation_registry(const moderation_registry&) = delete;
    moderation_registry& operator=(const moderation_registry&) = delete;

    // Mutes an address, and flags every connected user with that address.
    // Returns the rooms where such users are, so the caller can broadcast
    // updated user lists.
    std::vector<std::string> mute(std::string_view address);

    // Unmutes an address, clearing the flag on every connected user with that
    // address. Returns the affected rooms, like mute.
    std::vector<std::string> unmute(std::string_view address);

    bool is_muted(std::string_view address) const { return muted_.find(address) != muted_.end(); }

    // The muted addresses, sorted
    std::vector<std::string> list() const { return {muted_.begin(), muted_.end()}; }

    std::size_t size() const noexcept { return muted_.size(); }
};

}  // namespace lanchat

#endif
