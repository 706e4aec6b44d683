//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/moderation_registry.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "services/session_registry.hpp"

using namespace lanchat;

std::vector<std::string> moderation_registry::mute(std::string_view address)
{
    muted_.emplace(address);
    return sessions_->set_muted(address, true);
}

std::vector<std::string> moderation_registry::unmute(std::string_view address)
{
    auto it = muted_.find(address);
    if (it != muted_.end())
        muted_.erase(it);
    return sessions_->set_muted(address, false);
}
