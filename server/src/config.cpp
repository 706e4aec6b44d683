//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <cstdlib>
#include <string>

using namespace lanchat;

// Returns the value of an environment variable, or default_value if it's not defined
static std::string getenv_or(const char* name, const char* default_value)
{
    const char* res = std::getenv(name);
    return res == nullptr ? default_value : res;
}

application_config application_config::from_env()
{
    return {
        getenv_or("LANCHAT_ADMIN_TOKEN", ""),
        getenv_or("LANCHAT_DEFAULT_ROOM_NAME", "Public chat room"),
    };
}
