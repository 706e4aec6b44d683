//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_CONFIG_HPP
#define LANCHAT_SERVER_INCLUDE_CONFIG_HPP

#include <string>

namespace lanchat {

// Runtime settings that don't come from the command line
struct application_config
{
    // Credential for the administrative API, presented as a bearer token.
    // If empty, admin endpoints accept any caller, and no caller may bypass
    // mute checks.
    std::string admin_token;

    // Display name of the default room
    std::string default_room_name{"Public chat room"};

    // Reads the configuration from environment variables:
    // LANCHAT_ADMIN_TOKEN and LANCHAT_DEFAULT_ROOM_NAME
    static application_config from_env();
};

}  // namespace lanchat

#endif
