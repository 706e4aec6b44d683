//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_ID_GENERATOR_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_ID_GENERATOR_HPP

#include <atomic>
#include <cstdint>
#include <string>

namespace lanchat {

// Generates opaque IDs for users and messages, unique within the generator's
// lifetime. IDs look like id-<millis since epoch>-<sequence number>.
// Safe to call concurrently.
class id_generator
{
    std::atomic<std::uint64_t> next_seq_{0};

public:
    id_generator() = default;
    id_generator(const id_generator&) = delete;
    id_generator& operator=(const id_generator&) = delete;

    std::string next_id();
};

}  // namespace lanchat

#endif
