//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/id_generator.hpp"

#include <cstdint>
#include <string>

#include "timestamp.hpp"

using namespace lanchat;

std::string id_generator::next_id()
{
    // The sequence number alone guarantees uniqueness. The timestamp
    // makes IDs readable in logs
    auto seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
    auto millis = serialize_timestamp(timestamp_t::clock::now());

    std::string res = "id-";
    res += std::to_string(millis);
    res += '-';
    res += std::to_string(seq);
    return res;
}
