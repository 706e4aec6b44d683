//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_TEST_RECORDING_SINK_HPP
#define LANCHAT_SERVER_TEST_RECORDING_SINK_HPP

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "services/broadcast_coordinator.hpp"

namespace lanchat {
namespace test {

// A connection_sink that just records the events it receives
struct recording_sink final : public connection_sink
{
    std::vector<std::string> events;

    void deliver(std::shared_ptr<const std::string> payload) override final { events.push_back(*payload); }

    // The parsed events received so far
    std::vector<boost::json::value> parsed() const
    {
        std::vector<boost::json::value> res;
        for (const auto& evt : events)
            res.push_back(boost::json::parse(evt));
        return res;
    }

    // The types of the events received so far, in order
    std::vector<std::string> types() const
    {
        std::vector<std::string> res;
        for (const auto& evt : parsed())
            res.emplace_back(evt.at("type").as_string());
        return res;
    }

    // The payloads of the events of the given type, in order
    std::vector<boost::json::value> payloads(std::string_view type) const
    {
        std::vector<boost::json::value> res;
        for (const auto& evt : parsed())
        {
            if (evt.at("type").as_string() == type)
                res.push_back(evt.at("payload"));
        }
        return res;
    }

    // Number of events of the given type
    std::size_t count(std::string_view type) const { return payloads(type).size(); }

    void clear() { events.clear(); }
};

// A connection_sink whose transport is broken
struct throwing_sink final : public connection_sink
{
    void deliver(std::shared_ptr<const std::string>) override final
    {
        throw std::runtime_error("connection reset");
    }
};

}  // namespace test
}  // namespace lanchat

#endif
