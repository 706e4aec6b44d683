//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <string_view>

namespace lanchat {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    validation_error,
    not_authenticated,
    forbidden,
    not_found,
    conflict,
    room_not_empty,
    invalid_operation,
    websocket_parse_error,
    uncaught_exception,
    invalid_content_type
)

}  // namespace lanchat

namespace {

static const char* to_string(lanchat::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown lanchat error>");
}

// Custom category for lanchat::errc. Exposed by get_lanchat_category
class lanchat_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "lanchat"; }
    std::string message(int ev) const final override { return to_string(static_cast<lanchat::errc>(ev)); }
};

static lanchat_category cat;

}  // namespace

const boost::system::error_category& lanchat::get_lanchat_category() noexcept { return cat; }

[[noreturn]] void lanchat::throw_exception_from_error(const error_with_message& e, const boost::source_location&)
{
    throw boost::system::system_error(e.ec, e.msg);
}

void lanchat::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void lanchat::log_info(std::string_view what) { std::cout << what << '\n'; }
