//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_ERROR_HPP
#define LANCHAT_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio and Beast.

namespace lanchat {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    validation_error = 1,   // malformed input: bad username or room ID length, empty fields
    not_authenticated,      // the action requires a joined user
    forbidden,              // a muted user or address attempted a gated action
    not_found,              // the room or target doesn't exist
    conflict,               // an entity can't be created because it already exists
    room_not_empty,         // non-forced deletion of a room with members
    invalid_operation,      // e.g. deleting the default room, joining twice
    websocket_parse_error,  // Data received from the client didn't match the format we expected
    uncaught_exception,     // an API handler threw an unexpected exception
    invalid_content_type,   // an endpoint received an unsupported Content-Type
};

// The error category for errc
const boost::system::error_category& get_lanchat_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_lanchat_category());
}

// An error code with a human-readable message. The message is what
// clients get to see, so it must not contain internal details.
struct error_with_message
{
    error_code ec;
    std::string msg;
};

// A result type carrying an error_with_message on failure
template <class T>
using result_with_message = boost::system::result<T, error_with_message>;

// Required by boost::system::result<T, error_with_message>::value()
[[noreturn]] void throw_exception_from_error(const error_with_message& e, const boost::source_location& loc);

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");
inline void log_error(const error_with_message& err, std::string_view what)
{
    log_error(err.ec, what, err.msg);
}

// Logs a state change to stdout
void log_info(std::string_view what);

}  // namespace lanchat

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<lanchat::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define LANCHAT_RETURN_ERROR(e)                                                   \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Returns an error_with_message, with location information on the code
#define LANCHAT_RETURN_ERROR_MSG(e, msg)                                              \
    {                                                                                 \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                           \
        return ::lanchat::error_with_message{                                         \
            ::boost::system::error_code(::boost::system::error_code(e), &loc),        \
            msg                                                                       \
        };                                                                            \
    }

#endif
