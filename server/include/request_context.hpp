//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP
#define LANCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP

#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/error_types.hpp>
#include <boost/url/url_view.hpp>

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"

// Contains a request_context class, which encapsulates a Boost.Beast HTTP request
// and provides an easy way to build HTTP responses.

namespace lanchat {

// Provides an easy way to build HTTP responses. This class is instantiated by
// the request_context.
// All the functions returning an actual response can be called at most once,
// since they will move internal state.
class response_builder
{
public:
    // The type of the HTTP responses. We use the type-erased message_generator class to allow
    // bodies of different types with a uniform interface.
    using response_type = boost::beast::http::message_generator;

    // Sets the content-type of the response
    response_builder& set_content_type(std::string_view value)
    {
        assert(!used_);
        header_.set(boost::beast::http::field::content_type, value);
        return *this;
    }

    // Sends a response with a JSON body. The type T must have a to_json() const
    // member function returning a string that performs the JSON serialization.
    template <class T>
    response_type json_response(const T& value, boost::beast::http::status status = boost::beast::http::status::ok)
    {
        header_.result(status);
        return json_response_impl(value.to_json());
    }

    // Returns a "method not allowed" response with a simple plaintext body.
    response_type method_not_allowed()
    {
        return plaintext_response(boost::beast::http::status::method_not_allowed, "Method not allowed");
    }

    // Returns a "bad request" response with a simple plaintext body.
    response_type bad_request_text(std::string why)
    {
        return plaintext_response(boost::beast::http::status::bad_request, std::move(why));
    }

    // Returns a "not found" response with a simple plaintext body.
    response_type not_found_text()
    {
        return plaintext_response(boost::beast::http::status::not_found, "Not found");
    }

    // Returns an error response, with a JSON body describing what happened.
    // See the api_error struct for the JSON schema of this response.
    // Used by the API, to communicate errors that are likely to happen during normal operation
    // and should be processed by the client, like validation failures.
    response_type json_error(
        boost::beast::http::status status,
        api_error_id error_id,
        std::string_view error_message
    );

    // Returns a bad request error response, with the JSON body described above.
    response_type bad_request_json(api_error_id error_id, std::string_view error_message)
    {
        return json_error(boost::beast::http::status::bad_request, error_id, error_message);
    }

    // Returns a bad request error response, with the JSON body described above,
    // and a generic error ID.
    response_type bad_request_json(std::string_view error_message)
    {
        return bad_request_json(api_error_id::bad_request, error_message);
    }

    // Returns a 401 response, with the JSON body described above.
    response_type unauthorized_json()
    {
        return json_error(
            boost::beast::http::status::unauthorized,
            api_error_id::unauthorized,
            "Missing or invalid admin credentials"
        );
    }

    // Returns an internal server error response. Error information is logged
    // but not sent in the response.
    response_type internal_server_error(error_code ec, std::string_view what);
    response_type internal_server_error(const error_with_message& err)
    {
        return internal_server_error(err.ec, err.msg);
    }

private:
    using header_type = boost::beast::http::response_header<boost::beast::http::fields>;

    bool keep_alive_;
    header_type header_;
    bool used_{};

    response_builder(unsigned version, bool keep_alive);
    response_type plaintext_response(boost::beast::http::status status, std::string content);
    response_type json_response_impl(std::string serialized_json);

    header_type move_header()
    {
        assert(!used_);
        used_ = true;
        return std::move(header_);
    }

    template <class Body, class... Args>
    boost::beast::http::response<Body> build_response(Args&&... args)
    {
        boost::beast::http::response<Body> res{move_header(), std::forward<Args>(args)...};
        res.keep_alive(keep_alive_);
        return res;
    }

    friend class request_context;
};

// Encapsulates a Boost.Beast request and provides an easy way to build responses.
// Intended to be passed to the HTTP API handler functions.
class request_context
{
public:
    // The Boost.Beast request type
    using request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructor. remote_address and local_address are the endpoints of the connection
    request_context(request_type&& req, std::string remote_address, std::string local_address)
        : request_(std::move(req)),
          response_(request_.version(), request_.keep_alive()),
          remote_address_(std::move(remote_address)),
          local_address_(std::move(local_address))
    {
    }

    // Parses the HTTP request target line into a URL. Returns an error_code on
    // failure. This should be called prior to invoking any API handler functions.
    error_code parse_request_target();

    // Returns the request target as a URL. parse_request_target must have been
    // called and succeeded.
    const boost::urls::url_view& request_target() const
    {
        assert(target_.has_value());
        return *target_;
    }

    // Returns the HTTP method of the request.
    boost::beast::http::verb request_method() const noexcept { return request_.method(); }

    // The source address of the client
    std::string_view remote_address() const noexcept { return remote_address_; }

    // The server address the client connected to
    std::string_view local_address() const noexcept { return local_address_; }

    // The token in an "Authorization: Bearer <token>" header, or an empty view
    // if the header is missing or uses another scheme.
    std::string_view bearer_token() const;

    // Returns the value of a query parameter, or an empty optional if not present
    std::optional<std::string> query_param(std::string_view name) const;

    // Path segments captured by the endpoint pattern, in order. Set by the router
    void set_path_params(std::vector<std::string> params) { path_params_ = std::move(params); }
    std::string_view path_param(std::size_t index) const
    {
        assert(index < path_params_.size());
        return path_params_[index];
    }

    // Attempts to parse the request body as JSON, and converts the result
    // to type T. T must have a static member function with signature
    // result<T> from_json(std::string_view).
    // The request content-type is validated before attempting the parse.
    template <class T>
    result<T> parse_json_body() const
    {
        // Validate content-type
        if (!is_json_content_type())
            LANCHAT_RETURN_ERROR(errc::invalid_content_type)

        // Parse the json
        return T::from_json(request_.body());
    }

    // Returns a response_builder object
    response_builder& response() noexcept { return response_; }

private:
    request_type request_;
    response_builder response_;
    std::string remote_address_;
    std::string local_address_;
    std::optional<boost::urls::url_view> target_;
    std::vector<std::string> path_params_;

    bool is_json_content_type() const;
};

}  // namespace lanchat

#endif
