//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LANCHAT_SERVER_INCLUDE_SERVICES_CONTENT_RENDERER_HPP
#define LANCHAT_SERVER_INCLUDE_SERVICES_CONTENT_RENDERER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lanchat {

// Transforms the raw content of a text message into a rendered
// representation (e.g. HTML from markup).
class content_renderer
{
public:
    virtual ~content_renderer() {}

    // Returns an empty optional if raw contains no markup. May throw;
    // callers fall back to the raw content in that case.
    virtual std::optional<std::string> render(std::string_view raw) = 0;
};

// Creates a renderer that never detects markup
std::unique_ptr<content_renderer> create_plain_text_renderer();

}  // namespace lanchat

#endif
