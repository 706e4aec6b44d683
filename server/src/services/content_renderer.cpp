//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/content_renderer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace lanchat;

namespace {

class plain_text_renderer final : public content_renderer
{
public:
    std::optional<std::string> render(std::string_view) override final { return std::nullopt; }
};

}  // namespace

std::unique_ptr<content_renderer> lanchat::create_plain_text_renderer()
{
    return std::unique_ptr<content_renderer>{new plain_text_renderer()};
}
