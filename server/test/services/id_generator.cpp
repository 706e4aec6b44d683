//
// Copyright (c) 2023 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/id_generator.hpp"

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>

using namespace lanchat;

BOOST_AUTO_TEST_SUITE(id_generator_)

BOOST_AUTO_TEST_CASE(unique)
{
    id_generator gen;
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
    {
        auto insert_result = ids.insert(gen.next_id());
        BOOST_TEST(insert_result.second);  // No duplicates
    }
}

BOOST_AUTO_TEST_CASE(format)
{
    id_generator gen;
    auto id = gen.next_id();
    BOOST_TEST(id.rfind("id-", 0) == 0u);
    BOOST_TEST(id.size() > 3u);
}

BOOST_AUTO_TEST_SUITE_END()
