/*
 * Static Vector Unit Tests
 *
 * Copyright (C) 2017-2022 Cyberus Technology GmbH.
 *
 * Copyright (C) 2026 The Keel Authors.
 *
 * This file is part of the Keel kernel.
 *
 * Keel is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * Keel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License version 2 for more details.
 */

#include "lifetime_counter.hpp"
#include <static_vector.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Size functions work", "[static_vector]")
{
    Static_vector<int, 2> v;

    CHECK(v.empty());
    CHECK(v.max_size() == 2);

    v.push_back(5);
    CHECK(v.size() == 1);
    CHECK(not v.full());

    v.push_back(6);
    CHECK(v.full());
}

TEST_CASE("Elements keep insertion order", "[static_vector]")
{
    Static_vector<int, 10> v;

    v.push_back(1);
    v.emplace_back(9);
    v.emplace_back() = 4;

    REQUIRE(v.size() == 3);
    CHECK(v[0] == 1);
    CHECK(v[1] == 9);
    CHECK(v[2] == 4);

    int sum{0};
    for (int i : v) {
        sum += i;
    }
    CHECK(sum == 14);
}

TEST_CASE("Emplace value-initializes", "[static_vector]")
{
    struct Record {
        int id;
        bool enabled;
    };

    Static_vector<Record, 4> v;
    Record& r{v.emplace_back()};

    CHECK(r.id == 0);
    CHECK(not r.enabled);
}

TEST_CASE("Copies are independent", "[static_vector]")
{
    Static_vector<int, 4> a;
    a.push_back(1);
    a.push_back(2);

    Static_vector<int, 4> b{a};
    b[0] = 10;

    CHECK(a[0] == 1);
    CHECK(b[0] == 10);

    a = b;
    CHECK(a.size() == 2);
    CHECK(a[0] == 10);
}

TEST_CASE("Construction and destruction works", "[static_vector]")
{
    SECTION("Emplace constructs once")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        Static_vector<test_counter, 10> v;

        v.emplace_back();
        CHECK(test_counter::constructed == 1);
        CHECK(test_counter::destroyed == 0);
    }

    SECTION("Reset destructs")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        Static_vector<test_counter, 10> v;

        v.emplace_back();
        v.emplace_back();

        v.reset();
        CHECK(test_counter::destroyed == 2);
        CHECK(v.empty());
    }

    SECTION("Destructor destructs")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        {
            Static_vector<test_counter, 10> v;
            v.emplace_back();
            v.emplace_back();
            CHECK(test_counter::alive() == 2);
        }

        CHECK(test_counter::destroyed == 2);
        CHECK(test_counter::alive() == 0);
    }
}
