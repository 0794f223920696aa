/*
 * Optional Unit Tests
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
#include <optional.hpp>

#include <catch2/catch.hpp>

namespace
{
struct Ioapic_slot {
    unsigned id;
    unsigned gsi_base;
};
} // namespace

TEST_CASE("Default construction is empty", "[optional]")
{
    Optional<int> v;

    CHECK(not v.has_value());
    CHECK(v.value_or(10) == 10);
}

TEST_CASE("Construction and assignment store the value", "[optional]")
{
    Optional<int> w{7};
    Optional<int> v{w};

    REQUIRE(v.has_value());
    CHECK(*v == 7);

    v = 9;
    CHECK(*v == 9);

    v = Optional<int>{};
    CHECK(not v.has_value());
}

TEST_CASE("Emplace and reset work", "[optional]")
{
    Optional<Ioapic_slot> slot;

    slot.emplace(Ioapic_slot{2, 24});

    REQUIRE(slot.has_value());
    CHECK(slot->id == 2);
    CHECK(slot.value().gsi_base == 24);

    slot.reset();
    CHECK(not slot.has_value());
}

TEST_CASE("Optional comparisons work", "[optional]")
{
    Optional<int> const no_value{};
    Optional<int> const value{1};
    Optional<int> const other_value{7};

    CHECK(no_value == no_value);
    CHECK(no_value != value);
    CHECK(value == value);
    CHECK(value != other_value);
}

TEST_CASE("Optional construction and destruction works", "[optional]")
{
    SECTION("Empty option does not construct or destruct")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        {
            Optional<test_counter> o;
        }

        CHECK(test_counter::constructed == 0);
        CHECK(test_counter::destroyed == 0);
    }

    SECTION("Emplace constructs in place")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        {
            Optional<test_counter> o;
            o.emplace();

            CHECK(test_counter::constructed == 1);
            CHECK(test_counter::destroyed == 0);
        }

        CHECK(test_counter::destroyed == 1);
    }

    SECTION("Reset destructs the contained value")
    {
        struct local_tag {
        };
        using test_counter = Lifetime_counter<local_tag>;

        Optional<test_counter> o;
        o.emplace();
        o.reset();

        CHECK(test_counter::destroyed == 1);

        // A second reset has nothing left to destroy.
        o.reset();
        CHECK(test_counter::destroyed == 1);
    }
}
