/*
 * HPET Table Unit Tests
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

#include "acpi_hpet.hpp"
#include "acpi_test_tables.hpp"

#include <catch2/catch.hpp>

namespace
{
Acpi_table const& as_table(Bytes const& b) { return *reinterpret_cast<Acpi_table const*>(b.data()); }
} // namespace

TEST_CASE("The HPET table describes the timer block", "[hpet]")
{
    auto const result{Timer_info::parse(as_table(make_hpet(0xfed00000, 0x8086a201, 0x37ee)))};

    REQUIRE(result.is_ok());

    Timer_info const& hpet{result.unwrap()};

    CHECK(hpet.base == 0xfed00000);
    CHECK(hpet.min_tick == 0x37ee);
    CHECK(hpet.comparators == 3);
    CHECK(hpet.hw_revision == 1);
    CHECK(hpet.vendor_id == 0x8086);
    CHECK(hpet.counter_64bit);
    CHECK(hpet.legacy_replacement);
}

TEST_CASE("Unusable HPET tables are refused", "[hpet]")
{
    SECTION("Registers in I/O space")
    {
        auto const result{Timer_info::parse(as_table(make_hpet(0xfed00000, 0x8086a201, 0x80, 1)))};

        REQUIRE(result.is_err());
        CHECK(result.unwrap_err() == Acpi_error::UNUSABLE);
    }

    SECTION("No register address")
    {
        auto const result{Timer_info::parse(as_table(make_hpet(0)))};

        REQUIRE(result.is_err());
        CHECK(result.unwrap_err() == Acpi_error::UNUSABLE);
    }

    SECTION("Truncated table")
    {
        Bytes t{make_hpet(0xfed00000)};
        t.resize(48);
        finish_table(t, "HPET", 1);

        auto const result{Timer_info::parse(as_table(t))};

        REQUIRE(result.is_err());
        CHECK(result.unwrap_err() == Acpi_error::BAD_LENGTH);
    }
}
