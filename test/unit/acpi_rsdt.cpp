/*
 * ACPI Root Table Unit Tests
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

#include "acpi_rsdt.hpp"
#include "acpi_test_tables.hpp"

#include <catch2/catch.hpp>

namespace
{
Acpi_rsdp_info rsdp_info(Paddr rsdt, Optional<Paddr> xsdt = {})
{
    Acpi_rsdp_info info{};

    info.rsdt_addr = rsdt;
    info.xsdt_addr = xsdt;

    return info;
}
} // namespace

TEST_CASE("The RSDT lists 32-bit table addresses", "[acpi]")
{
    Fake_firmware fw;
    Paddr const rsdt{fw.place(make_rsdt({0x7fe10000, 0x7fe20000, 0x7fe30000}))};

    auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(rsdt))};

    REQUIRE(root.is_ok());
    CHECK(not root.unwrap().is_extended());
    CHECK(root.unwrap().addr() == rsdt);

    auto const& entries{root.unwrap().entries()};

    REQUIRE(entries.size() == 3);
    CHECK(entries[0] == 0x7fe10000);
    CHECK(entries[2] == 0x7fe30000);
}

TEST_CASE("The XSDT is preferred over the RSDT", "[acpi]")
{
    Fake_firmware fw;
    Paddr const rsdt{fw.place(make_rsdt({0x7fe10000}))};
    Paddr const xsdt{fw.place(make_xsdt({0x17fe20000, 0x7fe30000}))};

    auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(rsdt, xsdt))};

    REQUIRE(root.is_ok());
    CHECK(root.unwrap().is_extended());
    REQUIRE(root.unwrap().entries().size() == 2);
    CHECK(root.unwrap().entries()[0] == 0x17fe20000);
}

TEST_CASE("Zero entries are skipped", "[acpi]")
{
    Fake_firmware fw;
    Paddr const rsdt{fw.place(make_rsdt({0, 0x7fe10000, 0}))};

    auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(rsdt))};

    REQUIRE(root.is_ok());
    REQUIRE(root.unwrap().entries().size() == 1);
    CHECK(root.unwrap().entries()[0] == 0x7fe10000);
}

TEST_CASE("A corrupt root table is fatal", "[acpi]")
{
    Fake_firmware fw;

    SECTION("Bad checksum")
    {
        Bytes t{make_rsdt({0x7fe10000})};
        t[36] ^= 0x40;

        auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(fw.place(t)))};

        REQUIRE(root.is_err());
        CHECK(root.unwrap_err() == Acpi_error::BAD_CHECKSUM);
    }

    SECTION("Wrong signature")
    {
        Paddr const not_a_root_table{fw.place(make_table("FACP", 1, Bytes(8, 0)))};

        auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(not_a_root_table))};

        REQUIRE(root.is_err());
        CHECK(root.unwrap_err() == Acpi_error::BAD_SIGNATURE);
    }

    SECTION("An XSDT address pointing at the RSDT")
    {
        Paddr const rsdt{fw.place(make_rsdt({0x7fe10000}))};

        auto const root{Acpi_root_table::parse(fw.mem, rsdp_info(rsdt, rsdt))};

        REQUIRE(root.is_err());
        CHECK(root.unwrap_err() == Acpi_error::BAD_SIGNATURE);
    }
}
