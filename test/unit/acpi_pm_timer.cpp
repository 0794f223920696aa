/*
 * ACPI PM Timer Unit Tests
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

#include "acpi_pm_timer.hpp"
#include "acpi_test_tables.hpp"
#include "fake_platform.hpp"

#include <catch2/catch.hpp>

namespace
{

constexpr uint16 PM_TMR_PORT{0x408};

// A PM timer that advances by step on every read.
class Ticking_port_io final : public Port_io
{
public:
    uint32 now;
    uint32 const step;
    unsigned reads{0};

    Ticking_port_io(uint32 start, uint32 step_) : now(start), step(step_) {}

    uint32 in32(uint16 port) override
    {
        if (port != PM_TMR_PORT) {
            return ~uint32{0};
        }

        reads++;

        uint32 const val{now};
        now += step;
        return val;
    }

    uint8 in8(uint16) override { return 0xff; }
    uint16 in16(uint16) override { return 0xffff; }

    void out8(uint16, uint8) override {}
    void out16(uint16, uint16) override {}
    void out32(uint16, uint32) override {}
};

Fadt_info parse_fadt(Fadt_params const& params)
{
    Bytes const table{make_fadt(params)};
    auto const result{Fadt_info::parse(*reinterpret_cast<Acpi_table const*>(table.data()))};

    REQUIRE(result.is_ok());
    return result.unwrap();
}

} // namespace

TEST_CASE("The PM timer needs an implemented register", "[pm_timer]")
{
    Fake_port_io io;
    Fake_mmio mmio;

    CHECK(Acpi_pm_timer{parse_fadt({}), io, mmio}.usable());

    Fadt_params none;
    none.pm_tmr_blk = 0;
    none.pm_tmr_len = 0;

    CHECK_FALSE(Acpi_pm_timer{parse_fadt(none), io, mmio}.usable());
}

TEST_CASE("PM timer delays count timer ticks", "[pm_timer]")
{
    Fake_mmio mmio;

    SECTION("A millisecond is 3579 ticks")
    {
        Ticking_port_io io{1000, 100};
        Acpi_pm_timer timer{parse_fadt({}), io, mmio};

        timer.delay_us(1000);

        CHECK(io.now - 1000 >= 3579);
        CHECK(io.reads == 37);
    }

    SECTION("A 24-bit counter wraps around")
    {
        Ticking_port_io io{0xfffff0, 1};
        Acpi_pm_timer timer{parse_fadt({}), io, mmio};

        // 35 ticks, most of them after the wrap.
        timer.delay_us(10);

        CHECK(io.reads == 36);
    }

    SECTION("Only 24 bits count unless the FADT says otherwise")
    {
        // The upper byte of the register is garbage for a 24-bit timer.
        Ticking_port_io io{0xab000000, 1};
        Acpi_pm_timer timer{parse_fadt({}), io, mmio};

        timer.delay_us(10);

        CHECK(io.reads == 36);
    }

    SECTION("Long delays are split into chunks the counter can represent")
    {
        Ticking_port_io io{0, 0x10000};
        Acpi_pm_timer timer{parse_fadt({}), io, mmio};

        // 35795450 ticks, more than four times the half range of a 24-bit counter.
        timer.delay_us(10000000);

        CHECK(io.reads > 35795450 / 0x10000);
        CHECK(io.reads < 35795450 / 0x10000 + 20);
    }

    SECTION("Zero does not touch the timer")
    {
        Ticking_port_io io{0, 1};
        Acpi_pm_timer timer{parse_fadt({}), io, mmio};

        timer.delay_us(0);

        CHECK(io.reads == 0);
    }
}

TEST_CASE("Generic address structures reach I/O ports and memory", "[pm_timer]")
{
    Fake_port_io io;
    Fake_phys_mem mem;
    Mmio_phys mmio{mem};

    mem.add_region(0xfed80000, 0x1000);

    Acpi_gas port;
    port.init(Acpi_gas::IO, 2, 0x404);

    Acpi_gas reg;
    reg.init(Acpi_gas::MEMORY, 4, 0xfed80008);

    port.write(io, mmio, 0x12345);
    reg.write(io, mmio, 0xcafe0001);

    REQUIRE(io.writes.size() == 1);
    CHECK(io.writes[0].bytes == 2);
    CHECK(port.read(io, mmio) == 0x2345);
    CHECK(reg.read(io, mmio) == 0xcafe0001);

    // Unsupported registers read as zero and ignore writes.
    Acpi_gas wide;
    wide.init(Acpi_gas::MEMORY, 8, 0xfed80010);
    wide.write(io, mmio, 1);

    CHECK(wide.read(io, mmio) == 0);
    CHECK(mmio.read32(0xfed80010) == 0);
}
