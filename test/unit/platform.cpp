/*
 * Hardware Access Unit Tests
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

#include "platform.hpp"
#include "fake_platform.hpp"
#include "util.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Device registers go through the physical memory mapping", "[platform]")
{
    Fake_phys_mem mem;
    Mmio_phys mmio{mem};

    uint8_t* const regs{mem.add_region(0xfec00000, 0x1000)};

    mmio.write32(0xfec00010, 0x12345678);
    mmio.write64(0xfec00018, 0x1122334455667788ull);

    CHECK(load_unaligned<uint32>(regs + 0x10) == 0x12345678);
    CHECK(mmio.read32(0xfec00018) == 0x55667788);
    CHECK(mmio.read64(0xfec00018) == 0x1122334455667788ull);
}

TEST_CASE("PCI configuration space is reached through ports 0xcf8 and 0xcfc", "[platform]")
{
    Fake_port_io io;
    Pci_cfg_io pci{io};
    Pci_bdf const bdf{0, 0x02, 0x1c, 3};

    io.values[0xcfe] = 0xbeef;

    CHECK(pci.read16(bdf, 0x06) == 0xbeef);
    CHECK(io.writes_to(0xcf8).back() == (1u << 31 | 0x02u << 16 | 0x1cu << 11 | 3u << 8 | 0x04));

    pci.write16(bdf, 0x04, 0x0406);

    CHECK(io.writes_to(0xcf8).back() == (1u << 31 | 0x02u << 16 | 0x1cu << 11 | 3u << 8 | 0x04));
    CHECK(io.writes_to(0xcfc).back() == 0x0406);
}
