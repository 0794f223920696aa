/*
 * Legacy PIC Unit Tests
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

#include "pic.hpp"
#include "fake_platform.hpp"
#include "vectors.hpp"

#include <catch2/catch.hpp>

TEST_CASE("The PICs are remapped and masked", "[pic]")
{
    Fake_port_io io;
    Pic pic{io};

    pic.disable();

    CHECK(io.writes_to(0x20) == std::vector<uint32>{0x11});
    CHECK(io.writes_to(0xa0) == std::vector<uint32>{0x11});

    CHECK(io.writes_to(0x21) == std::vector<uint32>{VEC_PIC_MASTER, 0x4, 0x1, 0xff});
    CHECK(io.writes_to(0xa1) == std::vector<uint32>{VEC_PIC_SLAVE, 0x2, 0x1, 0xff});

    CHECK(pic.irq_mask() == 0xffff);
}

TEST_CASE("Legacy IRQs can be unmasked", "[pic]")
{
    Fake_port_io io;
    Pic pic{io};

    pic.disable();

    SECTION("A master line")
    {
        pic.unmask(1);

        CHECK(pic.irq_mask() == 0xfffd);
        CHECK(io.values[0x21] == 0xfd);
        CHECK(io.values[0xa1] == 0xff);
    }

    SECTION("A slave line opens the cascade")
    {
        pic.unmask(9);

        CHECK(pic.irq_mask() == 0xfdfb);
        CHECK(io.values[0x21] == 0xfb);
        CHECK(io.values[0xa1] == 0xfd);

        pic.mask(9);
        CHECK(pic.irq_mask() == 0xfffb);
    }
}
