/*
 * Programmable Interrupt Controller (PIC) Support
 *
 * Copyright (C) 2020 Julian Stecklina, Cyberus Technology GmbH.
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
#include "assert.hpp"
#include "stdio.hpp"
#include "vectors.hpp"

void Pic::write_mask()
{
    io.out8(MASTER_DATA, static_cast<uint8>(mask_));
    io.out8(SLAVE_DATA, static_cast<uint8>(mask_ >> 8));
}

void Pic::disable()
{
    // Start initialization sequence.
    io.out8(MASTER_CMD, ICW1_INIT);
    io.out8(SLAVE_CMD, ICW1_INIT);

    // Program interrupt vector offsets.
    io.out8(MASTER_DATA, VEC_PIC_MASTER);
    io.out8(SLAVE_DATA, VEC_PIC_SLAVE);

    // Slave PIC at IRQ2.
    io.out8(MASTER_DATA, ICW3_MASTER_CASCADE);
    io.out8(SLAVE_DATA, ICW3_SLAVE_ID);

    // 8086 Mode.
    io.out8(MASTER_DATA, ICW4_8086);
    io.out8(SLAVE_DATA, ICW4_8086);

    mask_ = 0xffff;
    write_mask();

    trace(TRACE_APIC, "PIC: vectors %#x/%#x, all lines masked", VEC_PIC_MASTER, VEC_PIC_SLAVE);
}

void Pic::unmask(unsigned irq)
{
    assert(irq < NUM_IRQ);

    mask_ &= static_cast<uint16>(~(1u << irq));

    // Lines on the slave only work with the cascade open.
    if (irq >= 8) {
        mask_ &= static_cast<uint16>(~(1u << CASCADE_IRQ));
    }

    write_mask();
}

void Pic::mask(unsigned irq)
{
    assert(irq < NUM_IRQ);

    mask_ |= static_cast<uint16>(1u << irq);
    write_mask();
}
