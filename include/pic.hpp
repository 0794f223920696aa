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

#pragma once

#include "platform.hpp"
#include "types.hpp"

// The two cascaded 8259 interrupt controllers of a PC.
class Pic
{
private:
    Port_io& io;

    enum Port : uint16
    {
        MASTER_CMD = 0x20,
        MASTER_DATA = 0x21,
        SLAVE_CMD = 0xa0,
        SLAVE_DATA = 0xa1,
    };

    enum
    {
        ICW1_INIT = 0x11,
        ICW3_MASTER_CASCADE = 1u << 2,
        ICW3_SLAVE_ID = 2,
        ICW4_8086 = 0x1,
    };

    uint16 mask_{0xffff};

    void write_mask();

public:
    enum
    {
        NUM_IRQ = 16,

        // The slave PIC is wired to this line of the master.
        CASCADE_IRQ = 2,
    };

    explicit Pic(Port_io& io_) : io(io_) {}

    // Continue with a PIC that was already programmed and has the given lines masked.
    Pic(Port_io& io_, uint16 irq_mask) : io(io_), mask_(irq_mask) {}

    // Move both PICs to VEC_PIC_MASTER/VEC_PIC_SLAVE and mask all lines.
    //
    // After this call, spurious PIC interrupts can be told apart from CPU exceptions.
    void disable();

    // Unmask a legacy IRQ. Only used when there is no IOAPIC.
    void unmask(unsigned irq);
    void mask(unsigned irq);

    uint16 irq_mask() const { return mask_; }
};
