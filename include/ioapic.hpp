/*
 * I/O Advanced Programmable Interrupt Controller (IOAPIC)
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2012 Udo Steinberg, Intel Corporation.
 *
 * Copyright (C) 2017-2018 Markus Partheymüller, Cyberus Technology GmbH.
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

#include "acpi_madt.hpp"
#include "config.hpp"
#include "platform.hpp"
#include "types.hpp"

// Our copy of the redirection table of one IOAPIC.
//
// The hardware is only ever written through Ioapic, which keeps this copy current. It is what later boot
// stages use to find out how a GSI is routed.
struct Ioapic_state {
    uint8 id;
    uint8 version;
    Paddr base;
    uint32 gsi_base;

    // The number of redirection table entries.
    unsigned pins;

    uint64 entries[NUM_IOAPIC_PINS];

    bool covers(uint32 gsi) const { return gsi >= gsi_base and gsi - gsi_base < pins; }
};

// A single IOAPIC
class Ioapic
{
private:
    Mmio& mmio;
    Ioapic_state& state;

    enum
    {
        IOAPIC_IDX = 0x0,
        IOAPIC_WND = 0x10,
    };

    enum Register
    {
        IOAPIC_ID = 0x0,
        IOAPIC_VER = 0x1,
        IOAPIC_ARB = 0x2,
        IOAPIC_IRT = 0x10,
    };

    void index(unsigned reg) { mmio.write32(state.base + IOAPIC_IDX, reg); }

    uint32 read(unsigned reg)
    {
        index(reg);
        return mmio.read32(state.base + IOAPIC_WND);
    }

    void write(unsigned reg, uint32 val)
    {
        index(reg);
        mmio.write32(state.base + IOAPIC_WND, val);
    }

public:
    enum Irt_entry : uint64
    {
        IRT_VECTOR_MASK = 0xff,
        IRT_DELIVERY_NMI = 4UL << 8,
        IRT_POLARITY_ACTIVE_LOW = 1UL << 13,
        IRT_TRIGGER_MODE_LEVEL = 1UL << 15,
        IRT_MASKED = 1UL << 16,
        IRT_DESTINATION_SHIFT = 56,
    };

    // Build a redirection table entry for physical destination mode.
    static uint64 make_entry(uint8 vector, uint32 dest_apic_id, Polarity polarity, Trigger trigger);

    Ioapic(Mmio& mmio_, Ioapic_state& state_) : mmio(mmio_), state(state_) {}

    // Read the version register, record what the firmware told us and mask every pin.
    void init(Ioapic_info const& info);

    // Program the entry for a pin.
    void set_entry(unsigned pin, uint64 entry);

    // Mask or unmask the entry for a GSI. Returns false if this IOAPIC does not handle the GSI.
    bool mask(uint32 gsi);
    bool unmask(uint32 gsi);

    unsigned pins() const { return state.pins; }
};
