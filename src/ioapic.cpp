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

#include "ioapic.hpp"
#include "math.hpp"
#include "stdio.hpp"

uint64 Ioapic::make_entry(uint8 vector, uint32 dest_apic_id, Polarity polarity, Trigger trigger)
{
    return static_cast<uint64>(dest_apic_id & 0xff) << IRT_DESTINATION_SHIFT |
           (trigger == Trigger::LEVEL ? IRT_TRIGGER_MODE_LEVEL : 0) |
           (polarity == Polarity::LOW ? IRT_POLARITY_ACTIVE_LOW : 0) | vector;
}

void Ioapic::init(Ioapic_info const& info)
{
    state.id = info.id;
    state.base = info.base;
    state.gsi_base = info.gsi_base;

    uint32 const ver{read(IOAPIC_VER)};

    state.version = static_cast<uint8>(ver);

    // The version register holds the index of the last entry.
    unsigned const pins{(ver >> 16 & 0xff) + 1};

    if (pins > NUM_IOAPIC_PINS) {
        trace(TRACE_APIC | TRACE_ERROR, "IOAPIC %u reports %u pins, using %u", info.id, pins,
              NUM_IOAPIC_PINS);
    }

    state.pins = min(pins, static_cast<unsigned>(NUM_IOAPIC_PINS));

    for (unsigned pin{0}; pin < state.pins; pin++) {
        set_entry(pin, IRT_MASKED);
    }

    trace(TRACE_APIC, "IOAPIC:%#llx ID:%#x VER:%#x GSI:%u-%u", static_cast<unsigned long long>(state.base),
          state.id, state.version, state.gsi_base, state.gsi_base + state.pins - 1);
}

void Ioapic::set_entry(unsigned pin, uint64 entry)
{
    assert(pin < state.pins);

    // Mask the pin while the two halves disagree.
    write(IOAPIC_IRT + 2 * pin, static_cast<uint32>(IRT_MASKED));
    write(IOAPIC_IRT + 2 * pin + 1, static_cast<uint32>(entry >> 32));
    write(IOAPIC_IRT + 2 * pin, static_cast<uint32>(entry));

    state.entries[pin] = entry;
}

bool Ioapic::mask(uint32 gsi)
{
    if (not state.covers(gsi)) {
        return false;
    }

    unsigned const pin{gsi - state.gsi_base};

    set_entry(pin, state.entries[pin] | IRT_MASKED);
    return true;
}

bool Ioapic::unmask(uint32 gsi)
{
    if (not state.covers(gsi)) {
        return false;
    }

    unsigned const pin{gsi - state.gsi_base};

    set_entry(pin, state.entries[pin] & ~static_cast<uint64>(IRT_MASKED));
    return true;
}
