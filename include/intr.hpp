/*
 * Interrupt Controller Bring-up
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
#include "ioapic.hpp"
#include "optional.hpp"
#include "platform.hpp"
#include "static_vector.hpp"

enum class Intr_mode
{
    // Interrupts go through IOAPICs and Local APICs.
    APIC,

    // There is no MADT. Interrupts go through the legacy PIC and we have a single CPU.
    LEGACY_PIC,
};

// Where a GSI is wired.
struct Gsi_location {
    // Index into Intr_state::ioapics.
    size_t ioapic;
    unsigned pin;
};

// Translates between legacy IRQs, GSIs and IOAPIC pins.
class Irq_routing
{
private:
    struct Ioapic_range {
        uint32 gsi_base;
        unsigned pins;
    };

    Static_vector<Irq_override, NUM_INTR_OVERRIDE> overrides;
    Static_vector<Ioapic_range, NUM_IOAPIC> ranges;

public:
    Irq_routing() = default;
    Irq_routing(Interrupt_topology const& topo, Static_vector<Ioapic_state, NUM_IOAPIC> const& ioapics);

    // The GSI a legacy ISA IRQ arrives at.
    uint32 irq_to_gsi(unsigned irq) const;

    Optional<Gsi_location> gsi_to_ioapic(uint32 gsi) const;
};

// The interrupt setup handed to later boot stages.
struct Intr_state {
    Intr_mode mode{Intr_mode::LEGACY_PIC};

    uint32 bsp_apic_id{0};
    Paddr lapic_base{0};

    // Masked legacy IRQs. Only changes in LEGACY_PIC mode.
    uint16 pic_mask{0xffff};

    Static_vector<Ioapic_state, NUM_IOAPIC> ioapics;
    Irq_routing routing;
};

class Intr
{
private:
    Mmio& mmio;
    Port_io& io;
    Delay& delay;

    void setup_ioapic(Interrupt_topology const& topo, Ioapic_info const& info, uint32 bsp_apic_id,
                      Intr_state& state);

    bool set_pic_line(Intr_state& state, uint32 irq, bool masked);

public:
    Intr(Mmio& mmio_, Port_io& io_, Delay& delay_) : mmio(mmio_), io(io_), delay(delay_) {}

    // Bring the interrupt controllers into a known state.
    //
    // Without a MADT, only the legacy PIC is set up. Otherwise, the PIC is disabled, the Local APIC of the
    // bootstrap processor is enabled and all IOAPIC pins are routed to the BSP, masked.
    void setup(Madt_info const* madt, Intr_state& state);

    // Mask or unmask a GSI. Returns false, if no IOAPIC handles it or it has no usable vector.
    //
    // In LEGACY_PIC mode, GSIs are PIC lines and GSI n arrives at vector VEC_PIC_MASTER + n. The cascade
    // line is not a device interrupt.
    bool mask_gsi(Intr_state& state, uint32 gsi);
    bool unmask_gsi(Intr_state& state, uint32 gsi);
};
