/*
 * Local Advanced Programmable Interrupt Controller (Local APIC)
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2017-2022 Cyberus Technology GmbH.
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
#include "compiler.hpp"
#include "platform.hpp"
#include "result.hpp"
#include "types.hpp"

enum class Apic_error
{
    // The interrupt command register stayed busy.
    IPI_NOT_DELIVERED,

    // The destination APIC ID does not fit into the xAPIC destination field.
    BAD_DESTINATION,
};

// The Local APIC of the CPU we run on, accessed in xAPIC mode.
class Lapic
{
private:
    enum Register
    {
        LAPIC_IDR = 0x2,
        LAPIC_LVR = 0x3,
        LAPIC_TPR = 0x8,
        LAPIC_EOI = 0xb,
        LAPIC_LDR = 0xd,
        LAPIC_DFR = 0xe,
        LAPIC_SVR = 0xf,
        LAPIC_ESR = 0x28,
        LAPIC_ICR_LO = 0x30,
        LAPIC_ICR_HI = 0x31,
        LAPIC_LVT_TIMER = 0x32,
        LAPIC_LVT_THERM = 0x33,
        LAPIC_LVT_PERFM = 0x34,
        LAPIC_LVT_LINT0 = 0x35,
        LAPIC_LVT_LINT1 = 0x36,
        LAPIC_LVT_ERROR = 0x37,
    };

    enum
    {
        SVR_ENABLE = 1U << 8,

        ICR_DELIVERY_PENDING = 1U << 12,
        ICR_LEVEL_ASSERT = 1U << 14,
        ICR_TRIGGER_LEVEL = 1U << 15,
        ICR_DEST_SHIFT = 24,

        LVT_ACTIVE_LOW = 1U << 13,
        LVT_TRIGGER_LEVEL = 1U << 15,
        LVT_MASKED = 1U << 16,

        // The interval at which we check whether the APIC accepted an IPI.
        IPI_POLL_US = 10,
    };

    Mmio& mmio;
    Delay& delay;
    Paddr const base;

    uint32 read(Register reg) { return mmio.read32(base + (reg << 4)); }
    void write(Register reg, uint32 val) { mmio.write32(base + (reg << 4), val); }

    Result_void<Apic_error> wait_for_delivery();

public:
    enum Delivery_mode : uint32
    {
        DLV_FIXED = 0U << 8,
        DLV_NMI = 4U << 8,
        DLV_INIT = 5U << 8,
        DLV_SIPI = 6U << 8,
        DLV_EXTINT = 7U << 8,
    };

    // Register offsets as seen in the MMIO window.
    enum Mmio_offset : uint32
    {
        OFFSET_ID = LAPIC_IDR << 4,
        OFFSET_VERSION = LAPIC_LVR << 4,
        OFFSET_SVR = LAPIC_SVR << 4,
        OFFSET_TPR = LAPIC_TPR << 4,
        OFFSET_ICR_LO = LAPIC_ICR_LO << 4,
        OFFSET_ICR_HI = LAPIC_ICR_HI << 4,
        OFFSET_LVT_TIMER = LAPIC_LVT_TIMER << 4,
        OFFSET_LVT_LINT0 = LAPIC_LVT_LINT0 << 4,
        OFFSET_LVT_LINT1 = LAPIC_LVT_LINT1 << 4,
        OFFSET_LVT_ERROR = LAPIC_LVT_ERROR << 4,
    };

    Lapic(Mmio& mmio_, Delay& delay_, Paddr base_) : mmio(mmio_), delay(delay_), base(base_) {}

    unsigned id() { return read(LAPIC_IDR) >> 24 & 0xff; }

    unsigned version() { return read(LAPIC_LVR) & 0xff; }

    // Return the number of the highest LVT entry.
    unsigned lvt_max() { return read(LAPIC_LVR) >> 16 & 0xff; }

    // Software-enable the APIC and bring the local vector table into a known state.
    //
    // Every LVT entry is masked, except for LINT pins that MADT NMI records route to NMI for the CPU with
    // the given ACPI processor ID.
    void enable(Interrupt_topology const& topo, uint32 acpi_id);

    // Send an IPI and wait for the APIC to accept it.
    Result_void<Apic_error> send_ipi(uint32 apic_id, uint32 vector, Delivery_mode mode);

    Result_void<Apic_error> send_init(uint32 apic_id);

    // Send a STARTUP IPI that starts the target in real mode at page * PAGE_SIZE.
    Result_void<Apic_error> send_sipi(uint32 apic_id, uint8 page);
};
