/*
 * Multiprocessor Bring-up
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

#include "config.hpp"
#include "cpu_topology.hpp"
#include "lapic.hpp"
#include "platform.hpp"
#include "result.hpp"

enum class Smp_error
{
    // The real-mode entry code is not page-aligned or not below 1 MiB.
    BAD_TRAMPOLINE,
};

struct Smp_report {
    // Application processors we tried to start.
    size_t attempted{0};
    size_t online{0};
    size_t failed{0};
};

// Starts the application processors.
//
// Only the bootstrap processor calls boot_aps(). Each application processor calls ap_online() once when
// it is ready. The only state shared between them are the per-CPU ready flags, each of which has a single
// writer.
class Smp
{
private:
    Lapic& lapic;
    Delay& delay;
    Cpu_topology& cpus;

    // Indexed like cpus. Written by the AP, read by the BSP.
    uint8 ready[NUM_CPU]{};

    bool is_ready(size_t idx) const;

    // Send INIT/SIPI/SIPI and wait for the CPU to report. Returns true if it did.
    bool boot_ap(size_t idx, uint8 page);

public:
    static constexpr uint64 INIT_DELAY_US{10000};
    static constexpr uint64 SIPI_DELAY_US{200};

    Smp(Lapic& lapic_, Delay& delay_, Cpu_topology& cpus_) : lapic(lapic_), delay(delay_), cpus(cpus_) {}

    // Start every enabled CPU except the BSP. The entry code must be at trampoline.
    //
    // A CPU that does not call ap_online() within AP_BOOT_TIMEOUT_US is marked as failed and bring-up
    // continues with the next CPU. CPUs with APIC IDs above XAPIC_MAX_ID are never sent an IPI.
    Result<Smp_report, Smp_error> boot_aps(Paddr trampoline);

    // Called by an application processor once it is ready to work.
    void ap_online(uint32 apic_id);
};
