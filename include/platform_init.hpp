/*
 * Platform Bring-up
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

#include "acpi.hpp"
#include "acpi_pm_timer.hpp"
#include "cpu_topology.hpp"
#include "dmar.hpp"
#include "intr.hpp"
#include "lapic.hpp"
#include "optional.hpp"
#include "platform.hpp"
#include "smp.hpp"

// The hardware access services platform bring-up runs on.
struct Platform_services {
    Phys_mem& mem;
    Mmio& mmio;
    Port_io& io;
    Delay& delay;
    Frame_alloc& frames;
    Pci_cfg& pci;
};

struct Platform_config {
    // Where the boot loader found the RSDP or 0.
    Paddr rsdp_hint{0};

    // The APIC ID of the CPU running the bring-up.
    uint32 bsp_apic_id{0};

    // The page-aligned real-mode entry code for application processors.
    Paddr ap_trampoline{0};

    // Switch the chipset from legacy to ACPI mode via the SMI command port.
    bool enable_acpi_mode{false};

    // Use the ACPI PM timer instead of the platform delay once the FADT is known.
    bool use_pm_timer{false};
};

// What later boot stages learn about the platform.
struct Platform_info {
    // ACPI discovery ran and succeeded. If not, the platform runs in legacy mode.
    bool acpi{false};
    Optional<Acpi_error> acpi_error;

    Acpi_info acpi_info;

    // Every processor we know about. In legacy mode only the BSP.
    Cpu_topology cpus;

    Intr_state intr;
    Smp_report smp;
    Dmar_state dmar;
};

// Brings up the platform in dependency order: ACPI tables, interrupt controllers, application processors
// and DMA remapping.
class Platform_init
{
private:
    Platform_services const hw;

    Optional<Acpi_pm_timer> pm_timer;
    Optional<Lapic> lapic;
    Optional<Smp> smp;

    Delay& delay();

    void discover(Platform_config const& cfg, Platform_info& info);
    void fallback_to_legacy(Platform_config const& cfg, Platform_info& info);
    void boot_aps(Platform_config const& cfg, Platform_info& info);
    void setup_iommu(Platform_config const& cfg, Platform_info& info);

public:
    explicit Platform_init(Platform_services const& hw_) : hw(hw_) {}

    // Run the whole bring-up on the bootstrap processor. Command line switches must be parsed already.
    //
    // Firmware problems never stop the boot. Without usable ACPI tables the platform comes up with the
    // legacy PIC and a single CPU.
    void run(Platform_config const& cfg, Platform_info& info);

    // Called by each application processor once it is ready.
    void ap_online(uint32 apic_id);
};
