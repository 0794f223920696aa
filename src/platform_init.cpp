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

#include "platform_init.hpp"
#include "acpi_registry.hpp"
#include "cmdline.hpp"
#include "panic.hpp"
#include "stdio.hpp"

Delay& Platform_init::delay()
{
    if (pm_timer.has_value()) {
        return *pm_timer;
    }

    return hw.delay;
}

void Platform_init::fallback_to_legacy(Platform_config const& cfg, Platform_info& info)
{
    info.acpi = false;
    info.acpi_info.have_madt = false;
    info.acpi_info.have_dmar = false;

    info.cpus.reset();
    info.cpus.add({0, cfg.bsp_apic_id, true, true, Cpu_state::ONLINE});

    trace(TRACE_ACPI, "Running in legacy mode with a single CPU");
}

void Platform_init::discover(Platform_config const& cfg, Platform_info& info)
{
    if (Cmdline::noacpi) {
        trace(TRACE_ACPI, "ACPI disabled on the command line");
        fallback_to_legacy(cfg, info);
        return;
    }

    Acpi acpi{info.acpi_info, {cfg.rsdp_hint, cfg.bsp_apic_id, not Cmdline::nohpet}};
    Acpi_table_registry registry;

    if (acpi.register_handlers(registry).is_err()) {
        panic("Failed to register ACPI table handlers");
    }

    auto const result{acpi.discover(hw.mem, registry)};

    if (result.is_err()) {
        Acpi_error const err{result.unwrap_err()};

        info.acpi_error = err;
        trace(TRACE_ACPI | TRACE_ERROR, "ACPI discovery failed: %s%s", acpi_error_name(err),
              acpi_error_is_fatal(err) ? " (firmware tables are corrupt)" : "");

        fallback_to_legacy(cfg, info);
        return;
    }

    info.acpi = true;

    if (info.acpi_info.have_madt) {
        info.cpus = info.acpi_info.madt.cpus;
    } else {
        trace(TRACE_ACPI, "No MADT, only the BSP will run");
        info.cpus.reset();
        info.cpus.add({0, cfg.bsp_apic_id, true, true, Cpu_state::ONLINE});
    }

    if (not info.acpi_info.fadt.has_value()) {
        return;
    }

    Fadt_info const& fadt{*info.acpi_info.fadt};

    if (cfg.enable_acpi_mode) {
        auto const mode{fadt.enable_acpi_mode(hw.io, hw.mmio, hw.delay)};

        if (mode.is_err()) {
            trace(TRACE_ACPI | TRACE_ERROR, "Could not switch to ACPI mode: %s",
                  acpi_error_name(mode.unwrap_err()));
        }
    }

    if (cfg.use_pm_timer) {
        pm_timer.emplace(fadt, hw.io, hw.mmio);

        if (not pm_timer->usable()) {
            trace(TRACE_ACPI, "PM timer is not usable");
            pm_timer.reset();
        }
    }
}

void Platform_init::boot_aps(Platform_config const& cfg, Platform_info& info)
{
    if (Cmdline::nosmp or info.intr.mode != Intr_mode::APIC) {
        trace(TRACE_SMP, "Not starting application processors");
        return;
    }

    lapic.emplace(hw.mmio, delay(), info.intr.lapic_base);
    smp.emplace(*lapic, delay(), info.cpus);

    auto const report{smp->boot_aps(cfg.ap_trampoline)};

    if (report.is_err()) {
        trace(TRACE_SMP | TRACE_ERROR, "Application processors stay offline");
        return;
    }

    info.smp = report.unwrap();
}

void Platform_init::setup_iommu(Platform_config const& cfg, Platform_info& info)
{
    if (Cmdline::noiommu or not info.acpi or not info.acpi_info.have_dmar) {
        Dmar::skip(info.dmar);
        return;
    }

    Dmar dmar{hw.mmio, delay(), hw.frames, hw.pci};
    dmar.setup(info.acpi_info.dmar, cfg.bsp_apic_id, info.dmar);
}

void Platform_init::run(Platform_config const& cfg, Platform_info& info)
{
    discover(cfg, info);

    Intr intr{hw.mmio, hw.io, delay()};
    intr.setup(info.acpi and info.acpi_info.have_madt ? &info.acpi_info.madt : nullptr, info.intr);

    boot_aps(cfg, info);
    setup_iommu(cfg, info);

    trace(TRACE_CPU, "Platform: %s, %lu of %lu CPUs online, DMA remapping %s",
          info.intr.mode == Intr_mode::APIC ? "APIC" : "legacy PIC",
          static_cast<unsigned long>(info.cpus.count(Cpu_state::ONLINE)),
          static_cast<unsigned long>(info.cpus.size()),
          info.dmar.protection ? "active" : "unavailable");
}

void Platform_init::ap_online(uint32 apic_id)
{
    if (not smp.has_value()) {
        trace(TRACE_SMP | TRACE_ERROR, "CPU with APIC ID %u came up unexpectedly", apic_id);
        return;
    }

    smp->ap_online(apic_id);
}
