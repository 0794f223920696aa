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

#include "smp.hpp"
#include "atomic.hpp"
#include "math.hpp"
#include "memory.hpp"
#include "stdio.hpp"

bool Smp::is_ready(size_t idx) const { return Atomic::load<uint8, Atomic::ACQUIRE>(ready[idx]) != 0; }

void Smp::ap_online(uint32 apic_id)
{
    long const idx{cpus.index_of_apic(apic_id)};

    if (idx < 0) {
        trace(TRACE_SMP | TRACE_ERROR, "Unknown CPU with APIC ID %u reported for duty", apic_id);
        return;
    }

    Atomic::store<uint8, Atomic::RELEASE>(ready[idx], 1);
}

bool Smp::boot_ap(size_t idx, uint8 page)
{
    uint32 const apic_id{cpus[idx].apic_id};

    if (lapic.send_init(apic_id).is_err()) {
        return false;
    }

    delay.delay_us(INIT_DELAY_US);

    for (unsigned i{0}; i < 2; i++) {
        if (lapic.send_sipi(apic_id, page).is_err()) {
            return false;
        }

        delay.delay_us(SIPI_DELAY_US);
    }

    for (unsigned waited{0}; waited < AP_BOOT_TIMEOUT_US; waited += AP_BOOT_POLL_US) {
        if (is_ready(idx)) {
            return true;
        }

        delay.delay_us(AP_BOOT_POLL_US);
    }

    return is_ready(idx);
}

Result<Smp_report, Smp_error> Smp::boot_aps(Paddr trampoline)
{
    if (not is_aligned(trampoline, PAGE_SIZE) or trampoline + PAGE_SIZE > REAL_MODE_LIMIT) {
        trace(TRACE_SMP | TRACE_ERROR, "AP entry code at %#llx is not usable",
              static_cast<unsigned long long>(trampoline));
        return Err(Smp_error::BAD_TRAMPOLINE);
    }

    uint8 const page{static_cast<uint8>(trampoline >> PAGE_BITS)};
    Smp_report report;

    for (size_t idx{0}; idx < cpus.size(); idx++) {
        Cpu_info& cpu{cpus[idx]};

        if (cpu.bsp or not cpu.enabled or cpu.state == Cpu_state::ONLINE) {
            continue;
        }

        if (cpu.apic_id > XAPIC_MAX_ID) {
            trace(TRACE_SMP | TRACE_ERROR, "Not starting CPU %u: APIC %u is out of reach", cpu.acpi_id,
                  cpu.apic_id);
            cpu.state = Cpu_state::FAILED;
            continue;
        }

        report.attempted++;
        cpu.state = Cpu_state::BOOTING;

        if (boot_ap(idx, page)) {
            cpu.state = Cpu_state::ONLINE;
            report.online++;
        } else {
            trace(TRACE_SMP | TRACE_ERROR, "CPU %u (APIC %u) did not come up", cpu.acpi_id, cpu.apic_id);
            cpu.state = Cpu_state::FAILED;
            report.failed++;
        }
    }

    trace(TRACE_SMP, "%lu of %lu application processors online", static_cast<unsigned long>(report.online),
          static_cast<unsigned long>(report.attempted));

    return Ok(report);
}
