/*
 * Advanced Configuration and Power Interface (ACPI)
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

#include "acpi_fadt.hpp"
#include "config.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Result<Fadt_info, Acpi_error> Fadt_info::parse(Acpi_table const& table)
{
    if (table.signature != SIG("FACP")) {
        return Err(Acpi_error::BAD_SIGNATURE);
    }

    if (table.length < Acpi_table_fadt::MIN_LENGTH) {
        trace(TRACE_ACPI | TRACE_ERROR, "FADT is too short: %u bytes", table.length);
        return Err(Acpi_error::BAD_LENGTH);
    }

    auto const& fadt{static_cast<Acpi_table_fadt const&>(table)};
    Fadt_info info;

    info.revision = fadt.revision;
    info.sci_irq = fadt.sci_irq;
    info.smi_cmd = fadt.smi_cmd;
    info.acpi_enable = fadt.acpi_enable;
    info.acpi_disable = fadt.acpi_disable;
    info.pm1a_cnt = fadt.pm1a_cnt();
    info.pm1b_cnt = fadt.pm1b_cnt();
    info.pm_tmr = fadt.pm_tmr();
    info.iapc_boot_arch = fadt.iapc_boot_arch;
    info.flags = fadt.flags;
    info.dsdt = fadt.dsdt();
    info.facs = fadt.facs();

    trace(TRACE_ACPI, "FADT: SCI %u, PM timer %s %#llx (%u bit), boot flags %#x", info.sci_irq,
          info.pm_tmr.asid == Acpi_gas::IO ? "port" : "mem",
          static_cast<unsigned long long>(info.pm_tmr.addr),
          info.pm_tmr_32bit() ? 32 : 24, info.iapc_boot_arch);

    return Ok(info);
}

Result_void<Acpi_error> Fadt_info::enable_acpi_mode(Port_io& io, Mmio& mmio, Delay& delay) const
{
    if (not pm1a_cnt.valid() or (pm1a_cnt.read(io, mmio) & PM1_CNT_SCI_EN)) {
        return Ok_void({});
    }

    if (smi_cmd == 0 or acpi_enable == 0) {
        trace(TRACE_ACPI, "No SMI command port, assuming ACPI mode");
        return Ok_void({});
    }

    io.out8(static_cast<uint16>(smi_cmd), acpi_enable);

    for (unsigned waited{0}; waited < HW_ACK_TIMEOUT_US; waited += 10) {
        if (pm1a_cnt.read(io, mmio) & PM1_CNT_SCI_EN) {
            trace(TRACE_ACPI, "ACPI mode enabled");
            return Ok_void({});
        }

        delay.delay_us(10);
    }

    trace(TRACE_ACPI | TRACE_ERROR, "Firmware did not switch to ACPI mode");
    return Err(Acpi_error::TIMEOUT);
}
