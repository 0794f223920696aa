/*
 * High Precision Event Timer (HPET) Table
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

#include "acpi_hpet.hpp"
#include "stdio.hpp"

Result<Timer_info, Acpi_error> Timer_info::parse(Acpi_table const& table)
{
    if (table.signature != SIG("HPET")) {
        return Err(Acpi_error::BAD_SIGNATURE);
    }

    if (table.length < sizeof(Acpi_table_hpet)) {
        trace(TRACE_ACPI | TRACE_ERROR, "HPET table is too short: %u bytes", table.length);
        return Err(Acpi_error::BAD_LENGTH);
    }

    auto const& hpet{static_cast<Acpi_table_hpet const&>(table)};
    uint32 const id{hpet.event_timer_block_id};

    if (hpet.base.asid != Acpi_gas::MEMORY or hpet.base.addr == 0) {
        trace(TRACE_ACPI | TRACE_ERROR, "HPET registers are not in memory space");
        return Err(Acpi_error::UNUSABLE);
    }

    Timer_info info;

    info.base = hpet.base.addr;
    info.min_tick = hpet.min_tick;
    info.comparators = ((id >> 8) & 0x1f) + 1;
    info.number = hpet.number;
    info.hw_revision = static_cast<uint8>(id);
    info.page_protection = hpet.page_protection;
    info.vendor_id = static_cast<uint16>(id >> 16);
    info.counter_64bit = id & (1U << 13);
    info.legacy_replacement = id & (1U << 15);

    trace(TRACE_ACPI, "HPET%u: %#llx, %u comparators, %u-bit counter, vendor %#x", info.number,
          static_cast<unsigned long long>(info.base), info.comparators, info.counter_64bit ? 64 : 32,
          info.vendor_id);

    return Ok(info);
}
