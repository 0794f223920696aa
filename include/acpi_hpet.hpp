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

#pragma once

#include "acpi_gas.hpp"
#include "acpi_table.hpp"

#pragma pack(1)

/*
 * IA-PC HPET Description Table
 */
class Acpi_table_hpet : public Acpi_table
{
public:
    uint32 event_timer_block_id; // 36
    Acpi_gas base;               // 40
    uint8 number;                // 52
    uint16 min_tick;             // 53
    uint8 page_protection;       // 55
};

#pragma pack()

static_assert(sizeof(Acpi_table_hpet) == 56, "HPET table layout is wrong");

// The HPET as described by firmware.
struct Timer_info {
    Paddr base;

    // In units of the main counter period.
    uint16 min_tick;

    unsigned comparators;
    uint8 number;
    uint8 hw_revision;
    uint8 page_protection;
    uint16 vendor_id;

    bool counter_64bit;
    bool legacy_replacement;

    static Result<Timer_info, Acpi_error> parse(Acpi_table const& table);
};
