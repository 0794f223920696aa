/*
 * ACPI Power Management Timer
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

#include "acpi_pm_timer.hpp"
#include "math.hpp"
#include "x86.hpp"

void Acpi_pm_timer::wait_ticks(uint32 ticks)
{
    uint64 const mask{(1ULL << bits) - 1};
    uint32 const start{read()};

    while (((read() - start) & mask) < ticks) {
        relax();
    }
}

void Acpi_pm_timer::delay_us(uint64 us)
{
    uint64 const max_chunk{1ULL << (bits - 1)};

    for (uint64 ticks{FREQUENCY * us / 1000000}; ticks > 0;) {
        uint64 const chunk{min(ticks, max_chunk - 1)};

        wait_ticks(static_cast<uint32>(chunk));
        ticks -= chunk;
    }
}
