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

#pragma once

#include "acpi_fadt.hpp"
#include "acpi_gas.hpp"
#include "platform.hpp"

// A busy wait based on the ACPI PM timer.
//
// The PM timer runs at a fixed frequency and works without interrupts, so it is usable for the INIT/SIPI
// sequence before any other timer is calibrated.
class Acpi_pm_timer final : public Delay
{
private:
    Acpi_gas const tmr;
    unsigned const bits;

    Port_io& io;
    Mmio& mmio;

    uint32 read() const { return tmr.read(io, mmio) & static_cast<uint32>((1ULL << bits) - 1); }

    // Wait for the given number of ticks. ticks must be less than half the counter range.
    void wait_ticks(uint32 ticks);

public:
    static constexpr uint64 FREQUENCY{3579545};

    Acpi_pm_timer(Fadt_info const& fadt, Port_io& io_, Mmio& mmio_)
        : tmr(fadt.pm_tmr), bits(fadt.pm_tmr_32bit() ? 32 : 24), io(io_), mmio(mmio_)
    {}

    // Is there a PM timer we can read?
    bool usable() const { return tmr.valid() and tmr.bits >= 24; }

    void delay_us(uint64 us) override;
};
