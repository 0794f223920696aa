/*
 * Generic Address Structure
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

#include "acpi_gas.hpp"
#include "platform.hpp"
#include "stdio.hpp"

uint32 Acpi_gas::read(Port_io& io, Mmio& mmio) const
{
    if (asid == IO) {
        uint16 const port{static_cast<uint16>(addr)};

        switch (bits) {
        case 8:
            return io.in8(port);
        case 16:
            return io.in16(port);
        case 32:
            return io.in32(port);
        }
    } else if (asid == MEMORY and bits == 32) {
        return mmio.read32(addr);
    }

    trace(TRACE_ACPI | TRACE_ERROR, "Unsupported GAS read: ASID %u, %u bits at %#llx", asid, bits,
          static_cast<unsigned long long>(addr));
    return 0;
}

void Acpi_gas::write(Port_io& io, Mmio& mmio, uint32 val) const
{
    if (asid == IO) {
        uint16 const port{static_cast<uint16>(addr)};

        switch (bits) {
        case 8:
            io.out8(port, static_cast<uint8>(val));
            return;
        case 16:
            io.out16(port, static_cast<uint16>(val));
            return;
        case 32:
            io.out32(port, val);
            return;
        }
    } else if (asid == MEMORY and bits == 32) {
        mmio.write32(addr, val);
        return;
    }

    trace(TRACE_ACPI | TRACE_ERROR, "Unsupported GAS write: ASID %u, %u bits at %#llx", asid, bits,
          static_cast<unsigned long long>(addr));
}
