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

#pragma once

#include "compiler.hpp"
#include "types.hpp"

class Mmio;
class Port_io;

#pragma pack(1)

/*
 * Generic Address Structure (5.2.3.2)
 */
class Acpi_gas
{
public:
    uint8 asid{0};
    uint8 bits{0};
    uint8 offset{0};
    uint8 access{0};
    uint64 addr{0};

    enum Asid
    {
        MEMORY = 0x0,
        IO = 0x1,
        PCI_CONFIG = 0x2,
        EC = 0x3,
        SMBUS = 0x4,
        FIXED = 0x7f,
    };

    void init(uint8 asid_, unsigned bytes, uint64 addr_)
    {
        asid = asid_;
        bits = static_cast<uint8>(bytes * 8);
        offset = 0;
        access = 0;
        addr = addr_;
    }

    // A register that is not implemented has a zero address.
    bool valid() const { return addr != 0; }

    // Read the register. Only system memory and system I/O registers of up to 32 bits are supported,
    // everything else reads as zero.
    uint32 read(Port_io& io, Mmio& mmio) const;

    void write(Port_io& io, Mmio& mmio, uint32 val) const;

    bool operator==(Acpi_gas const& o) const
    {
        return asid == o.asid and bits == o.bits and offset == o.offset and access == o.access and
               addr == o.addr;
    }
};

#pragma pack()

static_assert(sizeof(Acpi_gas) == 12, "GAS layout is wrong");
