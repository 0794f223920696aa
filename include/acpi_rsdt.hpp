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

#pragma once

#include "acpi_rsdp.hpp"
#include "acpi_table.hpp"
#include "config.hpp"
#include "static_vector.hpp"

#pragma pack(1)

/*
 * Root System Description Table (5.2.7) and Extended System Description Table (5.2.8)
 */
class Acpi_table_rsdt : public Acpi_table
{
public:
    // The entry array starts here. Entries are 4 bytes wide in the RSDT and 8 bytes in the XSDT, and the
    // XSDT entries are not naturally aligned.
    uint8 entries[];

    size_t entry_count(size_t entry_size) const { return payload_length() / entry_size; }

    Paddr entry(size_t i, size_t entry_size) const
    {
        return entry_size == sizeof(uint64) ? load_unaligned<uint64>(entries + i * entry_size)
                                            : load_unaligned<uint32>(entries + i * entry_size);
    }
};

#pragma pack()

// The list of tables the firmware publishes.
class Acpi_root_table
{
private:
    Paddr addr_{0};
    bool extended_{false};

    Static_vector<Paddr, NUM_ACPI_TABLES> entries_;

public:
    // Read the XSDT, if the RSDP has one, or the RSDT otherwise.
    //
    // A bad checksum or signature of the root table is fatal. Entries beyond NUM_ACPI_TABLES are ignored.
    static Result<Acpi_root_table, Acpi_error> parse(Phys_mem& mem, Acpi_rsdp_info const& rsdp);

    Paddr addr() const { return addr_; }

    // Is this an XSDT with 64-bit entries?
    bool is_extended() const { return extended_; }

    Static_vector<Paddr, NUM_ACPI_TABLES> const& entries() const { return entries_; }
};
