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

#include "acpi_rsdt.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Result<Acpi_root_table, Acpi_error> Acpi_root_table::parse(Phys_mem& mem, Acpi_rsdp_info const& rsdp)
{
    Acpi_root_table root;

    root.extended_ = rsdp.xsdt_addr.has_value();
    root.addr_ = root.extended_ ? *rsdp.xsdt_addr : rsdp.rsdt_addr;

    auto const* table{
        static_cast<Acpi_table_rsdt const*>(TRY_OR_RETURN(Acpi_table::map(mem, root.addr_)))};

    uint32 const sig{table->signature};

    if (sig != (root.extended_ ? SIG("XSDT") : SIG("RSDT"))) {
        trace(TRACE_ACPI | TRACE_ERROR, "Root table at %#010llx has signature %.4s",
              static_cast<unsigned long long>(root.addr_), reinterpret_cast<char const*>(&sig));
        return Err(Acpi_error::BAD_SIGNATURE);
    }

    if (not table->good_checksum(root.addr_)) {
        return Err(Acpi_error::BAD_CHECKSUM);
    }

    size_t const entry_size{root.extended_ ? sizeof(uint64) : sizeof(uint32)};
    size_t const count{table->entry_count(entry_size)};

    for (size_t i{0}; i < count; i++) {
        Paddr const entry{table->entry(i, entry_size)};

        if (entry == 0) {
            continue;
        }

        if (root.entries_.full()) {
            trace(TRACE_ACPI | TRACE_ERROR, "Ignoring %lu root table entries beyond the first %u",
                  static_cast<unsigned long>(count - i), NUM_ACPI_TABLES);
            break;
        }

        root.entries_.push_back(entry);
    }

    return Ok(root);
}
