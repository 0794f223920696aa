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

#include "acpi_table.hpp"
#include "algorithm.hpp"
#include "platform.hpp"
#include "stdio.hpp"

char const* acpi_error_name(Acpi_error err)
{
    switch (err) {
    case Acpi_error::NOT_FOUND:
        return "not found";
    case Acpi_error::UNUSABLE:
        return "unusable";
    case Acpi_error::UNMAPPABLE:
        return "unmappable";
    case Acpi_error::BAD_SIGNATURE:
        return "bad signature";
    case Acpi_error::BAD_CHECKSUM:
        return "bad checksum";
    case Acpi_error::BAD_LENGTH:
        return "bad length";
    case Acpi_error::RECORD_DESYNC:
        return "record desync";
    case Acpi_error::TIMEOUT:
        return "timeout";
    case Acpi_error::DUPLICATE_HANDLER:
        return "duplicate handler";
    case Acpi_error::TOO_MANY_ENTRIES:
        return "too many entries";
    }

    return "unknown";
}

uint8 Acpi_table::do_checksum(void const* table, size_t len)
{
    return static_cast<uint8>(
        accumulate(static_cast<uint8 const*>(table), static_cast<uint8 const*>(table) + len, 0U));
}

bool Acpi_table::good_checksum(Paddr addr) const
{
    bool valid{do_checksum() == 0};

    trace(TRACE_ACPI, "%.4s:%#010llx REV:%2d TBL:%8.8s OEM:%6.6s LEN:%5u (%s)",
          reinterpret_cast<char const*>(&signature), static_cast<unsigned long long>(addr), revision,
          oem_table_id, oem_id, length, valid ? "ok" : "bad");

    return valid;
}

Result<Acpi_table const*, Acpi_error> Acpi_table::map(Phys_mem& mem, Paddr addr)
{
    auto const* header{static_cast<Acpi_table const*>(mem.map(addr, sizeof(Acpi_table)))};

    if (header == nullptr) {
        return Err(Acpi_error::UNMAPPABLE);
    }

    uint32 const len{header->length};

    if (len < sizeof(Acpi_table)) {
        trace(TRACE_ACPI | TRACE_ERROR, "%.4s:%#010llx declares length %u",
              reinterpret_cast<char const*>(header), static_cast<unsigned long long>(addr), len);
        return Err(Acpi_error::BAD_LENGTH);
    }

    auto const* table{static_cast<Acpi_table const*>(mem.map(addr, len))};

    if (table == nullptr) {
        return Err(Acpi_error::UNMAPPABLE);
    }

    return Ok(table);
}
