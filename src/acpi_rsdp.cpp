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

#include "acpi_rsdp.hpp"
#include "acpi_table.hpp"
#include "memory.hpp"
#include "platform.hpp"
#include "stdio.hpp"
#include "string.hpp"

bool Acpi_rsdp::good_signature() const
{
    return signature[0] == SIG("RSD ") and signature[1] == SIG("PTR ");
}

Optional<Acpi_rsdp_info> Acpi_rsdp::check(Phys_mem& mem, Paddr addr)
{
    auto const* rsdp{static_cast<Acpi_rsdp const*>(mem.map(addr, V1_SIZE))};

    if (rsdp == nullptr or not rsdp->good_signature()) {
        return {};
    }

    if (Acpi_table::do_checksum(rsdp, V1_SIZE) != 0) {
        trace(TRACE_ACPI, "RSDP:%#010llx bad checksum", static_cast<unsigned long long>(addr));
        return {};
    }

    Acpi_rsdp_info info;

    info.checksum = rsdp->checksum;
    info.revision = rsdp->revision;
    memcpy(info.oem_id, rsdp->oem_id, sizeof(rsdp->oem_id));
    info.oem_id[sizeof(rsdp->oem_id)] = 0;
    info.location = addr;
    info.rsdt_addr = rsdp->rsdt_addr;

    if (rsdp->revision >= 2) {
        rsdp = static_cast<Acpi_rsdp const*>(mem.map(addr, V2_SIZE));

        if (rsdp == nullptr) {
            return {};
        }

        // The extended checksum covers the revision 2 fields on their own, so an old-style checksum that
        // happens to be correct does not vouch for them.
        if (Acpi_table::do_checksum(reinterpret_cast<uint8 const*>(rsdp) + V1_SIZE, V2_SIZE - V1_SIZE) != 0) {
            trace(TRACE_ACPI, "RSDP:%#010llx bad extended checksum", static_cast<unsigned long long>(addr));
            return {};
        }

        if (rsdp->xsdt_addr != 0) {
            info.xsdt_addr = static_cast<Paddr>(rsdp->xsdt_addr);
        }
    }

    return info;
}

Optional<Acpi_rsdp_info> Acpi_rsdp::scan(Phys_mem& mem, Paddr base, size_t size)
{
    auto const* area{static_cast<char const*>(mem.map(base, size))};

    if (area == nullptr) {
        return {};
    }

    for (size_t off{0}; off + V1_SIZE <= size; off += 16) {
        if (memcmp(area + off, "RSD PTR ", 8) != 0) {
            continue;
        }

        Optional<Acpi_rsdp_info> const info{check(mem, base + off)};

        if (info.has_value()) {
            return info;
        }
    }

    return {};
}

Result<Acpi_rsdp_info, Acpi_error> Acpi_rsdp::locate(Phys_mem& mem, Paddr hint)
{
    Optional<Acpi_rsdp_info> info;

    if (hint != 0) {
        info = check(mem, hint);

        if (not info.has_value()) {
            trace(TRACE_ACPI | TRACE_ERROR, "RSDP hint %#010llx is invalid, scanning",
                  static_cast<unsigned long long>(hint));
        }
    }

    if (not info.has_value()) {
        auto const* ebda_seg{static_cast<uint16 const*>(mem.map(BDA_EBDA_SEGMENT, sizeof(uint16)))};

        if (ebda_seg != nullptr and *ebda_seg != 0) {
            info = scan(mem, static_cast<Paddr>(*ebda_seg) << 4, EBDA_SCAN_SIZE);
        }
    }

    if (not info.has_value()) {
        info = scan(mem, BIOS_ROM_BASE, BIOS_ROM_SIZE);
    }

    if (not info.has_value()) {
        trace(TRACE_ACPI, "RSDP not found");
        return Err(Acpi_error::NOT_FOUND);
    }

    trace(TRACE_ACPI, "RSDP:%#010llx REV:%2u OEM:%s", static_cast<unsigned long long>(info->location),
          info->revision, info->oem_id);

    return Ok(*info);
}
