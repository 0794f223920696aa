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

#include "acpi_error.hpp"
#include "compiler.hpp"
#include "optional.hpp"
#include "result.hpp"
#include "types.hpp"

class Phys_mem;

// The validated contents of the root system description pointer.
struct Acpi_rsdp_info {
    uint8 checksum;
    uint8 revision;
    char oem_id[7];

    // Where the pointer structure itself was found.
    Paddr location;

    Paddr rsdt_addr;

    // Only present for revision 2 and later.
    Optional<Paddr> xsdt_addr;
};

#pragma pack(1)

/*
 * Root System Description Pointer (5.2.5)
 */
class Acpi_rsdp
{
private:
    uint32 signature[2];
    uint8 checksum;
    char oem_id[6];
    uint8 revision;
    uint32 rsdt_addr;

    // Revision 2 and later.
    uint32 length;
    uint64 xsdt_addr;
    uint8 extended_checksum;
    uint8 reserved[3];

    bool good_signature() const;

    // Validate the pointer structure at the given physical address.
    static Optional<Acpi_rsdp_info> check(Phys_mem& mem, Paddr addr);

    // Scan a physical memory range in 16-byte steps.
    static Optional<Acpi_rsdp_info> scan(Phys_mem& mem, Paddr base, size_t size);

public:
    static constexpr size_t V1_SIZE{20};
    static constexpr size_t V2_SIZE{36};

    // Find the root system description pointer.
    //
    // A non-zero hint, as passed by the boot loader, is tried first. Otherwise, we scan the first KiB of
    // the EBDA and the BIOS read-only area.
    static Result<Acpi_rsdp_info, Acpi_error> locate(Phys_mem& mem, Paddr hint = 0);
};

#pragma pack()

static_assert(sizeof(Acpi_rsdp) == Acpi_rsdp::V2_SIZE, "RSDP layout is wrong");
