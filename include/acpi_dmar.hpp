/*
 * DMA Remapping Reporting (DMAR) Table
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

#include "acpi_table.hpp"
#include "config.hpp"
#include "static_vector.hpp"

#pragma pack(1)

/*
 * DMA Remapping Reporting Structure (VT-d 8.1)
 */
class Acpi_table_dmar : public Acpi_table
{
public:
    uint8 haw;          // 36
    uint8 flags;        // 37
    uint8 reserved[10]; // 38
    uint8 remap[];      // 48

    enum
    {
        INTR_REMAP = 1u << 0,
        X2APIC_OPT_OUT = 1u << 1,
    };
};

// The common header of all remapping structures.
class Acpi_remap
{
public:
    uint16 type;
    uint16 length;

    enum Type
    {
        DRHD = 0,
        RMRR = 1,
    };
};

/*
 * DMA Remapping Hardware Unit Definition Structure (VT-d 8.3)
 */
class Acpi_drhd : public Acpi_remap
{
public:
    uint8 flags;
    uint8 size;
    uint16 segment;
    uint64 base;

    enum
    {
        INCLUDE_PCI_ALL = 1u << 0,
    };
};

/*
 * Reserved Memory Region Reporting Structure (VT-d 8.4)
 */
class Acpi_rmrr : public Acpi_remap
{
public:
    uint16 reserved;
    uint16 segment;
    uint64 base;
    uint64 limit;
};

/*
 * Device Scope Structure (VT-d 8.3.1)
 */
class Acpi_scope
{
public:
    uint8 type;
    uint8 length;
    uint16 reserved;
    uint8 enum_id;
    uint8 start_bus;
    uint8 path[];
};

#pragma pack()

static_assert(sizeof(Acpi_table_dmar) == 48, "DMAR table layout is wrong");
static_assert(sizeof(Acpi_drhd) == 16 and sizeof(Acpi_rmrr) == 24, "DMAR structure layout is wrong");
static_assert(sizeof(Acpi_scope) == 6, "DMAR device scope layout is wrong");

// One hop on the way from the start bus to a device.
struct Dmar_path_entry {
    uint8 dev;
    uint8 fn;
};

// A device or bridge a remapping structure applies to.
struct Dmar_scope {
    enum Type : uint8
    {
        PCI_ENDPOINT = 1,
        PCI_BRIDGE = 2,
        IOAPIC = 3,
        HPET = 4,
        ACPI_NAMESPACE = 5,
    };

    uint8 type;
    uint8 enum_id;
    uint8 start_bus;

    Static_vector<Dmar_path_entry, NUM_DMAR_PATH> path;
};

// A DMA remapping hardware unit.
struct Remap_unit {
    Paddr base;
    uint16 segment;

    // The unit covers all devices on its segment that no other unit claims.
    bool include_all;

    Static_vector<Dmar_scope, NUM_DMAR_SCOPE> scopes;
};

// Memory that devices use behind the OS's back, for example USB legacy emulation.
struct Rmrr_region {
    uint16 segment;
    Paddr base;
    Paddr limit;

    Static_vector<Dmar_scope, NUM_RMRR_SCOPE> scopes;
};

// Everything we learn from the DMAR table.
struct Remap_unit_list {
    // The maximum DMA physical address width is haw + 1 bits.
    uint8 haw{0};
    uint8 flags{0};

    Static_vector<Remap_unit, NUM_DMAR> units;
    Static_vector<Rmrr_region, NUM_RMRR> rmrrs;

    bool intr_remap() const { return flags & Acpi_table_dmar::INTR_REMAP; }
    bool x2apic_opt_out() const { return flags & Acpi_table_dmar::X2APIC_OPT_OUT; }

    // Fill this list from a DMAR table.
    //
    // Structures and device scopes that do not fit into their parent are fatal for the table. Structure
    // types other than DRHD and RMRR are skipped.
    Result_void<Acpi_error> parse(Acpi_table const& table);
};
