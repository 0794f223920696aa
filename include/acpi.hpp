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

#include "acpi_dmar.hpp"
#include "acpi_fadt.hpp"
#include "acpi_hpet.hpp"
#include "acpi_madt.hpp"
#include "acpi_registry.hpp"
#include "acpi_rsdp.hpp"
#include "optional.hpp"

class Phys_mem;

// Everything ACPI discovery learned about the platform.
struct Acpi_info {
    Optional<Acpi_rsdp_info> rsdp;
    Optional<Fadt_info> fadt;

    // Only valid if have_madt is set.
    bool have_madt{false};
    Madt_info madt;

    Optional<Timer_info> hpet;

    // Only valid if have_dmar is set.
    bool have_dmar{false};
    Remap_unit_list dmar;

    Acpi_dispatch_report report;
};

class Acpi_fadt_handler final : public Acpi_table_handler
{
public:
    Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) override;
};

class Acpi_madt_handler final : public Acpi_table_handler
{
private:
    Acpi_info& info;
    uint32 const bsp_apic_id;

public:
    Acpi_madt_handler(Acpi_info& info_, uint32 bsp_apic_id_) : info(info_), bsp_apic_id(bsp_apic_id_) {}

    Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) override;
};

class Acpi_hpet_handler final : public Acpi_table_handler
{
private:
    Acpi_info& info;

public:
    explicit Acpi_hpet_handler(Acpi_info& info_) : info(info_) {}

    Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) override;
};

class Acpi_dmar_handler final : public Acpi_table_handler
{
private:
    Acpi_info& info;

public:
    explicit Acpi_dmar_handler(Acpi_info& info_) : info(info_) {}

    Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) override;
};

// Finds and interprets the ACPI tables we care about.
class Acpi
{
private:
    Acpi_info& info;

    Acpi_fadt_handler fadt_handler;
    Acpi_madt_handler madt_handler;
    Acpi_hpet_handler hpet_handler;
    Acpi_dmar_handler dmar_handler;

public:
    struct Options {
        // Where the boot loader found the RSDP or 0.
        Paddr rsdp_hint;

        // The APIC ID of the CPU we are running on.
        uint32 bsp_apic_id;

        bool use_hpet;
    };

    Acpi(Acpi_info& info_, Options const& opts_);

    // Add our table handlers to the registry.
    Result_void<Acpi_error> register_handlers(Acpi_table_registry& registry);

    // Locate the RSDP, read the root table and dispatch all tables to their handlers.
    //
    // Returns NOT_FOUND if there is no RSDP. Other errors mean that firmware tables are corrupt.
    Result_void<Acpi_error> discover(Phys_mem& mem, Acpi_table_registry const& registry);

private:
    Options const opts;
};
