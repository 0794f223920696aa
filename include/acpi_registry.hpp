/*
 * ACPI Table Registry
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
#include "acpi_fadt.hpp"
#include "acpi_rsdt.hpp"
#include "acpi_table.hpp"
#include "config.hpp"
#include "optional.hpp"
#include "result.hpp"
#include "static_vector.hpp"

class Phys_mem;

// What table handlers see besides the table itself.
//
// The FADT handler runs alone in the first dispatch pass and publishes its result here. All other handlers
// run in the second pass and can rely on fadt being filled in, if the platform has a valid FADT.
struct Acpi_dispatch_context {
    Optional<Fadt_info> fadt;
};

// Interprets one kind of ACPI table.
class Acpi_table_handler
{
public:
    virtual ~Acpi_table_handler() = default;

    // Handle a table whose checksum was already verified.
    //
    // The table is only mapped for the duration of the call. Returning a fatal error aborts discovery.
    virtual Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) = 0;
};

// What happened to the tables the firmware published.
struct Acpi_dispatch_report {
    using Sig_list = Static_vector<uint32, NUM_ACPI_TABLES>;

    // Tables a handler accepted.
    Sig_list handled;

    // Tables nobody is interested in.
    Sig_list skipped;

    // Tables with a bad checksum or length, or tables their handler refused.
    Sig_list rejected;
};

// Maps table signatures to the handlers that interpret them.
//
// The registry is filled during boot before the root table is walked and is not modified afterwards.
class Acpi_table_registry
{
private:
    struct Entry {
        uint32 sig;
        Acpi_table_handler* handler;
    };

    Static_vector<Entry, NUM_ACPI_HANDLERS> entries;

    enum class Pass
    {
        FADT_ONLY,
        ALL_BUT_FADT,
    };

    Result_void<Acpi_error> dispatch_pass(Pass pass, Phys_mem& mem, Acpi_root_table const& root,
                                          Acpi_dispatch_context& ctx, Acpi_dispatch_report& report) const;

public:
    Result_void<Acpi_error> register_handler(uint32 sig, Acpi_table_handler* handler);

    // Returns the handler for the given signature or nullptr.
    Acpi_table_handler* lookup(uint32 sig) const;

    size_t size() const { return entries.size(); }

    // Hand every table in the root table to its handler.
    //
    // This happens in two passes: first the FADT, then everything else. The returned context contains
    // what the first pass found.
    Result<Acpi_dispatch_context, Acpi_error> dispatch_all(Phys_mem& mem, Acpi_root_table const& root,
                                                           Acpi_dispatch_report& report) const;
};
