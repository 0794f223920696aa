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

#include "acpi_registry.hpp"
#include "algorithm.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Result_void<Acpi_error> Acpi_table_registry::register_handler(uint32 sig, Acpi_table_handler* handler)
{
    assert(handler != nullptr);

    if (lookup(sig) != nullptr) {
        trace(TRACE_ACPI | TRACE_ERROR, "Duplicate handler for %.4s", reinterpret_cast<char const*>(&sig));
        return Err(Acpi_error::DUPLICATE_HANDLER);
    }

    if (entries.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "No space for a handler for %.4s",
              reinterpret_cast<char const*>(&sig));
        return Err(Acpi_error::TOO_MANY_ENTRIES);
    }

    entries.push_back({sig, handler});
    return Ok_void({});
}

Acpi_table_handler* Acpi_table_registry::lookup(uint32 sig) const
{
    auto const it{find_if(entries, [sig](Entry const& e) { return e.sig == sig; })};

    return it == entries.end() ? nullptr : it->handler;
}

Result_void<Acpi_error> Acpi_table_registry::dispatch_pass(Pass pass, Phys_mem& mem,
                                                           Acpi_root_table const& root,
                                                           Acpi_dispatch_context& ctx,
                                                           Acpi_dispatch_report& report) const
{
    for (Paddr const addr : root.entries()) {
        auto const* header{static_cast<Acpi_table const*>(mem.map(addr, sizeof(Acpi_table)))};

        if (header == nullptr) {
            trace(TRACE_ACPI | TRACE_ERROR, "Cannot map table header at %#010llx",
                  static_cast<unsigned long long>(addr));
            continue;
        }

        uint32 const sig{header->signature};
        bool const is_fadt{sig == SIG("FACP")};

        if (is_fadt != (pass == Pass::FADT_ONLY)) {
            continue;
        }

        auto const mapped{Acpi_table::map(mem, addr)};

        if (mapped.is_err()) {
            trace(TRACE_ACPI | TRACE_ERROR, "Cannot read %.4s at %#010llx: %s",
                  reinterpret_cast<char const*>(&sig), static_cast<unsigned long long>(addr),
                  acpi_error_name(mapped.unwrap_err()));
            report.rejected.push_back(sig);
            continue;
        }

        Acpi_table const& table{*mapped.unwrap()};

        if (not table.good_checksum(addr)) {
            report.rejected.push_back(sig);
            continue;
        }

        Acpi_table_handler* const handler{lookup(sig)};

        if (handler == nullptr) {
            report.skipped.push_back(sig);
            continue;
        }

        auto const result{handler->handle(table, ctx)};

        if (result.is_err()) {
            Acpi_error const err{result.unwrap_err()};

            trace(TRACE_ACPI | TRACE_ERROR, "%.4s at %#010llx refused: %s",
                  reinterpret_cast<char const*>(&sig), static_cast<unsigned long long>(addr),
                  acpi_error_name(err));

            if (acpi_error_is_fatal(err)) {
                return Err(err);
            }

            report.rejected.push_back(sig);
            continue;
        }

        report.handled.push_back(sig);
    }

    return Ok_void({});
}

Result<Acpi_dispatch_context, Acpi_error>
Acpi_table_registry::dispatch_all(Phys_mem& mem, Acpi_root_table const& root,
                                  Acpi_dispatch_report& report) const
{
    Acpi_dispatch_context ctx;

    TRY_OR_RETURN(dispatch_pass(Pass::FADT_ONLY, mem, root, ctx, report));
    TRY_OR_RETURN(dispatch_pass(Pass::ALL_BUT_FADT, mem, root, ctx, report));

    return Ok(ctx);
}
