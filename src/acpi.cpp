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

#include "acpi.hpp"
#include "acpi_rsdt.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Result_void<Acpi_error> Acpi_fadt_handler::handle(Acpi_table const& table, Acpi_dispatch_context& ctx)
{
    if (ctx.fadt.has_value()) {
        trace(TRACE_ACPI, "Ignoring additional FADT");
        return Ok_void({});
    }

    ctx.fadt = TRY_OR_RETURN(Fadt_info::parse(table));
    return Ok_void({});
}

Result_void<Acpi_error> Acpi_madt_handler::handle(Acpi_table const& table, Acpi_dispatch_context& ctx)
{
    if (info.have_madt) {
        trace(TRACE_ACPI, "Ignoring additional MADT");
        return Ok_void({});
    }

    Madt_parser parser{info.madt, bsp_apic_id};
    TRY_OR_RETURN(parser.parse(table, ctx.fadt));

    info.have_madt = true;
    return Ok_void({});
}

Result_void<Acpi_error> Acpi_hpet_handler::handle(Acpi_table const& table, Acpi_dispatch_context&)
{
    if (info.hpet.has_value()) {
        trace(TRACE_ACPI, "Ignoring additional HPET");
        return Ok_void({});
    }

    auto const timer{Timer_info::parse(table)};

    // The HPET is optional. A broken table only costs us the timer.
    if (timer.is_err()) {
        return Err(Acpi_error::UNUSABLE);
    }

    info.hpet = timer.unwrap();
    return Ok_void({});
}

Result_void<Acpi_error> Acpi_dmar_handler::handle(Acpi_table const& table, Acpi_dispatch_context&)
{
    if (info.have_dmar) {
        trace(TRACE_ACPI, "Ignoring additional DMAR");
        return Ok_void({});
    }

    auto const result{info.dmar.parse(table)};

    if (result.is_err()) {
        info.dmar = Remap_unit_list{};
        return Err(Acpi_error::UNUSABLE);
    }

    info.have_dmar = true;
    return Ok_void({});
}

Acpi::Acpi(Acpi_info& info_, Options const& opts_)
    : info(info_), madt_handler(info_, opts_.bsp_apic_id), hpet_handler(info_), dmar_handler(info_),
      opts(opts_)
{
}

Result_void<Acpi_error> Acpi::register_handlers(Acpi_table_registry& registry)
{
    TRY_OR_RETURN(registry.register_handler(SIG("FACP"), &fadt_handler));
    TRY_OR_RETURN(registry.register_handler(SIG("APIC"), &madt_handler));
    TRY_OR_RETURN(registry.register_handler(SIG("DMAR"), &dmar_handler));

    if (opts.use_hpet) {
        TRY_OR_RETURN(registry.register_handler(SIG("HPET"), &hpet_handler));
    }

    return Ok_void({});
}

Result_void<Acpi_error> Acpi::discover(Phys_mem& mem, Acpi_table_registry const& registry)
{
    info.rsdp = TRY_OR_RETURN(Acpi_rsdp::locate(mem, opts.rsdp_hint));

    auto const root{Acpi_root_table::parse(mem, *info.rsdp)};

    if (root.is_err()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Root table is unusable: %s", acpi_error_name(root.unwrap_err()));
        return Err(root.unwrap_err());
    }

    auto const ctx{registry.dispatch_all(mem, root.unwrap(), info.report)};

    if (ctx.is_err()) {
        return Err(ctx.unwrap_err());
    }

    info.fadt = ctx.unwrap().fadt;

    trace(TRACE_ACPI, "ACPI: %lu tables handled, %lu skipped, %lu rejected%s%s%s",
          static_cast<unsigned long>(info.report.handled.size()),
          static_cast<unsigned long>(info.report.skipped.size()),
          static_cast<unsigned long>(info.report.rejected.size()), info.have_madt ? "" : ", no MADT",
          info.hpet.has_value() ? "" : ", no HPET", info.have_dmar ? "" : ", no DMAR");

    return Ok_void({});
}
