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

#include "acpi_madt.hpp"
#include "stdio.hpp"

size_t Madt_record::min_length(uint8 type)
{
    switch (type) {
    case Acpi_apic::LAPIC:
        return sizeof(Acpi_lapic);
    case Acpi_apic::IOAPIC:
        return sizeof(Acpi_ioapic);
    case Acpi_apic::INTR:
        return sizeof(Acpi_intr);
    case Acpi_apic::NMI:
        return sizeof(Acpi_nmi);
    case Acpi_apic::LAPIC_NMI:
        return sizeof(Acpi_lapic_nmi);
    case Acpi_apic::LAPIC_ADDR:
        return sizeof(Acpi_lapic_addr);
    case Acpi_apic::X2APIC:
        return sizeof(Acpi_x2apic);
    case Acpi_apic::X2APIC_NMI:
        return sizeof(Acpi_x2apic_nmi);
    }

    return 0;
}

Optional<Madt_record> Madt_record::decode(Acpi_apic const& apic)
{
    enum
    {
        LAPIC_ENABLED = 1u << 0,
        LAPIC_ONLINE_CAPABLE = 1u << 1,
    };

    Madt_record rec;

    switch (apic.type) {
    case Acpi_apic::LAPIC: {
        auto const& r{static_cast<Acpi_lapic const&>(apic)};
        uint32 const flags{r.flags};

        rec.kind = Kind::LAPIC;
        rec.lapic = {r.acpi_id, r.apic_id, (flags & LAPIC_ENABLED) != 0, (flags & LAPIC_ONLINE_CAPABLE) != 0};
        break;
    }
    case Acpi_apic::X2APIC: {
        auto const& r{static_cast<Acpi_x2apic const&>(apic)};
        uint32 const flags{r.flags};

        rec.kind = Kind::X2APIC;
        rec.lapic = {r.acpi_uid, r.x2apic_id, (flags & LAPIC_ENABLED) != 0,
                     (flags & LAPIC_ONLINE_CAPABLE) != 0};
        break;
    }
    case Acpi_apic::IOAPIC: {
        auto const& r{static_cast<Acpi_ioapic const&>(apic)};

        rec.kind = Kind::IOAPIC;
        rec.ioapic = {r.id, r.phys, r.gsi};
        break;
    }
    case Acpi_apic::INTR: {
        auto const& r{static_cast<Acpi_intr const&>(apic)};

        rec.kind = Kind::INTR_OVERRIDE;
        rec.intr_override = {r.bus, r.irq, r.gsi, {r.flags}};
        break;
    }
    case Acpi_apic::NMI: {
        auto const& r{static_cast<Acpi_nmi const&>(apic)};

        rec.kind = Kind::NMI_SOURCE;
        rec.nmi_source = {r.gsi, {r.flags}};
        break;
    }
    case Acpi_apic::LAPIC_NMI: {
        auto const& r{static_cast<Acpi_lapic_nmi const&>(apic)};

        rec.kind = Kind::LAPIC_NMI;
        rec.lapic_nmi = {r.acpi_id == 0xff ? uint32{Lapic_nmi::ALL_CPUS} : r.acpi_id, r.lint, {r.flags}};
        break;
    }
    case Acpi_apic::X2APIC_NMI: {
        auto const& r{static_cast<Acpi_x2apic_nmi const&>(apic)};

        rec.kind = Kind::X2APIC_NMI;
        rec.lapic_nmi = {r.acpi_uid, r.lint, {r.flags}};
        break;
    }
    case Acpi_apic::LAPIC_ADDR: {
        auto const& r{static_cast<Acpi_lapic_addr const&>(apic)};

        rec.kind = Kind::LAPIC_ADDR_OVERRIDE;
        rec.lapic_addr = {r.addr};
        break;
    }
    default:
        return {};
    }

    return rec;
}

Madt_record_walker::Madt_record_walker(Acpi_table_madt const& madt)
    : Madt_record_walker(madt.records, madt.length - Acpi_table_madt::HEADER_LENGTH)
{
}

Madt_record_walker::Madt_record_walker(void const* records, size_t len)
    : cur(static_cast<uint8 const*>(records)), end(static_cast<uint8 const*>(records) + len)
{
}

Result<Optional<Madt_record>, Acpi_error> Madt_record_walker::next()
{
    while (not failed.has_value() and cur != end) {
        size_t const left{static_cast<size_t>(end - cur)};
        auto const& apic{*reinterpret_cast<Acpi_apic const*>(cur)};

        if (left < sizeof(Acpi_apic) or apic.length < sizeof(Acpi_apic) or apic.length > left) {
            trace(TRACE_ACPI | TRACE_ERROR, "MADT record does not fit: %lu bytes left, length %u",
                  static_cast<unsigned long>(left), left < sizeof(Acpi_apic) ? 0U : apic.length);
            failed = Acpi_error::RECORD_DESYNC;
            break;
        }

        size_t const min_len{Madt_record::min_length(apic.type)};

        if (apic.length < min_len) {
            trace(TRACE_ACPI | TRACE_ERROR, "MADT record of type %u is too short: %u < %lu", apic.type,
                  apic.length, static_cast<unsigned long>(min_len));
            failed = Acpi_error::BAD_LENGTH;
            break;
        }

        cur += apic.length;

        Optional<Madt_record> const rec{Madt_record::decode(apic)};

        if (rec.has_value()) {
            return Ok(rec);
        }

        trace(TRACE_ACPI, "Skipping MADT record of type %u", apic.type);
    }

    if (failed.has_value()) {
        return Err(*failed);
    }

    return Ok(Optional<Madt_record>{});
}

void Madt_parser::add_cpu(Madt_record::Lapic const& lapic, bool xapic_record)
{
    if (not lapic.enabled and not lapic.online_capable) {
        return;
    }

    // An xAPIC ID of 0xff is a placeholder for a CPU that is listed as x2APIC.
    if (xapic_record and lapic.apic_id == 0xff) {
        return;
    }

    if (info.cpus.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Ignoring CPU %u (APIC %u): more than %u CPUs", lapic.acpi_id,
              lapic.apic_id, NUM_CPU);
        return;
    }

    // We drive the Local APIC in xAPIC mode, so IPIs cannot reach larger IDs.
    bool const reachable{lapic.apic_id <= XAPIC_MAX_ID};

    if (not reachable) {
        trace(TRACE_ACPI | TRACE_ERROR, "CPU %u (APIC %u) is not addressable in xAPIC mode", lapic.acpi_id,
              lapic.apic_id);
    }

    Cpu_state const state{reachable ? Cpu_state::OFFLINE : Cpu_state::FAILED};

    if (not info.cpus.add({lapic.acpi_id, lapic.apic_id, lapic.enabled, false, state})) {
        trace(TRACE_ACPI, "Ignoring duplicate CPU %u (APIC %u)", lapic.acpi_id, lapic.apic_id);
    }
}

void Madt_parser::add_ioapic(Madt_record::Ioapic const& ioapic)
{
    if (info.interrupts.ioapics.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Ignoring IOAPIC %u: more than %u IOAPICs", ioapic.id, NUM_IOAPIC);
        return;
    }

    info.interrupts.ioapics.push_back({ioapic.id, ioapic.base, ioapic.gsi_base});
}

void Madt_parser::add_override(Madt_record::Intr_override const& intr)
{
    // Only ISA interrupts can be overridden.
    if (intr.bus != 0 or intr.irq >= 16) {
        trace(TRACE_ACPI, "Ignoring override for bus %u IRQ %u", intr.bus, intr.irq);
        return;
    }

    if (info.interrupts.find_override(intr.irq) != nullptr) {
        trace(TRACE_ACPI, "Ignoring second override for IRQ %u", intr.irq);
        return;
    }

    if (info.interrupts.overrides.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Ignoring override for IRQ %u: too many overrides", intr.irq);
        return;
    }

    info.interrupts.overrides.push_back(
        {intr.irq, intr.gsi, intr.flags.polarity(Polarity::HIGH), intr.flags.trigger(Trigger::EDGE)});
}

void Madt_parser::add_nmi_source(Madt_record::Nmi_source const& nmi)
{
    if (info.interrupts.nmi_sources.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Ignoring NMI source GSI %u", nmi.gsi);
        return;
    }

    info.interrupts.nmi_sources.push_back({nmi.gsi, nmi.flags.polarity(), nmi.flags.trigger()});
}

void Madt_parser::add_lapic_nmi(Madt_record::Lapic_nmi const& nmi)
{
    if (nmi.lint > 1) {
        trace(TRACE_ACPI, "Ignoring NMI on LINT%u", nmi.lint);
        return;
    }

    if (info.interrupts.lapic_nmis.full()) {
        trace(TRACE_ACPI | TRACE_ERROR, "Ignoring LAPIC NMI for CPU %u", nmi.acpi_id);
        return;
    }

    info.interrupts.lapic_nmis.push_back({nmi.acpi_id, nmi.lint, nmi.flags.polarity(), nmi.flags.trigger()});
}

void Madt_parser::add_sci_override(Fadt_info const& fadt)
{
    if (fadt.sci_irq >= 16 or info.interrupts.find_override(fadt.sci_irq) != nullptr or
        info.interrupts.overrides.full()) {
        return;
    }

    // The SCI is a shareable, level-triggered, active-low interrupt.
    info.interrupts.overrides.push_back(
        {static_cast<uint8>(fadt.sci_irq), fadt.sci_irq, Polarity::LOW, Trigger::LEVEL});

    trace(TRACE_ACPI, "SCI IRQ %u: using default level/low override", fadt.sci_irq);
}

void Madt_parser::pick_bsp()
{
    long const idx{info.cpus.index_of_apic(bsp_apic_id)};

    if (idx >= 0) {
        info.cpus[static_cast<size_t>(idx)].bsp = true;
        info.cpus[static_cast<size_t>(idx)].state = Cpu_state::ONLINE;
        return;
    }

    for (Cpu_info& cpu : info.cpus) {
        if (cpu.enabled and cpu.apic_id <= XAPIC_MAX_ID) {
            trace(TRACE_ACPI | TRACE_ERROR, "APIC ID %u not in MADT, assuming APIC %u is the BSP",
                  bsp_apic_id, cpu.apic_id);
            cpu.bsp = true;
            cpu.state = Cpu_state::ONLINE;
            return;
        }
    }

    trace(TRACE_ACPI | TRACE_ERROR, "MADT lists no enabled CPU");
}

Result_void<Acpi_error> Madt_parser::parse(Acpi_table const& table, Optional<Fadt_info> const& fadt)
{
    if (table.signature != SIG("APIC")) {
        return Err(Acpi_error::BAD_SIGNATURE);
    }

    if (table.length < Acpi_table_madt::HEADER_LENGTH) {
        return Err(Acpi_error::BAD_LENGTH);
    }

    auto const& madt{static_cast<Acpi_table_madt const&>(table)};

    info.interrupts.lapic_base = madt.apic_addr;
    info.interrupts.pcat_compat = madt.flags & Acpi_table_madt::PCAT_COMPAT;

    Madt_record_walker walker{madt};

    for (;;) {
        Optional<Madt_record> const rec{TRY_OR_RETURN(walker.next())};

        if (not rec.has_value()) {
            break;
        }

        if (info.interrupts.records.full()) {
            trace(TRACE_ACPI | TRACE_ERROR, "Not keeping more than %u MADT records", NUM_MADT_RECORDS);
        } else {
            info.interrupts.records.push_back(*rec);
        }

        switch (rec->kind) {
        case Madt_record::Kind::LAPIC:
        case Madt_record::Kind::X2APIC:
            add_cpu(rec->lapic, rec->kind == Madt_record::Kind::LAPIC);
            break;
        case Madt_record::Kind::IOAPIC:
            add_ioapic(rec->ioapic);
            break;
        case Madt_record::Kind::INTR_OVERRIDE:
            add_override(rec->intr_override);
            break;
        case Madt_record::Kind::NMI_SOURCE:
            add_nmi_source(rec->nmi_source);
            break;
        case Madt_record::Kind::LAPIC_NMI:
        case Madt_record::Kind::X2APIC_NMI:
            add_lapic_nmi(rec->lapic_nmi);
            break;
        case Madt_record::Kind::LAPIC_ADDR_OVERRIDE:
            info.interrupts.lapic_base = rec->lapic_addr.base;
            break;
        }
    }

    if (fadt.has_value()) {
        add_sci_override(*fadt);
    }

    pick_bsp();

    trace(TRACE_ACPI, "MADT: %lu CPUs, %lu IOAPICs, %lu overrides, LAPIC at %#llx%s",
          static_cast<unsigned long>(info.cpus.size()),
          static_cast<unsigned long>(info.interrupts.ioapics.size()),
          static_cast<unsigned long>(info.interrupts.overrides.size()),
          static_cast<unsigned long long>(info.interrupts.lapic_base),
          info.interrupts.pcat_compat ? ", PC-AT compatible" : "");

    return Ok_void({});
}
