/*
 * Local Advanced Programmable Interrupt Controller (Local APIC)
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

#include "lapic.hpp"
#include "config.hpp"
#include "stdio.hpp"
#include "vectors.hpp"

void Lapic::enable(Interrupt_topology const& topo, uint32 acpi_id)
{
    write(LAPIC_SVR, VEC_LAPIC_SPURIOUS | SVR_ENABLE);
    write(LAPIC_TPR, 0);

    unsigned const max_lvt{lvt_max()};

    write(LAPIC_LVT_TIMER, LVT_MASKED);
    write(LAPIC_LVT_ERROR, LVT_MASKED | VEC_LAPIC_ERROR);

    if (max_lvt >= 4) {
        write(LAPIC_LVT_THERM, LVT_MASKED);
    }

    if (max_lvt >= 5) {
        write(LAPIC_LVT_PERFM, LVT_MASKED);
    }

    uint32 lint[2]{LVT_MASKED, LVT_MASKED};

    for (Lapic_nmi_pin const& nmi : topo.lapic_nmis) {
        if (not nmi.applies_to(acpi_id)) {
            continue;
        }

        // NMIs are always edge-triggered.
        lint[nmi.lint] = DLV_NMI | (nmi.polarity == Polarity::LOW ? LVT_ACTIVE_LOW : 0);
    }

    write(LAPIC_LVT_LINT0, lint[0]);
    write(LAPIC_LVT_LINT1, lint[1]);

    trace(TRACE_APIC, "APIC:%#llx ID:%#x VER:%#x LVT:%#x LINT0:%#x LINT1:%#x",
          static_cast<unsigned long long>(base), id(), version(), max_lvt, lint[0], lint[1]);
}

Result_void<Apic_error> Lapic::wait_for_delivery()
{
    for (unsigned waited{0}; read(LAPIC_ICR_LO) & ICR_DELIVERY_PENDING; waited += IPI_POLL_US) {
        if (waited >= HW_ACK_TIMEOUT_US) {
            return Err(Apic_error::IPI_NOT_DELIVERED);
        }

        delay.delay_us(IPI_POLL_US);
    }

    return Ok_void({});
}

Result_void<Apic_error> Lapic::send_ipi(uint32 apic_id, uint32 vector, Delivery_mode mode)
{
    if (apic_id > XAPIC_MAX_ID) {
        trace(TRACE_APIC | TRACE_ERROR, "Cannot send IPI to APIC %u in xAPIC mode", apic_id);
        return Err(Apic_error::BAD_DESTINATION);
    }

    uint32 const level{mode == DLV_INIT ? ICR_LEVEL_ASSERT | ICR_TRIGGER_LEVEL : ICR_LEVEL_ASSERT};

    write(LAPIC_ICR_HI, apic_id << ICR_DEST_SHIFT);
    write(LAPIC_ICR_LO, level | mode | (vector & 0xff));

    auto const result{wait_for_delivery()};

    if (result.is_err()) {
        trace(TRACE_APIC | TRACE_ERROR, "IPI %#x to APIC %u was not delivered", mode | vector, apic_id);
    }

    return result;
}

Result_void<Apic_error> Lapic::send_init(uint32 apic_id) { return send_ipi(apic_id, 0, DLV_INIT); }

Result_void<Apic_error> Lapic::send_sipi(uint32 apic_id, uint8 page)
{
    return send_ipi(apic_id, page, DLV_SIPI);
}
