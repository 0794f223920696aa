/*
 * Interrupt Controller Bring-up
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

#include "intr.hpp"
#include "lapic.hpp"
#include "pic.hpp"
#include "stdio.hpp"
#include "vectors.hpp"

Irq_routing::Irq_routing(Interrupt_topology const& topo,
                         Static_vector<Ioapic_state, NUM_IOAPIC> const& ioapics)
    : overrides(topo.overrides)
{
    for (Ioapic_state const& ioapic : ioapics) {
        ranges.push_back({ioapic.gsi_base, ioapic.pins});
    }
}

uint32 Irq_routing::irq_to_gsi(unsigned irq) const
{
    auto const it{find_if(overrides, [irq](Irq_override const& o) { return o.irq == irq; })};
    return it == overrides.end() ? irq : it->gsi;
}

Optional<Gsi_location> Irq_routing::gsi_to_ioapic(uint32 gsi) const
{
    for (size_t i{0}; i < ranges.size(); i++) {
        if (gsi >= ranges[i].gsi_base and gsi - ranges[i].gsi_base < ranges[i].pins) {
            return Gsi_location{i, gsi - ranges[i].gsi_base};
        }
    }

    return {};
}

void Intr::setup_ioapic(Interrupt_topology const& topo, Ioapic_info const& info, uint32 bsp_apic_id,
                        Intr_state& state)
{
    Ioapic_state& ioapic_state{state.ioapics.emplace_back()};
    Ioapic ioapic{mmio, ioapic_state};

    ioapic.init(info);

    for (unsigned pin{0}; pin < ioapic.pins(); pin++) {
        uint32 const gsi{info.gsi_base + pin};

        // Vectors above the GSI range belong to the APIC and the IOMMU. Such pins stay masked with vector 0.
        if (VEC_GSI + gsi >= VEC_MSI_DMAR) {
            continue;
        }

        // ISA interrupts are edge-triggered and active-high, PCI interrupts are level-triggered and
        // active-low.
        bool const isa{gsi < 16};
        uint64 const entry{Ioapic::make_entry(static_cast<uint8>(VEC_GSI + gsi), bsp_apic_id,
                                              isa ? Polarity::HIGH : Polarity::LOW,
                                              isa ? Trigger::EDGE : Trigger::LEVEL)};

        ioapic.set_entry(pin, entry | Ioapic::IRT_MASKED);
    }

    for (Irq_override const& o : topo.overrides) {
        if (not ioapic_state.covers(o.gsi)) {
            continue;
        }

        uint64 const entry{
            Ioapic::make_entry(static_cast<uint8>(VEC_GSI + o.irq), bsp_apic_id, o.polarity, o.trigger)};

        ioapic.set_entry(o.gsi - info.gsi_base, entry | Ioapic::IRT_MASKED);

        trace(TRACE_APIC, "IRQ %u -> GSI %u (%s, %s)", o.irq, o.gsi,
              o.polarity == Polarity::LOW ? "low" : "high", o.trigger == Trigger::LEVEL ? "level" : "edge");
    }

    for (Nmi_source const& nmi : topo.nmi_sources) {
        if (not ioapic_state.covers(nmi.gsi)) {
            continue;
        }

        // NMI delivery only works edge-triggered.
        uint64 const entry{Ioapic::make_entry(0, bsp_apic_id, nmi.polarity, Trigger::EDGE)};

        ioapic.set_entry(nmi.gsi - info.gsi_base, entry | Ioapic::IRT_DELIVERY_NMI);

        trace(TRACE_APIC, "GSI %u is an NMI source", nmi.gsi);
    }
}

void Intr::setup(Madt_info const* madt, Intr_state& state)
{
    Pic pic{io};

    pic.disable();

    state.pic_mask = pic.irq_mask();
    state.ioapics.reset();

    if (madt == nullptr) {
        trace(TRACE_APIC, "No MADT, using the legacy PIC with a single CPU");

        state.mode = Intr_mode::LEGACY_PIC;
        state.routing = Irq_routing{};
        return;
    }

    Interrupt_topology const& topo{madt->interrupts};
    Cpu_info const* bsp{madt->cpus.bsp()};

    state.mode = Intr_mode::APIC;
    state.lapic_base = topo.lapic_base;
    state.bsp_apic_id = bsp != nullptr ? bsp->apic_id : 0;

    Lapic lapic{mmio, delay, topo.lapic_base};

    lapic.enable(topo, bsp != nullptr ? bsp->acpi_id : Madt_record::Lapic_nmi::ALL_CPUS);

    for (Ioapic_info const& info : topo.ioapics) {
        setup_ioapic(topo, info, state.bsp_apic_id, state);
    }

    state.routing = Irq_routing{topo, state.ioapics};

    for (Cpu_info const& cpu : madt->cpus) {
        if (not cpu.bsp) {
            trace(TRACE_CPU, "CPU %u: APIC %u%s", cpu.acpi_id, cpu.apic_id, cpu.enabled ? "" : " (disabled)");
        }
    }
}

bool Intr::set_pic_line(Intr_state& state, uint32 irq, bool masked)
{
    if (irq >= Pic::NUM_IRQ or irq == Pic::CASCADE_IRQ) {
        return false;
    }

    Pic pic{io, state.pic_mask};

    if (masked) {
        pic.mask(irq);
    } else {
        pic.unmask(irq);
    }

    state.pic_mask = pic.irq_mask();
    return true;
}

bool Intr::mask_gsi(Intr_state& state, uint32 gsi)
{
    if (state.mode == Intr_mode::LEGACY_PIC) {
        return set_pic_line(state, gsi, true);
    }

    Optional<Gsi_location> const loc{state.routing.gsi_to_ioapic(gsi)};

    if (not loc.has_value()) {
        return false;
    }

    return Ioapic{mmio, state.ioapics[loc->ioapic]}.mask(gsi);
}

bool Intr::unmask_gsi(Intr_state& state, uint32 gsi)
{
    if (state.mode == Intr_mode::LEGACY_PIC) {
        return set_pic_line(state, gsi, false);
    }

    Optional<Gsi_location> const loc{state.routing.gsi_to_ioapic(gsi)};

    if (not loc.has_value()) {
        return false;
    }

    Ioapic_state& ioapic{state.ioapics[loc->ioapic]};
    uint64 const entry{ioapic.entries[loc->pin]};

    if ((entry & Ioapic::IRT_VECTOR_MASK) == 0 and not(entry & Ioapic::IRT_DELIVERY_NMI)) {
        return false;
    }

    return Ioapic{mmio, ioapic}.unmask(gsi);
}
