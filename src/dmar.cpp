/*
 * DMA Remapping Unit (DMAR)
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

#include "dmar.hpp"
#include "algorithm.hpp"
#include "atomic.hpp"
#include "stdio.hpp"
#include "vectors.hpp"

namespace
{

enum
{
    PCI_VENDOR_ID = 0x0,
    PCI_HEADER_TYPE = 0xe,
    PCI_SECONDARY_BUS = 0x19,
    PCI_SUBORDINATE_BUS = 0x1a,

    PCI_HEADER_BRIDGE = 1,
    PCI_NO_DEVICE = 0xffff,
};

constexpr size_t CTX_ENTRIES{PAGE_SIZE / sizeof(Dmar_ctx)};
static_assert(CTX_ENTRIES == NUM_PCI_BUS, "A context table covers exactly one bus");

// Builds the root table of one unit and the context tables below it.
class Context_builder
{
private:
    Frame_alloc& frames;
    Dmar_ctx* const root;
    uint64 const ctx_hi;
    bool const flush;

    // Every entry in pass-through mode. Buses that are covered as a whole share it.
    Optional<Frame> shared;

    Dmar_ctx* tables[NUM_PCI_BUS]{};

    static constexpr uint64 CTX_LO{Dmar_ctx::PRESENT | Dmar_ctx::TT_PASS_THROUGH};

    Dmar_ctx* table(uint8 bus)
    {
        if (tables[bus] == nullptr) {
            Optional<Frame> const frame{frames.alloc_zeroed_page()};

            if (not frame.has_value()) {
                return nullptr;
            }

            tables[bus] = static_cast<Dmar_ctx*>(frame->virt);
            root[bus].set(0, frame->phys | Dmar_ctx::PRESENT, flush);
        }

        return tables[bus];
    }

public:
    size_t contexts{0};

    Context_builder(Frame_alloc& frames_, Frame const& root_, uint64 ctx_hi_, bool flush_)
        : frames(frames_), root(static_cast<Dmar_ctx*>(root_.virt)), ctx_hi(ctx_hi_), flush(flush_)
    {
    }

    bool add_bus(uint8 bus)
    {
        if (not shared.has_value()) {
            Optional<Frame> const frame{frames.alloc_zeroed_page()};

            if (not frame.has_value()) {
                return false;
            }

            Dmar_ctx* const entries{static_cast<Dmar_ctx*>(frame->virt)};
            for (size_t i{0}; i < CTX_ENTRIES; i++) {
                entries[i].set(ctx_hi, CTX_LO, flush);
            }

            shared.emplace(*frame);
        }

        root[bus].set(0, shared->phys | Dmar_ctx::PRESENT, flush);
        contexts += CTX_ENTRIES;

        return true;
    }

    bool add_device(uint8 bus, uint8 devfn)
    {
        Dmar_ctx* const entries{table(bus)};

        if (entries == nullptr) {
            return false;
        }

        if (not entries[devfn].present()) {
            entries[devfn].set(ctx_hi, CTX_LO, flush);
            contexts++;
        }

        return true;
    }
};

bool unit_failed(Remap_unit_state const& unit, char const* why)
{
    trace(TRACE_IOMMU | TRACE_ERROR, "DMAR %#llx: %s", static_cast<unsigned long long>(unit.base), why);
    return false;
}

} // namespace

size_t Dmar_state::count(Remap_status status) const
{
    return count_if(units, [status](Remap_unit_state const& u) { return u.status == status; });
}

bool Dmar::Coverage::claims(uint16 rid) const
{
    return buses.get(rid >> 8) or any_of(rids, [rid](uint16 r) { return r == rid; });
}

template <typename FN> bool Dmar::wait_for(FN done)
{
    for (uint32 waited{0}; waited < HW_ACK_TIMEOUT_US; waited += POLL_US) {
        if (done()) {
            return true;
        }

        delay.delay_us(POLL_US);
    }

    return done();
}

bool Dmar::command(Remap_unit_state const& unit, uint32 set, uint32 clear)
{
    uint32 const sts{mmio.read32(reg(unit, REG_GSTS))};

    mmio.write32(reg(unit, REG_GCMD), (sts & ~static_cast<uint32>(GSTS_ONE_SHOT) & ~clear) | set);

    return wait_for([&] {
        uint32 const now{mmio.read32(reg(unit, REG_GSTS))};
        return (now & set) == set and (now & clear) == 0;
    });
}

bool Dmar::flush_ctx(Remap_unit_state const& unit)
{
    mmio.write64(reg(unit, REG_CCMD), CCMD_ICC | CCMD_GLOBAL);

    if (not wait_for([&] { return not(mmio.read64(reg(unit, REG_CCMD)) & CCMD_ICC); })) {
        return false;
    }

    mmio.write64(reg(unit, REG_IOTLB), IOTLB_IVT | IOTLB_GLOBAL);

    return wait_for([&] { return not(mmio.read64(reg(unit, REG_IOTLB)) & IOTLB_IVT); });
}

int Dmar::address_width(uint64 cap)
{
    uint64 const sagaw{cap >> 8 & 0x1f};

    // 1 = 39 bit (3-level), 2 = 48 bit (4-level), 3 = 57 bit (5-level)
    for (int aw{3}; aw >= 1; aw--) {
        if (sagaw & (1u << aw)) {
            return aw;
        }
    }

    return -1;
}

Optional<Pci_bdf> Dmar::resolve(uint16 segment, Dmar_scope const& scope)
{
    uint8 bus{scope.start_bus};

    for (size_t i{0}; i < scope.path.size(); i++) {
        Pci_bdf const bdf{segment, bus, scope.path[i].dev, scope.path[i].fn};

        if (pci.read16(bdf, PCI_VENDOR_ID) == PCI_NO_DEVICE) {
            return {};
        }

        if (i + 1 == scope.path.size()) {
            return bdf;
        }

        if ((pci.read8(bdf, PCI_HEADER_TYPE) & 0x7f) != PCI_HEADER_BRIDGE) {
            return {};
        }

        bus = pci.read8(bdf, PCI_SECONDARY_BUS);
    }

    return {};
}

void Dmar::claim(Remap_unit const& unit, Coverage& coverage)
{
    for (Dmar_scope const& scope : unit.scopes) {
        if (scope.type != Dmar_scope::PCI_ENDPOINT and scope.type != Dmar_scope::PCI_BRIDGE) {
            trace(TRACE_IOMMU, "DMAR %#llx: scope type %u enum id %u needs no context entry",
                  static_cast<unsigned long long>(unit.base), scope.type, scope.enum_id);
            continue;
        }

        Optional<Pci_bdf> const bdf{resolve(unit.segment, scope)};

        if (not bdf.has_value()) {
            trace(TRACE_IOMMU, "DMAR %#llx: scope below bus %#x is not present",
                  static_cast<unsigned long long>(unit.base), scope.start_bus);
            continue;
        }

        if (scope.type == Dmar_scope::PCI_ENDPOINT) {
            if (coverage.rids.full()) {
                trace(TRACE_IOMMU | TRACE_ERROR, "DMAR %#llx: too many devices in scope",
                      static_cast<unsigned long long>(unit.base));
                continue;
            }

            coverage.rids.push_back(bdf->rid());
            continue;
        }

        uint8 const secondary{pci.read8(*bdf, PCI_SECONDARY_BUS)};
        uint8 const subordinate{pci.read8(*bdf, PCI_SUBORDINATE_BUS)};

        if (secondary == 0 or subordinate < secondary) {
            trace(TRACE_IOMMU | TRACE_ERROR, "DMAR %#llx: bridge %02x:%02x.%x has bad bus range %#x-%#x",
                  static_cast<unsigned long long>(unit.base), bdf->bus, bdf->dev, bdf->fn, secondary,
                  subordinate);
            continue;
        }

        coverage.buses.set_range(secondary, subordinate);
    }
}

bool Dmar::install_contexts(Remap_unit_list const& list, Coverage const* coverage, size_t self,
                            Frame const& root, uint64 ctx_hi, Remap_unit_state& state)
{
    Remap_unit const& unit{list.units[self]};
    Context_builder builder{frames, root, ctx_hi, not(state.ecap & ECAP_C)};

    if (not unit.include_all) {
        Coverage const& own{coverage[self]};

        for (unsigned bus{0}; bus < NUM_PCI_BUS; bus++) {
            if (own.buses.get(bus) and not builder.add_bus(static_cast<uint8>(bus))) {
                return false;
            }
        }

        for (uint16 rid : own.rids) {
            if (not own.buses.get(rid >> 8) and
                not builder.add_device(static_cast<uint8>(rid >> 8), static_cast<uint8>(rid))) {
                return false;
            }
        }

        state.contexts = builder.contexts;
        return true;
    }

    // An include-all unit gets everything on its segment that the scoped units leave over.
    auto const is_other_scoped = [&](size_t i) {
        return i != self and not list.units[i].include_all and list.units[i].segment == unit.segment;
    };

    auto const bus_claimed = [&](unsigned bus) {
        for (size_t i{0}; i < list.units.size(); i++) {
            if (is_other_scoped(i) and coverage[i].buses.get(bus)) {
                return true;
            }
        }
        return false;
    };

    auto const rid_claimed = [&](uint16 rid) {
        for (size_t i{0}; i < list.units.size(); i++) {
            if (is_other_scoped(i) and coverage[i].claims(rid)) {
                return true;
            }
        }
        return false;
    };

    auto const bus_partially_claimed = [&](unsigned bus) {
        for (size_t i{0}; i < list.units.size(); i++) {
            if (is_other_scoped(i) and any_of(coverage[i].rids, [bus](uint16 r) { return r >> 8 == bus; })) {
                return true;
            }
        }
        return false;
    };

    for (unsigned bus{0}; bus < NUM_PCI_BUS; bus++) {
        if (bus_claimed(bus)) {
            continue;
        }

        if (not bus_partially_claimed(bus)) {
            if (not builder.add_bus(static_cast<uint8>(bus))) {
                return false;
            }
            continue;
        }

        for (unsigned devfn{0}; devfn < CTX_ENTRIES; devfn++) {
            uint16 const rid{static_cast<uint16>(bus << 8 | devfn)};

            if (not rid_claimed(rid) and
                not builder.add_device(static_cast<uint8>(bus), static_cast<uint8>(devfn))) {
                return false;
            }
        }
    }

    state.contexts = builder.contexts;
    return true;
}

bool Dmar::configure(Remap_unit_list const& list, Coverage const* coverage, size_t self, uint32 bsp_apic_id,
                     Remap_unit_state& state)
{
    state.cap = mmio.read64(reg(state, REG_CAP));
    state.ecap = mmio.read64(reg(state, REG_ECAP));

    uint32 const ver{mmio.read32(reg(state, REG_VER))};

    trace(TRACE_IOMMU, "DMAR %#llx: version %u.%u seg %u cap %#llx ecap %#llx%s",
          static_cast<unsigned long long>(state.base), ver >> 4 & 0xf, ver & 0xf, state.segment,
          static_cast<unsigned long long>(state.cap), static_cast<unsigned long long>(state.ecap),
          state.include_all ? " include-all" : "");

    if (not(state.ecap & ECAP_PT)) {
        return unit_failed(state, "no pass-through support");
    }

    int const aw{address_width(state.cap)};

    if (aw < 0) {
        return unit_failed(state, "no usable address width");
    }

    if (mmio.read32(reg(state, REG_GSTS)) & GSTS_TES) {
        trace(TRACE_IOMMU, "DMAR %#llx: translation left enabled by firmware",
              static_cast<unsigned long long>(state.base));

        if (not command(state, 0, GCMD_TE)) {
            return unit_failed(state, "translation does not turn off");
        }
    }

    Optional<Frame> const root{frames.alloc_zeroed_page()};

    if (not root.has_value()) {
        return unit_failed(state, "out of memory for the root table");
    }

    state.root_table = root->phys;

    uint64 const ctx_hi{static_cast<uint64>(aw) | static_cast<uint64>(DOMAIN_ID) << Dmar_ctx::DID_SHIFT};

    if (not install_contexts(list, coverage, self, *root, ctx_hi, state)) {
        return unit_failed(state, "out of memory for context tables");
    }

    // Fault events are delivered to the BSP.
    mmio.write32(reg(state, REG_FEDATA), VEC_MSI_DMAR);
    mmio.write32(reg(state, REG_FEADDR), MSI_ADDR_BASE | (bsp_apic_id & 0xff) << 12);
    mmio.write32(reg(state, REG_FEUADDR), 0);
    mmio.write32(reg(state, REG_FECTL), 0);

    mmio.write64(reg(state, REG_RTADDR), root->phys);

    if (not command(state, GCMD_SRTP, 0)) {
        return unit_failed(state, "root table pointer not acknowledged");
    }

    if (not flush_ctx(state)) {
        return unit_failed(state, "cache invalidation timed out");
    }

    if (not command(state, GCMD_TE, 0)) {
        return unit_failed(state, "translation does not turn on");
    }

    trace(TRACE_IOMMU, "DMAR %#llx: %lu requester IDs in pass-through",
          static_cast<unsigned long long>(state.base), static_cast<unsigned long>(state.contexts));

    return true;
}

void Dmar::setup(Remap_unit_list const& list, uint32 bsp_apic_id, Dmar_state& state)
{
    Coverage coverage[NUM_DMAR];

    state.units.reset();
    state.protection = false;

    for (size_t i{0}; i < list.units.size(); i++) {
        Remap_unit const& unit{list.units[i]};
        Remap_unit_state& st{state.units.emplace_back()};

        st.base = unit.base;
        st.segment = unit.segment;
        st.include_all = unit.include_all;

        if (not unit.include_all) {
            claim(unit, coverage[i]);
        }
    }

    for (size_t i{0}; i < state.units.size(); i++) {
        Remap_unit_state& st{state.units[i]};
        bool const ok{configure(list, coverage, i, bsp_apic_id, st)};
        st.status = ok ? Remap_status::ACTIVE : Remap_status::FAILED;
    }

    state.protection = state.count(Remap_status::ACTIVE) != 0;

    trace(TRACE_IOMMU, "%lu of %lu remapping units active",
          static_cast<unsigned long>(state.count(Remap_status::ACTIVE)),
          static_cast<unsigned long>(state.units.size()));

    Atomic::store<bool, Atomic::RELEASE>(state.complete, true);
}

void Dmar::skip(Dmar_state& state)
{
    state.units.reset();
    state.protection = false;

    trace(TRACE_IOMMU, "DMA remapping is not available");

    Atomic::store<bool, Atomic::RELEASE>(state.complete, true);
}

bool Dma_gate::ready() const { return Atomic::load<bool, Atomic::ACQUIRE>(state.complete); }

Result_void<Dma_error> Dma_gate::enable_bus_master(Pci_bdf bdf)
{
    if (not ready()) {
        trace(TRACE_IOMMU | TRACE_ERROR, "Refusing bus mastering for %04x:%02x:%02x.%x before DMA remapping",
              bdf.seg, bdf.bus, bdf.dev, bdf.fn);
        return Err(Dma_error::IOMMU_NOT_READY);
    }

    uint16 const cmd{pci.read16(bdf, PCI_COMMAND)};
    pci.write16(bdf, PCI_COMMAND, static_cast<uint16>(cmd | PCI_COMMAND_MASTER));

    return Ok_void({});
}
