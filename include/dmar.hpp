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

#pragma once

#include "acpi_dmar.hpp"
#include "bitmap.hpp"
#include "config.hpp"
#include "memory.hpp"
#include "platform.hpp"
#include "result.hpp"
#include "static_vector.hpp"
#include "x86.hpp"

enum class Dma_error
{
    // DMA remapping has not been configured yet.
    IOMMU_NOT_READY,
};

enum class Remap_status : uint8
{
    PENDING,
    ACTIVE,
    FAILED,
};

// What happened to one remapping hardware unit.
struct Remap_unit_state {
    Paddr base{0};
    uint16 segment{0};
    bool include_all{false};

    uint64 cap{0};
    uint64 ecap{0};

    Remap_status status{Remap_status::PENDING};
    Paddr root_table{0};

    // The number of requester IDs that have a pass-through context entry.
    size_t contexts{0};
};

struct Dmar_state {
    // Written once by the configurator. Use Dma_gate to look at it.
    bool complete{false};

    // At least one unit translates DMA.
    bool protection{false};

    Static_vector<Remap_unit_state, NUM_DMAR> units;

    size_t count(Remap_status status) const;
};

// A root or context table entry.
class Dmar_ctx
{
private:
    uint64 lo, hi;

public:
    enum
    {
        PRESENT = 1u << 0,

        // Translation type 10b: requests bypass translation.
        TT_PASS_THROUGH = 2u << 2,

        DID_SHIFT = 8,
    };

    bool present() const { return lo & PRESENT; }

    Paddr addr() const { return static_cast<Paddr>(lo) & ~static_cast<Paddr>(PAGE_MASK); }

    uint64 low() const { return lo; }
    uint64 high() const { return hi; }

    void set(uint64 h, uint64 l, bool flush)
    {
        hi = h;
        lo = l;

        if (flush) {
            clflush(this);
        }
    }
};

static_assert(sizeof(Dmar_ctx) == 16, "DMAR table entries must be 16 bytes");

// Configures the VT-d remapping hardware units found in the DMAR table.
//
// All devices end up in a single pass-through domain. This keeps DMA working for drivers that do not know
// about the IOMMU while the remapping structures are in place for later per-device isolation.
class Dmar
{
private:
    Mmio& mmio;
    Delay& delay;
    Frame_alloc& frames;
    Pci_cfg& pci;

    enum Reg
    {
        REG_VER = 0x0,
        REG_CAP = 0x8,
        REG_ECAP = 0x10,
        REG_GCMD = 0x18,
        REG_GSTS = 0x1c,
        REG_RTADDR = 0x20,
        REG_CCMD = 0x28,
        REG_FSTS = 0x34,
        REG_FECTL = 0x38,
        REG_FEDATA = 0x3c,
        REG_FEADDR = 0x40,
        REG_FEUADDR = 0x44,
    };

    enum Tlb
    {
        REG_IVA = 0x0,
        REG_IOTLB = 0x8,
    };

    enum Cmd : uint32
    {
        GCMD_SRTP = 1u << 30,
        GCMD_TE = 1u << 31,
    };

    enum Sts : uint32
    {
        GSTS_RTPS = 1u << 30,
        GSTS_TES = 1u << 31,

        // Status bits that reflect one-shot commands and must not be written back to GCMD.
        GSTS_ONE_SHOT = 0x69000000,
    };

    enum : uint64
    {
        CCMD_ICC = 1ull << 63,
        CCMD_GLOBAL = 1ull << 61,

        IOTLB_IVT = 1ull << 63,
        IOTLB_GLOBAL = 1ull << 60,

        ECAP_C = 1ull << 0,
        ECAP_PT = 1ull << 6,
    };

    // Everything a scoped unit claims on its segment.
    struct Coverage {
        Bitmap<uint64, NUM_PCI_BUS> buses{false};
        Static_vector<uint16, NUM_DMAR_SCOPE> rids;

        bool claims(uint16 rid) const;
    };

    Paddr reg(Remap_unit_state const& unit, Reg r) const { return unit.base + r; }

    // The IOTLB registers sit at the offset the extended capabilities report.
    Paddr reg(Remap_unit_state const& unit, Tlb r) const
    {
        return unit.base + ((unit.ecap >> 8 & 0x3ff) << 4) + r;
    }

    // Poll until done() holds. Returns false after HW_ACK_TIMEOUT_US.
    template <typename FN> bool wait_for(FN done);

    // Issue a global command and wait for the status register to reflect it.
    bool command(Remap_unit_state const& unit, uint32 set, uint32 clear);

    bool flush_ctx(Remap_unit_state const& unit);

    // The adjusted guest address width encoding we use for context entries, or -1.
    static int address_width(uint64 cap);

    // Follow a device scope path through PCI-to-PCI bridges.
    Optional<Pci_bdf> resolve(uint16 segment, Dmar_scope const& scope);

    void claim(Remap_unit const& unit, Coverage& coverage);

    // Fill the root table with pass-through context entries for everything unit self covers.
    bool install_contexts(Remap_unit_list const& list, Coverage const* coverage, size_t self,
                          Frame const& root, uint64 ctx_hi, Remap_unit_state& state);

    bool configure(Remap_unit_list const& list, Coverage const* coverage, size_t self, uint32 bsp_apic_id,
                   Remap_unit_state& state);

public:
    static constexpr uint16 DOMAIN_ID{1};
    static constexpr uint32 POLL_US{10};

    Dmar(Mmio& mmio_, Delay& delay_, Frame_alloc& frames_, Pci_cfg& pci_)
        : mmio(mmio_), delay(delay_), frames(frames_), pci(pci_)
    {
    }

    // Configure every unit in the list and report completion.
    //
    // Units that lack pass-through support, run out of memory or do not acknowledge a command are marked
    // as failed. The others translate DMA when this returns.
    void setup(Remap_unit_list const& list, uint32 bsp_apic_id, Dmar_state& state);

    // Report completion without any remapping hardware.
    static void skip(Dmar_state& state);
};

// Lets drivers turn on bus mastering once DMA remapping is in place.
class Dma_gate
{
private:
    Dmar_state const& state;
    Pci_cfg& pci;

public:
    enum
    {
        PCI_COMMAND = 0x4,
        PCI_COMMAND_MASTER = 1u << 2,
    };

    Dma_gate(Dmar_state const& state_, Pci_cfg& pci_) : state(state_), pci(pci_) {}

    bool ready() const;

    // Whether DMA actually goes through an IOMMU. Only meaningful once ready() is true.
    bool protection() const { return state.protection; }

    Result_void<Dma_error> enable_bus_master(Pci_bdf bdf);
};
