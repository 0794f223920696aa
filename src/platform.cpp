/*
 * Platform Services
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

#include "platform.hpp"
#include "panic.hpp"

template <typename T> T volatile* Mmio_phys::reg_ptr(Paddr reg)
{
    void* const ptr{mem.map(reg, sizeof(T))};

    // Device register windows come from firmware tables we already validated. Not being able to reach
    // them leaves us without interrupt or IOMMU control.
    if (EXPECT_FALSE(ptr == nullptr)) {
        panic("Cannot map device register at %#llx", static_cast<unsigned long long>(reg));
    }

    return static_cast<T volatile*>(ptr);
}

uint32 Mmio_phys::read32(Paddr reg) { return *reg_ptr<uint32>(reg); }
void Mmio_phys::write32(Paddr reg, uint32 val) { *reg_ptr<uint32>(reg) = val; }

uint64 Mmio_phys::read64(Paddr reg) { return *reg_ptr<uint64>(reg); }
void Mmio_phys::write64(Paddr reg, uint64 val) { *reg_ptr<uint64>(reg) = val; }

void Pci_cfg_io::select(Pci_bdf bdf, unsigned reg)
{
    io.out32(PCI_CFG_ADDR, 1U << 31 | static_cast<uint32>(bdf.rid()) << 8 | (reg & 0xfc));
}

uint8 Pci_cfg_io::read8(Pci_bdf bdf, unsigned reg)
{
    select(bdf, reg);
    return io.in8(static_cast<uint16>(PCI_CFG_DATA + (reg & 3)));
}

uint16 Pci_cfg_io::read16(Pci_bdf bdf, unsigned reg)
{
    select(bdf, reg);
    return io.in16(static_cast<uint16>(PCI_CFG_DATA + (reg & 2)));
}

uint32 Pci_cfg_io::read32(Pci_bdf bdf, unsigned reg)
{
    select(bdf, reg);
    return io.in32(PCI_CFG_DATA);
}

void Pci_cfg_io::write16(Pci_bdf bdf, unsigned reg, uint16 val)
{
    select(bdf, reg);
    io.out16(static_cast<uint16>(PCI_CFG_DATA + (reg & 2)), val);
}
