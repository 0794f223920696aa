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

#pragma once

#include "compiler.hpp"
#include "io.hpp"
#include "optional.hpp"
#include "types.hpp"

// Services the platform bring-up code consumes from the rest of the kernel.
//
// These are abstract so the bring-up code can run against real hardware as well as against the fakes in
// the unit tests.

// Makes physical memory accessible.
class Phys_mem
{
public:
    virtual ~Phys_mem() = default;

    // Map size bytes of physical memory starting at phys.
    //
    // Returns nullptr, if the range cannot be mapped. Mappings stay valid until the end of platform
    // bring-up.
    virtual void* map(Paddr phys, size_t size) = 0;
};

// Memory-mapped device registers.
class Mmio
{
public:
    virtual ~Mmio() = default;

    virtual uint32 read32(Paddr reg) = 0;
    virtual void write32(Paddr reg, uint32 val) = 0;

    virtual uint64 read64(Paddr reg) = 0;
    virtual void write64(Paddr reg, uint64 val) = 0;
};

// The x86 I/O port space.
class Port_io
{
public:
    virtual ~Port_io() = default;

    virtual uint8 in8(uint16 port) = 0;
    virtual uint16 in16(uint16 port) = 0;
    virtual uint32 in32(uint16 port) = 0;

    virtual void out8(uint16 port, uint8 val) = 0;
    virtual void out16(uint16 port, uint16 val) = 0;
    virtual void out32(uint16 port, uint32 val) = 0;
};

// A busy wait that works with interrupts disabled.
class Delay
{
public:
    virtual ~Delay() = default;

    virtual void delay_us(uint64 us) = 0;
};

// A page of physical memory together with its kernel mapping.
struct Frame {
    Paddr phys;
    void* virt;
};

class Frame_alloc
{
public:
    virtual ~Frame_alloc() = default;

    // Allocate one zeroed 4 KiB page.
    virtual Optional<Frame> alloc_zeroed_page() = 0;
};

// A PCI function address.
struct Pci_bdf {
    uint16 seg;
    uint8 bus;
    uint8 dev;
    uint8 fn;

    // The 16-bit requester ID as it is used by the IOMMU.
    uint16 rid() const { return static_cast<uint16>(bus << 8 | (dev & 0x1f) << 3 | (fn & 0x7)); }

    bool operator==(Pci_bdf const& o) const
    {
        return seg == o.seg and bus == o.bus and dev == o.dev and fn == o.fn;
    }
};

// PCI configuration space.
class Pci_cfg
{
public:
    virtual ~Pci_cfg() = default;

    virtual uint8 read8(Pci_bdf bdf, unsigned reg) = 0;
    virtual uint16 read16(Pci_bdf bdf, unsigned reg) = 0;
    virtual uint32 read32(Pci_bdf bdf, unsigned reg) = 0;

    virtual void write16(Pci_bdf bdf, unsigned reg, uint16 val) = 0;
};

// Port I/O with the in and out instructions.
class Port_io_x86 final : public Port_io
{
public:
    uint8 in8(uint16 port) override { return Io::in<uint8>(port); }
    uint16 in16(uint16 port) override { return Io::in<uint16>(port); }
    uint32 in32(uint16 port) override { return Io::in<uint32>(port); }

    void out8(uint16 port, uint8 val) override { Io::out<uint8>(port, val); }
    void out16(uint16 port, uint16 val) override { Io::out<uint16>(port, val); }
    void out32(uint16 port, uint32 val) override { Io::out<uint32>(port, val); }
};

// Device registers accessed through the physical memory mapping service.
class Mmio_phys final : public Mmio
{
private:
    Phys_mem& mem;

    template <typename T> T volatile* reg_ptr(Paddr reg);

public:
    explicit Mmio_phys(Phys_mem& mem_) : mem(mem_) {}

    uint32 read32(Paddr reg) override;
    void write32(Paddr reg, uint32 val) override;

    uint64 read64(Paddr reg) override;
    void write64(Paddr reg, uint64 val) override;
};

// PCI configuration mechanism #1 (ports 0xcf8/0xcfc). Only segment 0 is reachable this way.
class Pci_cfg_io final : public Pci_cfg
{
private:
    enum
    {
        PCI_CFG_ADDR = 0xcf8,
        PCI_CFG_DATA = 0xcfc,
    };

    Port_io& io;

    void select(Pci_bdf bdf, unsigned reg);

public:
    explicit Pci_cfg_io(Port_io& io_) : io(io_) {}

    uint8 read8(Pci_bdf bdf, unsigned reg) override;
    uint16 read16(Pci_bdf bdf, unsigned reg) override;
    uint32 read32(Pci_bdf bdf, unsigned reg) override;

    void write16(Pci_bdf bdf, unsigned reg, uint16 val) override;
};
