/*
 * Fake Hardware for Unit Tests
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

#include "lapic.hpp"
#include "platform.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

// Physical memory made of a few byte arrays. The first MiB always exists.
class Fake_phys_mem final : public Phys_mem
{
private:
    struct Region {
        Paddr base;
        std::vector<uint8_t> bytes;
    };

    std::vector<std::unique_ptr<Region>> regions;

public:
    static constexpr Paddr LOW_MEMORY_SIZE{0x100000};

    Fake_phys_mem() { add_region(0, LOW_MEMORY_SIZE); }

    uint8_t* add_region(Paddr base, size_t size)
    {
        regions.push_back(std::make_unique<Region>(Region{base, std::vector<uint8_t>(size, 0)}));
        return regions.back()->bytes.data();
    }

    // Returns nullptr if [addr, addr + size) is not backed by a single region.
    uint8_t* at(Paddr addr, size_t size = 1)
    {
        for (auto const& r : regions) {
            if (addr >= r->base and addr + size <= r->base + r->bytes.size()) {
                return r->bytes.data() + (addr - r->base);
            }
        }

        return nullptr;
    }

    void write(Paddr addr, std::vector<uint8_t> const& bytes)
    {
        uint8_t* const dst{at(addr, bytes.size())};

        if (dst == nullptr) {
            throw std::out_of_range("fake physical memory is not backed");
        }

        memcpy(dst, bytes.data(), bytes.size());
    }

    void* map(Paddr phys, size_t size) override { return at(phys, size); }
};

// A device that claims a window of MMIO space.
class Fake_mmio_device
{
public:
    virtual ~Fake_mmio_device() = default;

    virtual uint64 read(Paddr offset, unsigned bytes) = 0;
    virtual void write(Paddr offset, uint64 val, unsigned bytes) = 0;
};

class Fake_mmio final : public Mmio
{
private:
    struct Window {
        Paddr base;
        size_t size;
        Fake_mmio_device* dev;
    };

    std::vector<Window> windows;

    Window* find(Paddr addr)
    {
        for (Window& w : windows) {
            if (addr >= w.base and addr < w.base + w.size) {
                return &w;
            }
        }

        return nullptr;
    }

    uint64 read(Paddr addr, unsigned bytes)
    {
        Window* const w{find(addr)};
        return w != nullptr ? w->dev->read(addr - w->base, bytes) : ~uint64{0};
    }

    void write(Paddr addr, uint64 val, unsigned bytes)
    {
        Window* const w{find(addr)};

        if (w == nullptr) {
            unclaimed_writes.push_back(addr);
            return;
        }

        w->dev->write(addr - w->base, val, bytes);
    }

public:
    // Writes that did not hit any device.
    std::vector<Paddr> unclaimed_writes;

    void attach(Paddr base, size_t size, Fake_mmio_device& dev) { windows.push_back({base, size, &dev}); }

    uint32 read32(Paddr reg) override { return static_cast<uint32>(read(reg, 4)); }
    void write32(Paddr reg, uint32 val) override { write(reg, val, 4); }

    uint64 read64(Paddr reg) override { return read(reg, 8); }
    void write64(Paddr reg, uint64 val) override { write(reg, val, 8); }
};

// A Local APIC that records the IPIs it is asked to send.
class Fake_lapic final : public Fake_mmio_device
{
public:
    static constexpr size_t SIZE{0x1000};

    struct Ipi {
        uint32 dest;
        uint32 mode;
        uint8 vector;
        bool level_triggered;
    };

    std::map<Paddr, uint32> regs;
    std::vector<Ipi> ipis;

    // Called for every IPI after it was recorded.
    std::function<void(Ipi const&)> on_ipi;

    // The delivery status bit never clears.
    bool stuck{false};

    explicit Fake_lapic(uint32 apic_id, unsigned max_lvt = 5)
    {
        regs[Lapic::OFFSET_ID] = apic_id << 24;
        regs[Lapic::OFFSET_VERSION] = max_lvt << 16 | 0x14;
    }

    uint32 reg(Paddr offset) const
    {
        auto const it{regs.find(offset)};
        return it == regs.end() ? 0 : it->second;
    }

    size_t count(uint32 mode) const
    {
        size_t n{0};

        for (Ipi const& ipi : ipis) {
            n += ipi.mode == mode ? 1 : 0;
        }

        return n;
    }

    uint64 read(Paddr offset, unsigned) override
    {
        uint32 const val{reg(offset)};
        return offset == Lapic::OFFSET_ICR_LO and stuck ? val | 1u << 12 : val;
    }

    void write(Paddr offset, uint64 val, unsigned) override
    {
        regs[offset] = static_cast<uint32>(val);

        if (offset != Lapic::OFFSET_ICR_LO) {
            return;
        }

        uint32 const lo{static_cast<uint32>(val)};
        Ipi const ipi{reg(Lapic::OFFSET_ICR_HI) >> 24, lo & 0x700, static_cast<uint8>(lo),
                      (lo & 1u << 15) != 0};

        ipis.push_back(ipi);

        if (on_ipi) {
            on_ipi(ipi);
        }
    }
};

// An IOAPIC behind its index and data window.
class Fake_ioapic final : public Fake_mmio_device
{
private:
    uint32 index{0};

    uint32 reg(uint32 idx) const
    {
        if (idx == 0) {
            return static_cast<uint32>(id) << 24;
        }

        if (idx == 1) {
            return static_cast<uint32>(irt.size() - 1) << 16 | 0x20;
        }

        if (idx >= 0x10 and idx < 0x10 + 2 * irt.size()) {
            uint64 const entry{irt[(idx - 0x10) / 2]};
            return static_cast<uint32>(idx % 2 ? entry >> 32 : entry);
        }

        return 0;
    }

public:
    static constexpr size_t SIZE{0x20};

    uint8 id;
    std::vector<uint64> irt;

    Fake_ioapic(uint8 id_, unsigned pins) : id(id_), irt(pins, uint64{1} << 16) {}

    uint64 read(Paddr offset, unsigned) override { return offset == 0 ? index : reg(index); }

    void write(Paddr offset, uint64 val, unsigned) override
    {
        if (offset == 0) {
            index = static_cast<uint32>(val);
            return;
        }

        if (offset != 0x10 or index < 0x10 or index >= 0x10 + 2 * irt.size()) {
            return;
        }

        uint64& entry{irt[(index - 0x10) / 2]};

        if (index % 2) {
            entry = (entry & 0xffffffffu) | val << 32;
        } else {
            entry = (entry & ~uint64{0xffffffffu}) | (val & 0xffffffffu);
        }
    }
};

// A VT-d remapping unit with register-based invalidation.
class Fake_dmar_unit final : public Fake_mmio_device
{
public:
    static constexpr size_t SIZE{0x1000};
    static constexpr Paddr IOTLB_OFFSET{0x100};

    enum : uint32
    {
        STS_RTPS = 1u << 30,
        STS_TES = 1u << 31,
    };

    uint64 cap;
    uint64 ecap;

    uint32 gsts{0};
    uint64 rtaddr{0};
    uint64 ccmd{0};
    uint64 iotlb{0};

    uint32 fectl{1u << 31};
    uint32 fedata{0};
    uint32 feaddr{0};
    uint32 feuaddr{0};

    // Commands take effect. If false, the unit never acknowledges anything.
    bool responsive{true};

    std::vector<uint32> gcmd_writes;
    unsigned context_invalidations{0};
    unsigned iotlb_invalidations{0};

    // By default the unit supports 48-bit address widths, pass-through and coherent table walks.
    explicit Fake_dmar_unit(bool pass_through = true)
        : cap(uint64{1} << 10), ecap((IOTLB_OFFSET / 16) << 8 | (pass_through ? 1u << 6 : 0) | 1u)
    {
    }

    bool translating() const { return gsts & STS_TES; }

    uint64 read(Paddr offset, unsigned) override
    {
        switch (offset) {
        case 0x0:
            return 0x10;
        case 0x8:
            return cap;
        case 0x10:
            return ecap;
        case 0x1c:
            return gsts;
        case 0x20:
            return rtaddr;
        case 0x28:
            return ccmd;
        case 0x38:
            return fectl;
        case 0x3c:
            return fedata;
        case 0x40:
            return feaddr;
        case 0x44:
            return feuaddr;
        case IOTLB_OFFSET + 8:
            return iotlb;
        }

        return 0;
    }

    void write(Paddr offset, uint64 val, unsigned) override
    {
        switch (offset) {
        case 0x18:
            gcmd_writes.push_back(static_cast<uint32>(val));

            if (responsive) {
                gsts = (gsts & ~STS_TES) | (static_cast<uint32>(val) & STS_TES);
                gsts |= val & STS_RTPS ? STS_RTPS : 0;
            }
            break;
        case 0x20:
            rtaddr = val;
            break;
        case 0x28:
            ccmd = val;

            if (responsive) {
                ccmd &= ~(uint64{1} << 63);
                context_invalidations++;
            }
            break;
        case 0x38:
            fectl = static_cast<uint32>(val);
            break;
        case 0x3c:
            fedata = static_cast<uint32>(val);
            break;
        case 0x40:
            feaddr = static_cast<uint32>(val);
            break;
        case 0x44:
            feuaddr = static_cast<uint32>(val);
            break;
        case IOTLB_OFFSET + 8:
            iotlb = val;

            if (responsive) {
                iotlb &= ~(uint64{1} << 63);
                iotlb_invalidations++;
            }
            break;
        }
    }
};

class Fake_port_io final : public Port_io
{
private:
    uint32 in(uint16 port, uint32 all_ones)
    {
        auto const it{values.find(port)};
        return it == values.end() ? all_ones : it->second;
    }

    void out(uint16 port, uint32 val, unsigned bytes)
    {
        writes.push_back({port, val, bytes});
        values[port] = val;

        if (on_write) {
            on_write(port, val);
        }
    }

public:
    struct Access {
        uint16 port;
        uint32 value;
        unsigned bytes;
    };

    std::vector<Access> writes;

    // What reads return. Ports that were never written read as all ones.
    std::map<uint16, uint32> values;

    std::function<void(uint16, uint32)> on_write;

    std::vector<uint32> writes_to(uint16 port) const
    {
        std::vector<uint32> result;

        for (Access const& a : writes) {
            if (a.port == port) {
                result.push_back(a.value);
            }
        }

        return result;
    }

    uint8 in8(uint16 port) override { return static_cast<uint8>(in(port, 0xff)); }
    uint16 in16(uint16 port) override { return static_cast<uint16>(in(port, 0xffff)); }
    uint32 in32(uint16 port) override { return in(port, 0xffffffff); }

    void out8(uint16 port, uint8 val) override { out(port, val, 1); }
    void out16(uint16 port, uint16 val) override { out(port, val, 2); }
    void out32(uint16 port, uint32 val) override { out(port, val, 4); }
};

// Time only passes when somebody waits.
class Fake_delay final : public Delay
{
public:
    uint64 elapsed_us{0};

    // Called after every wait with the total elapsed time.
    std::function<void(uint64)> on_delay;

    void delay_us(uint64 us) override
    {
        elapsed_us += us;

        if (on_delay) {
            on_delay(elapsed_us);
        }
    }
};

class Fake_frame_alloc final : public Frame_alloc
{
private:
    struct alignas(4096) Page {
        uint8_t bytes[4096];
    };

    std::vector<std::unique_ptr<Page>> pages;

public:
    static constexpr Paddr BASE{0x40000000};

    // Allocation fails once this many pages are handed out.
    size_t limit{~size_t{0}};

    Optional<Frame> alloc_zeroed_page() override
    {
        if (pages.size() >= limit) {
            return {};
        }

        pages.push_back(std::make_unique<Page>());
        memset(pages.back()->bytes, 0, sizeof(Page));

        return Frame{BASE + (pages.size() - 1) * sizeof(Page), pages.back()->bytes};
    }

    size_t allocated() const { return pages.size(); }

    void* virt(Paddr phys) const
    {
        size_t const idx{static_cast<size_t>((phys - BASE) / sizeof(Page))};

        if (phys < BASE or idx >= pages.size()) {
            return nullptr;
        }

        return pages[idx]->bytes + (phys - BASE) % sizeof(Page);
    }
};

// Configuration space of a handful of PCI functions.
class Fake_pci_cfg final : public Pci_cfg
{
private:
    std::map<uint32, std::array<uint8_t, 256>> functions;

    static uint32 key(Pci_bdf bdf) { return static_cast<uint32>(bdf.seg) << 16 | bdf.rid(); }

    std::array<uint8_t, 256>* find(Pci_bdf bdf)
    {
        auto const it{functions.find(key(bdf))};
        return it == functions.end() ? nullptr : &it->second;
    }

    uint32 read(Pci_bdf bdf, unsigned reg, unsigned bytes)
    {
        auto* const cfg{find(bdf)};

        if (cfg == nullptr) {
            return ~uint32{0};
        }

        uint32 val{0};
        memcpy(&val, cfg->data() + reg, bytes);
        return val;
    }

public:
    void add_device(Pci_bdf bdf, uint16 vendor = 0x8086)
    {
        auto& cfg{functions[key(bdf)]};

        cfg.fill(0);
        memcpy(cfg.data(), &vendor, sizeof(vendor));
    }

    void add_bridge(Pci_bdf bdf, uint8 secondary, uint8 subordinate)
    {
        add_device(bdf);

        auto& cfg{functions[key(bdf)]};

        cfg[0x0e] = 0x01;
        cfg[0x19] = secondary;
        cfg[0x1a] = subordinate;
    }

    uint16 command(Pci_bdf bdf) { return static_cast<uint16>(read(bdf, 0x4, 2)); }

    uint8 read8(Pci_bdf bdf, unsigned reg) override { return static_cast<uint8>(read(bdf, reg, 1)); }
    uint16 read16(Pci_bdf bdf, unsigned reg) override { return static_cast<uint16>(read(bdf, reg, 2)); }
    uint32 read32(Pci_bdf bdf, unsigned reg) override { return read(bdf, reg, 4); }

    void write16(Pci_bdf bdf, unsigned reg, uint16 val) override
    {
        auto* const cfg{find(bdf)};

        if (cfg != nullptr) {
            memcpy(cfg->data() + reg, &val, sizeof(val));
        }
    }
};
