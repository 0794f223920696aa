/*
 * Platform Bring-up Unit Tests
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

#include "platform_init.hpp"
#include "acpi_test_tables.hpp"
#include "cmdline.hpp"
#include "fake_platform.hpp"

#include <catch2/catch.hpp>

#include <map>

namespace
{

constexpr Paddr LAPIC_BASE{0xfee00000};
constexpr Paddr IOAPIC_BASE{0xfec00000};
constexpr Paddr DMAR_BASE{0xfed90000};
constexpr Paddr TRAMPOLINE{0x8000};

// Command line switches are global. Every test starts and ends without any.
struct Cmdline_guard {
    explicit Cmdline_guard(char const* line)
    {
        Cmdline::reset();
        Cmdline::init(line);
    }

    ~Cmdline_guard() { Cmdline::reset(); }
};

// A two-CPU machine with one IOAPIC, an HPET and an include-all remapping unit.
struct Machine {
    Fake_firmware fw;
    Fake_mmio mmio;
    Fake_port_io io;
    Fake_delay delay;
    Fake_frame_alloc frames;
    Fake_pci_cfg pci;

    Fake_lapic lapic{0};
    Fake_ioapic ioapic{2, 24};
    Fake_dmar_unit iommu;

    Platform_init init{{fw.mem, mmio, io, delay, frames, pci}};
    Platform_config cfg;
    Platform_info info;

    std::map<uint32, unsigned> sipis;

    Machine()
    {
        mmio.attach(LAPIC_BASE, Fake_lapic::SIZE, lapic);
        mmio.attach(IOAPIC_BASE, Fake_ioapic::SIZE, ioapic);
        mmio.attach(DMAR_BASE, Fake_dmar_unit::SIZE, iommu);

        cfg.ap_trampoline = TRAMPOLINE;

        // Application processors report in after their second SIPI.
        lapic.on_ipi = [this](Fake_lapic::Ipi const& ipi) {
            if (ipi.mode == Lapic::DLV_SIPI and ++sipis[ipi.dest] == 2) {
                init.ap_online(ipi.dest);
            }
        };
    }

    void install_firmware(Bytes const& madt)
    {
        Bytes const dmar{Dmar_builder{}.drhd(DMAR_BASE, true).build()};
        fw.install({madt, make_fadt({}), make_hpet(0xfed00000), dmar});
    }

    void install_firmware()
    {
        install_firmware(Madt_builder{}
                             .lapic(0, 0)
                             .lapic(1, 1)
                             .ioapic(2, static_cast<uint32_t>(IOAPIC_BASE), 0)
                             .irq_override(0, 2)
                             .build());
    }

    void run() { init.run(cfg, info); }
};

void check_legacy(Machine const& m)
{
    CHECK_FALSE(m.info.acpi);
    CHECK(m.info.intr.mode == Intr_mode::LEGACY_PIC);

    REQUIRE(m.info.cpus.size() == 1);
    CHECK(m.info.cpus[0].bsp);
    CHECK(m.info.cpus[0].state == Cpu_state::ONLINE);

    CHECK(m.lapic.ipis.empty());

    // Bus mastering is allowed, but nothing protects memory.
    CHECK(m.info.dmar.complete);
    CHECK_FALSE(m.info.dmar.protection);
    CHECK_FALSE(m.iommu.translating());
}

} // namespace

TEST_CASE("A complete platform comes up with all CPUs and DMA remapping", "[platform]")
{
    Cmdline_guard const cmdline{""};
    Machine m;

    m.install_firmware();
    m.run();

    CHECK(m.info.acpi);
    CHECK_FALSE(m.info.acpi_error.has_value());
    CHECK(m.info.acpi_info.hpet.has_value());

    CHECK(m.info.intr.mode == Intr_mode::APIC);
    CHECK(m.info.intr.lapic_base == LAPIC_BASE);
    REQUIRE(m.info.intr.ioapics.size() == 1);
    CHECK(m.info.intr.routing.irq_to_gsi(0) == 2);

    REQUIRE(m.info.cpus.size() == 2);
    CHECK(m.info.cpus.count(Cpu_state::ONLINE) == 2);
    CHECK(m.info.smp.attempted == 1);
    CHECK(m.info.smp.online == 1);

    REQUIRE(m.info.dmar.units.size() == 1);
    CHECK(m.info.dmar.units[0].status == Remap_status::ACTIVE);
    CHECK(m.info.dmar.protection);
    CHECK(m.iommu.translating());

    Pci_bdf const nic{0, 3, 0, 0};
    m.pci.add_device(nic);

    Dma_gate gate{m.info.dmar, m.pci};
    CHECK(gate.protection());
    CHECK(gate.enable_bus_master(nic).is_ok());
}

TEST_CASE("Platforms without usable ACPI tables run in legacy mode", "[platform]")
{
    SECTION("ACPI disabled on the command line")
    {
        Cmdline_guard const cmdline{"nosmp noacpi"};
        Machine m;

        m.cfg.bsp_apic_id = 3;
        m.install_firmware();
        m.run();

        check_legacy(m);
        CHECK_FALSE(m.info.acpi_error.has_value());
        CHECK(m.info.cpus[0].apic_id == 3);
    }

    SECTION("No RSDP")
    {
        Cmdline_guard const cmdline{""};
        Machine m;

        m.run();

        check_legacy(m);
        REQUIRE(m.info.acpi_error.has_value());
        CHECK(*m.info.acpi_error == Acpi_error::NOT_FOUND);
    }

    SECTION("A corrupt MADT")
    {
        Cmdline_guard const cmdline{""};
        Machine m;

        m.install_firmware(Madt_builder{}.lapic(0, 0).lapic(1, 1).raw({1, 40}).build());
        m.run();

        check_legacy(m);
        REQUIRE(m.info.acpi_error.has_value());
        CHECK(*m.info.acpi_error == Acpi_error::RECORD_DESYNC);
        CHECK_FALSE(m.info.acpi_info.have_dmar);
    }
}

TEST_CASE("Command line switches turn off parts of the bring-up", "[platform]")
{
    SECTION("nosmp")
    {
        Cmdline_guard const cmdline{"nosmp"};
        Machine m;

        m.install_firmware();
        m.run();

        CHECK(m.info.intr.mode == Intr_mode::APIC);
        CHECK(m.info.smp.attempted == 0);
        CHECK(m.info.cpus[1].state == Cpu_state::OFFLINE);
        CHECK(m.lapic.ipis.empty());
    }

    SECTION("noiommu")
    {
        Cmdline_guard const cmdline{"noiommu"};
        Machine m;

        m.install_firmware();
        m.run();

        CHECK(m.info.dmar.complete);
        CHECK(m.info.dmar.units.empty());
        CHECK_FALSE(m.info.dmar.protection);
        CHECK_FALSE(m.iommu.translating());
        CHECK(m.info.smp.online == 1);
    }

    SECTION("nohpet")
    {
        Cmdline_guard const cmdline{"nohpet"};
        Machine m;

        m.install_firmware();
        m.run();

        CHECK(m.info.acpi);
        CHECK_FALSE(m.info.acpi_info.hpet.has_value());
    }
}

TEST_CASE("A platform without a MADT runs on the bootstrap processor", "[platform]")
{
    Cmdline_guard const cmdline{""};
    Machine m;

    m.cfg.bsp_apic_id = 5;
    m.fw.install({make_fadt({})});
    m.run();

    CHECK(m.info.acpi);
    CHECK(m.info.intr.mode == Intr_mode::LEGACY_PIC);

    REQUIRE(m.info.cpus.size() == 1);
    CHECK(m.info.cpus[0].apic_id == 5);
    CHECK(m.lapic.ipis.empty());
}

TEST_CASE("Unexpected processors are ignored", "[platform]")
{
    Cmdline_guard const cmdline{""};
    Machine m;

    m.init.ap_online(1);
    m.install_firmware();
    m.run();

    CHECK(m.info.smp.online == 1);
}
