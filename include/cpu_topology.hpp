/*
 * CPU Topology
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

#include "algorithm.hpp"
#include "config.hpp"
#include "static_vector.hpp"
#include "types.hpp"

// The highest APIC ID an xAPIC can address. 0xff is the broadcast destination.
constexpr uint32 XAPIC_MAX_ID{0xfe};

enum class Cpu_state : uint8
{
    // Not started (yet).
    OFFLINE,

    // INIT/SIPI was sent and we wait for the CPU to report.
    BOOTING,

    ONLINE,

    // The CPU did not report for duty in time or cannot be reached.
    FAILED,
};

struct Cpu_info {
    uint32 acpi_id;
    uint32 apic_id;

    // Disabled CPUs are listed by firmware, but must not be started.
    bool enabled;
    bool bsp;

    Cpu_state state;
};

// The processors the firmware told us about.
//
// Each ACPI processor ID and APIC ID appears at most once.
class Cpu_topology
{
private:
    Static_vector<Cpu_info, NUM_CPU> cpus;

public:
    Cpu_info const* begin() const { return cpus.begin(); }
    Cpu_info const* end() const { return cpus.end(); }

    Cpu_info* begin() { return cpus.begin(); }
    Cpu_info* end() { return cpus.end(); }

    size_t size() const { return cpus.size(); }
    bool full() const { return cpus.full(); }

    Cpu_info& operator[](size_t i) { return cpus[i]; }
    Cpu_info const& operator[](size_t i) const { return cpus[i]; }

    // Add a CPU. Returns false for duplicates.
    bool add(Cpu_info const& cpu)
    {
        assert(not full());

        auto const same_cpu{
            [&cpu](Cpu_info const& c) { return c.acpi_id == cpu.acpi_id or c.apic_id == cpu.apic_id; }};

        if (any_of(cpus, same_cpu)) {
            return false;
        }

        cpus.push_back(cpu);
        return true;
    }

    // The index of the CPU with the given APIC ID or -1.
    long index_of_apic(uint32 apic_id) const
    {
        auto const it{find_if(cpus, [apic_id](Cpu_info const& c) { return c.apic_id == apic_id; })};
        return it == cpus.end() ? -1 : it - cpus.begin();
    }

    Cpu_info const* bsp() const
    {
        auto const it{find_if(cpus, [](Cpu_info const& c) { return c.bsp; })};
        return it == cpus.end() ? nullptr : it;
    }

    size_t count(Cpu_state state) const
    {
        return count_if(cpus, [state](Cpu_info const& c) { return c.state == state; });
    }

    void reset() { cpus.reset(); }
};
