/*
 * x86-specific Functions
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

#include "compiler.hpp"
#include "types.hpp"

// Tell the CPU that we are in a busy loop and that it can chill out.
//
// This function is not called pause, because this clashes with a function in unistd.h.
inline void relax() { __builtin_ia32_pause(); }

// Write the cache line that contains the given address back to memory.
inline void clflush(void const* ptr)
{
    asm volatile("clflush %0" : : "m"(*static_cast<char const*>(ptr)) : "memory");
}

inline uint64 rdtsc()
{
    uint32 h, l;
    asm volatile("rdtsc" : "=a"(l), "=d"(h));
    return static_cast<uint64>(h) << 32 | l;
}

inline void cpuid(unsigned leaf, uint32& eax, uint32& ebx, uint32& ecx, uint32& edx)
{
    asm volatile("cpuid" : "=a"(eax), "=b"(ebx), "=c"(ecx), "=d"(edx) : "a"(leaf), "c"(0));
}

// Return the initial APIC ID of the current CPU.
//
// This works before the Local APIC is mapped.
inline unsigned early_apic_id()
{
    uint32 eax, ebx, ecx, edx;
    cpuid(1, eax, ebx, ecx, edx);

    return ebx >> 24;
}
