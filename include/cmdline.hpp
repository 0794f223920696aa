/*
 * Command Line Parser
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

// Boot command line switches.
//
// All switches default to off and are only ever set by init(), which runs once on the bootstrap processor
// before any other CPU is started.
class Cmdline
{
private:
    struct param_map {
        char const* arg;
        bool* const ptr;
    };

    static param_map const map[];

    static char const* get_arg(char const** line, size_t& len);

public:
    // Do not look at ACPI tables. The platform comes up with the legacy PIC and a single CPU.
    static inline bool noacpi;

    // Do not start application processors.
    static inline bool nosmp;

    // Leave DMA remapping hardware alone.
    static inline bool noiommu;

    // Ignore the HPET table.
    static inline bool nohpet;

    static void init(char const* line);

    // Reset all switches to their defaults.
    static void reset();
};
