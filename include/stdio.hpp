/*
 * Tracing
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

#include "console.hpp"
#include "string.hpp"

// Returns the APIC ID of the CPU that emits a trace message.
//
// This function is only intended to be called from the trace macro below.
int trace_id();

// Emit a log message to all configured consoles.
//
// The first parameter is one of the TRACE_ values defined below. Messages will only be printed, if the trace
// value is included in trace_mask.
#define trace(T, format, ...)                                                                                \
    do {                                                                                                     \
        if (EXPECT_FALSE((trace_mask & (T)) == (T))) {                                                       \
            Console::print("[%3d][%s:%d] " format, trace_id(), FILENAME, __LINE__, ##__VA_ARGS__);           \
        }                                                                                                    \
    } while (0)

// Possible trace events.
enum
{
    TRACE_CPU = 1UL << 0,
    TRACE_IOMMU = 1UL << 1,
    TRACE_APIC = 1UL << 2,
    TRACE_SMP = 1UL << 3,
    TRACE_ACPI = 1UL << 8,
    TRACE_PCI = 1UL << 14,
    TRACE_ERROR = 1UL << 31,
};

// Enabled trace events.
constexpr unsigned trace_mask =
#ifdef DEBUG
    TRACE_PCI |
#endif
    TRACE_CPU | TRACE_IOMMU | TRACE_APIC | TRACE_SMP | TRACE_ACPI | TRACE_ERROR;
