/*
 * Mathematical Functions
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

template <typename T> constexpr T min(T v1, T v2) { return v1 < v2 ? v1 : v2; }

template <typename T> constexpr T max(T v1, T v2) { return v1 > v2 ? v1 : v2; }

constexpr inline uint64 align_dn(uint64 val, uint64 align)
{
    val &= ~(align - 1); // Expect power-of-2
    return val;
}

constexpr inline uint64 align_up(uint64 val, uint64 align)
{
    val += (align - 1); // Expect power-of-2
    return align_dn(val, align);
}

constexpr inline bool is_aligned(uint64 val, uint64 align) { return (val & (align - 1)) == 0; }
