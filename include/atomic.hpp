/*
 * Atomic Operations
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

class Atomic
{
public:
    enum Order
    {
        RELAXED = __ATOMIC_RELAXED,
        ACQUIRE = __ATOMIC_ACQUIRE,
        RELEASE = __ATOMIC_RELEASE,
        SEQ_CST = __ATOMIC_SEQ_CST,
    };

    template <typename T, Order O = SEQ_CST> static inline T load(T const& ptr)
    {
        return __atomic_load_n(&ptr, O);
    }

    template <typename T, Order O = SEQ_CST> static inline void store(T& ptr, T n)
    {
        __atomic_store_n(&ptr, n, O);
    }

    template <typename T, Order O = SEQ_CST> static inline T exchange(T& ptr, T n)
    {
        return __atomic_exchange_n(&ptr, n, O);
    }

    template <typename T, Order O = SEQ_CST> static inline T fetch_add(T& ptr, T v)
    {
        return __atomic_fetch_add(&ptr, v, O);
    }

    template <typename T> static inline bool cmp_swap(T& ptr, T o, T n)
    {
        return __atomic_compare_exchange_n(&ptr, &o, n, false, __ATOMIC_SEQ_CST, __ATOMIC_SEQ_CST);
    }
};
