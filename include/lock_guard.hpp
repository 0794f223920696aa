/*
 * Lock Guard
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

template <typename T> class Lock_guard
{
private:
    T& lock_;

public:
    ALWAYS_INLINE inline explicit Lock_guard(T& l) : lock_(l) { lock_.lock(); }

    ALWAYS_INLINE inline ~Lock_guard() { lock_.unlock(); }

    Lock_guard(Lock_guard const&) = delete;
    Lock_guard& operator=(Lock_guard const&) = delete;
};
