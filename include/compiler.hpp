/*
 * Compiler Specific Code
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

#if defined(__GNUC__)

#if defined(__clang__)
#define COMPILER_VERSION (__clang_major__ * 100 + __clang_minor__ * 10 + __clang_patchlevel__)
#else
#define COMPILER_VERSION (__GNUC__ * 100 + __GNUC_MINOR__ * 10 + __GNUC_PATCHLEVEL__)
#endif

// Static_vector and friends rely on C++17 and the builtins below.
#if (COMPILER_VERSION < 700)
#error "Please upgrade the compiler to a supported version"
#endif

#define COLD __attribute__((cold))
#define ALWAYS_INLINE __attribute__((always_inline))
#define FORMAT(X, Y) __attribute__((format(printf, (X), (Y))))
#define NONNULL __attribute__((nonnull))

#define EXPECT_FALSE(X) __builtin_expect(!!(X), 0)
#define EXPECT_TRUE(X) __builtin_expect(!!(X), 1)

#else
#error "Unknown compiler"
#endif
