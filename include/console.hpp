/*
 * Console
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
#include "spinlock.hpp"
#include "types.hpp"

#include <stdarg.h>

// An output sink for kernel messages.
//
// Consoles are registered with enable() and receive every message passed to print(). Formatting is done by
// this class, so a concrete console only has to implement putc.
class Console
{
private:
    enum Mode
    {
        MODE_FLAGS = 0,
        MODE_WIDTH = 1,
        MODE_PRECS = 2,
    };

    enum Flags
    {
        FLAG_SIGNED = 1UL << 0,
        FLAG_ALT_FORM = 1UL << 1,
        FLAG_ZERO_PAD = 1UL << 2,
    };

    Console* next{nullptr};

    static Console* list;
    static Spinlock lock;

    void print_num(uint64, unsigned, unsigned, unsigned);
    void print_str(char const*, unsigned, unsigned);

    void vprintf(char const*, va_list);

protected:
    virtual void putc(int c) = 0;

public:
    Console() = default;
    virtual ~Console() = default;

    Console(Console const&) = delete;
    Console& operator=(Console const&) = delete;

    // Add a console to the list of consoles that receive output.
    static void enable(Console* c);

    // Remove a console from the output list.
    static void disable(Console* c);

    FORMAT(1, 2) static void print(char const*, ...);

    static void vprint(char const*, va_list);
};

// A console that keeps the most recent output in memory.
//
// It captures messages before a real output device is available and lets tests inspect what was logged.
class Console_buffer : public Console
{
private:
    static constexpr size_t BUFFER_SIZE{16384};

    char buffer[BUFFER_SIZE];
    size_t used{0};

    void putc(int c) override;

public:
    Console_buffer() { clear(); }

    // The captured output as a NUL-terminated string.
    char const* text() const { return buffer; }

    bool contains(char const* needle) const;

    void clear();
};
