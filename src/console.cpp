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

#include "console.hpp"
#include "lock_guard.hpp"
#include "string.hpp"

Console* Console::list;
Spinlock Console::lock;

void Console::enable(Console* c)
{
    Lock_guard<Spinlock> guard(lock);

    Console** ptr{&list};
    for (; *ptr; ptr = &(*ptr)->next) {
        if (*ptr == c) {
            return;
        }
    }

    c->next = nullptr;
    *ptr = c;
}

void Console::disable(Console* c)
{
    Lock_guard<Spinlock> guard(lock);

    for (Console** ptr{&list}; *ptr; ptr = &(*ptr)->next) {
        if (*ptr == c) {
            *ptr = c->next;
            c->next = nullptr;
            return;
        }
    }
}

void Console::print_num(uint64 val, unsigned base, unsigned width, unsigned flags)
{
    bool const neg{(flags & FLAG_SIGNED) and static_cast<int64>(val) < 0};

    if (neg) {
        val = -val;
    }

    static char const digits[] = "0123456789abcdef";
    char buffer[24];
    char* ptr{buffer + sizeof buffer};

    do {
        *--ptr = digits[val % base];
        val /= base;
    } while (val);

    if (neg) {
        *--ptr = '-';
    }

    unsigned count{static_cast<unsigned>(buffer + sizeof buffer - ptr)};
    unsigned n{count + (flags & FLAG_ALT_FORM ? 2 : 0)};

    if (not(flags & FLAG_ZERO_PAD)) {
        for (; n < width; n++) {
            putc(' ');
        }
    }

    if (flags & FLAG_ALT_FORM) {
        putc('0');
        putc('x');
    }

    for (; n < width; n++) {
        putc('0');
    }

    while (count--) {
        putc(*ptr++);
    }
}

void Console::print_str(char const* s, unsigned width, unsigned precs)
{
    if (EXPECT_FALSE(!s)) {
        s = "(null)";
    }

    unsigned n{0};

    for (; *s and precs--; n++) {
        putc(*s++);
    }

    for (; n < width; n++) {
        putc(' ');
    }
}

void Console::vprintf(char const* format, va_list args)
{
    while (*format) {
        if (EXPECT_TRUE(*format != '%')) {
            putc(*format++);
            continue;
        }

        unsigned flags{0}, width{0}, precs{0}, len{0}, mode{MODE_FLAGS};
        bool done{false};

        while (not done) {
            uint64 u;
            char const c{*++format};

            switch (c) {
            case '0' ... '9':
                if (mode == MODE_FLAGS and c == '0') {
                    flags |= FLAG_ZERO_PAD;
                } else if (mode == MODE_PRECS) {
                    precs = precs * 10 + (c - '0');
                } else {
                    mode = MODE_WIDTH;
                    width = width * 10 + (c - '0');
                }
                continue;

            case '.':
                mode = MODE_PRECS;
                continue;

            case '#':
                flags |= FLAG_ALT_FORM;
                continue;

            case 'l':
                len++;
                continue;

            case 'c':
                putc(va_arg(args, int));
                break;

            case 's':
                print_str(va_arg(args, char const*), width, precs ? precs : ~0U);
                break;

            case 'd':
                u = len == 0   ? static_cast<uint64>(va_arg(args, int))
                    : len == 1 ? static_cast<uint64>(va_arg(args, long))
                               : static_cast<uint64>(va_arg(args, long long));
                print_num(u, 10, width, flags | FLAG_SIGNED);
                break;

            case 'u':
            case 'x':
                u = len == 0   ? va_arg(args, unsigned)
                    : len == 1 ? va_arg(args, unsigned long)
                               : va_arg(args, unsigned long long);
                print_num(u, c == 'x' ? 16 : 10, width, flags);
                break;

            case 'p':
                print_num(reinterpret_cast<mword>(va_arg(args, void*)), 16, width, FLAG_ALT_FORM);
                break;

            case 0:
                // A lone '%' at the end of the format string.
                format--;
                [[fallthrough]];

            default:
                putc(c ? c : '%');
                break;
            }

            done = true;
        }

        format++;
    }

    putc('\n');
}

void Console::print(char const* format, ...)
{
    va_list ap;

    va_start(ap, format);
    vprint(format, ap);
    va_end(ap);
}

void Console::vprint(char const* format, va_list ap)
{
    Lock_guard<Spinlock> guard(lock);

    for (Console* c{list}; c; c = c->next) {
        va_list copy;

        // Every console consumes its own copy of the arguments.
        va_copy(copy, ap);
        c->vprintf(format, copy);
        va_end(copy);
    }
}

void Console_buffer::putc(int c)
{
    // Keep the last byte for the terminator. A full buffer drops further output.
    if (used + 1 < BUFFER_SIZE) {
        buffer[used++] = static_cast<char>(c);
        buffer[used] = 0;
    }
}

bool Console_buffer::contains(char const* needle) const { return strstr(buffer, needle) != nullptr; }

void Console_buffer::clear()
{
    used = 0;
    buffer[0] = 0;
}
