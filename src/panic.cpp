/*
 * Panic
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

#include "panic.hpp"

#if !__STDC_HOSTED__

#include "console.hpp"

#include <stdarg.h>

void panic(char const* format, ...)
{
    va_list ap;

    va_start(ap, format);

    Console::print("PANIC: Keel encountered an unrecoverable error near RIP %p:",
                   __builtin_return_address(0));
    Console::vprint(format, ap);

    va_end(ap);

    for (;;) {
        asm volatile("cli; hlt");
    }
}

#endif // !__STDC_HOSTED__
