/*
 * String Functions
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

#if __STDC_HOSTED__
#include <string.h>
#else

extern "C" NONNULL void* memcpy(void* d, void const* s, size_t n);
extern "C" NONNULL void* memset(void* d, int c, size_t n);
extern "C" NONNULL int memcmp(void const* s1, void const* s2, size_t n);
extern "C" NONNULL char* strstr(char const* haystack, char const* needle);
extern "C" NONNULL size_t strlen(char const* s);

#endif // __STDC_HOSTED__

// Check whether the first n bytes in two strings match.
bool strnmatch(char const* s1, char const* s2, size_t n);

// Expands to the file name without path components. Does this at compile time.
#define FILENAME                                                                                             \
    ({                                                                                                       \
        constexpr const char* const sf__{past_last_slash(__FILE__)};                                         \
        sf__;                                                                                                \
    })

// Compile-time C-string search. Returns the component after the last slash.
static constexpr const char* past_last_slash(const char* const str, const char* const last_slash)
{
    return *str == '\0'  ? last_slash
           : *str == '/' ? past_last_slash(str + 1, str + 1)
                         : past_last_slash(str + 1, last_slash);
}

static constexpr const char* past_last_slash(const char* const str) { return past_last_slash(str, str); }
