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

#include "cmdline.hpp"
#include "string.hpp"

Cmdline::param_map const Cmdline::map[] = {
    {"noacpi", &Cmdline::noacpi},
    {"nosmp", &Cmdline::nosmp},
    {"noiommu", &Cmdline::noiommu},
    {"nohpet", &Cmdline::nohpet},
};

char const* Cmdline::get_arg(char const** line, size_t& len)
{
    len = 0;

    for (; **line == ' '; ++*line) {
    }

    if (!**line) {
        return nullptr;
    }

    char const* arg = *line;

    for (; **line != ' '; ++*line) {
        if (!**line) {
            return arg;
        }
        len++;
    }

    return arg;
}

void Cmdline::init(char const* line)
{
    if (line == nullptr) {
        return;
    }

    char const* arg;
    size_t len;

    while ((arg = get_arg(&line, len))) {
        for (auto const& param : map) {
            // Only whole words match: "nosmpx" does not enable nosmp.
            if (strlen(param.arg) == len and strnmatch(param.arg, arg, len)) {
                *param.ptr = true;
            }
        }
    }
}

void Cmdline::reset()
{
    for (auto const& param : map) {
        *param.ptr = false;
    }
}
