/*
 * Memory Layout
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

#define PAGE_BITS 12
#define PAGE_SIZE (1 << PAGE_BITS)
#define PAGE_MASK (PAGE_SIZE - 1)

// Real-mode addressable memory. AP trampolines must live below this limit.
#define REAL_MODE_LIMIT 0x100000

// Where firmware publishes the root system description pointer.
#define BDA_EBDA_SEGMENT 0x40e
#define EBDA_SCAN_SIZE 0x400
#define BIOS_ROM_BASE 0xe0000
#define BIOS_ROM_SIZE 0x20000

// Message-signalled interrupts are writes to this window. Bits 19:12 select the destination APIC.
#define MSI_ADDR_BASE 0xfee00000
