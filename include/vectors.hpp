/*
 * Interrupt Vectors
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

#include "config.hpp"

// The legacy PICs are moved to these vectors, so spurious PIC interrupts do not alias exceptions.
#define VEC_PIC_MASTER (NUM_EXC)
#define VEC_PIC_SLAVE (NUM_EXC + 8)

// IOAPIC pins are delivered at VEC_GSI + source IRQ.
#define VEC_GSI 0x30

#define VEC_MSI_DMAR 0xfd
#define VEC_LAPIC_ERROR 0xfe
#define VEC_LAPIC_SPURIOUS 0xff
