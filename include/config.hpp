/*
 * Compile-time Configuration
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

// The maximum number of CPUs, including the bootstrap processor.
#define NUM_CPU 128

#define NUM_IOAPIC 16

// The highest redirection table size an IOAPIC may report.
#define NUM_IOAPIC_PINS 240

// Limits for records collected from the MADT.
#define NUM_INTR_OVERRIDE 24
#define NUM_NMI_SOURCE 16
#define NUM_LAPIC_NMI (NUM_CPU * 2)
#define NUM_MADT_RECORDS (NUM_CPU * 4)

// Limits for the DMAR table.
#define NUM_DMAR 8
#define NUM_RMRR 16
#define NUM_DMAR_SCOPE 32
#define NUM_DMAR_PATH 8
#define NUM_RMRR_SCOPE 4

// PCI buses per segment.
#define NUM_PCI_BUS 256

// The number of root table entries we look at and the size of the table handler registry.
#define NUM_ACPI_TABLES 64
#define NUM_ACPI_HANDLERS 16

#define NUM_EXC 32

// How long we wait for an application processor to report for duty.
#define AP_BOOT_TIMEOUT_US 200000
#define AP_BOOT_POLL_US 100

// How long we wait for hardware to acknowledge a register command.
#define HW_ACK_TIMEOUT_US 10000
