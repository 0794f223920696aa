/*
 * Advanced Configuration and Power Interface (ACPI)
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

#include "acpi_error.hpp"
#include "acpi_fadt.hpp"
#include "acpi_table.hpp"
#include "config.hpp"
#include "cpu_topology.hpp"
#include "optional.hpp"
#include "result.hpp"
#include "static_vector.hpp"

#pragma pack(1)

/*
 * APIC Structure (5.2.12)
 */
class Acpi_apic
{
public:
    uint8 type;
    uint8 length;

    enum Type
    {
        LAPIC = 0,
        IOAPIC = 1,
        INTR = 2,
        NMI = 3,
        LAPIC_NMI = 4,
        LAPIC_ADDR = 5,
        X2APIC = 9,
        X2APIC_NMI = 10,
    };
};

/*
 * Processor Local APIC (5.2.12.2)
 */
class Acpi_lapic : public Acpi_apic
{
public:
    uint8 acpi_id;
    uint8 apic_id;
    uint32 flags;
};

/*
 * I/O APIC (5.2.12.3)
 */
class Acpi_ioapic : public Acpi_apic
{
public:
    uint8 id;
    uint8 reserved;
    uint32 phys;
    uint32 gsi;
};

/*
 * Interrupt Source Override (5.2.12.5)
 */
class Acpi_intr : public Acpi_apic
{
public:
    uint8 bus;
    uint8 irq;
    uint32 gsi;
    uint16 flags;
};

/*
 * Non-Maskable Interrupt Source (5.2.12.6)
 */
class Acpi_nmi : public Acpi_apic
{
public:
    uint16 flags;
    uint32 gsi;
};

/*
 * Local APIC NMI (5.2.12.7)
 */
class Acpi_lapic_nmi : public Acpi_apic
{
public:
    uint8 acpi_id;
    uint16 flags;
    uint8 lint;
};

/*
 * Local APIC Address Override (5.2.12.8)
 */
class Acpi_lapic_addr : public Acpi_apic
{
public:
    uint16 reserved;
    uint64 addr;
};

/*
 * Processor Local x2APIC (5.2.12.12)
 */
class Acpi_x2apic : public Acpi_apic
{
public:
    uint16 reserved;
    uint32 x2apic_id;
    uint32 flags;
    uint32 acpi_uid;
};

/*
 * Local x2APIC NMI (5.2.12.13)
 */
class Acpi_x2apic_nmi : public Acpi_apic
{
public:
    uint16 flags;
    uint32 acpi_uid;
    uint8 lint;
    uint8 reserved[3];
};

/*
 * Multiple APIC Description Table (5.2.12)
 */
class Acpi_table_madt : public Acpi_table
{
public:
    uint32 apic_addr;
    uint32 flags;
    uint8 records[];

    enum
    {
        // The system also has a PC-AT-compatible dual-8259 setup.
        PCAT_COMPAT = 1u << 0,
    };

    // The MADT header up to the first record.
    static constexpr size_t HEADER_LENGTH{44};
};

#pragma pack()

static_assert(sizeof(Acpi_table_madt) == Acpi_table_madt::HEADER_LENGTH, "MADT layout is wrong");

enum class Polarity : uint8
{
    HIGH,
    LOW,
};

enum class Trigger : uint8
{
    EDGE,
    LEVEL,
};

// MPS INTI flags as they appear in overrides and NMI records.
struct Inti_flags {
    enum
    {
        POLARITY_MASK = 0x3,
        POLARITY_HIGH = 0x1,
        POLARITY_LOW = 0x3,

        TRIGGER_SHIFT = 2,
        TRIGGER_MASK = 0x3 << TRIGGER_SHIFT,
        TRIGGER_EDGE = 0x1 << TRIGGER_SHIFT,
        TRIGGER_LEVEL = 0x3 << TRIGGER_SHIFT,
    };

    uint16 raw;

    // Flags of 0 mean "conforms to the bus". The bus defaults are passed in.
    Polarity polarity(Polarity bus_default = Polarity::HIGH) const
    {
        switch (raw & POLARITY_MASK) {
        case POLARITY_HIGH:
            return Polarity::HIGH;
        case POLARITY_LOW:
            return Polarity::LOW;
        default:
            return bus_default;
        }
    }

    Trigger trigger(Trigger bus_default = Trigger::EDGE) const
    {
        switch (raw & TRIGGER_MASK) {
        case TRIGGER_EDGE:
            return Trigger::EDGE;
        case TRIGGER_LEVEL:
            return Trigger::LEVEL;
        default:
            return bus_default;
        }
    }
};

// One MADT record in host representation.
struct Madt_record {
    enum class Kind : uint8
    {
        LAPIC,
        IOAPIC,
        INTR_OVERRIDE,
        NMI_SOURCE,
        LAPIC_NMI,
        LAPIC_ADDR_OVERRIDE,
        X2APIC,
        X2APIC_NMI,
    };

    // Used for LAPIC and X2APIC.
    struct Lapic {
        uint32 acpi_id;
        uint32 apic_id;
        bool enabled;
        bool online_capable;
    };

    struct Ioapic {
        uint8 id;
        Paddr base;
        uint32 gsi_base;
    };

    struct Intr_override {
        uint8 bus;
        uint8 irq;
        uint32 gsi;
        Inti_flags flags;
    };

    struct Nmi_source {
        uint32 gsi;
        Inti_flags flags;
    };

    // Used for LAPIC_NMI and X2APIC_NMI.
    struct Lapic_nmi {
        enum : uint32
        {
            ALL_CPUS = ~0U,
        };

        uint32 acpi_id;
        uint8 lint;
        Inti_flags flags;
    };

    struct Lapic_addr {
        Paddr base;
    };

    Kind kind;

    union {
        Lapic lapic;
        Ioapic ioapic;
        Intr_override intr_override;
        Nmi_source nmi_source;
        Lapic_nmi lapic_nmi;
        Lapic_addr lapic_addr;
    };

    // Decode a record whose length was already checked to cover the fixed layout of its type.
    //
    // Returns an empty optional for record types we don't know.
    static Optional<Madt_record> decode(Acpi_apic const& apic);

    // The minimum length of a record type or 0 for unknown types.
    static size_t min_length(uint8 type);
};

// Iterates over the variable-length records in the MADT.
//
// The walker can only be used once. After it reported an error, it keeps reporting that error.
class Madt_record_walker
{
private:
    uint8 const* cur;
    uint8 const* const end;

    Optional<Acpi_error> failed;

public:
    // Walk the records following the MADT header.
    explicit Madt_record_walker(Acpi_table_madt const& madt);

    // Walk a bare record stream.
    Madt_record_walker(void const* records, size_t len);

    // Return the next known record, or an empty optional at the end of the table.
    Result<Optional<Madt_record>, Acpi_error> next();
};

struct Ioapic_info {
    uint8 id;
    Paddr base;
    uint32 gsi_base;
};

// A legacy ISA IRQ that is not identity-mapped or uses non-default polarity or trigger mode.
struct Irq_override {
    uint8 irq;
    uint32 gsi;
    Polarity polarity;
    Trigger trigger;
};

// A GSI that is wired to NMI.
struct Nmi_source {
    uint32 gsi;
    Polarity polarity;
    Trigger trigger;
};

// A Local APIC LINT pin that is wired to NMI.
struct Lapic_nmi_pin {
    // Either an ACPI processor ID or Madt_record::Lapic_nmi::ALL_CPUS.
    uint32 acpi_id;
    uint8 lint;
    Polarity polarity;
    Trigger trigger;

    bool applies_to(uint32 cpu_acpi_id) const
    {
        return acpi_id == Madt_record::Lapic_nmi::ALL_CPUS or acpi_id == cpu_acpi_id;
    }
};

// How interrupts are wired on this platform.
struct Interrupt_topology {
    Paddr lapic_base{0};

    // A legacy PIC pair is present and needs to be disabled.
    bool pcat_compat{false};

    // All known records in table order.
    Static_vector<Madt_record, NUM_MADT_RECORDS> records;

    Static_vector<Ioapic_info, NUM_IOAPIC> ioapics;
    Static_vector<Irq_override, NUM_INTR_OVERRIDE> overrides;
    Static_vector<Nmi_source, NUM_NMI_SOURCE> nmi_sources;
    Static_vector<Lapic_nmi_pin, NUM_LAPIC_NMI> lapic_nmis;

    Irq_override const* find_override(unsigned irq) const
    {
        auto const it{find_if(overrides, [irq](Irq_override const& o) { return o.irq == irq; })};
        return it == overrides.end() ? nullptr : it;
    }
};

// Everything we learn from the MADT.
struct Madt_info {
    Interrupt_topology interrupts;
    Cpu_topology cpus;
};

class Madt_parser
{
private:
    Madt_info& info;

    uint32 const bsp_apic_id;

    void add_cpu(Madt_record::Lapic const& lapic, bool xapic_record);
    void add_ioapic(Madt_record::Ioapic const& ioapic);
    void add_override(Madt_record::Intr_override const& intr);
    void add_nmi_source(Madt_record::Nmi_source const& nmi);
    void add_lapic_nmi(Madt_record::Lapic_nmi const& nmi);

    void add_sci_override(Fadt_info const& fadt);
    void pick_bsp();

public:
    Madt_parser(Madt_info& info_, uint32 bsp_apic_id_) : info(info_), bsp_apic_id(bsp_apic_id_) {}

    // Parse the MADT into info.
    //
    // The bootstrap processor is the CPU with the given APIC ID, or the first enabled CPU, if there is no
    // such CPU. If the FADT is known, the SCI gets a level-triggered, active-low override unless the
    // firmware provided one.
    Result_void<Acpi_error> parse(Acpi_table const& table, Optional<Fadt_info> const& fadt);
};
