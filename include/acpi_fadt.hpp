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

#include "acpi_gas.hpp"
#include "acpi_table.hpp"
#include "compiler.hpp"
#include "math.hpp"

class Delay;
class Mmio;
class Port_io;

#pragma pack(1)

/*
 * Fixed ACPI Description Table (5.2.9)
 */
class Acpi_table_fadt : public Acpi_table
{
public:
    uint32 firmware_ctrl; // 36
    uint32 dsdt_addr;     // 40
    uint8 int_model;      // 44
    uint8 pm_profile;     // 45
    uint16 sci_irq;       // 46
    uint32 smi_cmd;       // 48
    uint8 acpi_enable;    // 52
    uint8 acpi_disable;   // 53
    uint8 s4_bios_req;
    uint8 pstate_cnt;
    uint32 pm1a_evt_blk;
    uint32 pm1b_evt_blk;
    uint32 pm1a_cnt_blk; // 64
    uint32 pm1b_cnt_blk; // 68
    uint32 pm2_cnt_blk;
    uint32 pm_tmr_blk; // 76
    uint32 gpe0_blk;
    uint32 gpe1_blk;
    uint8 pm1_evt_len;
    uint8 pm1_cnt_len;
    uint8 pm2_cnt_len;
    uint8 pm_tmr_len; // 91
    uint8 gpe0_blk_len;
    uint8 gpe1_blk_len;
    uint8 gpe1_base;
    uint8 cstate_cnt;
    uint16 p_lvl2_lat;
    uint16 p_lvl3_lat;
    uint16 flush_size;
    uint16 flush_stride;
    uint8 duty_offset;
    uint8 duty_width;
    uint8 day_alarm;
    uint8 mon_alarm;
    uint8 century;           // 108
    uint16 iapc_boot_arch;   // 109
    uint8 reserved_1;        // 111
    uint32 flags;            // 112
    Acpi_gas reset_reg;      // 116
    uint8 reset_value;       // 128
    uint8 reserved_2[3];     // 129
    uint64 x_firmware_ctrl;  // 132
    uint64 x_dsdt_addr;      // 140
    Acpi_gas x_pm1a_evt_blk; // 148
    Acpi_gas x_pm1b_evt_blk; // 160
    Acpi_gas x_pm1a_cnt_blk; // 172
    Acpi_gas x_pm1b_cnt_blk; // 184
    Acpi_gas x_pm2_cnt_blk;  // 196
    Acpi_gas x_pm_tmr_blk;   // 208

    // The first revision of the FADT ends after the flags field.
    static constexpr size_t MIN_LENGTH{116};

    Acpi_gas pm1a_cnt() const { return parse_reg(x_pm1a_cnt_blk, pm1_cnt_len, pm1a_cnt_blk, 172); }
    Acpi_gas pm1b_cnt() const { return parse_reg(x_pm1b_cnt_blk, pm1_cnt_len, pm1b_cnt_blk, 184); }
    Acpi_gas pm_tmr() const { return parse_reg(x_pm_tmr_blk, pm_tmr_len, pm_tmr_blk, 208); }

    Paddr facs() const
    {
        if (length >= 140 and x_firmware_ctrl) {
            return x_firmware_ctrl;
        }
        return firmware_ctrl;
    }

    Paddr dsdt() const
    {
        if (length >= 148 and x_dsdt_addr) {
            return x_dsdt_addr;
        }
        return dsdt_addr;
    }

private:
    // Parse register blocks that consist of a single register. gas_offset is where the extended address
    // lives in the table.
    //
    // The extended address is used if the table is long enough to contain it and it is valid. Otherwise
    // we fall back to the legacy I/O port address. See ACPI 4.8.1.
    Acpi_gas parse_reg(Acpi_gas const& table_gas, unsigned reg_bytes, uint32 reg_addr,
                       size_t gas_offset) const
    {
        Acpi_gas result;

        if (length >= gas_offset + sizeof(Acpi_gas) and table_gas.valid()) {
            // `table_gas.bits` can encode values up to 255, but the size in bits of a given register may be
            // larger. In these cases `reg_bytes` is the relevant value
            unsigned const bytes{max(static_cast<unsigned>(table_gas.bits / 8), reg_bytes)};
            result.init(table_gas.asid, bytes, table_gas.addr);
        } else if (reg_addr != 0) {
            result.init(Acpi_gas::IO, reg_bytes, reg_addr);
        }

        return result;
    }
};

#pragma pack()

// What we need to know from the FADT.
struct Fadt_info {
    enum Boot
    {
        HAS_LEGACY_DEVICES = 1u << 0,
        HAS_8042 = 1u << 1,
        NO_VGA = 1u << 2,
        NO_MSI = 1u << 3,
        NO_ASPM = 1u << 4,
        NO_CMOS_RTC = 1u << 5,
    };

    enum Feature
    {
        WBINVD = 1u << 0,
        PROC_C1 = 1u << 2,
        TMR_VAL_EXT = 1u << 8,
        HW_REDUCED_ACPI = 1u << 20,
    };

    enum PM1_Control
    {
        PM1_CNT_SCI_EN = 1U << 0,
    };

    uint8 revision{0};

    // The legacy IRQ the system control interrupt is wired to.
    uint16 sci_irq{0};

    // Writing acpi_enable to the SMI command port hands the fixed hardware from SMM to us.
    uint32 smi_cmd{0};
    uint8 acpi_enable{0};
    uint8 acpi_disable{0};

    Acpi_gas pm1a_cnt;
    Acpi_gas pm1b_cnt;
    Acpi_gas pm_tmr;

    uint16 iapc_boot_arch{0};
    uint32 flags{0};

    Paddr dsdt{0};
    Paddr facs{0};

    // Does the PM timer count with 32 instead of 24 bits?
    bool pm_tmr_32bit() const { return flags & TMR_VAL_EXT; }

    static Result<Fadt_info, Acpi_error> parse(Acpi_table const& table);

    // Switch the platform from legacy mode into ACPI mode.
    //
    // Does nothing if the platform is already in ACPI mode or has no SMI command port. Waits for the SCI_EN
    // bit for at most HW_ACK_TIMEOUT_US.
    Result_void<Acpi_error> enable_acpi_mode(Port_io& io, Mmio& mmio, Delay& delay) const;
};
