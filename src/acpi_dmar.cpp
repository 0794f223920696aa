/*
 * DMA Remapping Reporting (DMAR) Table
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

#include "acpi_dmar.hpp"
#include "stdio.hpp"

namespace
{

// Parse the device scopes between begin and end into scopes.
template <size_t N>
Result_void<Acpi_error> parse_scopes(uint8 const* cur, uint8 const* end, Static_vector<Dmar_scope, N>& scopes)
{
    while (cur != end) {
        size_t const left{static_cast<size_t>(end - cur)};
        auto const& s{*reinterpret_cast<Acpi_scope const*>(cur)};

        if (left < sizeof(Acpi_scope) or s.length < sizeof(Acpi_scope) or s.length > left) {
            trace(TRACE_ACPI | TRACE_ERROR, "DMAR device scope does not fit its structure");
            return Err(Acpi_error::RECORD_DESYNC);
        }

        if (scopes.full()) {
            trace(TRACE_ACPI | TRACE_ERROR, "Ignoring DMAR device scope of type %u", s.type);
        } else {
            Dmar_scope& scope{scopes.emplace_back()};

            scope.type = s.type;
            scope.enum_id = s.enum_id;
            scope.start_bus = s.start_bus;

            size_t const hops{(s.length - sizeof(Acpi_scope)) / 2};

            for (size_t i{0}; i < hops; i++) {
                if (scope.path.full()) {
                    trace(TRACE_ACPI | TRACE_ERROR, "DMAR device path is too long");
                    return Err(Acpi_error::TOO_MANY_ENTRIES);
                }

                scope.path.push_back({s.path[i * 2], s.path[i * 2 + 1]});
            }
        }

        cur += s.length;
    }

    return Ok_void({});
}

} // namespace

Result_void<Acpi_error> Remap_unit_list::parse(Acpi_table const& table)
{
    if (table.signature != SIG("DMAR")) {
        return Err(Acpi_error::BAD_SIGNATURE);
    }

    if (table.length < sizeof(Acpi_table_dmar)) {
        return Err(Acpi_error::BAD_LENGTH);
    }

    auto const& dmar{static_cast<Acpi_table_dmar const&>(table)};

    haw = dmar.haw;
    flags = dmar.flags;

    uint8 const* cur{dmar.remap};
    uint8 const* const end{reinterpret_cast<uint8 const*>(&dmar) + dmar.length};

    while (cur != end) {
        size_t const left{static_cast<size_t>(end - cur)};
        auto const& r{*reinterpret_cast<Acpi_remap const*>(cur)};

        if (left < sizeof(Acpi_remap) or r.length < sizeof(Acpi_remap) or r.length > left) {
            trace(TRACE_ACPI | TRACE_ERROR, "DMAR structure does not fit the table");
            return Err(Acpi_error::RECORD_DESYNC);
        }

        uint8 const* const r_end{cur + r.length};

        if (r.type == Acpi_remap::DRHD) {
            if (r.length < sizeof(Acpi_drhd)) {
                return Err(Acpi_error::BAD_LENGTH);
            }

            auto const& drhd{static_cast<Acpi_drhd const&>(r)};

            if (units.full()) {
                trace(TRACE_ACPI | TRACE_ERROR, "Ignoring DMAR unit at %#llx",
                      static_cast<unsigned long long>(drhd.base));
            } else {
                Remap_unit& unit{units.emplace_back()};

                unit.base = drhd.base;
                unit.segment = drhd.segment;
                unit.include_all = drhd.flags & Acpi_drhd::INCLUDE_PCI_ALL;

                TRY_OR_RETURN(parse_scopes(cur + sizeof(Acpi_drhd), r_end, unit.scopes));

                trace(TRACE_ACPI, "DRHD: %#llx, segment %u, %lu scopes%s",
                      static_cast<unsigned long long>(unit.base), unit.segment,
                      static_cast<unsigned long>(unit.scopes.size()),
                      unit.include_all ? ", include all" : "");
            }
        } else if (r.type == Acpi_remap::RMRR) {
            if (r.length < sizeof(Acpi_rmrr)) {
                return Err(Acpi_error::BAD_LENGTH);
            }

            auto const& rmrr{static_cast<Acpi_rmrr const&>(r)};

            if (rmrrs.full()) {
                trace(TRACE_ACPI | TRACE_ERROR, "Ignoring RMRR at %#llx",
                      static_cast<unsigned long long>(rmrr.base));
            } else {
                Rmrr_region& region{rmrrs.emplace_back()};

                region.segment = rmrr.segment;
                region.base = rmrr.base;
                region.limit = rmrr.limit;

                TRY_OR_RETURN(parse_scopes(cur + sizeof(Acpi_rmrr), r_end, region.scopes));
            }
        } else {
            trace(TRACE_ACPI, "Skipping DMAR structure of type %u", r.type);
        }

        cur = r_end;
    }

    return Ok_void({});
}
