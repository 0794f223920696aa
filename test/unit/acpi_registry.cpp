/*
 * ACPI Table Registry Unit Tests
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

#include "acpi_registry.hpp"
#include "acpi_test_tables.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <vector>

namespace
{

// Remembers which tables it saw and answers with a fixed result.
class Recording_handler final : public Acpi_table_handler
{
private:
    std::vector<uint32>& log;

public:
    Optional<Acpi_error> error;

    // Whether the FADT was known when this handler ran.
    bool saw_fadt{false};

    explicit Recording_handler(std::vector<uint32>& log_) : log(log_) {}

    Result_void<Acpi_error> handle(Acpi_table const& table, Acpi_dispatch_context& ctx) override
    {
        uint32 const sig{table.signature};

        log.push_back(sig);
        saw_fadt = ctx.fadt.has_value();

        if (sig == SIG("FACP")) {
            ctx.fadt = Fadt_info{};
        }

        if (error.has_value()) {
            return Err(*error);
        }

        return Ok_void({});
    }
};

Acpi_root_table root_table(Fake_firmware& fw)
{
    auto const rsdp{Acpi_rsdp::locate(fw.mem)};
    REQUIRE(rsdp.is_ok());

    auto const root{Acpi_root_table::parse(fw.mem, rsdp.unwrap())};
    REQUIRE(root.is_ok());

    return root.unwrap();
}

bool contains(Acpi_dispatch_report::Sig_list const& list, uint32 sig)
{
    return std::find(list.begin(), list.end(), sig) != list.end();
}

} // namespace

TEST_CASE("Handlers are registered once per signature", "[acpi_registry]")
{
    std::vector<uint32> log;
    Recording_handler a{log}, b{log};
    Acpi_table_registry registry;

    REQUIRE(registry.register_handler(SIG("APIC"), &a).is_ok());

    auto const dup{registry.register_handler(SIG("APIC"), &b)};

    REQUIRE(dup.is_err());
    CHECK(dup.unwrap_err() == Acpi_error::DUPLICATE_HANDLER);
    CHECK(registry.lookup(SIG("APIC")) == &a);
    CHECK(registry.lookup(SIG("HPET")) == nullptr);
    CHECK(registry.size() == 1);
}

TEST_CASE("The registry has a fixed capacity", "[acpi_registry]")
{
    std::vector<uint32> log;
    Recording_handler h{log};
    Acpi_table_registry registry;

    for (uint32 i{0}; i < NUM_ACPI_HANDLERS; i++) {
        REQUIRE(registry.register_handler(SIG("TST0") + i, &h).is_ok());
    }

    auto const overflow{registry.register_handler(SIG("FULL"), &h)};

    REQUIRE(overflow.is_err());
    CHECK(overflow.unwrap_err() == Acpi_error::TOO_MANY_ENTRIES);
}

TEST_CASE("The FADT is dispatched before all other tables", "[acpi_registry]")
{
    Fake_firmware fw;
    fw.install({Madt_builder{}.lapic(0, 0).build(), make_hpet(0xfed00000), make_fadt({})});

    std::vector<uint32> log;
    Recording_handler fadt{log}, madt{log}, hpet{log};
    Acpi_table_registry registry;

    REQUIRE(registry.register_handler(SIG("FACP"), &fadt).is_ok());
    REQUIRE(registry.register_handler(SIG("APIC"), &madt).is_ok());
    REQUIRE(registry.register_handler(SIG("HPET"), &hpet).is_ok());

    Acpi_dispatch_report report;
    auto const ctx{registry.dispatch_all(fw.mem, root_table(fw), report)};

    REQUIRE(ctx.is_ok());
    CHECK(ctx.unwrap().fadt.has_value());

    REQUIRE(log.size() == 3);
    CHECK(log[0] == SIG("FACP"));
    CHECK(log[1] == SIG("APIC"));
    CHECK(log[2] == SIG("HPET"));

    CHECK(not fadt.saw_fadt);
    CHECK(madt.saw_fadt);
    CHECK(hpet.saw_fadt);

    CHECK(report.handled.size() == 3);
    CHECK(report.skipped.empty());
    CHECK(report.rejected.empty());
}

TEST_CASE("Tables without a handler are skipped", "[acpi_registry]")
{
    Fake_firmware fw;
    fw.install({make_table("SSDT", 2, Bytes(16, 0)), make_hpet(0xfed00000)});

    std::vector<uint32> log;
    Recording_handler hpet{log};
    Acpi_table_registry registry;

    REQUIRE(registry.register_handler(SIG("HPET"), &hpet).is_ok());

    Acpi_dispatch_report report;
    auto const ctx{registry.dispatch_all(fw.mem, root_table(fw), report)};

    REQUIRE(ctx.is_ok());
    CHECK(not ctx.unwrap().fadt.has_value());
    CHECK(contains(report.skipped, SIG("SSDT")));
    CHECK(contains(report.handled, SIG("HPET")));
}

TEST_CASE("Tables with bad checksums never reach their handler", "[acpi_registry]")
{
    Bytes broken{make_hpet(0xfed00000)};
    broken[40] ^= 0x10;

    Fake_firmware fw;
    fw.install({broken, Madt_builder{}.lapic(0, 0).build()});

    std::vector<uint32> log;
    Recording_handler hpet{log}, madt{log};
    Acpi_table_registry registry;

    REQUIRE(registry.register_handler(SIG("HPET"), &hpet).is_ok());
    REQUIRE(registry.register_handler(SIG("APIC"), &madt).is_ok());

    Acpi_dispatch_report report;
    auto const ctx{registry.dispatch_all(fw.mem, root_table(fw), report)};

    REQUIRE(ctx.is_ok());
    REQUIRE(log.size() == 1);
    CHECK(log[0] == SIG("APIC"));
    CHECK(contains(report.rejected, SIG("HPET")));
}

TEST_CASE("Handler errors are sorted by severity", "[acpi_registry]")
{
    Fake_firmware fw;
    fw.install({make_hpet(0xfed00000), Madt_builder{}.lapic(0, 0).build()});

    std::vector<uint32> log;
    Recording_handler hpet{log}, madt{log};
    Acpi_table_registry registry;

    REQUIRE(registry.register_handler(SIG("HPET"), &hpet).is_ok());
    REQUIRE(registry.register_handler(SIG("APIC"), &madt).is_ok());

    Acpi_dispatch_report report;

    SECTION("An unusable table is rejected and dispatch goes on")
    {
        hpet.error = Acpi_error::UNUSABLE;

        auto const ctx{registry.dispatch_all(fw.mem, root_table(fw), report)};

        REQUIRE(ctx.is_ok());
        CHECK(log.size() == 2);
        CHECK(contains(report.rejected, SIG("HPET")));
        CHECK(contains(report.handled, SIG("APIC")));
    }

    SECTION("A corrupt table aborts dispatch")
    {
        hpet.error = Acpi_error::RECORD_DESYNC;

        auto const ctx{registry.dispatch_all(fw.mem, root_table(fw), report)};

        REQUIRE(ctx.is_err());
        CHECK(ctx.unwrap_err() == Acpi_error::RECORD_DESYNC);
        CHECK(log.size() == 1);
    }
}
