/*
 * ACPI Errors
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

// Everything that can go wrong while looking at firmware tables.
enum class Acpi_error
{
    // A pointer or table is absent. The feature depending on it is unavailable.
    NOT_FOUND,

    // An optional table is present, but malformed. The feature depending on it is unavailable.
    UNUSABLE,

    // The firmware memory cannot be mapped.
    UNMAPPABLE,

    // A table does not carry the signature we expected at its location.
    BAD_SIGNATURE,

    // The byte sum of a table is not zero.
    BAD_CHECKSUM,

    // A table or record is shorter than its fixed layout.
    BAD_LENGTH,

    // A variable-length record stream does not add up to the table length.
    RECORD_DESYNC,

    // Hardware did not acknowledge a command in time.
    TIMEOUT,

    // A table handler was registered twice for the same signature.
    DUPLICATE_HANDLER,

    // A bounded container ran out of space.
    TOO_MANY_ENTRIES,
};

// Returns true for errors that mean the firmware data is corrupt or the kernel is misconfigured, as
// opposed to something optional just being absent.
inline bool acpi_error_is_fatal(Acpi_error err)
{
    return err != Acpi_error::NOT_FOUND and err != Acpi_error::UNUSABLE;
}

char const* acpi_error_name(Acpi_error err);
