/*
 * Result Type
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

#include "assert.hpp"
#include "monostate.hpp"
#include "panic.hpp"
#include "util.hpp"

// A wrapper around error values.
//
// This type autoconverts into the appropriate Result type below:
//
// return Err(Acpi_error::BAD_CHECKSUM);
template <typename E> struct [[nodiscard]] Err {
    E value;

    Err(E&& err) : value(move(err)) {}
    Err(E const& err) : value(err) {}
};

// A wrapper around success values.
//
// return Ok(parsed_table);
template <typename T> struct [[nodiscard]] Ok {
    T value;

    Ok(T&& ok) : value(move(ok)) {}
    Ok(T const& ok) : value(ok) {}
};

// A matching Ok type alias for Result_void.
using Ok_void = Ok<monostate>;

// A Rust-like result type.
//
// Keel does not use exceptions. Every operation that can fail returns a Result carrying either the outcome
// of the computation of type T or an error value of type E. Useful error types are enum classes. See the
// TRY_OR_RETURN macro for the equivalent of the Rust '?' operator.
//
// If explicit unwrap operations in code are necessary, they should be accompanied by an explanation why
// they cannot fail.
template <typename T, typename E> class [[nodiscard]] Result
{
    union {
        T ok_value;
        E err_value;
    };

    bool has_ok;

public:
    using ok_t = T;
    using err_t = E;

    Result(Result const& r) : has_ok(r.has_ok)
    {
        if (has_ok) {
            new (&ok_value) ok_t(r.ok_value);
        } else {
            new (&err_value) err_t(r.err_value);
        }
    }

    Result(Result&& r) : has_ok(r.has_ok)
    {
        if (has_ok) {
            new (&ok_value) ok_t(move(r.ok_value));
        } else {
            new (&err_value) err_t(move(r.err_value));
        }
    }

    template <typename OK> Result(Ok<OK> const& ok) : ok_value(ok.value), has_ok(true) {}
    template <typename OK> Result(Ok<OK>&& ok) : ok_value(move(ok.value)), has_ok(true) {}

    template <typename ERR> Result(Err<ERR> const& err) : err_value(err.value), has_ok(false) {}
    template <typename ERR> Result(Err<ERR>&& err) : err_value(move(err.value)), has_ok(false) {}

    Result& operator=(Result const&) = delete;
    Result& operator=(Result&&) = delete;

    ~Result()
    {
        if (has_ok) {
            ok_value.~ok_t();
        } else {
            err_value.~err_t();
        }
    }

    static Result ok(ok_t const& t) { return Ok(t); }
    static Result ok(ok_t&& t) { return Ok(move(t)); }

    static Result err(err_t const& e) { return Err(e); }
    static Result err(err_t&& e) { return Err(move(e)); }

    bool is_ok() const { return has_ok; }
    bool is_err() const { return not has_ok; }

    // Unwrap the contained OK value.
    //
    // It is a bug to call this function when the result does not contain an OK value.
    T const& unwrap() const
    {
        assert(is_ok());
        return ok_value;
    }

    // Unwrap the contained OK value or panic with the given message.
    T const& expect(char const* message) const
    {
        if (EXPECT_FALSE(is_err())) {
            panic("%s", message);
        }

        return ok_value;
    }

    template <typename F> T unwrap_or_else(F&& f) const
    {
        if (is_ok()) {
            return ok_value;
        } else {
            return f(err_value);
        }
    }

    // Unwrap the contained error value.
    //
    // It is a bug to call this function when the result does not contain an error value.
    E const& unwrap_err() const
    {
        assert(is_err());
        return err_value;
    }

    template <typename F> auto map(F&& f) const -> Result<decltype(f(ok_value)), err_t>
    {
        if (is_ok()) {
            return Ok(f(ok_value));
        } else {
            return Err(err_value);
        }
    }

    template <typename F> auto map_err(F&& f) const -> Result<ok_t, decltype(f(err_value))>
    {
        if (is_ok()) {
            return Ok(ok_value);
        } else {
            return Err(f(err_value));
        }
    }

    // If the result holds an OK value, hand it to the given function.
    template <typename F> auto and_then(F&& f) const -> Result<typename decltype(f(ok_value))::ok_t, err_t>
    {
        if (is_ok()) {
            return f(ok_value);
        } else {
            return Err(err_value);
        }
    }
};

// A return type for functions that want to return void, but can also fail.
template <typename E> using Result_void = Result<monostate, E>;

// Try a fallible operation and return from the current function, if it fails. Otherwise, this is an
// expression that evaluates to the unwrapped OK value.
//
// Result<Fadt_info, Acpi_error> parse_example(Acpi_table const& table)
// {
//     auto const& fadt {TRY_OR_RETURN(Fadt_info::parse(table))};
//     ...
// }
#define TRY_OR_RETURN(expr)                                                                                  \
    ({                                                                                                       \
        auto const result__{expr};                                                                           \
        if (result__.is_err())                                                                               \
            return Err(result__.unwrap_err());                                                               \
        result__.unwrap();                                                                                   \
    })
