/*
 * Utility Functions
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

#include "compiler.hpp"
#include "types.hpp"

template <typename T, T v> struct integral_constant {
    using value_type = T;

    static constexpr value_type value = v;
    constexpr operator value_type() const { return v; }
};

using true_type = integral_constant<bool, true>;
using false_type = integral_constant<bool, false>;

template <typename T> struct remove_reference {
    using type = T;
};
template <typename T> struct remove_reference<T&> {
    using type = T;
};
template <typename T> struct remove_reference<T&&> {
    using type = T;
};

template <typename T> struct is_lvalue_reference : false_type {
};
template <typename T> struct is_lvalue_reference<T&> : true_type {
};

template <typename T> constexpr T&& forward(typename remove_reference<T>::type& arg)
{
    return static_cast<T&&>(arg);
}

template <typename T> constexpr T&& forward(typename remove_reference<T>::type&& arg)
{
    static_assert(not is_lvalue_reference<T>::value, "Invalid rvalue to lvalue conversion");
    return static_cast<T&&>(arg);
}

template <typename T> constexpr typename remove_reference<T>::type&& move(T&& v)
{
    return static_cast<typename remove_reference<T>::type&&>(v);
}

// Read a little-endian value of type T from a possibly unaligned location.
//
// Firmware tables give no alignment guarantees for their fields, so all accesses to table contents go
// through this function or packed structures.
template <typename T> inline T load_unaligned(void const* ptr)
{
    T val;
    __builtin_memcpy(&val, ptr, sizeof(val));
    return val;
}

#if __STDC_HOSTED__
#include <new>
#else
// Placement new operator
inline void* operator new(size_t, void* p) { return p; }
#endif
