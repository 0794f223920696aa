/*
 * Fixed-Capacity Vector
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
#include "types.hpp"
#include "util.hpp"

// A vector with statically allocated backing store and a maximum size.
//
// Keel uses this container for everything it extracts from firmware tables, because tables are parsed
// before any memory allocator is available.
template <typename T, size_t N> class Static_vector
{
private:
    size_t size_{0};

    alignas(T) char backing[sizeof(T) * N];

public:
    Static_vector() = default;

    Static_vector(Static_vector const& other)
    {
        for (T const& elem : other) {
            push_back(elem);
        }
    }

    Static_vector& operator=(Static_vector const& other)
    {
        if (this != &other) {
            reset();

            for (T const& elem : other) {
                push_back(elem);
            }
        }

        return *this;
    }

    ~Static_vector() { reset(); }

    T* data() { return reinterpret_cast<T*>(backing); }
    T const* data() const { return reinterpret_cast<T const*>(backing); }

    T& operator[](size_t i)
    {
        assert_slow(i < size());
        return data()[i];
    }

    T const& operator[](size_t i) const
    {
        assert_slow(i < size());
        return data()[i];
    }

    T* begin() { return &data()[0]; }
    T const* begin() const { return &data()[0]; }

    T* end() { return &data()[size()]; }
    T const* end() const { return &data()[size()]; }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == N; }
    constexpr size_t max_size() const { return N; }

    template <typename... ARGS> T& emplace_back(ARGS&&... args)
    {
        assert(not full());

        return *new (&data()[size_++]) T(forward<ARGS>(args)...);
    }

    void push_back(T const& o) { emplace_back(o); }

    void reset()
    {
        for (T& elem : *this) {
            elem.~T();
        }

        size_ = 0;
    }
};
