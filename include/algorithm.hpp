/*
 * Generic Algorithms
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

#include "util.hpp"

template <typename T, size_t N> constexpr size_t array_size(T (&)[N]) { return N; }

template <typename IT, typename IT_END, typename T> T accumulate(IT begin, IT_END end, T init)
{
    for (; begin != end; ++begin) {
        init += *begin;
    }

    return init;
}

template <typename IT, typename IT_END, typename PRED> IT find_if(IT begin, IT_END end, PRED predicate)
{
    for (; begin != end and not predicate(*begin); ++begin) {
    }

    return begin;
}

template <typename T, typename PRED> auto find_if(T& container, PRED&& predicate)
{
    return find_if(container.begin(), container.end(), forward<PRED>(predicate));
}

template <typename T, typename PRED> bool any_of(T const& container, PRED&& predicate)
{
    return find_if(container.begin(), container.end(), forward<PRED>(predicate)) != container.end();
}

template <typename T, typename PRED> size_t count_if(T const& container, PRED&& predicate)
{
    size_t count{0};

    for (auto const& elem : container) {
        if (predicate(elem)) {
            count++;
        }
    }

    return count;
}
