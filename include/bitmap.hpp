/*
 * Generic Bitmap
 *
 * Copyright (C) 2020 Markus Partheymüller, Cyberus Technology GmbH.
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
#include "math.hpp"
#include "string.hpp"
#include "types.hpp"

/**
 * Fixed-size Bitmap
 *
 * Stores NUMBER_OF_BITS bits in an array of words of type T.
 */
template <typename T, size_t NUMBER_OF_BITS> class Bitmap
{
private:
    static constexpr size_t BITS_PER_WORD{sizeof(T) * 8};
    static constexpr size_t NUMBER_OF_WORDS{align_up(NUMBER_OF_BITS, BITS_PER_WORD) / BITS_PER_WORD};

    static size_t word_index(size_t i) { return i / BITS_PER_WORD; }
    static T bit_mask(size_t i) { return static_cast<T>(1) << (i % BITS_PER_WORD); }

    T words[NUMBER_OF_WORDS];

public:
    explicit Bitmap(bool initial_value) { memset(words, initial_value ? 0xff : 0, sizeof(words)); }

    static constexpr size_t size() { return NUMBER_OF_BITS; }

    void set(size_t i, bool v)
    {
        assert(i < NUMBER_OF_BITS);

        if (v) {
            words[word_index(i)] |= bit_mask(i);
        } else {
            words[word_index(i)] &= static_cast<T>(~bit_mask(i));
        }
    }

    bool get(size_t i) const
    {
        assert(i < NUMBER_OF_BITS);
        return words[word_index(i)] & bit_mask(i);
    }

    bool operator[](size_t i) const { return get(i); }

    // Set every bit in [first, last].
    void set_range(size_t first, size_t last)
    {
        for (size_t i{first}; i <= last; i++) {
            set(i, true);
        }
    }

    // Set every bit that is set in other.
    void merge(Bitmap const& other)
    {
        for (size_t w{0}; w < NUMBER_OF_WORDS; w++) {
            words[w] |= other.words[w];
        }
    }

    // The number of set bits.
    size_t count() const
    {
        size_t n{0};

        for (size_t i{0}; i < NUMBER_OF_BITS; i++) {
            n += get(i) ? 1 : 0;
        }

        return n;
    }
};
