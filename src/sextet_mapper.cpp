/*
 * File:        sextet_mapper.cpp
 * Module:      odins-eye
 * Purpose:     Bijection between bytes and 6-bit oscillator choices
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "sextet_mapper.h"
#include "coordinate.h"

namespace odins_eye {

static constexpr uint32_t SEXTET_MASK = 0x3F;

int32_t SextetPacker::push(uint8_t byte, std::array<int32_t, 2>& choices) {
    bit_buffer_ = (bit_buffer_ << 8) | byte;
    bit_count_ += 8;

    int32_t produced = 0;
    while (bit_count_ >= CHOICE_BITS) {
        bit_count_ -= CHOICE_BITS;
        choices[produced++] = static_cast<int32_t>((bit_buffer_ >> bit_count_) & SEXTET_MASK);
    }

    // Drop consumed bits
    bit_buffer_ &= (1u << bit_count_) - 1u;
    return produced;
}

bool SextetPacker::finish(int32_t& choice) {
    if (bit_count_ == 0) return false;

    choice = static_cast<int32_t>((bit_buffer_ << (CHOICE_BITS - bit_count_)) & SEXTET_MASK);
    reset();
    return true;
}

void SextetPacker::reset() {
    bit_buffer_ = 0;
    bit_count_ = 0;
}

uint64_t SextetMapper::choice_count(uint64_t byte_count) {
    return (byte_count * 8 + (CHOICE_BITS - 1)) / CHOICE_BITS;
}

int32_t SextetMapper::padding_bits(uint64_t byte_count) {
    return static_cast<int32_t>(choice_count(byte_count) * CHOICE_BITS - byte_count * 8);
}

bool SextetMapper::has_clean_padding(int32_t final_choice, uint64_t byte_count) {
    uint32_t padding_mask = (1u << padding_bits(byte_count)) - 1u;
    return (static_cast<uint32_t>(final_choice) & padding_mask) == 0;
}

bool SextetMapper::to_bytes(const std::vector<int32_t>& choices,
                            uint64_t byte_count,
                            std::vector<uint8_t>& bytes) {
    if (choices.size() != choice_count(byte_count)) return false;
    if (!choices.empty() && !has_clean_padding(choices.back(), byte_count)) return false;

    std::vector<uint8_t> result;
    result.reserve(byte_count);

    uint32_t bit_buffer = 0;
    int32_t bit_count = 0;
    for (int32_t choice : choices) {
        if (!is_choice_in_range(choice)) return false;

        bit_buffer = (bit_buffer << CHOICE_BITS) | static_cast<uint32_t>(choice);
        bit_count += CHOICE_BITS;

        if (bit_count >= 8 && result.size() < byte_count) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bit_buffer >> bit_count) & 0xFF));
            bit_buffer &= (1u << bit_count) - 1u;
        }
    }

    // Whatever is left is the zero padding of the final choice
    if (result.size() != byte_count) return false;

    bytes.swap(result);
    return true;
}

} // namespace odins_eye
