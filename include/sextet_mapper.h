/*
 * File:        sextet_mapper.h
 * Module:      odins-eye
 * Purpose:     Bijection between bytes and 6-bit oscillator choices
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_SEXTET_MAPPER_H
#define ODINS_EYE_SEXTET_MAPPER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace odins_eye {

/**
 * @brief Streaming byte to sextet regrouping
 *
 * Holds fewer than six pending bits between bytes, so encoding never
 * buffers the input.
 */
class SextetPacker {
public:
    /**
     * @brief Feed one byte
     * @param byte Input byte
     * @param choices Output: completed choices, in order
     * @return Number of choices written to @p choices (0, 1 or 2)
     */
    int32_t push(uint8_t byte, std::array<int32_t, 2>& choices);

    /**
     * @brief Flush the partial sextet left after the last byte
     * @param choice Output: the zero-padded final choice
     * @return true if a padded choice was produced
     */
    bool finish(int32_t& choice);

    void reset();

private:
    uint32_t bit_buffer_ = 0;
    int32_t bit_count_ = 0;
};

/**
 * @brief Byte to choice mapping
 *
 * The input is read as one big-endian bit string and cut into 6-bit groups
 * (sextets), each one a choice in [0, 63]. The high bits of a byte complete
 * one choice and its remaining low bits lead the next, so no bit of any byte
 * is lost. The last sextet is padded with zero bits.
 *
 * For a known byte count n the mapping is a bijection between byte sequences
 * of length n and choice sequences of length ceil(8n / 6) whose final choice
 * has zero padding bits:
 *
 *   n mod 3 == 0: 4n/3 choices, no padding
 *   n mod 3 == 1: 4 bits of padding (1 byte  -> 2 sextets)
 *   n mod 3 == 2: 2 bits of padding (2 bytes -> 3 sextets)
 */
class SextetMapper {
public:
    /**
     * @brief Number of choices produced for a given byte count
     */
    static uint64_t choice_count(uint64_t byte_count);

    /**
     * @brief Number of zero bits appended to the final choice
     */
    static int32_t padding_bits(uint64_t byte_count);

    /**
     * @brief Check that a final choice has zero padding bits for the byte count
     */
    static bool has_clean_padding(int32_t final_choice, uint64_t byte_count);

    /**
     * @brief Map a choice sequence back to bytes
     *
     * @param choices Choice sequence (must hold exactly choice_count(byte_count) entries)
     * @param byte_count Original byte count
     * @param bytes Output byte sequence
     * @return false if the count is wrong, a choice is out of range or the
     *         padding bits are not zero
     */
    static bool to_bytes(const std::vector<int32_t>& choices,
                         uint64_t byte_count,
                         std::vector<uint8_t>& bytes);
};

} // namespace odins_eye

#endif // ODINS_EYE_SEXTET_MAPPER_H
