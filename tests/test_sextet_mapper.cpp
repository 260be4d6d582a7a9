/*
 * File:        test_sextet_mapper.cpp
 * Module:      odins-eye
 * Purpose:     Test the byte to choice bijection
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "sextet_mapper.h"
#include <array>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace odins_eye;

static int g_failures = 0;

static void check(bool condition, const std::string& description) {
    if (condition) {
        std::cout << "  ok   " << description << "\n";
    } else {
        std::cout << "  FAIL " << description << "\n";
        ++g_failures;
    }
}

// Run a whole byte sequence through the streaming packer
static std::vector<int32_t> choices_of(const std::vector<uint8_t>& bytes) {
    std::vector<int32_t> choices;
    SextetPacker packer;
    std::array<int32_t, 2> produced{};
    for (uint8_t byte : bytes) {
        int32_t count = packer.push(byte, produced);
        for (int32_t i = 0; i < count; ++i) {
            choices.push_back(produced[i]);
        }
    }
    int32_t last = 0;
    if (packer.finish(last)) {
        choices.push_back(last);
    }
    return choices;
}

static void test_counts() {
    std::cout << "Choice counts and padding:\n";

    check(SextetMapper::choice_count(0) == 0, "0 bytes -> 0 choices");
    check(SextetMapper::choice_count(1) == 2, "1 byte -> 2 choices");
    check(SextetMapper::choice_count(2) == 3, "2 bytes -> 3 choices");
    check(SextetMapper::choice_count(3) == 4, "3 bytes -> 4 choices");
    check(SextetMapper::choice_count(1200) == 1600, "1200 bytes -> 1600 choices");

    check(SextetMapper::padding_bits(1) == 4, "1 byte pads 4 bits");
    check(SextetMapper::padding_bits(2) == 2, "2 bytes pad 2 bits");
    check(SextetMapper::padding_bits(3) == 0, "3 bytes pad nothing");

    check(SextetMapper::has_clean_padding(48, 1), "48 has four clean low bits");
    check(!SextetMapper::has_clean_padding(49, 1), "49 has a dirty padding bit");
    check(SextetMapper::has_clean_padding(63, 3), "no padding accepts any choice");
}

static void test_known_values() {
    std::cout << "Known values:\n";

    check(choices_of({0x28}) == std::vector<int32_t>({10, 0}), "0x28 -> 10, 0");
    check(choices_of({0xFF}) == std::vector<int32_t>({63, 48}), "0xFF -> 63, 48");
    check(choices_of({0xFF, 0xFF}) == std::vector<int32_t>({63, 63, 60}), "0xFFFF -> 63, 63, 60");

    // Same grouping as base64: "Man" -> "TWFu"
    check(choices_of({'M', 'a', 'n'}) == std::vector<int32_t>({19, 22, 5, 46}), "\"Man\" -> 19, 22, 5, 46");

    check(choices_of({}).empty(), "empty input has no choices");

    SextetPacker packer;
    std::array<int32_t, 2> produced{};
    int32_t count = packer.push(0x4D, produced);
    check(count == 1 && produced[0] == 19, "first byte completes one sextet");
    count = packer.push(0x61, produced);
    check(count == 1 && produced[0] == 22, "second byte completes one sextet");
    count = packer.push(0x6E, produced);
    check(count == 2 && produced[0] == 5 && produced[1] == 46, "third byte completes two sextets");
    int32_t last = -1;
    check(!packer.finish(last), "no padded sextet after a multiple of three bytes");
}

static void test_bijection() {
    std::cout << "Bijection:\n";

    std::set<std::pair<int32_t, int32_t>> seen;
    bool single_ok = true;
    for (int32_t value = 0; value < 256; ++value) {
        std::vector<uint8_t> input = {static_cast<uint8_t>(value)};
        std::vector<int32_t> choices = choices_of(input);
        std::vector<uint8_t> output;

        if (choices.size() != 2 ||
            !SextetMapper::has_clean_padding(choices[1], 1) ||
            !SextetMapper::to_bytes(choices, 1, output) ||
            output != input) {
            single_ok = false;
        }
        if (choices.size() == 2) {
            seen.insert(std::make_pair(choices[0], choices[1]));
        }
    }
    check(single_ok, "every single byte maps to clean choices and back");
    check(seen.size() == 256, "256 bytes give 256 distinct choice pairs");

    bool pair_ok = true;
    for (int32_t value = 0; value < 65536; ++value) {
        std::vector<uint8_t> input = {static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)};
        std::vector<uint8_t> output;
        if (!SextetMapper::to_bytes(choices_of(input), 2, output) || output != input) {
            pair_ok = false;
            break;
        }
    }
    check(pair_ok, "every two-byte sequence maps back exactly");

    // Every clean single-byte choice pair is hit: 64 * 4 == 256
    bool inverse_ok = true;
    for (int32_t first = 0; first < 64; ++first) {
        for (int32_t second = 0; second < 64; second += 16) {
            std::vector<uint8_t> output;
            if (!SextetMapper::to_bytes({first, second}, 1, output) ||
                choices_of(output) != std::vector<int32_t>({first, second})) {
                inverse_ok = false;
            }
        }
    }
    check(inverse_ok, "every clean choice pair maps to a byte and back");
}

static void test_rejections() {
    std::cout << "Rejections:\n";

    std::vector<uint8_t> output = {0xAA};
    check(!SextetMapper::to_bytes({10, 1}, 1, output), "dirty padding is rejected");
    check(!SextetMapper::to_bytes({10}, 1, output), "too few choices are rejected");
    check(!SextetMapper::to_bytes({10, 0, 0}, 1, output), "too many choices are rejected");
    check(!SextetMapper::to_bytes({64, 0}, 1, output), "choice 64 is rejected");
    check(!SextetMapper::to_bytes({-1, 0}, 1, output), "negative choice is rejected");
    check(output == std::vector<uint8_t>({0xAA}), "output is untouched on failure");

    check(SextetMapper::to_bytes({}, 0, output) && output.empty(), "no choices give no bytes");
}

int main() {
    std::cout << "Testing sextet mapper...\n\n";

    test_counts();
    test_known_values();
    test_bijection();
    test_rejections();

    if (g_failures > 0) {
        std::cout << "\n" << g_failures << " check(s) failed\n";
        return 1;
    }

    std::cout << "\nSextet mapper test completed successfully!\n";
    return 0;
}
