/*
 * File:        test_codec_errors.cpp
 * Module:      odins-eye
 * Purpose:     Test codec error reporting
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "odins_eye_codec.h"
#include "logging.h"
#include <iostream>
#include <limits>
#include <string>
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

static Coordinate make_coordinate(int32_t start, int32_t end, int32_t prev, int32_t end_d, int64_t length) {
    Coordinate coordinate;
    coordinate.start_mask = start;
    coordinate.end_mask = end;
    coordinate.prev_mask = prev;
    coordinate.end_d = end_d;
    coordinate.length_bytes = length;
    return coordinate;
}

// Decode and check the reported error kind; output must be left empty
static bool decode_fails_with(const Coordinate& coordinate, int64_t length, CodecError expected) {
    OdinsEyeCodec codec(coordinate.start_mask);
    std::vector<uint8_t> output = {0xAA, 0xBB};
    bool ok = codec.decode(coordinate, length, output);
    if (ok || codec.get_error_kind() != expected || !output.empty() || codec.get_error().empty()) {
        std::cout << "       got " << codec_error_name(codec.get_error_kind()) << ": " << codec.get_error() << "\n";
        return false;
    }
    return true;
}

static void test_encode_errors() {
    std::cout << "Encode errors:\n";

    Coordinate coordinate = make_coordinate(1, 2, 3, 4, 5);
    Coordinate untouched = coordinate;

    OdinsEyeCodec below(9999);
    check(!below.encode(std::vector<uint8_t>({0x28}), coordinate), "start 9999 is rejected");
    check(below.get_error_kind() == CodecError::OutOfRangeStartPosition, "start 9999 reports OutOfRangeStartPosition");
    check(coordinate == untouched, "coordinate is untouched on failure");

    OdinsEyeCodec above(100000);
    check(!above.encode(std::vector<uint8_t>(), coordinate), "start 100000 is rejected even for empty input");
    check(above.get_error_kind() == CodecError::OutOfRangeStartPosition, "start 100000 reports OutOfRangeStartPosition");

    OdinsEyeCodec edge_low(10000);
    OdinsEyeCodec edge_high(99999);
    check(edge_low.encode(std::vector<uint8_t>({0xFF}), coordinate), "start on LOW is accepted");
    check(edge_high.encode(std::vector<uint8_t>({0xFF}), coordinate), "start on HIGH is accepted");

    OdinsEyeCodec null_data(50000);
    check(!null_data.encode(nullptr, 4, coordinate), "null pointer with a size is rejected");
    check(null_data.get_error_kind() == CodecError::LengthMismatch, "null pointer reports LengthMismatch");
}

static void test_decode_argument_errors() {
    std::cout << "Decode argument errors:\n";

    Coordinate good = make_coordinate(50000, 50010, 50010, 0, 1);

    check(decode_fails_with(good, -1, CodecError::LengthMismatch), "negative length is rejected");
    check(decode_fails_with(make_coordinate(50000, 50010, 50010, 0, -1), -1, CodecError::LengthMismatch),
          "negative recorded length is rejected");
    check(decode_fails_with(good, 2, CodecError::LengthMismatch), "length differing from the coordinate is rejected");

    check(decode_fails_with(make_coordinate(9999, 50010, 50010, 0, 1), 1, CodecError::OutOfRangeStartPosition),
          "start 9999 is rejected");
    check(decode_fails_with(make_coordinate(100000, 50010, 50010, 0, 1), 1, CodecError::OutOfRangeStartPosition),
          "start 100000 is rejected");

    check(decode_fails_with(make_coordinate(50000, 50010, 50010, 64, 1), 1, CodecError::InvalidChoice),
          "final choice 64 is rejected");
    check(decode_fails_with(make_coordinate(50000, 50010, 50010, -1, 1), 1, CodecError::InvalidChoice),
          "final choice -1 with bytes is rejected");

    check(decode_fails_with(make_coordinate(50000, 50000, 50000, 0, 0), 0, CodecError::LengthMismatch),
          "zero length with a final choice is rejected");
    check(decode_fails_with(make_coordinate(50000, 50010, 50000, NO_CHOICE, 0), 0, CodecError::LengthMismatch),
          "zero length with a moved end is rejected");
}

static void test_decode_consistency_errors() {
    std::cout << "Decode consistency errors:\n";

    // 0x28 from 50000 is {50000, 50010, 50010, 0, 1}

    check(decode_fails_with(make_coordinate(50000, 50010, 50010, 0, 5), 5, CodecError::AmbiguousReconstruction),
          "coordinate claimed for the wrong length is refused");

    check(decode_fails_with(make_coordinate(50000, 51010, 50010, 0, 1), 1, CodecError::AmbiguousReconstruction),
          "end not reachable from prev with end_d is refused");

    check(decode_fails_with(make_coordinate(50000, 50011, 50010, 1, 1), 1, CodecError::AmbiguousReconstruction),
          "final choice with non-zero padding bits is refused");

    // 0xFFFF from 50000 ends with choice 60, which has dirty padding for one byte
    check(decode_fails_with(make_coordinate(50000, 50186, 50126, 60, 1), 1, CodecError::AmbiguousReconstruction),
          "two-byte coordinate claimed as one byte is refused");

    check(decode_fails_with(make_coordinate(50000, 50100, 50100, 0, 1), 1, CodecError::AmbiguousReconstruction),
          "prev too far from start for the step count is refused");

    check(decode_fails_with(make_coordinate(50000, 100000, 50010, 0, 1), 1, CodecError::AmbiguousReconstruction),
          "end outside the position range is refused");
}

static void test_huge_lengths() {
    std::cout << "Huge lengths:\n";

    const int64_t too_long = std::numeric_limits<int64_t>::max() / 8 + 1;
    check(decode_fails_with(make_coordinate(50000, 50010, 50010, 0, too_long), too_long, CodecError::LengthMismatch),
          "length whose bit count overflows is rejected");

    // Both directions at 50010 are reachable in that many steps, so the anchor is not unique
    const int64_t terabyte = static_cast<int64_t>(1) << 40;
    check(decode_fails_with(make_coordinate(50000, 50010, 50010, 0, terabyte), terabyte,
                            CodecError::AmbiguousReconstruction),
          "terabyte length is refused as ambiguous");
}

static void test_error_reset() {
    std::cout << "Error reset:\n";

    OdinsEyeCodec codec(50000);
    std::vector<uint8_t> output;
    check(!codec.decode(make_coordinate(50000, 50010, 50010, 0, 1), 3, output), "mismatched decode fails");
    check(codec.get_error_kind() == CodecError::LengthMismatch, "error kind is recorded");

    check(codec.decode(make_coordinate(50000, 50010, 50010, 0, 1), 1, output), "valid decode succeeds");
    check(codec.get_error_kind() == CodecError::None && codec.get_error().empty(), "error is cleared");
    check(output == std::vector<uint8_t>({0x28}), "output holds the recovered byte");

    check(std::string(codec_error_name(CodecError::AmbiguousReconstruction)) == "AmbiguousReconstruction",
          "error kinds have printable names");
}

int main() {
    init_logging("off");

    std::cout << "Testing codec errors...\n\n";

    test_encode_errors();
    test_decode_argument_errors();
    test_decode_consistency_errors();
    test_huge_lengths();
    test_error_reset();

    if (g_failures > 0) {
        std::cout << "\n" << g_failures << " check(s) failed\n";
        return 1;
    }

    std::cout << "\nCodec error test completed successfully!\n";
    return 0;
}
