/*
 * File:        odins_eye_codec.cpp
 * Module:      odins-eye
 * Purpose:     Coordinate codec implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "odins_eye_codec.h"
#include "sextet_mapper.h"
#include "logging.h"
#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace odins_eye {

// Stream read block size
static constexpr size_t READ_BLOCK_SIZE = 64 * 1024;

// Largest byte count whose bit length still fits the step counter
static constexpr int64_t MAX_LENGTH_BYTES = std::numeric_limits<int64_t>::max() / 8;

const char* codec_error_name(CodecError error) {
    switch (error) {
        case CodecError::None: return "None";
        case CodecError::OutOfRangeStartPosition: return "OutOfRangeStartPosition";
        case CodecError::InvalidChoice: return "InvalidChoice";
        case CodecError::AmbiguousReconstruction: return "AmbiguousReconstruction";
        case CodecError::LengthMismatch: return "LengthMismatch";
    }
    return "Unknown";
}

// True if a walk with the given travel fits in the number of steps left
static bool travel_fits(int64_t travel, uint64_t steps_left) {
    uint64_t steps_needed = (static_cast<uint64_t>(travel) + CHOICE_MAX - 1) / CHOICE_MAX;
    return steps_needed <= steps_left;
}

/**
 * @brief Forward oscillator walk over a byte stream
 *
 * Holds the oscillator, the sextet packer and the anchor of the most
 * recent step; nothing else of the trajectory is kept.
 */
class OdinsEyeCodec::ForwardWalk {
public:
    ForwardWalk(int32_t start_mask, EncodeStats& stats)
        : oscillator_(start_mask), stats_(stats), prev_position_(start_mask) {}

    bool push(uint8_t byte) {
        std::array<int32_t, 2> choices{};
        int32_t count = packer_.push(byte, choices);
        for (int32_t i = 0; i < count; ++i) {
            if (!apply(choices[i])) return false;
        }
        ++byte_count_;
        return true;
    }

    bool finish() {
        int32_t choice = 0;
        if (packer_.finish(choice)) {
            return apply(choice);
        }
        return true;
    }

    int32_t position() const { return oscillator_.position(); }
    int32_t prev_position() const { return prev_position_; }
    int32_t last_choice() const { return last_choice_; }
    int64_t byte_count() const { return byte_count_; }
    int32_t rejected_choice() const { return rejected_choice_; }

private:
    bool apply(int32_t choice) {
        if (!is_choice_in_range(choice)) {
            rejected_choice_ = choice;
            return false;
        }

        OscillatorState before = oscillator_.state();
        BounceEdge edge = Oscillator::bounce_edge(before, choice);
        oscillator_.advance(choice);

        if (edge == BounceEdge::High) {
            ++stats_.bounces_high;
            ODINS_EYE_LOG_TRACE("Step {}: bounce off HIGH, {} -> {}", stats_.steps, before.position, oscillator_.position());
        } else if (edge == BounceEdge::Low) {
            ++stats_.bounces_low;
            ODINS_EYE_LOG_TRACE("Step {}: bounce off LOW, {} -> {}", stats_.steps, before.position, oscillator_.position());
        }

        prev_position_ = before.position;
        last_choice_ = choice;
        ++stats_.steps;
        return true;
    }

    Oscillator oscillator_;
    SextetPacker packer_;
    EncodeStats& stats_;
    int32_t prev_position_;
    int32_t last_choice_ = NO_CHOICE;
    int32_t rejected_choice_ = NO_CHOICE;
    int64_t byte_count_ = 0;
};

OdinsEyeCodec::OdinsEyeCodec(int32_t start_mask)
    : start_mask_(start_mask) {
}

bool OdinsEyeCodec::fail(CodecError kind, const std::string& message) {
    error_kind_ = kind;
    error_message_ = message;
    ODINS_EYE_LOG_WARN("{}: {}", codec_error_name(kind), message);
    return false;
}

void OdinsEyeCodec::clear_error() {
    error_kind_ = CodecError::None;
    error_message_.clear();
}

bool OdinsEyeCodec::begin_encode() {
    clear_error();
    stats_ = EncodeStats();

    if (!is_position_in_range(start_mask_)) {
        return fail(CodecError::OutOfRangeStartPosition,
                    "Start mask " + std::to_string(start_mask_) + " is outside [" +
                    std::to_string(POSITION_LOW) + ", " + std::to_string(POSITION_HIGH) + "]");
    }
    return true;
}

bool OdinsEyeCodec::finish_encode(ForwardWalk& walk, Coordinate& coordinate) {
    if (!walk.finish()) {
        return fail(CodecError::InvalidChoice,
                    "Byte mapping produced choice " + std::to_string(walk.rejected_choice()));
    }

    Coordinate result;
    result.start_mask = start_mask_;
    result.end_mask = walk.position();
    result.prev_mask = walk.prev_position();
    result.end_d = walk.last_choice();
    result.length_bytes = walk.byte_count();

    ODINS_EYE_LOG_DEBUG("Encoded {} bytes in {} steps ({} high / {} low bounces): start {}, prev {}, end {}, end_d {}",
                        result.length_bytes, stats_.steps, stats_.bounces_high, stats_.bounces_low,
                        result.start_mask, result.prev_mask, result.end_mask, result.end_d);

    coordinate = result;
    return true;
}

bool OdinsEyeCodec::encode(const std::vector<uint8_t>& data, Coordinate& coordinate) {
    return encode(data.data(), data.size(), coordinate);
}

bool OdinsEyeCodec::encode(const uint8_t* data, size_t size, Coordinate& coordinate) {
    if (!begin_encode()) return false;

    if (data == nullptr && size > 0) {
        return fail(CodecError::LengthMismatch, "No data supplied for " + std::to_string(size) + " bytes");
    }

    ForwardWalk walk(start_mask_, stats_);
    for (size_t i = 0; i < size; ++i) {
        if (!walk.push(data[i])) {
            return fail(CodecError::InvalidChoice,
                        "Byte mapping produced choice " + std::to_string(walk.rejected_choice()) +
                        " at byte " + std::to_string(i));
        }
    }

    return finish_encode(walk, coordinate);
}

bool OdinsEyeCodec::encode_stream(std::istream& input, Coordinate& coordinate) {
    if (!begin_encode()) return false;

    ForwardWalk walk(start_mask_, stats_);
    std::vector<char> block(READ_BLOCK_SIZE);

    while (input) {
        input.read(block.data(), static_cast<std::streamsize>(block.size()));
        std::streamsize got = input.gcount();
        for (std::streamsize i = 0; i < got; ++i) {
            if (!walk.push(static_cast<uint8_t>(block[static_cast<size_t>(i)]))) {
                return fail(CodecError::InvalidChoice,
                            "Byte mapping produced choice " + std::to_string(walk.rejected_choice()) +
                            " at byte " + std::to_string(walk.byte_count()));
            }
        }
    }

    if (input.bad()) {
        return fail(CodecError::LengthMismatch,
                    "Input stream failed after " + std::to_string(walk.byte_count()) + " bytes");
    }

    return finish_encode(walk, coordinate);
}

bool OdinsEyeCodec::decode(const Coordinate& coordinate, std::vector<uint8_t>& output) {
    return decode(coordinate, coordinate.length_bytes, output);
}

bool OdinsEyeCodec::decode(const Coordinate& coordinate, int64_t length_bytes, std::vector<uint8_t>& output) {
    clear_error();
    output.clear();

    if (length_bytes < 0) {
        return fail(CodecError::LengthMismatch, "Negative length: " + std::to_string(length_bytes));
    }
    if (coordinate.length_bytes != length_bytes) {
        return fail(CodecError::LengthMismatch,
                    "Expected length " + std::to_string(length_bytes) + " but coordinate records " +
                    std::to_string(coordinate.length_bytes));
    }
    if (length_bytes > MAX_LENGTH_BYTES) {
        return fail(CodecError::LengthMismatch, "Length too large: " + std::to_string(length_bytes));
    }
    if (!is_position_in_range(coordinate.start_mask)) {
        return fail(CodecError::OutOfRangeStartPosition,
                    "Start mask " + std::to_string(coordinate.start_mask) + " is out of range");
    }
    if (!is_position_in_range(coordinate.end_mask) || !is_position_in_range(coordinate.prev_mask)) {
        return fail(CodecError::AmbiguousReconstruction,
                    "End mask " + std::to_string(coordinate.end_mask) + " or prev mask " +
                    std::to_string(coordinate.prev_mask) + " is out of range");
    }

    if (length_bytes == 0) {
        if (coordinate.end_mask != coordinate.start_mask ||
            coordinate.prev_mask != coordinate.start_mask ||
            coordinate.end_d != NO_CHOICE) {
            return fail(CodecError::LengthMismatch,
                        "Zero-length coordinate must have end and prev equal to start and no final choice");
        }
        ODINS_EYE_LOG_DEBUG("Decoded empty coordinate at start {}", coordinate.start_mask);
        return true;
    }

    if (!is_choice_in_range(coordinate.end_d)) {
        return fail(CodecError::InvalidChoice, "Final choice " + std::to_string(coordinate.end_d) + " is out of range");
    }

    const uint64_t byte_count = static_cast<uint64_t>(length_bytes);
    const uint64_t steps = SextetMapper::choice_count(byte_count);

    if (!SextetMapper::has_clean_padding(coordinate.end_d, byte_count)) {
        return fail(CodecError::AmbiguousReconstruction,
                    "Final choice " + std::to_string(coordinate.end_d) + " has non-zero padding bits for " +
                    std::to_string(length_bytes) + " bytes");
    }

    try {
        // Anchor: which direction before the last step reproduces end_mask
        std::vector<OscillatorState> anchors;
        for (int32_t direction : {1, -1}) {
            OscillatorState before;
            before.position = coordinate.prev_mask;
            before.direction = direction;

            if (Oscillator::step(before, coordinate.end_d).state.position != coordinate.end_mask) continue;

            auto travel = Oscillator::travel_from(coordinate.start_mask, before);
            if (!travel || !travel_fits(*travel, steps - 1)) continue;

            anchors.push_back(before);
        }

        if (anchors.empty()) {
            return fail(CodecError::AmbiguousReconstruction,
                        "Anchor mismatch: no walk of " + std::to_string(steps) + " steps from " +
                        std::to_string(coordinate.start_mask) + " ends with prev " +
                        std::to_string(coordinate.prev_mask) + " -> end " + std::to_string(coordinate.end_mask));
        }
        if (anchors.size() > 1) {
            return fail(CodecError::AmbiguousReconstruction,
                        "Anchor is consistent with both directions before the last step");
        }

        std::vector<int32_t> choices;
        if (!walk_backward(coordinate.start_mask, anchors.front(), steps - 1, choices)) {
            return false;
        }

        std::reverse(choices.begin(), choices.end());
        choices.push_back(coordinate.end_d);

        std::vector<uint8_t> bytes;
        if (!SextetMapper::to_bytes(choices, byte_count, bytes)) {
            return fail(CodecError::InvalidChoice, "Recovered choices do not map back to " +
                        std::to_string(length_bytes) + " bytes");
        }

        ODINS_EYE_LOG_DEBUG("Decoded {} bytes from start {} in {} backward steps",
                            length_bytes, coordinate.start_mask, steps);

        output.swap(bytes);
        return true;

    } catch (const std::invalid_argument& e) {
        output.clear();
        return fail(CodecError::AmbiguousReconstruction, std::string("Inconsistent oscillator state: ") + e.what());
    }
}

bool OdinsEyeCodec::walk_backward(int32_t start_mask,
                                  const OscillatorState& anchor,
                                  uint64_t steps,
                                  std::vector<int32_t>& choices) {
    choices.clear();
    choices.reserve(static_cast<size_t>(std::min<uint64_t>(steps, 1u << 20)));

    OscillatorState state = anchor;
    uint64_t bounces = 0;

    for (uint64_t remaining = steps; remaining > 0; --remaining) {
        int32_t found = 0;
        OscillatorState previous;
        int32_t recovered_choice = NO_CHOICE;
        BounceEdge recovered_edge = BounceEdge::None;

        for (int32_t choice = CHOICE_MIN; choice <= CHOICE_MAX; ++choice) {
            for (const auto& candidate : Oscillator::inverse_step(state, choice)) {
                auto travel = Oscillator::travel_from(start_mask, candidate.previous);
                if (!travel || !travel_fits(*travel, remaining - 1)) continue;

                if (++found > 1) {
                    return fail(CodecError::AmbiguousReconstruction,
                                "More than one consistent predecessor of position " +
                                std::to_string(state.position) + " with " + std::to_string(remaining) +
                                " steps left");
                }
                previous = candidate.previous;
                recovered_choice = choice;
                recovered_edge = candidate.edge;
            }
        }

        if (found == 0) {
            return fail(CodecError::AmbiguousReconstruction,
                        "No consistent predecessor of position " + std::to_string(state.position) +
                        " with " + std::to_string(remaining) + " steps left");
        }

        if (recovered_edge != BounceEdge::None) {
            ++bounces;
            ODINS_EYE_LOG_TRACE("Undo bounce off {} at position {}",
                                recovered_edge == BounceEdge::High ? "HIGH" : "LOW", state.position);
        }

        choices.push_back(recovered_choice);
        state = previous;
    }

    OscillatorState start;
    start.position = start_mask;
    start.direction = 1;
    if (state != start) {
        return fail(CodecError::AmbiguousReconstruction,
                    "Backward walk ended at " + std::to_string(state.position) + " instead of the start mask");
    }

    ODINS_EYE_LOG_DEBUG("Backward walk undid {} steps and {} bounces", steps, bounces);
    return true;
}

} // namespace odins_eye
