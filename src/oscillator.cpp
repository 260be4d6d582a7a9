/*
 * File:        oscillator.cpp
 * Module:      odins-eye
 * Purpose:     Bounded oscillator state machine implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "oscillator.h"
#include <stdexcept>
#include <string>

namespace odins_eye {

// Length of one full up-and-down cycle in unfolded distance
static constexpr int64_t CYCLE_LENGTH = 2 * static_cast<int64_t>(POSITION_SPAN);

Oscillator::Oscillator(int32_t start_position) {
    if (!is_position_in_range(start_position)) {
        throw std::invalid_argument("Start position out of range: " + std::to_string(start_position));
    }
    state_.position = start_position;
    state_.direction = 1;
}

bool Oscillator::advance(int32_t choice) {
    StepResult result = step(state_, choice);
    state_ = result.state;
    return result.bounced;
}

bool Oscillator::is_valid_state(const OscillatorState& state) {
    return is_position_in_range(state.position) &&
           (state.direction == 1 || state.direction == -1);
}

BounceEdge Oscillator::bounce_edge(const OscillatorState& state, int32_t choice) {
    int64_t candidate = static_cast<int64_t>(state.position) +
                        static_cast<int64_t>(state.direction) * choice;
    if (candidate > POSITION_HIGH) return BounceEdge::High;
    if (candidate < POSITION_LOW) return BounceEdge::Low;
    return BounceEdge::None;
}

StepResult Oscillator::step(const OscillatorState& state, int32_t choice) {
    if (!is_valid_state(state)) {
        throw std::invalid_argument("Invalid oscillator state: position " + std::to_string(state.position) +
                                    ", direction " + std::to_string(state.direction));
    }
    if (!is_choice_in_range(choice)) {
        throw std::invalid_argument("Choice out of range: " + std::to_string(choice));
    }

    int32_t candidate = state.position + state.direction * choice;

    StepResult result;
    if (candidate > POSITION_HIGH) {
        int32_t overshoot = candidate - POSITION_HIGH;
        result.state.position = POSITION_HIGH - overshoot;
        result.state.direction = -state.direction;
        result.bounced = true;
    } else if (candidate < POSITION_LOW) {
        int32_t overshoot = POSITION_LOW - candidate;
        result.state.position = POSITION_LOW + overshoot;
        result.state.direction = -state.direction;
        result.bounced = true;
    } else {
        result.state.position = candidate;
        result.state.direction = state.direction;
        result.bounced = false;
    }

    return result;
}

std::vector<InverseCandidate> Oscillator::inverse_step(const OscillatorState& after, int32_t choice) {
    if (!is_valid_state(after)) {
        throw std::invalid_argument("Invalid oscillator state: position " + std::to_string(after.position) +
                                    ", direction " + std::to_string(after.direction));
    }
    if (!is_choice_in_range(choice)) {
        throw std::invalid_argument("Choice out of range: " + std::to_string(choice));
    }

    // Previous state proposed by each hypothesis
    struct Hypothesis {
        BounceEdge edge;
        int32_t position;
        int32_t direction;
    };

    const int32_t pos = after.position;
    const int32_t dir = after.direction;

    const Hypothesis hypotheses[] = {
        // Direction unchanged, plain move
        {BounceEdge::None, pos - dir * choice, dir},
        // Was moving up, reflected off HIGH
        {BounceEdge::High, 2 * POSITION_HIGH - pos - choice, 1},
        // Was moving down, reflected off LOW
        {BounceEdge::Low, 2 * POSITION_LOW - pos + choice, -1},
    };

    std::vector<InverseCandidate> candidates;
    for (const auto& hypothesis : hypotheses) {
        if (!is_position_in_range(hypothesis.position)) continue;

        OscillatorState previous;
        previous.position = hypothesis.position;
        previous.direction = hypothesis.direction;

        // Forward re-application must reproduce the state and the bounce edge
        if (bounce_edge(previous, choice) != hypothesis.edge) continue;
        if (step(previous, choice).state != after) continue;

        InverseCandidate candidate;
        candidate.previous = previous;
        candidate.edge = hypothesis.edge;
        candidates.push_back(candidate);
    }

    return candidates;
}

std::optional<int64_t> Oscillator::travel_from(int32_t start_position, const OscillatorState& state) {
    if (!is_position_in_range(start_position) || !is_valid_state(state)) {
        return std::nullopt;
    }

    // Unfolded distance u - LOW, taken modulo one cycle:
    //   (0, SPAN]        moving up,   position = LOW + r
    //   (SPAN, 2*SPAN]   moving down, position = HIGH - (r - SPAN)
    // r == 0 only for a walk that starts on LOW and has not moved yet.
    const int64_t start_offset = static_cast<int64_t>(start_position) - POSITION_LOW;

    if (state.direction == 1) {
        if (state.position == POSITION_LOW) {
            // Arriving at LOW always happens moving down
            if (start_position == POSITION_LOW) return 0;
            return std::nullopt;
        }
        int64_t offset = static_cast<int64_t>(state.position) - POSITION_LOW;
        int64_t travel = offset - start_offset;
        if (travel < 0) travel += CYCLE_LENGTH;
        return travel;
    }

    // Arriving at HIGH always happens moving up
    if (state.position == POSITION_HIGH) return std::nullopt;

    int64_t offset = static_cast<int64_t>(POSITION_SPAN) + (POSITION_HIGH - state.position);
    return offset - start_offset;
}

} // namespace odins_eye
