/*
 * File:        oscillator.h
 * Module:      odins-eye
 * Purpose:     Bounded oscillator state machine with boundary reflection
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef ODINS_EYE_OSCILLATOR_H
#define ODINS_EYE_OSCILLATOR_H

#include "coordinate.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace odins_eye {

/**
 * @brief Position and direction sign of the oscillator
 */
struct OscillatorState {
    int32_t position = DEFAULT_START_MASK;
    int32_t direction = 1;  // +1 or -1

    bool operator==(const OscillatorState& other) const {
        return position == other.position && direction == other.direction;
    }

    bool operator!=(const OscillatorState& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Outcome of one forward step
 */
struct StepResult {
    OscillatorState state;
    bool bounced = false;
};

/**
 * @brief Boundary a bounce reflected off
 */
enum class BounceEdge {
    None,
    High,
    Low
};

/**
 * @brief One consistent hypothesis for undoing a step
 */
struct InverseCandidate {
    OscillatorState previous;   ///< State before the step
    BounceEdge edge = BounceEdge::None;
};

/**
 * @brief Oscillator state machine
 *
 * The position always stays inside [POSITION_LOW, POSITION_HIGH]. Each step
 * moves it by direction * choice; a move that would leave the range is
 * reflected off the crossed boundary and the direction flips. Because the
 * range is far wider than the largest choice, one reflection per step is
 * always enough.
 */
class Oscillator {
public:
    /**
     * @brief Create an oscillator at the given start position, moving upwards
     * @throws std::invalid_argument if start_position is out of range
     */
    explicit Oscillator(int32_t start_position = DEFAULT_START_MASK);

    /**
     * @brief Apply one choice to the current state
     * @return true if the step bounced
     */
    bool advance(int32_t choice);

    const OscillatorState& state() const { return state_; }
    int32_t position() const { return state_.position; }
    int32_t direction() const { return state_.direction; }

    /**
     * @brief Forward step transition
     *
     * @param state Current state (position in range, direction +1 or -1)
     * @param choice Step amount in [0, 63]
     * @return New state and whether a bounce occurred
     * @throws std::invalid_argument for an out-of-domain state or choice
     */
    static StepResult step(const OscillatorState& state, int32_t choice);

    /**
     * @brief Boundary the unbounded candidate of a step would cross
     */
    static BounceEdge bounce_edge(const OscillatorState& state, int32_t choice);

    /**
     * @brief Undo one step
     *
     * Tests the no-bounce, bounce-on-high and bounce-on-low hypotheses. A
     * hypothesis survives when its previous position is in range and stepping
     * forward from it with the same choice reproduces @p after exactly.
     * Two hypotheses can only survive together at a boundary position; the
     * caller decides what to do with more than one.
     *
     * @param after State after the step
     * @param choice Choice the step applied
     * @return All consistent hypotheses (possibly none)
     */
    static std::vector<InverseCandidate> inverse_step(const OscillatorState& after, int32_t choice);

    /**
     * @brief Minimal accumulated choice sum that puts a walk in @p state
     *
     * A walk starting at (start_position, +1) whose choices sum to S is in a
     * state that depends on S alone (reflection preserves the unfolded
     * distance). The returned travel T is the smallest such S; the walk can
     * sit in @p state after exactly k steps if and only if T <= 63 * k.
     *
     * @return Travel, or nullopt if no walk from the start can reach the state
     */
    static std::optional<int64_t> travel_from(int32_t start_position, const OscillatorState& state);

    static bool is_valid_state(const OscillatorState& state);

private:
    OscillatorState state_;
};

} // namespace odins_eye

#endif // ODINS_EYE_OSCILLATOR_H
