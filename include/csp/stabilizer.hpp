#pragma once
#include "color.hpp"
#include <cstddef>
#include <deque>
#include <optional>

namespace csp {

/// How many of the N history frames must agree on a sticker.
enum class QuorumPolicy { Unanimous, AllButOne };

struct StabilizerParams {
    std::size_t capacity = 5;
    QuorumPolicy policy = QuorumPolicy::AllButOne;
};

/// N for Unanimous, N-1 for AllButOne (never below 1).
std::size_t required_votes(const StabilizerParams& p);

/// Rolling window of classified frames, oldest first.
struct History {
    std::size_t capacity{5};
    std::deque<FaceReading> frames;

    bool full() const { return frames.size() == capacity; }
    std::size_t size() const { return frames.size(); }
};

enum class StabilizerState { Accumulating, Deciding };

struct Vote { DiscreteColor color{DiscreteColor::Unknown}; std::size_t count{0}; };

/// Most frequent color at one sticker position; ties go to the color seen first.
Vote tally(const History& h, std::size_t position);

/// Consensus reading if every position has >= required votes for a known color.
std::optional<FaceReading> evaluate_quorum(const History& h, std::size_t required);

struct StepResult {
    History history;                        // state to carry into the next frame
    std::optional<FaceReading> consensus;   // set only on a successful decision
    StabilizerState state;                  // Deciding when quorum was evaluated
};

/// Pure per-frame transition: append, trim to h.capacity, decide when full.
/// N is always h.capacity; only p.policy is read from the params.
/// A consensus clears the returned history; a failed decision keeps it.
StepResult step(History h, const FaceReading& frame, const StabilizerParams& p);

/// Owns one History and feeds it through step().
class TemporalStabilizer {
public:
    explicit TemporalStabilizer(const StabilizerParams& p = {});

    std::optional<FaceReading> push(const FaceReading& frame);

    void reset() { history_.frames.clear(); last_state_ = StabilizerState::Accumulating; }

    const History& history() const { return history_; }
    StabilizerState last_state() const { return last_state_; }
    const StabilizerParams& params() const { return p_; }

private:
    StabilizerParams p_;
    History history_;
    StabilizerState last_state_{StabilizerState::Accumulating};
};
}
