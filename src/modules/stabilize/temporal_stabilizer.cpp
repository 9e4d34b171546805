#include "csp/stabilizer.hpp"
#include <array>
#include <stdexcept>
#include <utility>

namespace csp {
std::size_t required_votes(const StabilizerParams& p){
  if(p.policy == QuorumPolicy::Unanimous) return p.capacity;
  return p.capacity > 1 ? p.capacity - 1 : 1;
}

Vote tally(const History& h, std::size_t position){
  std::array<std::size_t, kColorCount> counts{};
  std::array<DiscreteColor, kColorCount> order{};
  std::size_t seen = 0;
  for(auto& f : h.frames){
    const DiscreteColor c = f.at(position);
    if(counts[static_cast<std::size_t>(c)]++ == 0) order[seen++] = c;
  }
  Vote best;
  for(std::size_t i=0;i<seen;++i){
    const std::size_t n = counts[static_cast<std::size_t>(order[i])];
    if(n > best.count) best = Vote{order[i], n};
  }
  return best;
}

std::optional<FaceReading> evaluate_quorum(const History& h, std::size_t required){
  FaceReading out;
  for(std::size_t pos=0; pos<kStickers; ++pos){
    const Vote v = tally(h, pos);
    if(v.count < required || v.color == DiscreteColor::Unknown) return std::nullopt;
    out[pos] = v.color;
  }
  return out;
}

StepResult step(History h, const FaceReading& frame, const StabilizerParams& p){
  h.frames.push_back(frame);
  while(h.frames.size() > h.capacity) h.frames.pop_front();
  if(!h.full()) return {std::move(h), std::nullopt, StabilizerState::Accumulating};

  // the history's own capacity is N; p only supplies the policy
  auto consensus = evaluate_quorum(h, required_votes({h.capacity, p.policy}));
  if(consensus) h.frames.clear();
  return {std::move(h), consensus, StabilizerState::Deciding};
}

TemporalStabilizer::TemporalStabilizer(const StabilizerParams& p) : p_(p){
  if(p_.capacity == 0) throw std::invalid_argument("stabilizer history capacity must be > 0");
  history_.capacity = p_.capacity;
}

std::optional<FaceReading> TemporalStabilizer::push(const FaceReading& frame){
  StepResult r = step(std::move(history_), frame, p_);
  history_ = std::move(r.history);
  last_state_ = r.state;
  return r.consensus;
}
}
