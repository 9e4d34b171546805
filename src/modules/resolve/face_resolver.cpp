#include "csp/resolver.hpp"
#include "csp/logger.hpp"

namespace csp {
FaceReading FaceResolver::expected(int face) const{
  const Queued& q = queued_[face];
  if(q.sequence != 0 && q.sequence > channel_.delivered()) return q.reading;
  return faces_.face(face);
}

ResolveOutcome FaceResolver::resolve(const FaceReading& consensus){
  const auto face = face_index_for(consensus[kCenter]);
  if(!face){
    Logger::debug("consensus %s has no face for center %s",
                  to_string(consensus).c_str(), to_string(consensus[kCenter]));
    return ResolveOutcome::UnresolvableCenter;
  }
  if(expected(*face) == consensus) return ResolveOutcome::RedundantReading;

  const std::uint64_t seq = channel_.push(*face, consensus);
  if(seq == 0){
    Logger::warn("commit channel closed, dropping face %c %s",
                 face_letter(*face), to_string(consensus).c_str());
    return ResolveOutcome::ChannelClosed;
  }
  queued_[*face] = Queued{seq, consensus};
  Logger::info("face %c <- %s", face_letter(*face), to_string(consensus).c_str());
  return ResolveOutcome::Committed;
}
}
