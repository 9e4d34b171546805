#pragma once
#include "color.hpp"
#include "commit_channel.hpp"
#include "face_set.hpp"
#include <array>
#include <cstdint>

namespace csp {
enum class ResolveOutcome { Committed, RedundantReading, UnresolvableCenter, ChannelClosed };

/// Routes a consensus reading to its face slot and queues a commit when it
/// differs from what the face will hold once pending commits land: the last
/// queued reading while it is in flight, otherwise the stored face.
/// Never writes the face set directly.
class FaceResolver {
public:
    FaceResolver(const CubeFaceSet& faces, CommitChannel& channel) : faces_(faces), channel_(channel) {}

    ResolveOutcome resolve(const FaceReading& consensus);

private:
    struct Queued { std::uint64_t sequence{0}; FaceReading reading{}; };

    FaceReading expected(int face) const;

    const CubeFaceSet& faces_;
    CommitChannel& channel_;
    std::array<Queued, kFaces> queued_{};
};
}
