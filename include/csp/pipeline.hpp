#pragma once
#include "classifier.hpp"
#include "commit_channel.hpp"
#include "config.hpp"
#include "face_set.hpp"
#include "frame.hpp"
#include "metrics.hpp"
#include "resolver.hpp"
#include "sampler.hpp"
#include "stabilizer.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>

namespace csp {

/// Outcome of one frame. Everything except Committed means "wait for the next frame".
enum class FrameStatus {
    Accumulating,        // history not yet full
    BufferUnavailable,   // lock failed or no backing memory
    IncompleteSample,    // fewer than 9 usable patches
    QuorumNotReached,    // history full, some sticker unstable
    UnresolvableCenter,  // consensus center has no face slot
    RedundantReading,    // face already holds this reading
    Committed,           // commit queued for the face set owner
    ChannelClosed        // consensus reached but the owner is gone
};
constexpr std::size_t kFrameStatusCount = 8;

const char* to_string(FrameStatus s);

/// sample -> classify -> stabilize -> resolve, one frame per process() call.
class ScanPipeline {
public:
    ScanPipeline(const Config& cfg, const CubeFaceSet& faces, CommitChannel& channel,
                 Metrics* metrics = nullptr);

    FrameStatus process(IPixelBuffer& buf);

    /// Labels from the most recent successfully sampled frame.
    std::optional<FaceReading> last_reading() const;
    std::size_t history_size() const;
    int frames() const;
    /// Empties the history and restarts frame ids (and metrics frame numbers) at 1.
    void reset();

private:
    SamplerParams sampler_;
    ColorClassifier classifier_;
    TemporalStabilizer stabilizer_;
    FaceResolver resolver_;
    Metrics* metrics_;

    mutable std::mutex mu_;   // serializes callers if the host does not
    std::optional<FaceReading> last_;
    int frame_id_{0};
};

/// Host-side capture loop hooks.
struct Host {
    std::function<bool(cv::Mat& bgra)> capture;   // false ends the loop
    std::function<void(const cv::Mat& bgra, const std::optional<FaceReading>& last, FrameStatus st)> present;
};

struct RunStats {
    int frames{0};
    std::array<int, kFrameStatusCount> by_status{};

    int count(FrameStatus s) const { return by_status[static_cast<std::size_t>(s)]; }
};

/// Pulls frames from host.capture until it fails or max_frames (<= 0: no limit)
/// is reached. Runs on the capture context; commits go out through the
/// pipeline's channel.
RunStats run(Host& host, ScanPipeline& pipeline, int max_frames = 0);
}
