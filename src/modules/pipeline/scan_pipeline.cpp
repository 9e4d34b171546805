#include "csp/pipeline.hpp"
#include "csp/logger.hpp"
#include "csp/tracer.hpp"

namespace csp {
const char* to_string(FrameStatus s){
  switch(s){
    case FrameStatus::Accumulating:       return "accumulating";
    case FrameStatus::BufferUnavailable:  return "buffer_unavailable";
    case FrameStatus::IncompleteSample:   return "incomplete_sample";
    case FrameStatus::QuorumNotReached:   return "quorum_not_reached";
    case FrameStatus::UnresolvableCenter: return "unresolvable_center";
    case FrameStatus::RedundantReading:   return "redundant_reading";
    case FrameStatus::Committed:          return "committed";
    case FrameStatus::ChannelClosed:      return "channel_closed";
  }
  return "?";
}

ScanPipeline::ScanPipeline(const Config& cfg, const CubeFaceSet& faces, CommitChannel& channel,
                           Metrics* metrics)
  : sampler_(cfg.sampler), classifier_(cfg.classifier), stabilizer_(cfg.stabilizer),
    resolver_(faces, channel), metrics_(metrics) {}

FrameStatus ScanPipeline::process(IPixelBuffer& buf){
  std::lock_guard<std::mutex> lk(mu_);
  const int fid = ++frame_id_;

  std::optional<GridSamples> samples;
  {
    CSP_TRACE_METRICS(metrics_, "sample", fid);
    ScopedReadLock lock(buf);
    const PixelView view = lock.view();
    if(view.data == nullptr){
      Logger::debug("frame %d: buffer unavailable", fid);
      return FrameStatus::BufferUnavailable;
    }
    samples = sample_grid(view, sampler_);
  }
  if(!samples){
    Logger::debug("frame %d: incomplete sample", fid);
    return FrameStatus::IncompleteSample;
  }

  FaceReading labels;
  {
    CSP_TRACE_METRICS(metrics_, "classify", fid);
    labels = classifier_.classify(*samples);
  }
  last_ = labels;

  std::optional<FaceReading> consensus;
  {
    CSP_TRACE_METRICS(metrics_, "stabilize", fid);
    consensus = stabilizer_.push(labels);
  }
  if(!consensus){
    if(stabilizer_.last_state() == StabilizerState::Accumulating) return FrameStatus::Accumulating;
    Logger::debug("frame %d: no quorum, last %s", fid, to_string(labels).c_str());
    return FrameStatus::QuorumNotReached;
  }

  CSP_TRACE_METRICS(metrics_, "resolve", fid);
  switch(resolver_.resolve(*consensus)){
    case ResolveOutcome::Committed:          return FrameStatus::Committed;
    case ResolveOutcome::RedundantReading:   return FrameStatus::RedundantReading;
    case ResolveOutcome::UnresolvableCenter: return FrameStatus::UnresolvableCenter;
    case ResolveOutcome::ChannelClosed:      return FrameStatus::ChannelClosed;
  }
  return FrameStatus::UnresolvableCenter;
}

std::optional<FaceReading> ScanPipeline::last_reading() const{
  std::lock_guard<std::mutex> lk(mu_);
  return last_;
}

std::size_t ScanPipeline::history_size() const{
  std::lock_guard<std::mutex> lk(mu_);
  return stabilizer_.history().size();
}

int ScanPipeline::frames() const{
  std::lock_guard<std::mutex> lk(mu_);
  return frame_id_;
}

void ScanPipeline::reset(){
  std::lock_guard<std::mutex> lk(mu_);
  stabilizer_.reset();
  last_.reset();
  frame_id_ = 0;
}

RunStats run(Host& host, ScanPipeline& pipeline, int max_frames){
  RunStats stats;
  cv::Mat bgra;
  while(max_frames <= 0 || stats.frames < max_frames){
    if(!host.capture || !host.capture(bgra)) break;
    MatPixelBuffer buf(bgra);
    const FrameStatus st = pipeline.process(buf);
    ++stats.frames;
    ++stats.by_status[static_cast<std::size_t>(st)];
    if(host.present) host.present(bgra, pipeline.last_reading(), st);
  }
  Logger::debug("run: %d frames, %d committed", stats.frames, stats.count(FrameStatus::Committed));
  return stats;
}
}
