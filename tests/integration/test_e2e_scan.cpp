#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "csp/logger.hpp"
#include "csp/pipeline.hpp"
#include "support/synthetic.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace csp;
using csp::test::face_frame;
using csp::test::reading;

namespace {
struct Recorded { int face; FaceReading reading; };
}

TEST_CASE("green-centered face commits exactly once"){
  CubeFaceSet faces; CommitChannel ch; Metrics metrics;
  std::vector<Recorded> updates;
  faces.set_observer([&](int f, const FaceReading& r){ updates.push_back({f, r}); });
  ScanPipeline pl(Config{}, faces, ch, &metrics);

  const FaceReading face = reading("WRBOGYYBW");
  MatPixelBuffer buf(face_frame(face));
  for(int i=0; i<4; ++i) CHECK(pl.process(buf) == FrameStatus::Accumulating);
  CHECK(pl.process(buf) == FrameStatus::Committed);
  CHECK(pl.history_size() == 0);
  CHECK(buf.lock_depth() == 0);
  CHECK(buf.lock_count() == 5);

  CHECK(ch.drain(faces) == 1);
  REQUIRE(updates.size() == 1);
  CHECK(updates[0].face == 2);
  CHECK(updates[0].reading == face);
  CHECK(metrics.size() == 5*6 + 2);   // sample/classify/stabilize x5, resolve x1

  // five more identical frames: consensus again, but already stored
  for(int i=0; i<4; ++i) pl.process(buf);
  CHECK(pl.process(buf) == FrameStatus::RedundantReading);
  CHECK(ch.drain(faces) == 0);
  CHECK(updates.size() == 1);
}

TEST_CASE("dark center never commits"){
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);
  MatPixelBuffer buf(face_frame(reading("WRBO?YYBW")));
  for(int i=0; i<40; ++i){
    const FrameStatus st = pl.process(buf);
    CHECK(st != FrameStatus::Committed);
    CHECK(st != FrameStatus::UnresolvableCenter);   // an Unknown center cannot even reach quorum
  }
  REQUIRE(pl.last_reading());
  CHECK((*pl.last_reading())[kCenter] == DiscreteColor::Unknown);
  CHECK(ch.size() == 0);
  ch.drain(faces);
  CHECK(faces.change_count() == 0);
}

TEST_CASE("flicker within the slack still commits"){
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);
  const FaceReading face = reading("BBBBBBBBB");
  FaceReading flicker = face; flicker[2] = DiscreteColor::Green;
  MatPixelBuffer clean(face_frame(face)), noisy(face_frame(flicker));
  pl.process(clean); pl.process(noisy); pl.process(clean); pl.process(clean);
  CHECK(pl.process(clean) == FrameStatus::Committed);
  ch.drain(faces);
  CHECK(faces.face(5) == face);
}

TEST_CASE("unavailable buffers are skipped without touching history"){
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);
  MatPixelBuffer good(face_frame(reading("GGGGGGGGG")));
  pl.process(good);
  REQUIRE(pl.history_size() == 1);

  test::FakeBuffer no_memory;
  no_memory.w = 160; no_memory.h = 120; no_memory.stride = 640;
  CHECK(pl.process(no_memory) == FrameStatus::BufferUnavailable);
  CHECK(no_memory.depth == 0);
  CHECK(no_memory.unlocks == 1);

  test::FakeBuffer refuses;
  refuses.lock_ok = false;
  CHECK(pl.process(refuses) == FrameStatus::BufferUnavailable);
  CHECK(refuses.unlocks == 0);

  MatPixelBuffer empty;
  CHECK(pl.process(empty) == FrameStatus::BufferUnavailable);
  CHECK(pl.history_size() == 1);
}

TEST_CASE("degenerate geometry is an incomplete sample"){
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);
  std::uint8_t px[4] = {0, 255, 0, 255};
  test::FakeBuffer flat;
  flat.data = px; flat.w = 0; flat.h = 0; flat.stride = 4;
  CHECK(pl.process(flat) == FrameStatus::IncompleteSample);
  CHECK(flat.depth == 0);
  CHECK(pl.history_size() == 0);
}

TEST_CASE("capture thread and owner thread"){
  Logger::set_level(LogLevel::Warn);
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);

  const std::vector<FaceReading> cube = {
    reading("WWWWWWWWW"), reading("RRRRRRRRR"), reading("GGGGGGGGG"),
    reading("YYYYYYYYY"), reading("OOOOOOOOO"), reading("BBBBBBBBB")};
  std::vector<cv::Mat> frames;
  for(auto& f : cube) frames.push_back(face_frame(f, 320, 240));

  int next = 0;
  Host host;
  host.capture = [&](cv::Mat& bgra){
    if(next >= 6*5) return false;
    bgra = frames[next++ / 5];
    return true;
  };
  std::atomic<int> presented{0};
  host.present = [&](const cv::Mat&, const std::optional<FaceReading>&, FrameStatus){ ++presented; };

  RunStats stats;
  std::thread capture([&]{ stats = run(host, pl); ch.close(); });

  std::vector<int> order;
  FaceCommit c;
  while(ch.pop_wait(c, 2000)){
    faces.update(c.face_index, c.reading);
    order.push_back(c.face_index);
  }
  capture.join();

  CHECK(stats.frames == 30);
  CHECK(presented == 30);
  CHECK(stats.count(FrameStatus::Committed) == 6);
  const std::vector<int> expected_order = {0, 1, 2, 3, 4, 5};
  CHECK(order == expected_order);
  CHECK(faces.is_complete());
  CHECK(faces.to_facelet_string() ==
        "UUUUUUUUURRRRRRRRRFFFFFFFFFDDDDDDDDDLLLLLLLLLBBBBBBBBB");
  Logger::set_level(LogLevel::Info);
}

TEST_CASE("run stops at max_frames"){
  CubeFaceSet faces; CommitChannel ch;
  ScanPipeline pl(Config{}, faces, ch);
  cv::Mat frame = face_frame(reading("YYYYYYYYY"));
  Host host;
  host.capture = [&](cv::Mat& bgra){ bgra = frame; return true; };
  RunStats s = run(host, pl, 3);
  CHECK(s.frames == 3);
  CHECK(s.count(FrameStatus::Accumulating) == 3);
  CHECK(pl.frames() == 3);
}

TEST_CASE("reset restarts frame numbering"){
  CubeFaceSet faces; CommitChannel ch; Metrics metrics;
  ScanPipeline pl(Config{}, faces, ch, &metrics);
  MatPixelBuffer buf(face_frame(reading("OOOOOOOOO")));
  pl.process(buf); pl.process(buf);
  CHECK(pl.frames() == 2);
  pl.reset();
  CHECK(pl.frames() == 0);
  CHECK(pl.history_size() == 0);
  CHECK_FALSE(pl.last_reading());
  metrics.clear();
  pl.process(buf);
  CHECK(pl.frames() == 1);
  const std::string path = "csp_reset_metrics.csv";
  REQUIRE(metrics.dump_csv(path));
  std::ifstream in(path);
  std::string header, row;
  std::getline(in, header);
  std::getline(in, row);
  CHECK(row.rfind("1,sample:in,", 0) == 0);
  in.close();
  std::remove(path.c_str());
}
