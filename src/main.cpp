#include <opencv2/opencv.hpp>
#include "cli/args.hpp"
#include "csp/commit_channel.hpp"
#include "csp/config.hpp"
#include "csp/face_set.hpp"
#include "csp/logger.hpp"
#include "csp/pipeline.hpp"
#include "csp/render.hpp"
#include <atomic>
#include <mutex>
#include <thread>

using namespace csp;

namespace {
void usage() {
    Logger::info("usage: csp_scan [--source=<camera index|video file>] [--config=<yaml|json>]\n"
                 "                [--headless] [--frames=N] [--log=debug|info|warn|error] [--metrics=<csv>]");
}

bool open_source(cv::VideoCapture& cap, const std::string& src) {
    int index = 0;
    return argAsIndex(src, index) ? cap.open(index) : cap.open(src);
}
}

int main(int argc, char** argv) {
    if (argHas(argc, argv, "help")) { usage(); return 0; }

    Config cfg;
    const std::string cfg_path = argValue(argc, argv, "config");
    if (!cfg_path.empty() && !load_config(cfg_path, cfg)) return 1;
    const std::string level = argValue(argc, argv, "log", cfg.log_level);
    if (!Logger::set_level(level)) Logger::warn("unknown log level '%s', keeping info", level.c_str());

    const std::string src = argValue(argc, argv, "source", "0");
    cv::VideoCapture cap;
    if (!open_source(cap, src)) { Logger::error("fail open %s", src.c_str()); return 1; }

    const bool headless = argHas(argc, argv, "headless");
    const int max_frames = argValueInt(argc, argv, "frames", 0);

    Metrics metrics(cfg.max_metric_stamps);
    CubeFaceSet faces;
    CommitChannel channel;
    ScanPipeline pl(cfg, faces, channel, &metrics);

    faces.set_observer([](int face, const FaceReading& r) {
        Logger::info("face %c updated: %s", face_letter(face), to_string(r).c_str());
    });

    std::atomic<bool> stop{false};
    std::mutex preview_mu;
    cv::Mat preview;

    Host host;
    host.capture = [&](cv::Mat& bgra) {
        if (stop) return false;
        cv::Mat img;
        if (!cap.read(img) || img.empty()) return false;
        cv::cvtColor(img, bgra, img.channels() == 1 ? cv::COLOR_GRAY2BGRA : cv::COLOR_BGR2BGRA);
        return true;
    };
    host.present = [&](const cv::Mat& bgra, const std::optional<FaceReading>& last, FrameStatus) {
        if (headless) return;
        cv::Mat bgr;
        cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
        draw_overlay(bgr, last, cfg.sampler);
        std::lock_guard<std::mutex> lk(preview_mu);
        preview = bgr;
    };

    // capture context: the pipeline; main thread: sole owner of 'faces'
    RunStats stats;
    std::atomic<bool> done{false};
    std::thread capture_thread([&] {
        stats = run(host, pl, max_frames);
        done = true;
    });

    while (!done) {
        if (headless) {
            channel.apply_wait(faces, 50);
            continue;
        }
        channel.drain(faces);
        cv::Mat shown;
        {
            std::lock_guard<std::mutex> lk(preview_mu);
            shown = preview;
        }
        if (!shown.empty()) cv::imshow("csp", shown);
        cv::imshow("cube", render_net(faces));
        const int key = cv::waitKey(15);
        if (key == 'q' || key == 27) stop = true;
        else if (key == 'r') { faces.reset(); Logger::info("cube state cleared"); }
    }
    capture_thread.join();
    channel.close();
    channel.drain(faces);

    Logger::info("done. %d frames, %d commits, %d redundant, %d no-quorum",
                 stats.frames, stats.count(FrameStatus::Committed),
                 stats.count(FrameStatus::RedundantReading), stats.count(FrameStatus::QuorumNotReached));
    Logger::info("cube %s: %s", faces.is_complete() ? "complete" : "partial",
                 faces.to_facelet_string().c_str());

    const std::string metrics_path = argValue(argc, argv, "metrics");
    if (!metrics_path.empty()) {
        if (metrics.dump_csv(metrics_path))
            Logger::info("%s saved (sample %.3f ms, classify %.3f ms avg)", metrics_path.c_str(),
                         metrics.stage_mean_ms("sample"), metrics.stage_mean_ms("classify"));
        else
            Logger::warn("could not write %s", metrics_path.c_str());
    }
    return 0;
}
