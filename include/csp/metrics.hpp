#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <string>

namespace csp {
struct Stamp { std::string name; double ms; int frame; };

class Metrics {
public:
    explicit Metrics(std::size_t max_stamps = 100000) : max_stamps_(max_stamps) {}

    void mark(const std::string& name, int frame) {
        using clk = std::chrono::steady_clock;
        auto now = clk::now();
        double ms = std::chrono::duration<double, std::milli>(now.time_since_epoch()).count();
        stamps_.push_back({name, ms, frame});
        while (stamps_.size() > max_stamps_) stamps_.pop_front();
    }

    // Mean in->out latency of one stage over all recorded frames, 0 if none.
    double stage_mean_ms(const std::string& stage) const {
        const std::string in = stage + ":in", out = stage + ":out";
        double total = 0.0, open = 0.0;
        int n = 0, open_frame = -1;
        bool have_open = false;
        for (auto& s : stamps_) {
            if (s.name == in) { open = s.ms; open_frame = s.frame; have_open = true; }
            else if (s.name == out && have_open && s.frame == open_frame) {
                total += s.ms - open; ++n; have_open = false;
            }
        }
        return n ? total / n : 0.0;
    }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        f << "frame,stage,timestamp_ms\n";
        for (auto& s : stamps_) f << s.frame << "," << s.name << "," << s.ms << "\n";
        return static_cast<bool>(f);
    }

    std::size_t size() const { return stamps_.size(); }
    void clear() { stamps_.clear(); }

private:
    std::size_t max_stamps_;
    std::deque<Stamp> stamps_;
};
}   // namespace csp
