#pragma once
#include "metrics.hpp"
#include <string>
#include <utility>

#define CSP_CONCAT_(a, b) a##b
#define CSP_CONCAT(a, b) CSP_CONCAT_(a, b)

// metrics is a Metrics*; a null pointer turns the stamp into a no-op
#define CSP_TRACE_METRICS(metrics, stage, frame) \
    csp::ScopeStamp CSP_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, frame)

namespace csp {
struct ScopeStamp {
    Metrics* m;
    std::string stage;
    int frame;

    ScopeStamp(Metrics* met, std::string s, int f) : m(met), stage(std::move(s)), frame(f) {
        if (m) m->mark(stage + ":in", frame);
    }

    ~ScopeStamp() { if (m) m->mark(stage + ":out", frame); }

    ScopeStamp(const ScopeStamp&) = delete;
    ScopeStamp& operator=(const ScopeStamp&) = delete;
};
}
