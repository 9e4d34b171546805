#pragma once
#include "face_set.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace csp {
struct FaceCommit {
    std::uint64_t sequence{0};
    int face_index{0};
    FaceReading reading{};
};

/*
  Ordered hand-off of face commits from the capture context to the owner of
  CubeFaceSet.

  - push() never waits on the consumer and never drops; commits leave in the
    order they were pushed.
  - The owner either polls with drain() from its own loop or blocks in
    pop_wait() on a dedicated thread.
  - close() wakes a blocked consumer; pushes after close are ignored.
  - delivered() is the highest sequence handed to the owner; anything above
    it is still in flight.
*/
class CommitChannel {
public:
    // Returns the commit's sequence number, 0 if the channel is closed.
    std::uint64_t push(int face, const FaceReading& reading) {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) return 0;
        q_.push_back(FaceCommit{++seq_, face, reading});
        cv_.notify_one();
        return seq_;
    }

    // Pop one commit, waiting up to 'wait_ms' milliseconds.
    // Returns false on timeout, or when closed and empty.
    // The commit counts as delivered once popped; apply it right away.
    bool pop_wait(FaceCommit& out, int wait_ms) {
        if (!take(out, wait_ms)) return false;
        mark_delivered(out.sequence);
        return true;
    }

    // pop_wait() plus the update; delivered only after the face set holds it.
    bool apply_wait(CubeFaceSet& faces, int wait_ms) {
        FaceCommit c;
        if (!take(c, wait_ms)) return false;
        faces.update(c.face_index, c.reading);
        mark_delivered(c.sequence);
        return true;
    }

    // Apply every pending commit in FIFO order; returns how many changed state.
    // Must run on the face set's owner context.
    std::size_t drain(CubeFaceSet& faces) {
        std::deque<FaceCommit> batch;
        {
            std::lock_guard<std::mutex> lk(m_);
            batch.swap(q_);
        }
        std::size_t changed = 0;
        for (auto& c : batch)
            if (faces.update(c.face_index, c.reading)) ++changed;
        if (!batch.empty()) mark_delivered(batch.back().sequence);
        return changed;
    }

    void close() {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    std::uint64_t delivered() const {
        std::lock_guard<std::mutex> lk(m_);
        return delivered_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

private:
    bool take(FaceCommit& out, int wait_ms) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, std::chrono::milliseconds(wait_ms), [this] { return !q_.empty() || closed_; });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void mark_delivered(std::uint64_t seq) {
        std::lock_guard<std::mutex> lk(m_);
        if (seq > delivered_) delivered_ = seq;
    }

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<FaceCommit> q_;
    std::uint64_t seq_{0};
    std::uint64_t delivered_{0};
    bool closed_{false};
};
}
