#pragma once
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>

namespace csp {

/// Read-only view of a locked BGRA frame (4 bytes per pixel: B, G, R, A).
struct PixelView {
    const std::uint8_t* data{nullptr};
    int width{0};
    int height{0};
    std::size_t stride{0};   // bytes per row

    bool empty() const { return data == nullptr || width <= 0 || height <= 0; }

    /// cv::Mat header over the same memory, no copy.
    cv::Mat as_mat() const {
        return cv::Mat(height, width, CV_8UC4, const_cast<std::uint8_t*>(data), stride);
    }
};

/// A host-owned video frame. Valid only for the duration of one callback.
class IPixelBuffer {
public:
    virtual ~IPixelBuffer() = default;

    virtual bool lock_read() = 0;
    virtual void unlock_read() = 0;

    /// nullptr when the frame has no accessible backing memory
    virtual const std::uint8_t* base_address() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual std::size_t bytes_per_row() const = 0;
};

/// Holds the read lock for its own lifetime.
class ScopedReadLock {
public:
    explicit ScopedReadLock(IPixelBuffer& buf) : buf_(buf), locked_(buf.lock_read()) {}
    ~ScopedReadLock() { if (locked_) buf_.unlock_read(); }

    ScopedReadLock(const ScopedReadLock&) = delete;
    ScopedReadLock& operator=(const ScopedReadLock&) = delete;

    bool locked() const { return locked_; }

    /// Empty view if the lock failed or the buffer has no memory.
    PixelView view() const {
        if (!locked_ || !buf_.base_address()) return {};
        return PixelView{buf_.base_address(), buf_.width(), buf_.height(), buf_.bytes_per_row()};
    }

private:
    IPixelBuffer& buf_;
    bool locked_;
};

/// IPixelBuffer over a CV_8UC4 cv::Mat (OpenCV BGRA order matches the frame layout).
class MatPixelBuffer : public IPixelBuffer {
public:
    MatPixelBuffer() = default;
    explicit MatPixelBuffer(cv::Mat bgra);

    bool lock_read() override;
    void unlock_read() override;
    const std::uint8_t* base_address() const override;
    int width() const override { return mat_.cols; }
    int height() const override { return mat_.rows; }
    std::size_t bytes_per_row() const override { return mat_.step[0]; }

    int lock_depth() const { return locks_; }
    int lock_count() const { return total_locks_; }

private:
    cv::Mat mat_;
    int locks_{0};
    int total_locks_{0};
};
}
