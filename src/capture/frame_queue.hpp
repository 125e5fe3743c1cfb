#pragma once

#include "video/pixels.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace screen_mirror {

// Bounded frame queue between a capture producer and the delivery thread.
// When full, the oldest frame is displaced.
class FrameQueue {
public:
    explicit FrameQueue(size_t depth);

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    // Returns true if an older frame was displaced to make room
    bool push(RawFrame&& frame);

    // Blocks until a frame is available or the queue is closed.
    // Returns false once closed, even if frames remain.
    bool pop(RawFrame& out);

    // Wake all waiters and reject further pushes
    void close();

    // Accept frames again after close()
    void reset();

    size_t size() const;
    size_t get_depth() const { return m_depth; }
    uint64_t get_dropped() const;

private:
    const size_t m_depth;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<RawFrame> m_frames;
    bool m_closed = false;
    uint64_t m_dropped = 0;
};

}  // namespace screen_mirror
