#include "frame_queue.hpp"

namespace screen_mirror {

FrameQueue::FrameQueue(size_t depth)
    : m_depth(depth > 0 ? depth : 1) {
}

bool FrameQueue::push(RawFrame&& frame) {
    bool displaced = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        if (m_frames.size() >= m_depth) {
            m_frames.pop_front();
            m_dropped++;
            displaced = true;
        }
        m_frames.push_back(std::move(frame));
    }
    m_cv.notify_one();
    return displaced;
}

bool FrameQueue::pop(RawFrame& out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this]() { return m_closed || !m_frames.empty(); });

    if (m_closed) {
        return false;
    }

    out = std::move(m_frames.front());
    m_frames.pop_front();
    return true;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_frames.clear();
    }
    m_cv.notify_all();
}

void FrameQueue::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = false;
    m_frames.clear();
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames.size();
}

uint64_t FrameQueue::get_dropped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

}  // namespace screen_mirror
