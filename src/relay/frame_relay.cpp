#include "frame_relay.hpp"
#include "util/logger.hpp"

#include <vector>

namespace screen_mirror {

FrameRelay::FrameRelay(EventLoop& loop)
    : m_loop(loop) {
}

FrameRelay::~FrameRelay() {
    LOG_DEBUG("Frame relay destroyed: %lu published, %lu decode failures, %lu stale",
              static_cast<unsigned long>(m_published.load()),
              static_cast<unsigned long>(m_decode_failures.load()),
              static_cast<unsigned long>(m_stale_drops.load()));
}

uint64_t FrameRelay::begin_session() {
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending = MirroredFrame();
    uint64_t generation = ++m_generation;
    m_accepting = true;
    return generation;
}

void FrameRelay::end_session() {
    m_accepting = false;
    ++m_generation;

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending = MirroredFrame();
}

void FrameRelay::on_raw_frame(const RawFrame& frame, uint64_t generation) {
    if (!m_accepting || generation != m_generation) {
        m_stale_drops++;
        return;
    }

    auto image = std::make_shared<Image>();
    if (!convert_to_bgra(frame, *image)) {
        uint64_t failures = ++m_decode_failures;
        if (failures == 1 || failures % 100 == 0) {
            LOG_DEBUG("Dropped undecodable frame %dx%d stride %d (%lu so far)",
                      frame.width, frame.height, frame.stride,
                      static_cast<unsigned long>(failures));
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        // end_session() may have run during conversion
        if (generation != m_generation) {
            m_stale_drops++;
            return;
        }
        m_pending.image = std::move(image);
        m_pending.sequence = m_next_sequence++;
        m_pending.timestamp_us = frame.timestamp_us;
        m_pending_generation = generation;
    }

    // One hand-off in flight at a time; it picks up whatever is newest
    if (!m_publish_scheduled.exchange(true)) {
        std::weak_ptr<FrameRelay> weak = weak_from_this();
        m_loop.post([weak]() {
            if (auto relay = weak.lock()) {
                relay->publish_pending();
            }
        });
    }
}

void FrameRelay::publish_pending() {
    m_publish_scheduled = false;

    MirroredFrame frame;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        frame = std::move(m_pending);
        m_pending = MirroredFrame();
        generation = m_pending_generation;
    }

    if (!frame.image) {
        return;
    }
    if (!m_accepting || generation != m_generation) {
        m_stale_drops++;
        return;
    }
    if (m_latest.image && frame.sequence <= m_latest.sequence) {
        return;
    }

    m_latest = std::move(frame);
    m_published++;
    notify(&m_latest);
}

void FrameRelay::clear() {
    bool had_frame = m_latest.image != nullptr;
    m_latest = MirroredFrame();
    if (had_frame) {
        notify(nullptr);
    }
}

int FrameRelay::subscribe(FrameCallback callback) {
    int id = m_next_subscriber++;
    m_subscribers[id] = std::move(callback);
    return id;
}

void FrameRelay::unsubscribe(int id) {
    m_subscribers.erase(id);
}

void FrameRelay::notify(const MirroredFrame* frame) {
    // Callbacks may unsubscribe
    std::vector<FrameCallback> callbacks;
    callbacks.reserve(m_subscribers.size());
    for (const auto& entry : m_subscribers) {
        callbacks.push_back(entry.second);
    }
    for (const auto& callback : callbacks) {
        callback(frame);
    }
}

}  // namespace screen_mirror
