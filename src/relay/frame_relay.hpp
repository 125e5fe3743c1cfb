#pragma once

#include "util/event_loop.hpp"
#include "video/pixels.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace screen_mirror {

struct MirroredFrame {
    std::shared_ptr<const Image> image;
    uint64_t sequence = 0;        // Strictly increasing per relay
    uint64_t timestamp_us = 0;
};

// Turns raw frames from the delivery thread into images and publishes the
// newest one on the loop thread. Latest wins: frames published while the
// loop is busy replace each other in a single pending slot.
//
// Sinks hold a weak_ptr to the relay plus the generation returned by
// begin_session(); frames for an ended generation are dropped.
class FrameRelay : public std::enable_shared_from_this<FrameRelay> {
public:
    // nullptr means the published frame was cleared
    using FrameCallback = std::function<void(const MirroredFrame*)>;

    explicit FrameRelay(EventLoop& loop);
    ~FrameRelay();

    FrameRelay(const FrameRelay&) = delete;
    FrameRelay& operator=(const FrameRelay&) = delete;

    // Accept frames for a new generation (loop thread)
    uint64_t begin_session();

    // Stop accepting frames; anything in flight is discarded (loop thread)
    void end_session();

    // Delivery thread. Converts, then schedules publication; never waits
    // on the loop thread.
    void on_raw_frame(const RawFrame& frame, uint64_t generation);

    // Drop the published frame (loop thread)
    void clear();

    bool has_frame() const { return m_latest.image != nullptr; }
    const MirroredFrame* get_latest() const { return m_latest.image ? &m_latest : nullptr; }

    int subscribe(FrameCallback callback);
    void unsubscribe(int id);

    uint64_t get_generation() const { return m_generation; }
    uint64_t get_published_frames() const { return m_published; }
    uint64_t get_decode_failures() const { return m_decode_failures; }
    uint64_t get_stale_drops() const { return m_stale_drops; }

private:
    void publish_pending();
    void notify(const MirroredFrame* frame);

    EventLoop& m_loop;

    std::atomic<uint64_t> m_generation{0};
    std::atomic<bool> m_accepting{false};

    // Delivery thread -> loop thread slot
    std::mutex m_pending_mutex;
    MirroredFrame m_pending;
    uint64_t m_pending_generation = 0;
    uint64_t m_next_sequence = 1;
    std::atomic<bool> m_publish_scheduled{false};

    // Loop thread only
    MirroredFrame m_latest;
    std::map<int, FrameCallback> m_subscribers;
    int m_next_subscriber = 1;

    std::atomic<uint64_t> m_published{0};
    std::atomic<uint64_t> m_decode_failures{0};
    std::atomic<uint64_t> m_stale_drops{0};
};

}  // namespace screen_mirror
