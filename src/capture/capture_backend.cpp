#include "capture_backend.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <pthread.h>

namespace screen_mirror {

CaptureSubscription::CaptureSubscription(const StreamConfig& config)
    : m_config(config)
    , m_queue(static_cast<size_t>(config.queue_depth > 0 ? config.queue_depth : 1)) {
}

CaptureSubscription::~CaptureSubscription() {
    // Derived destructors stop the producer; only the delivery thread is left here
    m_queue.close();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool CaptureSubscription::start(FrameSink sink) {
    if (m_running) {
        LOG_WARN("%s subscription already running", get_name());
        return false;
    }

    m_sink = std::move(sink);
    m_queue.reset();
    m_delivered = 0;
    m_running = true;
    m_thread = std::thread(&CaptureSubscription::delivery_thread, this);

    if (!start_producer()) {
        LOG_ERROR("Failed to start %s producer", get_name());
        m_running = false;
        m_queue.close();
        m_thread.join();
        m_sink = nullptr;
        return false;
    }

    LOG_INFO("%s subscription started: %dx%d @ %d fps, queue depth %d",
             get_name(), m_config.width, m_config.height, m_config.fps, m_config.queue_depth);
    return true;
}

void CaptureSubscription::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    stop_producer();

    m_queue.close();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_sink = nullptr;

    LOG_INFO("%s subscription stopped: delivered=%lu dropped=%lu",
             get_name(),
             static_cast<unsigned long>(m_delivered.load()),
             static_cast<unsigned long>(m_queue.get_dropped()));
}

void CaptureSubscription::deliver(RawFrame&& frame) {
    if (!m_running) {
        return;
    }
    if (m_queue.push(std::move(frame))) {
        LOG_DEBUG("%s delivery lagging, displaced oldest frame", get_name());
    }
}

void CaptureSubscription::delivery_thread() {
    pthread_setname_np(pthread_self(), "mirror-delivery");

    auto last_log = std::chrono::steady_clock::now();
    uint64_t logged_delivered = 0;

    RawFrame frame;
    while (m_queue.pop(frame)) {
        if (m_sink) {
            m_sink(frame);
        }
        m_delivered++;

        // Log delivery rate every 5 seconds
        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_log).count() >= 5) {
            uint64_t delivered = m_delivered;
            LOG_INFO("%s delivery: %lu frames in last 5s, %lu dropped total",
                     get_name(),
                     static_cast<unsigned long>(delivered - logged_delivered),
                     static_cast<unsigned long>(m_queue.get_dropped()));
            logged_delivered = delivered;
            last_log = now;
        }
    }
}

}  // namespace screen_mirror
