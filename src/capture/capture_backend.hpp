#pragma once

#include "screen_mirror/config.hpp"
#include "capture/frame_queue.hpp"
#include "util/rect.hpp"
#include "video/pixels.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace screen_mirror {

enum class SourceKind {
    WINDOW,
    DISPLAY
};

// A window or screen the backend can produce a live feed from. Rebuilt on
// every catalog refresh; the underlying window may vanish at any time.
struct CaptureSource {
    uint32_t id = NO_SOURCE;
    SourceKind kind = SourceKind::WINDOW;
    std::string title;
    std::string app_name;
    uint32_t owner_pid = 0;       // 0 = unknown
    std::string owner_class;      // WM_CLASS class, empty if unknown
    Rect bounds;                  // Logical units
    std::shared_ptr<const Image> thumbnail;
};

struct StreamConfig {
    int width = 0;
    int height = 0;
    int fps = 60;                 // Frame-rate cap
    PixelFormat format = PixelFormat::BGRA;
    bool show_cursor = false;
    int queue_depth = 5;

    uint64_t frame_interval_us() const {
        return fps > 0 ? 1000000ULL / static_cast<uint64_t>(fps) : 0;
    }

    bool is_valid() const {
        return width > 0 && height > 0 && fps > 0 && queue_depth > 0;
    }
};

// Called on the subscription's delivery thread, once per frame, in order
using FrameSink = std::function<void(const RawFrame&)>;

// One live capture stream. The producer (grab thread, PipeWire loop) hands
// frames to deliver(); a dedicated delivery thread drains the bounded queue
// and invokes the sink.
class CaptureSubscription {
public:
    virtual ~CaptureSubscription();

    // Start producing and delivering frames to sink
    bool start(FrameSink sink);

    // Tear down. No sink call happens after this returns. Idempotent.
    void stop();

    bool is_running() const { return m_running; }

    const StreamConfig& get_config() const { return m_config; }
    uint64_t get_delivered_frames() const { return m_delivered; }
    uint64_t get_dropped_frames() const { return m_queue.get_dropped(); }

protected:
    explicit CaptureSubscription(const StreamConfig& config);

    CaptureSubscription(const CaptureSubscription&) = delete;
    CaptureSubscription& operator=(const CaptureSubscription&) = delete;

    // Start the producer; it calls deliver() from its own thread
    virtual bool start_producer() = 0;

    // Stop the producer; deliver() must not be called after this returns
    virtual void stop_producer() = 0;

    virtual const char* get_name() const = 0;

    // Producer -> delivery thread hand-off, never blocks on the sink
    void deliver(RawFrame&& frame);

    const StreamConfig m_config;

private:
    void delivery_thread();

    FrameQueue m_queue;
    FrameSink m_sink;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_delivered{0};
};

class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    // Initialize the capture backend
    // Returns true on success
    virtual bool init(const char* display_name = nullptr) = 0;

    // Shutdown and cleanup resources
    virtual void shutdown() = 0;

    // List every candidate the system will share. May block on the system
    // (or on a portal dialog); call it off the UI thread.
    virtual bool enumerate_sources(std::vector<CaptureSource>& out) = 0;

    // One still image scaled to fit max_width x max_height
    virtual bool capture_still(const CaptureSource& source, int max_width, int max_height,
                               bool show_cursor, Image& out) = 0;

    // Create a stream for source. Returns nullptr if the source is gone or
    // the stream cannot be configured. The subscription is not started.
    virtual std::unique_ptr<CaptureSubscription> subscribe(const CaptureSource& source,
                                                           const StreamConfig& config) = 0;

    // Check if initialized successfully
    virtual bool is_initialized() const = 0;

    // Get backend name for logging
    virtual const char* get_name() const = 0;

protected:
    CaptureBackend() = default;

    // Non-copyable
    CaptureBackend(const CaptureBackend&) = delete;
    CaptureBackend& operator=(const CaptureBackend&) = delete;
};

// Create and initialize a backend. AUTO detects the session type.
// Returns nullptr if no suitable backend is available.
std::unique_ptr<CaptureBackend> create_capture_backend(CaptureBackendType type,
                                                       const MirrorConfig& config);

}  // namespace screen_mirror
