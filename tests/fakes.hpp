#pragma once

#include "capture/capture_backend.hpp"
#include "display/display_directory.hpp"
#include "present/mirror_surface.hpp"
#include "util/event_loop.hpp"

#include <chrono>
#include <functional>
#include <set>
#include <thread>
#include <fcntl.h>
#include <unistd.h>

namespace screen_mirror {
namespace test {

inline CaptureSource make_source(uint32_t id, int width, int height,
                                 uint32_t owner_pid = 0, const std::string& owner_class = "") {
    CaptureSource source;
    source.id = id;
    source.title = "Window " + std::to_string(id);
    source.app_name = "app";
    source.owner_pid = owner_pid;
    source.owner_class = owner_class;
    source.bounds = Rect{10, 20, width, height};
    return source;
}

inline DisplayDescriptor make_display(uint32_t id, bool primary, int x, int y, int width, int height) {
    DisplayDescriptor display;
    display.id = id;
    display.name = "OUT-" + std::to_string(id);
    display.is_primary = primary;
    display.bounds = Rect{x, y, width, height};
    return display;
}

// Solid BGRx frame, tag carried in timestamp_us
inline RawFrame make_frame(int width, int height, uint8_t value, uint64_t tag = 0) {
    RawFrame frame;
    frame.width = width;
    frame.height = height;
    frame.stride = width * 4;
    frame.format = PixelFormat::BGRX;
    frame.timestamp_us = tag;
    frame.data.assign(static_cast<size_t>(frame.stride) * height, value);
    return frame;
}

// Pump the loop until pred holds or the timeout passes
inline bool wait_until(EventLoop& loop, const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        loop.run_once();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

// Drain whatever is queued on the loop right now
inline void pump(EventLoop& loop, int iterations = 20) {
    for (int i = 0; i < iterations; i++) {
        loop.run_once();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

class FakeSubscription : public CaptureSubscription {
public:
    FakeSubscription(const StreamConfig& config, bool fail_start, std::atomic<int>& stop_count)
        : CaptureSubscription(config)
        , m_fail_start(fail_start)
        , m_stop_count(stop_count) {
    }

    ~FakeSubscription() override {
        stop();
    }

    // Hand a frame to the delivery thread as a producer would
    void emit(RawFrame frame) { deliver(std::move(frame)); }

    bool producer_stopped() const { return m_producer_stopped; }

protected:
    bool start_producer() override { return !m_fail_start; }
    void stop_producer() override {
        m_producer_stopped = true;
        m_stop_count++;
    }
    const char* get_name() const override { return "Fake"; }

private:
    bool m_fail_start;
    std::atomic<int>& m_stop_count;
    std::atomic<bool> m_producer_stopped{false};
};

class FakeCaptureBackend : public CaptureBackend {
public:
    bool init(const char* /*display_name*/ = nullptr) override { return true; }
    void shutdown() override {}

    bool enumerate_sources(std::vector<CaptureSource>& out) override {
        enumerate_calls++;
        if (on_enumerate) {
            on_enumerate();
        }
        if (!enumerate_ok) {
            return false;
        }
        out = sources;
        return true;
    }

    bool capture_still(const CaptureSource& source, int max_width, int max_height,
                       bool show_cursor, Image& out) override {
        still_calls++;
        last_still_width = max_width;
        last_still_height = max_height;
        last_still_cursor = show_cursor;
        if (failing_stills.count(source.id)) {
            return false;
        }
        int width = 0, height = 0;
        fit_within(source.bounds.width, source.bounds.height, max_width, max_height, width, height);
        out.allocate(width, height);
        return true;
    }

    std::unique_ptr<CaptureSubscription> subscribe(const CaptureSource& source,
                                                   const StreamConfig& config) override {
        subscribe_calls++;
        last_config = config;
        last_source_id = source.id;
        if (fail_subscribe) {
            return nullptr;
        }
        auto sub = std::make_unique<FakeSubscription>(config, fail_start, producers_stopped);
        last_subscription = sub.get();
        return sub;
    }

    bool is_initialized() const override { return true; }
    const char* get_name() const override { return "Fake"; }

    std::vector<CaptureSource> sources;
    bool enumerate_ok = true;
    std::function<void()> on_enumerate;
    std::set<uint32_t> failing_stills;
    bool fail_subscribe = false;
    bool fail_start = false;

    std::atomic<int> enumerate_calls{0};
    std::atomic<int> still_calls{0};
    int last_still_width = 0;
    int last_still_height = 0;
    bool last_still_cursor = true;
    int subscribe_calls = 0;
    std::atomic<int> producers_stopped{0};   // Outlives the subscriptions
    uint32_t last_source_id = NO_SOURCE;
    StreamConfig last_config;

    // Owned by the session; valid only while it runs
    FakeSubscription* last_subscription = nullptr;
};

// Change notifications arrive through a pipe, like a real connection fd
class FakeDisplayBackend : public DisplayBackend {
public:
    FakeDisplayBackend() {
        if (pipe(m_pipe) == 0) {
            fcntl(m_pipe[0], F_SETFL, O_NONBLOCK);
        }
    }

    ~FakeDisplayBackend() override {
        shutdown();
    }

    bool init(const char* /*display_name*/ = nullptr) override { return true; }

    void shutdown() override {
        for (int& fd : m_pipe) {
            if (fd >= 0) {
                close(fd);
                fd = -1;
            }
        }
    }

    bool enumerate(std::vector<DisplayDescriptor>& out) override {
        enumerate_calls++;
        if (!enumerate_ok) {
            return false;
        }
        out = displays;
        if (during_enumerate) {
            during_enumerate();
        }
        return true;
    }

    int get_event_fd() const override { return m_pipe[0]; }

    bool process_events() override {
        char buf[16];
        bool changed = false;
        while (read(m_pipe[0], buf, sizeof(buf)) > 0) {
            changed = true;
        }
        return changed;
    }

    bool process_queued_events() override {
        bool changed = m_queued_change;
        m_queued_change = false;
        return changed;
    }

    const char* get_name() const override { return "Fake"; }

    // A change already read off the connection: the fd stays quiet
    void queue_change() { m_queued_change = true; }

    bool trigger_change() {
        char c = 1;
        return write(m_pipe[1], &c, 1) == 1;
    }

    std::vector<DisplayDescriptor> displays;
    bool enumerate_ok = true;
    int enumerate_calls = 0;
    // Runs after the result is copied, as if the server changed mid-reply
    std::function<void()> during_enumerate;

private:
    int m_pipe[2] = {-1, -1};
    bool m_queued_change = false;
};

class FakeSurface;

// Outlives the surfaces the coordinator creates and destroys
struct SurfaceLog {
    int created = 0;
    int opened = 0;
    int closed = 0;
    int presented = 0;
    bool fail_open = false;
    SurfacePlacement last_placement;
    bool last_controls_visible = false;
    std::shared_ptr<const Image> last_frame;
    uint64_t last_sequence = 0;
    FlipState last_flip;
    FakeSurface* current = nullptr;
};

class FakeSurface : public MirrorSurface {
public:
    explicit FakeSurface(SurfaceLog& log)
        : m_log(log) {
        m_log.created++;
        m_log.current = this;
    }

    ~FakeSurface() override {
        if (m_log.current == this) {
            m_log.current = nullptr;
        }
    }

    bool open(const SurfacePlacement& placement, bool controls_visible) override {
        if (m_log.fail_open) {
            return false;
        }
        m_log.opened++;
        m_log.last_placement = placement;
        m_log.last_controls_visible = controls_visible;
        m_open = true;
        return true;
    }

    void close() override {
        if (m_open) {
            m_log.closed++;
            m_open = false;
        }
    }

    bool is_open() const override { return m_open; }

    void present(const PresentedFrame& frame) override {
        m_log.presented++;
        m_log.last_frame = frame.image;
        m_log.last_sequence = frame.sequence;
        m_log.last_flip = frame.flip;
    }

    // What the window would do on a click or a close button
    void click(FlipAxis axis) {
        if (m_on_flip_toggle) {
            m_on_flip_toggle(axis);
        }
    }

    void request_close() {
        CloseRequestCallback callback = m_on_close_request;
        if (callback) {
            callback();
        }
    }

private:
    SurfaceLog& m_log;
    bool m_open = false;
};

inline SurfaceFactory make_surface_factory(SurfaceLog& log) {
    return [&log]() -> std::unique_ptr<MirrorSurface> {
        return std::make_unique<FakeSurface>(log);
    };
}

}  // namespace test
}  // namespace screen_mirror
