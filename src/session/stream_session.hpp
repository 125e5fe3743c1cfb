#pragma once

#include "capture/capture_backend.hpp"
#include "relay/frame_relay.hpp"
#include "util/event_loop.hpp"

#include <functional>
#include <memory>

namespace screen_mirror {

enum class SessionState {
    IDLE,
    STARTING,
    ACTIVE,
    STOPPING
};

const char* session_state_name(SessionState state);

// Source bounds scaled up, capped frame rate, BGRA, bounded queue
StreamConfig derive_stream_config(const CaptureSource& source, const MirrorConfig& config);

// The single live capture. Lives on the loop thread; start() and stop()
// serialize through the state machine.
class StreamSession {
public:
    using StateCallback = std::function<void(SessionState)>;

    StreamSession(CaptureBackend& backend, EventLoop& loop);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Replace any running session. Returns false (state IDLE) if the
    // subscription could not be established.
    bool start(const CaptureSource& source, const StreamConfig& config);
    bool start(const CaptureSource& source, const MirrorConfig& config);

    // No-op when IDLE. On return no further frame is published.
    void stop();

    SessionState get_state() const { return m_state; }
    bool is_active() const { return m_state == SessionState::ACTIVE; }

    // Source of the running session
    const CaptureSource& get_source() const { return m_source; }

    FrameRelay& relay() { return *m_relay; }
    const FrameRelay& relay() const { return *m_relay; }

    void set_state_callback(StateCallback callback) { m_on_state = std::move(callback); }

private:
    void set_state(SessionState state);

    CaptureBackend& m_backend;
    std::shared_ptr<FrameRelay> m_relay;

    SessionState m_state = SessionState::IDLE;
    CaptureSource m_source;
    std::unique_ptr<CaptureSubscription> m_subscription;

    StateCallback m_on_state;
};

}  // namespace screen_mirror
