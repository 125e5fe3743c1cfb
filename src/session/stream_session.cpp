#include "stream_session.hpp"
#include "util/logger.hpp"

namespace screen_mirror {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::STARTING: return "starting";
        case SessionState::ACTIVE: return "active";
        case SessionState::STOPPING: return "stopping";
    }
    return "unknown";
}

StreamConfig derive_stream_config(const CaptureSource& source, const MirrorConfig& config) {
    StreamConfig stream;
    stream.width = source.bounds.width * config.scale_factor;
    stream.height = source.bounds.height * config.scale_factor;
    stream.fps = config.capture_fps;
    stream.format = PixelFormat::BGRA;
    stream.show_cursor = config.show_cursor;
    stream.queue_depth = config.queue_depth;
    return stream;
}

StreamSession::StreamSession(CaptureBackend& backend, EventLoop& loop)
    : m_backend(backend)
    , m_relay(std::make_shared<FrameRelay>(loop)) {
}

StreamSession::~StreamSession() {
    m_on_state = nullptr;
    stop();
}

bool StreamSession::start(const CaptureSource& source, const MirrorConfig& config) {
    return start(source, derive_stream_config(source, config));
}

bool StreamSession::start(const CaptureSource& source, const StreamConfig& config) {
    if (m_state != SessionState::IDLE) {
        LOG_INFO("Replacing running session on source 0x%x", m_source.id);
        stop();
    }

    set_state(SessionState::STARTING);
    if (m_state != SessionState::STARTING) {
        // A state observer stopped us
        return false;
    }

    if (!config.is_valid()) {
        LOG_ERROR("Invalid stream configuration %dx%d @ %d fps, queue %d",
                  config.width, config.height, config.fps, config.queue_depth);
        set_state(SessionState::IDLE);
        return false;
    }

    std::unique_ptr<CaptureSubscription> subscription = m_backend.subscribe(source, config);
    if (!subscription) {
        LOG_ERROR("Failed to subscribe to source 0x%x '%s'", source.id, source.title.c_str());
        set_state(SessionState::IDLE);
        return false;
    }

    uint64_t generation = m_relay->begin_session();
    std::weak_ptr<FrameRelay> weak_relay = m_relay;
    bool started = subscription->start([weak_relay, generation](const RawFrame& frame) {
        if (auto relay = weak_relay.lock()) {
            relay->on_raw_frame(frame, generation);
        }
    });

    if (!started) {
        LOG_ERROR("Failed to start capture of source 0x%x '%s'", source.id, source.title.c_str());
        m_relay->end_session();
        set_state(SessionState::IDLE);
        return false;
    }

    m_subscription = std::move(subscription);
    m_source = source;
    m_source.thumbnail.reset();

    LOG_INFO("Mirroring source 0x%x '%s' at %dx%d, %d fps",
             source.id, source.title.c_str(), config.width, config.height, config.fps);
    set_state(SessionState::ACTIVE);
    return true;
}

void StreamSession::stop() {
    if (m_state == SessionState::IDLE || m_state == SessionState::STOPPING) {
        return;
    }

    set_state(SessionState::STOPPING);

    // Invalidate in-flight frames before tearing the stream down
    m_relay->end_session();
    if (m_subscription) {
        m_subscription->stop();
        m_subscription.reset();
    }
    m_relay->clear();
    m_source = CaptureSource();

    set_state(SessionState::IDLE);
}

void StreamSession::set_state(SessionState state) {
    if (m_state == state) {
        return;
    }
    LOG_DEBUG("Session %s -> %s", session_state_name(m_state), session_state_name(state));
    m_state = state;
    if (m_on_state) {
        m_on_state(state);
    }
}

}  // namespace screen_mirror
