#include "session/stream_session.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;
using namespace screen_mirror::test;

TEST(StreamConfigDerivation, ScalesBoundsWithFixedRate) {
    MirrorConfig config;
    StreamConfig stream = derive_stream_config(make_source(1, 640, 480), config);

    EXPECT_EQ(stream.width, 1280);
    EXPECT_EQ(stream.height, 960);
    EXPECT_EQ(stream.fps, 60);
    EXPECT_EQ(stream.frame_interval_us(), 16666u);
    EXPECT_EQ(stream.queue_depth, 5);
    EXPECT_EQ(stream.format, PixelFormat::BGRA);
    EXPECT_FALSE(stream.show_cursor);
    EXPECT_TRUE(stream.is_valid());

    config.scale_factor = 1;
    config.capture_fps = 30;
    stream = derive_stream_config(make_source(1, 640, 480), config);
    EXPECT_EQ(stream.width, 640);
    EXPECT_EQ(stream.fps, 30);
}

class StreamSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_loop.init());
        m_session = std::make_unique<StreamSession>(m_backend, m_loop);
        m_session->set_state_callback([this](SessionState state) { m_transitions.push_back(state); });
    }

    void TearDown() override {
        m_session.reset();
    }

    EventLoop m_loop;
    FakeCaptureBackend m_backend;
    std::unique_ptr<StreamSession> m_session;
    std::vector<SessionState> m_transitions;
};

TEST_F(StreamSessionTest, StopWhenIdleIsNoop) {
    m_session->stop();
    m_session->stop();
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_TRUE(m_transitions.empty());
}

TEST_F(StreamSessionTest, StartThenImmediateStop) {
    ASSERT_TRUE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    EXPECT_EQ(m_session->get_state(), SessionState::ACTIVE);
    EXPECT_FALSE(m_session->relay().has_frame());

    FakeSubscription* sub = m_backend.last_subscription;
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_running());

    m_session->stop();
    pump(m_loop);

    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_FALSE(m_session->relay().has_frame());
    EXPECT_EQ(m_session->relay().get_published_frames(), 0u);
    EXPECT_EQ(m_transitions, (std::vector<SessionState>{
        SessionState::STARTING, SessionState::ACTIVE, SessionState::STOPPING, SessionState::IDLE}));
}

TEST_F(StreamSessionTest, DeliveredFramesReachRelay) {
    ASSERT_TRUE(m_session->start(make_source(1, 320, 240), MirrorConfig()));
    EXPECT_EQ(m_backend.last_config.width, 640);
    EXPECT_EQ(m_backend.last_config.height, 480);

    m_backend.last_subscription->emit(make_frame(640, 480, 0x40, 1));
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_session->relay().has_frame(); }));
    EXPECT_EQ(m_session->relay().get_latest()->image->width, 640);

    m_session->stop();
    EXPECT_FALSE(m_session->relay().has_frame());
}

TEST_F(StreamSessionTest, InFlightFrameIsNotPublishedAfterStop) {
    ASSERT_TRUE(m_session->start(make_source(1, 320, 240), MirrorConfig()));
    FakeSubscription* sub = m_backend.last_subscription;

    // Converted on the delivery thread, hand-off still queued on the loop
    sub->emit(make_frame(640, 480, 0x40, 1));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (sub->get_delivered_frames() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(sub->get_delivered_frames(), 1u);

    m_session->stop();
    pump(m_loop);
    EXPECT_FALSE(m_session->relay().has_frame());
    EXPECT_EQ(m_session->relay().get_published_frames(), 0u);
}

TEST_F(StreamSessionTest, SubscribeFailureReturnsToIdle) {
    m_backend.fail_subscribe = true;
    EXPECT_FALSE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_EQ(m_transitions, (std::vector<SessionState>{SessionState::STARTING, SessionState::IDLE}));

    // No retry behind the caller's back
    EXPECT_EQ(m_backend.subscribe_calls, 1);
}

TEST_F(StreamSessionTest, ProducerFailureReturnsToIdle) {
    m_backend.fail_start = true;
    EXPECT_FALSE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
}

TEST_F(StreamSessionTest, InvalidConfigurationIsRejected) {
    EXPECT_FALSE(m_session->start(make_source(1, 0, 480), MirrorConfig()));
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_EQ(m_backend.subscribe_calls, 0);
}

TEST_F(StreamSessionTest, StartWhileActiveReplacesSession) {
    ASSERT_TRUE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    m_transitions.clear();

    ASSERT_TRUE(m_session->start(make_source(2, 800, 600), MirrorConfig()));
    EXPECT_EQ(m_session->get_state(), SessionState::ACTIVE);
    EXPECT_EQ(m_session->get_source().id, 2u);
    EXPECT_EQ(m_backend.subscribe_calls, 2);
    EXPECT_EQ(m_transitions, (std::vector<SessionState>{
        SessionState::STOPPING, SessionState::IDLE, SessionState::STARTING, SessionState::ACTIVE}));
}

TEST_F(StreamSessionTest, DestroyingSessionStopsCapture) {
    ASSERT_TRUE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    ASSERT_EQ(m_backend.producers_stopped.load(), 0);

    m_session.reset();
    EXPECT_EQ(m_backend.producers_stopped.load(), 1);
    EXPECT_EQ(m_backend.subscribe_calls, 1);
}
