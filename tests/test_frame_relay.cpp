#include "relay/frame_relay.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;
using namespace screen_mirror::test;

class FrameRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_loop.init());
        m_relay = std::make_shared<FrameRelay>(m_loop);
    }

    void TearDown() override {
        m_relay.reset();
    }

    EventLoop m_loop;
    std::shared_ptr<FrameRelay> m_relay;
};

TEST_F(FrameRelayTest, NothingPublishedBeforeFirstFrame) {
    m_relay->begin_session();
    pump(m_loop);
    EXPECT_FALSE(m_relay->has_frame());
    EXPECT_EQ(m_relay->get_latest(), nullptr);
}

TEST_F(FrameRelayTest, PublishesOnLoopThread) {
    uint64_t generation = m_relay->begin_session();
    int notified = 0;
    m_relay->subscribe([&](const MirroredFrame* frame) {
        ASSERT_NE(frame, nullptr);
        notified++;
    });

    std::thread delivery([&]() { m_relay->on_raw_frame(make_frame(4, 2, 0x80, 7), generation); });
    delivery.join();

    // Hand-off only happens when the loop runs
    EXPECT_FALSE(m_relay->has_frame());
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_relay->has_frame(); }));

    const MirroredFrame* latest = m_relay->get_latest();
    ASSERT_NE(latest, nullptr);
    EXPECT_EQ(latest->image->width, 4);
    EXPECT_EQ(latest->image->height, 2);
    EXPECT_EQ(latest->image->pixels[3], 255);
    EXPECT_EQ(latest->timestamp_us, 7u);
    EXPECT_EQ(notified, 1);
}

TEST_F(FrameRelayTest, LatestWinsWhileLoopIsBusy) {
    uint64_t generation = m_relay->begin_session();
    for (uint64_t tag = 1; tag <= 3; tag++) {
        m_relay->on_raw_frame(make_frame(2, 2, 0, tag), generation);
    }

    pump(m_loop);
    ASSERT_TRUE(m_relay->has_frame());
    EXPECT_EQ(m_relay->get_latest()->timestamp_us, 3u);
    EXPECT_EQ(m_relay->get_published_frames(), 1u);
}

TEST_F(FrameRelayTest, SequenceOnlyMovesForward) {
    uint64_t generation = m_relay->begin_session();
    uint64_t last_sequence = 0;
    for (uint64_t tag = 1; tag <= 5; tag++) {
        m_relay->on_raw_frame(make_frame(2, 2, 0, tag), generation);
        ASSERT_TRUE(wait_until(m_loop, [&]() {
            return m_relay->has_frame() && m_relay->get_latest()->timestamp_us == tag;
        }));
        EXPECT_GT(m_relay->get_latest()->sequence, last_sequence);
        last_sequence = m_relay->get_latest()->sequence;
    }
}

TEST_F(FrameRelayTest, DecodeFailureKeepsPreviousFrame) {
    uint64_t generation = m_relay->begin_session();
    m_relay->on_raw_frame(make_frame(2, 2, 0x10, 1), generation);
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_relay->has_frame(); }));
    std::shared_ptr<const Image> before = m_relay->get_latest()->image;

    RawFrame empty = make_frame(2, 2, 0, 2);
    empty.width = 0;
    m_relay->on_raw_frame(empty, generation);
    pump(m_loop);

    EXPECT_EQ(m_relay->get_decode_failures(), 1u);
    EXPECT_EQ(m_relay->get_latest()->image, before);
    EXPECT_EQ(m_relay->get_latest()->timestamp_us, 1u);

    // Later frames still flow
    m_relay->on_raw_frame(make_frame(2, 2, 0x20, 3), generation);
    EXPECT_TRUE(wait_until(m_loop, [&]() { return m_relay->get_latest()->timestamp_us == 3u; }));
}

TEST_F(FrameRelayTest, FramesFromEndedSessionAreDropped) {
    uint64_t old_generation = m_relay->begin_session();
    m_relay->end_session();

    m_relay->on_raw_frame(make_frame(2, 2, 0, 1), old_generation);
    pump(m_loop);
    EXPECT_FALSE(m_relay->has_frame());
    EXPECT_EQ(m_relay->get_stale_drops(), 1u);

    // A newer session ignores the old generation too
    m_relay->begin_session();
    m_relay->on_raw_frame(make_frame(2, 2, 0, 2), old_generation);
    pump(m_loop);
    EXPECT_FALSE(m_relay->has_frame());
}

TEST_F(FrameRelayTest, EndSessionDiscardsPendingFrame) {
    uint64_t generation = m_relay->begin_session();
    m_relay->on_raw_frame(make_frame(2, 2, 0, 1), generation);
    m_relay->end_session();

    pump(m_loop);
    EXPECT_FALSE(m_relay->has_frame());
    EXPECT_EQ(m_relay->get_published_frames(), 0u);
}

TEST_F(FrameRelayTest, ClearNotifiesSubscribers) {
    uint64_t generation = m_relay->begin_session();
    bool cleared = false;
    int id = m_relay->subscribe([&](const MirroredFrame* frame) { cleared = frame == nullptr; });

    m_relay->on_raw_frame(make_frame(2, 2, 0, 1), generation);
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_relay->has_frame(); }));

    m_relay->clear();
    EXPECT_FALSE(m_relay->has_frame());
    EXPECT_TRUE(cleared);

    m_relay->unsubscribe(id);
    cleared = false;
    m_relay->on_raw_frame(make_frame(2, 2, 0, 2), generation);
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_relay->has_frame(); }));
    m_relay->clear();
    EXPECT_FALSE(cleared);
}

TEST_F(FrameRelayTest, HandOffAfterRelayIsGoneIsIgnored) {
    uint64_t generation = m_relay->begin_session();
    m_relay->on_raw_frame(make_frame(2, 2, 0, 1), generation);

    m_relay.reset();
    pump(m_loop);
    SUCCEED();
}
