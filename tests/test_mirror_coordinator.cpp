#include "present/mirror_coordinator.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace screen_mirror;
using namespace screen_mirror::test;

class MirrorCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_loop.init());

        auto display_backend = std::make_unique<FakeDisplayBackend>();
        m_display_backend = display_backend.get();
        m_display_backend->displays = {
            make_display(10, true, 0, 0, 1920, 1080),
            make_display(11, false, 1920, 0, 1280, 1024),
        };
        m_displays = std::make_unique<DisplayDirectory>(std::move(display_backend), m_loop);
        ASSERT_TRUE(m_displays->init());

        m_session = std::make_unique<StreamSession>(m_capture, m_loop);
        m_coordinator = std::make_unique<MirrorCoordinator>(*m_session, *m_displays,
                                                            make_surface_factory(m_log));
        m_coordinator->set_closed_callback([this]() { m_closed_notifications++; });
    }

    void TearDown() override {
        m_coordinator.reset();
        m_session.reset();
        m_displays.reset();
    }

    void start_session() {
        ASSERT_TRUE(m_session->start(make_source(1, 640, 480), MirrorConfig()));
    }

    static MirrorWindowState state_for(uint32_t display_id) {
        MirrorWindowState state;
        state.display_id = display_id;
        state.flip.horizontal = true;
        state.controls_visible = true;
        return state;
    }

    EventLoop m_loop;
    FakeCaptureBackend m_capture;
    FakeDisplayBackend* m_display_backend = nullptr;
    std::unique_ptr<DisplayDirectory> m_displays;
    std::unique_ptr<StreamSession> m_session;
    SurfaceLog m_log;
    std::unique_ptr<MirrorCoordinator> m_coordinator;
    int m_closed_notifications = 0;
};

TEST_F(MirrorCoordinatorTest, PinnedToSelectedDisplay) {
    ASSERT_TRUE(m_coordinator->open(state_for(11)));
    EXPECT_TRUE(m_log.last_placement.pinned);
    EXPECT_EQ(m_log.last_placement.bounds, (Rect{1920, 0, 1280, 1024}));
    EXPECT_TRUE(m_log.last_controls_visible);
    EXPECT_EQ(m_coordinator->get_state().display_id, 11u);
}

TEST_F(MirrorCoordinatorTest, UnknownDisplayFallsBackToPrimary) {
    ASSERT_TRUE(m_coordinator->open(state_for(42)));
    EXPECT_TRUE(m_log.last_placement.pinned);
    EXPECT_EQ(m_log.last_placement.bounds, (Rect{0, 0, 1920, 1080}));
}

TEST_F(MirrorCoordinatorTest, CenteredWithoutDisplays) {
    m_display_backend->displays.clear();
    ASSERT_TRUE(m_coordinator->open(state_for(11)));
    EXPECT_FALSE(m_log.last_placement.pinned);
}

TEST_F(MirrorCoordinatorTest, OpenFailureLeavesNothingOpen) {
    m_log.fail_open = true;
    EXPECT_FALSE(m_coordinator->open(state_for(10)));
    EXPECT_FALSE(m_coordinator->is_open());
}

TEST_F(MirrorCoordinatorTest, CloseStopsSession) {
    start_session();
    ASSERT_TRUE(m_coordinator->open(state_for(10)));

    m_coordinator->close();
    EXPECT_FALSE(m_coordinator->is_open());
    EXPECT_EQ(m_log.closed, 1);
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_EQ(m_closed_notifications, 1);
}

TEST_F(MirrorCoordinatorTest, SurfaceCloseRequestStopsSession) {
    start_session();
    ASSERT_TRUE(m_coordinator->open(state_for(10)));
    ASSERT_NE(m_log.current, nullptr);

    m_log.current->request_close();
    EXPECT_FALSE(m_coordinator->is_open());
    EXPECT_EQ(m_log.current, nullptr);
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_EQ(m_closed_notifications, 1);
}

TEST_F(MirrorCoordinatorTest, CloseWithNothingOpenStillStopsSession) {
    start_session();
    m_coordinator->close();
    EXPECT_EQ(m_session->get_state(), SessionState::IDLE);
    EXPECT_EQ(m_closed_notifications, 0);
}

TEST_F(MirrorCoordinatorTest, ReopenReplacesSurfaceAndKeepsSession) {
    start_session();
    ASSERT_TRUE(m_coordinator->open(state_for(10)));
    ASSERT_TRUE(m_coordinator->open(state_for(11)));

    EXPECT_EQ(m_log.created, 2);
    EXPECT_EQ(m_log.opened, 2);
    EXPECT_EQ(m_log.closed, 1);
    EXPECT_TRUE(m_coordinator->is_open());
    EXPECT_TRUE(m_session->is_active());
    EXPECT_EQ(m_closed_notifications, 0);
}

TEST_F(MirrorCoordinatorTest, ClickTogglesFlipAndRepaints) {
    ASSERT_TRUE(m_coordinator->open(state_for(10)));
    int presented = m_log.presented;

    m_log.current->click(FlipAxis::VERTICAL);
    EXPECT_TRUE(m_coordinator->get_state().flip.vertical);
    EXPECT_TRUE(m_coordinator->get_state().flip.horizontal);
    EXPECT_EQ(m_log.presented, presented + 1);
    EXPECT_EQ(m_log.last_flip, (FlipState{true, true}));

    m_log.current->click(FlipAxis::HORIZONTAL);
    EXPECT_EQ(m_log.last_flip, (FlipState{false, true}));
}

TEST_F(MirrorCoordinatorTest, PresentsPublishedFrames) {
    start_session();
    ASSERT_TRUE(m_coordinator->open(state_for(10)));
    EXPECT_FALSE(m_log.last_frame);

    m_capture.last_subscription->emit(make_frame(1280, 960, 0x33, 1));
    ASSERT_TRUE(wait_until(m_loop, [&]() { return m_log.last_frame != nullptr; }));
    EXPECT_EQ(m_log.last_frame->width, 1280);
    EXPECT_EQ(m_log.last_frame, m_session->relay().get_latest()->image);
    EXPECT_EQ(m_log.last_sequence, m_session->relay().get_latest()->sequence);
    EXPECT_EQ(m_log.last_flip, (FlipState{true, false}));

    // Stopping clears what is shown
    m_session->stop();
    EXPECT_FALSE(m_log.last_frame);
}

TEST_F(MirrorCoordinatorTest, DisplayChangeKeepsMirrorOpen) {
    start_session();
    ASSERT_TRUE(m_coordinator->open(state_for(11)));

    bool changed = false;
    m_displays->set_change_callback([&]() { changed = true; });
    m_display_backend->displays.pop_back();
    ASSERT_TRUE(m_display_backend->trigger_change());
    ASSERT_TRUE(wait_until(m_loop, [&]() { return changed; }));

    EXPECT_TRUE(m_coordinator->is_open());
    EXPECT_TRUE(m_session->is_active());
}

TEST(CapturesOwnOutput, ScreenSourceOnTargetDisplay) {
    CaptureSource left = make_source(20, 1920, 1080);
    left.kind = SourceKind::DISPLAY;
    left.bounds = Rect{0, 0, 1920, 1080};
    CaptureSource right = left;
    right.bounds = Rect{1920, 0, 1280, 1024};

    SurfacePlacement placement;
    placement.pinned = true;
    placement.bounds = Rect{1920, 0, 1280, 1024};

    EXPECT_TRUE(captures_own_output(right, placement));
    // Adjacent monitors only share an edge
    EXPECT_FALSE(captures_own_output(left, placement));
}

TEST(CapturesOwnOutput, WindowsAndCenteredSurfacesNeverDo) {
    CaptureSource window = make_source(21, 800, 600);
    window.bounds = Rect{1920, 0, 800, 600};

    SurfacePlacement placement;
    placement.pinned = true;
    placement.bounds = Rect{1920, 0, 1280, 1024};
    EXPECT_FALSE(captures_own_output(window, placement));

    CaptureSource screen = window;
    screen.kind = SourceKind::DISPLAY;
    placement.pinned = false;
    EXPECT_FALSE(captures_own_output(screen, placement));
}

TEST_F(MirrorCoordinatorTest, ScreenSourceOnTargetStillOpens) {
    CaptureSource screen = make_source(30, 1280, 1024);
    screen.kind = SourceKind::DISPLAY;
    screen.bounds = Rect{1920, 0, 1280, 1024};
    ASSERT_TRUE(m_session->start(screen, MirrorConfig()));

    ASSERT_TRUE(m_coordinator->open(state_for(11)));
    EXPECT_TRUE(captures_own_output(m_session->get_source(), m_log.last_placement));
    EXPECT_TRUE(m_session->is_active());
}
