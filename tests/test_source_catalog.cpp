#include "capture/source_catalog.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <future>

using namespace screen_mirror;
using namespace screen_mirror::test;

static const uint32_t SELF_PID = 4242;

class SourceCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_loop.init());
        CatalogPolicy policy = make_catalog_policy(MirrorConfig());
        policy.self_pid = SELF_PID;
        m_catalog = std::make_unique<SourceCatalog>(m_backend, m_loop, policy);
    }

    void TearDown() override {
        m_catalog.reset();
    }

    static std::vector<uint32_t> ids(const std::vector<CaptureSource>& sources) {
        std::vector<uint32_t> out;
        for (const CaptureSource& source : sources) {
            out.push_back(source.id);
        }
        return out;
    }

    EventLoop m_loop;
    FakeCaptureBackend m_backend;
    std::unique_ptr<SourceCatalog> m_catalog;
};

TEST_F(SourceCatalogTest, SmallSourcesAreFiltered) {
    m_backend.sources = {make_source(1, 640, 480), make_source(2, 50, 50)};
    EXPECT_EQ(ids(m_catalog->list_capture_sources()), (std::vector<uint32_t>{1}));
}

TEST_F(SourceCatalogTest, MinimumSizeIsExclusive) {
    m_backend.sources = {
        make_source(1, 100, 500),
        make_source(2, 500, 100),
        make_source(3, 101, 101),
    };
    EXPECT_EQ(ids(m_catalog->list_capture_sources()), (std::vector<uint32_t>{3}));
}

TEST_F(SourceCatalogTest, OwnWindowsAreExcluded) {
    m_backend.sources = {
        make_source(1, 640, 480, SELF_PID),
        make_source(2, 640, 480, 0, APP_WM_CLASS),
        make_source(3, 640, 480, 777, "Firefox"),
    };
    std::vector<CaptureSource> sources = m_catalog->list_capture_sources();
    EXPECT_EQ(ids(sources), (std::vector<uint32_t>{3}));
    for (const CaptureSource& source : sources) {
        EXPECT_GT(source.bounds.width, 100);
        EXPECT_GT(source.bounds.height, 100);
        EXPECT_NE(source.owner_pid, SELF_PID);
    }
}

TEST_F(SourceCatalogTest, ThumbnailsFitTheBoxWithoutCursor) {
    m_backend.sources = {make_source(1, 1600, 1200)};
    std::vector<CaptureSource> sources = m_catalog->list_capture_sources();

    ASSERT_EQ(sources.size(), 1u);
    ASSERT_TRUE(sources[0].thumbnail);
    EXPECT_EQ(sources[0].thumbnail->width, 400);
    EXPECT_EQ(sources[0].thumbnail->height, 300);
    EXPECT_EQ(m_backend.last_still_width, 400);
    EXPECT_EQ(m_backend.last_still_height, 300);
    EXPECT_FALSE(m_backend.last_still_cursor);
}

TEST_F(SourceCatalogTest, ThumbnailFailureKeepsSource) {
    m_backend.sources = {make_source(1, 640, 480), make_source(2, 800, 600), make_source(3, 800, 600)};
    m_backend.failing_stills = {2};

    std::vector<CaptureSource> sources = m_catalog->list_capture_sources();
    ASSERT_EQ(ids(sources), (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_TRUE(sources[0].thumbnail);
    EXPECT_FALSE(sources[1].thumbnail);
    EXPECT_TRUE(sources[2].thumbnail);
}

TEST_F(SourceCatalogTest, EnumerationFailureIsEmpty) {
    m_backend.sources = {make_source(1, 640, 480)};
    m_backend.enumerate_ok = false;
    EXPECT_TRUE(m_catalog->list_capture_sources().empty());
    EXPECT_EQ(m_backend.still_calls.load(), 0);
}

TEST_F(SourceCatalogTest, FindUsesLastScan) {
    m_backend.sources = {make_source(1, 640, 480), make_source(2, 50, 50)};
    m_catalog->list_capture_sources();

    CaptureSource source;
    ASSERT_TRUE(m_catalog->find(1, source));
    EXPECT_EQ(source.title, "Window 1");
    EXPECT_FALSE(m_catalog->find(2, source));
}

TEST_F(SourceCatalogTest, AsyncResultArrivesOnLoopThread) {
    m_backend.sources = {make_source(1, 640, 480), make_source(2, 50, 50)};

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    m_backend.on_enumerate = [released]() { released.wait(); };

    bool done = false;
    std::vector<uint32_t> result;
    std::thread::id callback_thread;
    ASSERT_TRUE(m_catalog->list_capture_sources_async([&](const std::vector<CaptureSource>& sources) {
        result = ids(sources);
        callback_thread = std::this_thread::get_id();
        done = true;
    }));

    // One scan at a time
    EXPECT_TRUE(m_catalog->is_scanning());
    EXPECT_FALSE(m_catalog->list_capture_sources_async(nullptr));

    release.set_value();
    ASSERT_TRUE(wait_until(m_loop, [&]() { return done; }));
    EXPECT_EQ(result, (std::vector<uint32_t>{1}));
    EXPECT_EQ(callback_thread, std::this_thread::get_id());
    EXPECT_FALSE(m_catalog->is_scanning());

    m_backend.on_enumerate = nullptr;
    done = false;
    ASSERT_TRUE(m_catalog->list_capture_sources_async([&](const std::vector<CaptureSource>&) { done = true; }));
    EXPECT_TRUE(wait_until(m_loop, [&]() { return done; }));
}
