#pragma once

#include "capture_backend.hpp"
#include "util/event_loop.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace screen_mirror {

struct CatalogPolicy {
    int min_width = 100;          // Sources must be strictly larger
    int min_height = 100;
    int thumbnail_width = 400;
    int thumbnail_height = 300;
    uint32_t self_pid = 0;        // Windows owned by this pid are ours
};

CatalogPolicy make_catalog_policy(const MirrorConfig& config);

// Whether a source may be offered for mirroring
bool is_capturable(const CaptureSource& source, const CatalogPolicy& policy);

// Filtered list of mirrorable sources, each with a best-effort thumbnail
class SourceCatalog {
public:
    using ResultCallback = std::function<void(const std::vector<CaptureSource>&)>;

    SourceCatalog(CaptureBackend& backend, EventLoop& loop, const CatalogPolicy& policy);
    ~SourceCatalog();

    SourceCatalog(const SourceCatalog&) = delete;
    SourceCatalog& operator=(const SourceCatalog&) = delete;

    // Blocking scan. Empty when the backend cannot list sources.
    std::vector<CaptureSource> list_capture_sources();

    // Scan on a worker thread; callback runs on the loop thread.
    // Returns false if a scan is already running.
    bool list_capture_sources_async(ResultCallback callback);

    bool is_scanning() const { return m_scanning; }

    // Look up a source from the last completed scan
    bool find(uint32_t id, CaptureSource& out) const;

    std::vector<CaptureSource> get_last_result() const;

private:
    void store_result(const std::vector<CaptureSource>& sources);

    CaptureBackend& m_backend;
    EventLoop& m_loop;
    CatalogPolicy m_policy;

    // Posted results check this before touching the catalog
    std::shared_ptr<bool> m_alive;

    std::thread m_worker;
    std::atomic<bool> m_scanning{false};

    mutable std::mutex m_result_mutex;
    std::vector<CaptureSource> m_last_result;
};

}  // namespace screen_mirror
