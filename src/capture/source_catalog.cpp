#include "source_catalog.hpp"
#include "util/logger.hpp"

#include <unistd.h>

namespace screen_mirror {

CatalogPolicy make_catalog_policy(const MirrorConfig& config) {
    CatalogPolicy policy;
    policy.min_width = config.min_source_width;
    policy.min_height = config.min_source_height;
    policy.thumbnail_width = config.thumbnail_width;
    policy.thumbnail_height = config.thumbnail_height;
    policy.self_pid = static_cast<uint32_t>(getpid());
    return policy;
}

bool is_capturable(const CaptureSource& source, const CatalogPolicy& policy) {
    if (source.bounds.width <= policy.min_width || source.bounds.height <= policy.min_height) {
        return false;
    }
    if (policy.self_pid != 0 && source.owner_pid == policy.self_pid) {
        return false;
    }
    // Our own windows without _NET_WM_PID (or from another instance)
    if (source.owner_class == APP_WM_CLASS) {
        return false;
    }
    return true;
}

SourceCatalog::SourceCatalog(CaptureBackend& backend, EventLoop& loop, const CatalogPolicy& policy)
    : m_backend(backend)
    , m_loop(loop)
    , m_policy(policy)
    , m_alive(std::make_shared<bool>(true)) {
}

SourceCatalog::~SourceCatalog() {
    m_alive.reset();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::vector<CaptureSource> SourceCatalog::list_capture_sources() {
    std::vector<CaptureSource> all;
    if (!m_backend.enumerate_sources(all)) {
        LOG_ERROR("Failed to enumerate capture sources (%s)", m_backend.get_name());
        return {};
    }

    std::vector<CaptureSource> result;
    for (CaptureSource& source : all) {
        if (!is_capturable(source, m_policy)) {
            LOG_DEBUG("Skipping source 0x%x '%s' (%dx%d)", source.id, source.title.c_str(),
                      source.bounds.width, source.bounds.height);
            continue;
        }

        auto thumbnail = std::make_shared<Image>();
        if (m_backend.capture_still(source, m_policy.thumbnail_width, m_policy.thumbnail_height,
                                    false, *thumbnail) && !thumbnail->empty()) {
            source.thumbnail = std::move(thumbnail);
        } else {
            LOG_DEBUG("No thumbnail for source 0x%x '%s'", source.id, source.title.c_str());
            source.thumbnail.reset();
        }
        result.push_back(std::move(source));
    }

    LOG_INFO("Found %zu capturable sources (%zu candidates)", result.size(), all.size());
    store_result(result);
    return result;
}

bool SourceCatalog::list_capture_sources_async(ResultCallback callback) {
    if (m_scanning.exchange(true)) {
        LOG_WARN("Source scan already in progress");
        return false;
    }

    // The previous worker has posted its result and is exiting
    if (m_worker.joinable()) {
        m_worker.join();
    }

    std::weak_ptr<bool> alive = m_alive;
    m_worker = std::thread([this, alive, callback]() {
        std::vector<CaptureSource> sources = list_capture_sources();
        m_loop.post([this, alive, callback, sources]() {
            if (alive.expired()) {
                return;
            }
            m_scanning = false;
            if (callback) {
                callback(sources);
            }
        });
    });
    return true;
}

bool SourceCatalog::find(uint32_t id, CaptureSource& out) const {
    std::lock_guard<std::mutex> lock(m_result_mutex);
    for (const CaptureSource& source : m_last_result) {
        if (source.id == id) {
            out = source;
            return true;
        }
    }
    return false;
}

std::vector<CaptureSource> SourceCatalog::get_last_result() const {
    std::lock_guard<std::mutex> lock(m_result_mutex);
    return m_last_result;
}

void SourceCatalog::store_result(const std::vector<CaptureSource>& sources) {
    std::lock_guard<std::mutex> lock(m_result_mutex);
    m_last_result = sources;
}

}  // namespace screen_mirror
