#pragma once

#include <memory>
#include <string>
#include <vector>
#include "screen_mirror/config.hpp"
#include "util/event_loop.hpp"
#include "capture/capture_backend.hpp"
#include "capture/source_catalog.hpp"
#include "display/display_directory.hpp"
#include "session/stream_session.hpp"
#include "present/mirror_coordinator.hpp"

namespace screen_mirror {

class MirrorApp {
public:
    MirrorApp();
    ~MirrorApp();

    // Initialize with configuration
    bool init(const MirrorConfig& config);

    // Run until quit or signal (blocking). Returns the process exit code.
    int run();

    // Print the capturable sources / displays and return
    int list_sources();
    int list_displays();

    // Request shutdown. Async-signal-safe.
    void stop();

    // Mirror a source from the last scan on the current target display
    bool start_mirror(uint32_t source_id);
    void stop_mirror();

    SourceCatalog& catalog() { return *m_catalog; }
    DisplayDirectory& displays() { return *m_displays; }
    StreamSession& session() { return *m_session; }
    MirrorCoordinator& mirror() { return *m_mirror; }

private:
    void refresh_displays();
    void rescan_sources();
    void on_sources(const std::vector<CaptureSource>& sources);

    void on_stdin();
    void handle_command(const std::string& line);

    void print_sources(const std::vector<CaptureSource>& sources) const;
    void print_displays(const std::vector<DisplayDescriptor>& displays) const;

    MirrorConfig m_config;
    EventLoop m_loop;

    std::unique_ptr<CaptureBackend> m_capture;
    std::unique_ptr<DisplayDirectory> m_displays;
    std::unique_ptr<SourceCatalog> m_catalog;
    std::unique_ptr<StreamSession> m_session;
    std::unique_ptr<MirrorCoordinator> m_mirror;

    uint32_t m_target_display = NO_DISPLAY;
    bool m_startup_mirror_pending = false;
    int m_exit_code = 0;

    void* m_stdin_poll = nullptr;
    std::string m_stdin_buffer;
};

}  // namespace screen_mirror
