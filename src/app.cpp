#include "app.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#ifdef HAVE_X11
#include "present/x11_mirror_window.hpp"
#endif

namespace screen_mirror {

MirrorApp::MirrorApp() = default;

MirrorApp::~MirrorApp() {
    if (m_stdin_poll) {
        m_loop.remove_poll(m_stdin_poll);
        m_stdin_poll = nullptr;
    }
    // Mirror first: closing it stops the session
    m_mirror.reset();
    m_session.reset();
    m_catalog.reset();
    m_displays.reset();
    if (m_capture) {
        m_capture->shutdown();
        m_capture.reset();
    }
}

bool MirrorApp::init(const MirrorConfig& config) {
    m_config = config;

    if (!m_loop.init()) {
        return false;
    }

    const char* display = config.display.empty() ? nullptr : config.display.c_str();

    // Without RandR the mirror still works as a centered window
    m_displays = std::make_unique<DisplayDirectory>(create_display_backend(display), m_loop);
    if (!m_displays->init()) {
        LOG_WARN("Display enumeration unavailable, mirror will open centered");
    }
    m_displays->set_change_callback([this]() { refresh_displays(); });

    m_capture = create_capture_backend(config.capture_backend, config);
    if (!m_capture) {
        LOG_ERROR("Failed to initialize capture backend");
        return false;
    }
    LOG_INFO("Using %s capture backend", m_capture->get_name());

    m_catalog = std::make_unique<SourceCatalog>(*m_capture, m_loop, make_catalog_policy(config));
    m_session = std::make_unique<StreamSession>(*m_capture, m_loop);
    m_session->set_state_callback([](SessionState state) {
        LOG_INFO("Session %s", session_state_name(state));
    });

    std::string display_name = config.display;
    EventLoop& loop = m_loop;
    SurfaceFactory factory = [&loop, display_name]() -> std::unique_ptr<MirrorSurface> {
#ifdef HAVE_X11
        return std::make_unique<X11MirrorWindow>(loop, display_name);
#else
        (void)loop;
        LOG_ERROR("No mirror surface compiled in");
        return nullptr;
#endif
    };
    m_mirror = std::make_unique<MirrorCoordinator>(*m_session, *m_displays, factory);

    FlipState flip;
    flip.horizontal = config.flip_horizontal;
    flip.vertical = config.flip_vertical;
    m_mirror->set_flip(flip);
    m_mirror->set_closed_callback([]() {
        printf("Mirror closed\n");
        fflush(stdout);
    });

    m_target_display = config.target_display;
    return true;
}

int MirrorApp::list_sources() {
    std::vector<CaptureSource> sources = m_catalog->list_capture_sources();
    print_sources(sources);
    return 0;
}

int MirrorApp::list_displays() {
    std::vector<DisplayDescriptor> displays = m_displays->list_displays();
    m_target_display = resolve_default_display(displays, m_target_display);
    print_displays(displays);
    return 0;
}

int MirrorApp::run() {
    refresh_displays();

    m_stdin_poll = m_loop.add_poll(STDIN_FILENO, [this]() { on_stdin(); });
    if (!m_stdin_poll) {
        LOG_WARN("Interactive commands unavailable");
    }

    m_startup_mirror_pending = m_config.source_id != NO_SOURCE;
    rescan_sources();

    printf("Commands: <source id> mirror, h/v flip, r rescan, d displays, s stop, q quit\n");
    fflush(stdout);

    m_loop.run();

    stop_mirror();
    LOG_INFO("Exiting with code %d", m_exit_code);
    return m_exit_code;
}

void MirrorApp::stop() {
    m_loop.request_stop();
}

bool MirrorApp::start_mirror(uint32_t source_id) {
    CaptureSource source;
    if (!m_catalog->find(source_id, source)) {
        LOG_ERROR("Source 0x%x is not in the last scan", source_id);
        return false;
    }

    if (!m_session->start(source, m_config)) {
        printf("Mirror failed to start\n");
        fflush(stdout);
        return false;
    }

    MirrorWindowState state;
    state.display_id = m_target_display;
    state.flip = m_mirror->get_state().flip;
    state.controls_visible = m_config.show_controls;
    if (!m_mirror->open(state)) {
        m_session->stop();
        printf("Mirror failed to open\n");
        fflush(stdout);
        return false;
    }

    printf("Mirroring 0x%x '%s'\n", source.id, source.title.c_str());
    fflush(stdout);
    return true;
}

void MirrorApp::stop_mirror() {
    if (m_mirror) {
        m_mirror->close();
    }
}

void MirrorApp::refresh_displays() {
    std::vector<DisplayDescriptor> displays = m_displays->list_displays();
    uint32_t previous = m_target_display;
    m_target_display = resolve_default_display(displays, previous);
    if (m_target_display != previous) {
        LOG_INFO("Target display %u -> %u", previous, m_target_display);
    }
    print_displays(displays);
}

void MirrorApp::rescan_sources() {
    m_catalog->list_capture_sources_async([this](const std::vector<CaptureSource>& sources) {
        on_sources(sources);
    });
}

void MirrorApp::on_sources(const std::vector<CaptureSource>& sources) {
    if (sources.empty()) {
        printf("No capturable sources found\n");
    } else {
        print_sources(sources);
    }
    fflush(stdout);

    if (m_startup_mirror_pending) {
        m_startup_mirror_pending = false;
        if (!start_mirror(m_config.source_id)) {
            m_exit_code = 1;
            m_loop.stop();
        }
    }
}

void MirrorApp::on_stdin() {
    char buf[256];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
            return;
        }
        // EOF: keep running, signals still stop us
        m_loop.remove_poll(m_stdin_poll);
        m_stdin_poll = nullptr;
        return;
    }

    m_stdin_buffer.append(buf, static_cast<size_t>(n));
    size_t pos;
    while ((pos = m_stdin_buffer.find('\n')) != std::string::npos) {
        std::string line = m_stdin_buffer.substr(0, pos);
        m_stdin_buffer.erase(0, pos + 1);
        handle_command(line);
    }
}

void MirrorApp::handle_command(const std::string& line) {
    size_t begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return;
    }
    size_t end = line.find_last_not_of(" \t\r");
    std::string command = line.substr(begin, end - begin + 1);

    if (command == "h") {
        m_mirror->toggle_flip(FlipAxis::HORIZONTAL);
    } else if (command == "v") {
        m_mirror->toggle_flip(FlipAxis::VERTICAL);
    } else if (command == "r") {
        rescan_sources();
    } else if (command == "d") {
        print_displays(m_displays->list_displays());
    } else if (command == "s") {
        stop_mirror();
    } else if (command == "q") {
        m_loop.stop();
    } else {
        char* parse_end = nullptr;
        unsigned long id = strtoul(command.c_str(), &parse_end, 0);
        if (parse_end && *parse_end == '\0' && id != NO_SOURCE) {
            start_mirror(static_cast<uint32_t>(id));
        } else {
            printf("Unknown command: %s\n", command.c_str());
            fflush(stdout);
        }
    }
}

void MirrorApp::print_sources(const std::vector<CaptureSource>& sources) const {
    printf("Sources:\n");
    for (const CaptureSource& source : sources) {
        printf("  0x%08x  %-7s %5dx%-5d %-20s %s%s\n",
               source.id,
               source.kind == SourceKind::DISPLAY ? "screen" : "window",
               source.bounds.width, source.bounds.height,
               source.app_name.c_str(), source.title.c_str(),
               source.thumbnail ? "" : "  (no preview)");
    }
    fflush(stdout);
}

void MirrorApp::print_displays(const std::vector<DisplayDescriptor>& displays) const {
    printf("Displays:\n");
    for (const DisplayDescriptor& display : displays) {
        printf("  %c %-8u %-12s %dx%d+%d+%d%s\n",
               display.id == m_target_display ? '*' : ' ',
               display.id, display.name.c_str(),
               display.bounds.width, display.bounds.height, display.bounds.x, display.bounds.y,
               display.is_primary ? "  (primary)" : "");
    }
    fflush(stdout);
}

}  // namespace screen_mirror
