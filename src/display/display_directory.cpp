#include "display_directory.hpp"
#include "util/logger.hpp"

#ifdef HAVE_X11
#include "display/x11_display_backend.hpp"
#endif

namespace screen_mirror {

std::unique_ptr<DisplayBackend> create_display_backend(const char* display_name) {
#ifdef HAVE_X11
    auto backend = std::make_unique<X11DisplayBackend>();
    if (!backend->init(display_name)) {
        LOG_ERROR("Failed to initialize %s display backend", backend->get_name());
        return nullptr;
    }
    return backend;
#else
    (void)display_name;
    LOG_ERROR("No display backend compiled in");
    return nullptr;
#endif
}

uint32_t resolve_default_display(const std::vector<DisplayDescriptor>& displays, uint32_t previous) {
    if (previous != NO_DISPLAY && find_display(displays, previous)) {
        return previous;
    }
    for (const DisplayDescriptor& display : displays) {
        if (!display.is_primary) {
            return display.id;
        }
    }
    for (const DisplayDescriptor& display : displays) {
        if (display.is_primary) {
            return display.id;
        }
    }
    return NO_DISPLAY;
}

const DisplayDescriptor* find_display(const std::vector<DisplayDescriptor>& displays, uint32_t id) {
    for (const DisplayDescriptor& display : displays) {
        if (display.id == id) {
            return &display;
        }
    }
    return nullptr;
}

DisplayDirectory::DisplayDirectory(std::unique_ptr<DisplayBackend> backend, EventLoop& loop)
    : m_backend(std::move(backend))
    , m_loop(loop)
    , m_alive(std::make_shared<bool>(true)) {
}

DisplayDirectory::~DisplayDirectory() {
    m_alive.reset();
    if (m_poll_handle) {
        m_loop.remove_poll(m_poll_handle);
        m_poll_handle = nullptr;
    }
}

bool DisplayDirectory::init() {
    if (!m_backend) {
        LOG_ERROR("Display directory has no backend");
        return false;
    }

    int fd = m_backend->get_event_fd();
    if (fd < 0) {
        LOG_WARN("%s display backend has no change notifications", m_backend->get_name());
        return true;
    }

    m_poll_handle = m_loop.add_poll(fd, [this]() { on_events(); });
    if (!m_poll_handle) {
        LOG_ERROR("Failed to watch display configuration changes");
        return false;
    }
    return true;
}

std::vector<DisplayDescriptor> DisplayDirectory::list_displays() {
    std::vector<DisplayDescriptor> displays;
    if (!m_backend) {
        LOG_ERROR("Failed to enumerate displays");
        return {};
    }

    bool ok = m_backend->enumerate(displays);
    if (m_backend->process_queued_events()) {
        LOG_DEBUG("Display configuration changed during enumeration");
        schedule_change();
    }
    check_connection();

    if (!ok) {
        LOG_ERROR("Failed to enumerate displays");
        return {};
    }
    return displays;
}

uint32_t DisplayDirectory::resolve_default(uint32_t previous) {
    return resolve_default_display(list_displays(), previous);
}

bool DisplayDirectory::find(uint32_t id, DisplayDescriptor& out) {
    std::vector<DisplayDescriptor> displays = list_displays();
    const DisplayDescriptor* display = find_display(displays, id);
    if (!display) {
        return false;
    }
    out = *display;
    return true;
}

void DisplayDirectory::on_events() {
    bool changed = m_backend->process_events();
    check_connection();
    if (changed) {
        notify_change();
    }
}

void DisplayDirectory::check_connection() {
    if (m_poll_handle && m_backend->get_event_fd() < 0) {
        // Backend lost its connection
        m_loop.remove_poll(m_poll_handle);
        m_poll_handle = nullptr;
    }
}

void DisplayDirectory::schedule_change() {
    if (m_change_posted) {
        return;
    }
    m_change_posted = true;

    std::weak_ptr<bool> alive = m_alive;
    m_loop.post([this, alive]() {
        if (alive.expired()) {
            return;
        }
        m_change_posted = false;
        notify_change();
    });
}

void DisplayDirectory::notify_change() {
    LOG_INFO("Display configuration changed");
    if (m_on_change) {
        m_on_change();
    }
}

}  // namespace screen_mirror
