#pragma once

#include "screen_mirror/config.hpp"
#include "util/event_loop.hpp"
#include "util/rect.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace screen_mirror {

struct DisplayDescriptor {
    uint32_t id = NO_DISPLAY;     // Stable for one physical output during a run
    std::string name;
    bool is_primary = false;
    Rect bounds;                  // Pixels, in root window coordinates
};

// Windowing-system source of displays and change notifications
class DisplayBackend {
public:
    virtual ~DisplayBackend() = default;

    virtual bool init(const char* display_name = nullptr) = 0;
    virtual void shutdown() = 0;

    // Current outputs, in system order
    virtual bool enumerate(std::vector<DisplayDescriptor>& out) = 0;

    // Fd that becomes readable when events are pending, -1 if none
    virtual int get_event_fd() const = 0;

    // Drain pending events. Returns true if the configuration changed.
    virtual bool process_events() = 0;

    // Like process_events(), but only for events already read off the
    // connection, which do not make the fd readable again
    virtual bool process_queued_events() = 0;

    virtual const char* get_name() const = 0;

protected:
    DisplayBackend() = default;

    DisplayBackend(const DisplayBackend&) = delete;
    DisplayBackend& operator=(const DisplayBackend&) = delete;
};

// Initialized RandR backend, or nullptr
std::unique_ptr<DisplayBackend> create_display_backend(const char* display_name);

// previous if it is still listed, else the first non-primary display,
// else the primary, else NO_DISPLAY
uint32_t resolve_default_display(const std::vector<DisplayDescriptor>& displays, uint32_t previous);

const DisplayDescriptor* find_display(const std::vector<DisplayDescriptor>& displays, uint32_t id);

class DisplayDirectory {
public:
    using ChangeCallback = std::function<void()>;

    DisplayDirectory(std::unique_ptr<DisplayBackend> backend, EventLoop& loop);
    ~DisplayDirectory();

    DisplayDirectory(const DisplayDirectory&) = delete;
    DisplayDirectory& operator=(const DisplayDirectory&) = delete;

    // Start watching for configuration changes
    bool init();

    // Re-enumerated on every call. Empty (and logged) on failure. A change
    // that arrives while enumerating is notified from the loop afterwards.
    std::vector<DisplayDescriptor> list_displays();

    uint32_t resolve_default(uint32_t previous);

    // Look up an id in a fresh enumeration
    bool find(uint32_t id, DisplayDescriptor& out);

    // Called on the loop thread after the configuration changed
    void set_change_callback(ChangeCallback callback) { m_on_change = std::move(callback); }

    DisplayBackend* get_backend() { return m_backend.get(); }

private:
    void on_events();
    void check_connection();
    void schedule_change();
    void notify_change();

    std::unique_ptr<DisplayBackend> m_backend;
    EventLoop& m_loop;
    void* m_poll_handle = nullptr;
    ChangeCallback m_on_change;

    // Posted notifications check this before touching the directory
    std::shared_ptr<bool> m_alive;
    bool m_change_posted = false;
};

}  // namespace screen_mirror
