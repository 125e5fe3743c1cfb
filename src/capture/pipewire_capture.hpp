#pragma once

#include "capture_backend.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations - avoid including GLib headers
typedef struct _GDBusConnection GDBusConnection;
typedef struct _GDBusProxy GDBusProxy;
typedef struct _GVariant GVariant;

namespace screen_mirror {

// One stream granted by the ScreenCast portal
struct PortalStream {
    uint32_t node_id = 0;
    uint32_t source_type = 0;   // 1 = monitor, 2 = window, 4 = virtual
    Rect bounds;                // size/position as reported by the portal
};

// Capture through xdg-desktop-portal and PipeWire. The portal decides what
// is shareable: enumeration runs the portal dialog once and lists the
// streams it grants.
class PipeWireCapture : public CaptureBackend {
public:
    explicit PipeWireCapture(bool show_cursor = false);
    ~PipeWireCapture() override;

    // Initialize capture (display_name is ignored for PipeWire)
    bool init(const char* display_name = nullptr) override;

    // Shutdown and cleanup
    void shutdown() override;

    bool enumerate_sources(std::vector<CaptureSource>& out) override;

    bool capture_still(const CaptureSource& source, int max_width, int max_height,
                       bool show_cursor, Image& out) override;

    std::unique_ptr<CaptureSubscription> subscribe(const CaptureSource& source,
                                                   const StreamConfig& config) override;

    // Check if initialized
    bool is_initialized() const override { return m_initialized; }

    // Backend name
    const char* get_name() const override { return "PipeWire"; }

private:
    // Portal D-Bus methods
    bool init_dbus();
    bool ensure_session();
    bool create_session();
    bool select_sources();
    bool start_capture();
    bool open_remote();
    void cleanup_portal();
    std::string next_token();

    // Call a ScreenCast method that answers through a Request object and
    // wait for its Response. Returns the results (caller unrefs) or nullptr
    // on error, timeout or when the user cancelled. Consumes params.
    GVariant* portal_request(const char* method, GVariant* params, const std::string& token,
                             int timeout_ms);

    // New fd for one PipeWire connection (caller owns it)
    int dup_remote_fd();

    bool m_show_cursor = false;

    // D-Bus / Portal state
    GDBusConnection* m_dbus_conn = nullptr;
    GDBusProxy* m_portal_proxy = nullptr;
    std::string m_request_prefix;   // Request object path minus the token
    std::string m_session_handle;
    uint32_t m_token_counter = 0;
    int m_pipewire_fd = -1;
    std::vector<PortalStream> m_streams;
    std::mutex m_portal_mutex;

    std::atomic<bool> m_initialized{false};
};

}  // namespace screen_mirror
