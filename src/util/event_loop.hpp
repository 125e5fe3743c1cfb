#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <uv.h>

namespace screen_mirror {

// The UI-bound sequential context. Everything that touches rendering or
// session state runs on the thread that calls run()/run_once().
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Initialize
    bool init();

    // Queue a task for the loop thread. Safe from any thread, never waits.
    void post(Task task);

    // Ask run() to return. Async-signal-safe.
    void request_stop();

    // Add timer callback (returns handle for cancellation)
    void* add_timer(uint64_t timeout_ms, uint64_t repeat_ms, Task callback);

    // Remove timer
    void remove_timer(void* handle);

    // Watch a file descriptor for readability (returns handle for removal)
    void* add_poll(int fd, Task on_readable);

    // Stop watching
    void remove_poll(void* handle);

    // Run event loop (blocking)
    void run();

    // Stop event loop (loop thread only)
    void stop();

    // Run one iteration (non-blocking)
    void run_once();

    bool is_running() const { return m_running; }

    // Get libuv loop
    uv_loop_t* get_loop() { return m_loop; }

private:
    static void on_post_async(uv_async_t* handle);
    static void on_stop_async(uv_async_t* handle);
    void run_posted();

    uv_loop_t* m_loop = nullptr;
    uv_async_t* m_post_async = nullptr;
    uv_async_t* m_stop_async = nullptr;
    bool m_running = false;

    std::mutex m_post_mutex;
    std::deque<Task> m_posted;
};

}  // namespace screen_mirror
