#include "event_loop.hpp"
#include "logger.hpp"

namespace screen_mirror {

struct TimerData {
    EventLoop::Task callback;
    EventLoop* loop;
};

struct PollData {
    EventLoop::Task callback;
    int fd;
};

static void timer_callback(uv_timer_t* handle) {
    TimerData* data = static_cast<TimerData*>(handle->data);
    if (data && data->callback) {
        data->callback();
    }
}

static void poll_callback(uv_poll_t* handle, int status, int events) {
    PollData* data = static_cast<PollData*>(handle->data);
    if (status < 0) {
        LOG_WARN("Poll error on fd %d: %s", data ? data->fd : -1, uv_strerror(status));
        return;
    }
    if ((events & UV_READABLE) && data && data->callback) {
        data->callback();
    }
}

static void handle_close_callback(uv_handle_t* handle) {
    switch (handle->type) {
        case UV_TIMER:
            delete static_cast<TimerData*>(handle->data);
            delete reinterpret_cast<uv_timer_t*>(handle);
            break;
        case UV_POLL:
            delete static_cast<PollData*>(handle->data);
            delete reinterpret_cast<uv_poll_t*>(handle);
            break;
        case UV_ASYNC:
            delete reinterpret_cast<uv_async_t*>(handle);
            break;
        default:
            break;
    }
}

static void close_walk_callback(uv_handle_t* handle, void* /*arg*/) {
    if (!uv_is_closing(handle)) {
        uv_close(handle, handle_close_callback);
    }
}

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    if (m_loop) {
        // Close every remaining handle, then let the close callbacks run
        uv_walk(m_loop, close_walk_callback, nullptr);
        uv_run(m_loop, UV_RUN_DEFAULT);
        if (uv_loop_close(m_loop) != 0) {
            LOG_WARN("Event loop closed with active handles");
        }
        delete m_loop;
        m_loop = nullptr;
    }
}

bool EventLoop::init() {
    m_loop = new uv_loop_t;
    if (uv_loop_init(m_loop) != 0) {
        LOG_ERROR("Failed to initialize event loop");
        delete m_loop;
        m_loop = nullptr;
        return false;
    }

    m_post_async = new uv_async_t;
    m_post_async->data = this;
    uv_async_init(m_loop, m_post_async, on_post_async);

    m_stop_async = new uv_async_t;
    m_stop_async->data = this;
    uv_async_init(m_loop, m_stop_async, on_stop_async);

    return true;
}

void EventLoop::post(Task task) {
    if (!m_post_async || !task) return;

    {
        std::lock_guard<std::mutex> lock(m_post_mutex);
        m_posted.push_back(std::move(task));
    }
    uv_async_send(m_post_async);
}

void EventLoop::request_stop() {
    if (m_stop_async) {
        uv_async_send(m_stop_async);
    }
}

void EventLoop::on_post_async(uv_async_t* handle) {
    static_cast<EventLoop*>(handle->data)->run_posted();
}

void EventLoop::on_stop_async(uv_async_t* handle) {
    static_cast<EventLoop*>(handle->data)->stop();
}

void EventLoop::run_posted() {
    // uv_async_send coalesces, so drain everything queued so far
    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_post_mutex);
        tasks.swap(m_posted);
    }
    for (auto& task : tasks) {
        task();
    }
}

void* EventLoop::add_timer(uint64_t timeout_ms, uint64_t repeat_ms, Task callback) {
    if (!m_loop) return nullptr;

    uv_timer_t* timer = new uv_timer_t;
    TimerData* data = new TimerData{std::move(callback), this};

    uv_timer_init(m_loop, timer);
    timer->data = data;

    uv_timer_start(timer, timer_callback, timeout_ms, repeat_ms);

    return timer;
}

void EventLoop::remove_timer(void* handle) {
    if (!handle) return;

    uv_timer_t* timer = static_cast<uv_timer_t*>(handle);
    uv_timer_stop(timer);
    uv_close(reinterpret_cast<uv_handle_t*>(timer), handle_close_callback);
}

void* EventLoop::add_poll(int fd, Task on_readable) {
    if (!m_loop || fd < 0) return nullptr;

    uv_poll_t* poll = new uv_poll_t;
    if (uv_poll_init(m_loop, poll, fd) != 0) {
        LOG_ERROR("Failed to watch fd %d", fd);
        delete poll;
        return nullptr;
    }
    poll->data = new PollData{std::move(on_readable), fd};

    uv_poll_start(poll, UV_READABLE, poll_callback);
    return poll;
}

void EventLoop::remove_poll(void* handle) {
    if (!handle) return;

    uv_poll_t* poll = static_cast<uv_poll_t*>(handle);
    uv_poll_stop(poll);
    uv_close(reinterpret_cast<uv_handle_t*>(poll), handle_close_callback);
}

void EventLoop::run() {
    if (!m_loop) return;
    m_running = true;
    uv_run(m_loop, UV_RUN_DEFAULT);
    m_running = false;
}

void EventLoop::stop() {
    if (m_loop) {
        uv_stop(m_loop);
    }
}

void EventLoop::run_once() {
    if (m_loop) {
        uv_run(m_loop, UV_RUN_NOWAIT);
    }
}

}  // namespace screen_mirror
