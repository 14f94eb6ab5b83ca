#include "event_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

// ─────────────────────────────────────
EventLoop::~EventLoop() {
    Stop();
}

// ─────────────────────────────────────
void EventLoop::Start() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Running) {
        return;
    }
    m_Stop = false;
    m_Running = true;
    m_Thread = std::thread([this]() { Run(); });
}

// ─────────────────────────────────────
void EventLoop::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Running) {
            return;
        }
        m_Stop = true;
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }

    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Running = false;
    m_Tasks.clear();
    m_Timers.clear();
}

// ─────────────────────────────────────
bool EventLoop::IsRunning() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Running;
}

// ─────────────────────────────────────
TimerHandle EventLoop::ScheduleRepeating(std::chrono::milliseconds interval,
                                         std::function<void()> callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("repeating interval must be positive");
    }
    return AddTimer(interval, interval, std::move(callback));
}

// ─────────────────────────────────────
TimerHandle EventLoop::ScheduleOnce(std::chrono::milliseconds delay,
                                    std::function<void()> callback) {
    return AddTimer(delay, std::chrono::milliseconds(0), std::move(callback));
}

// ─────────────────────────────────────
TimerHandle EventLoop::AddTimer(std::chrono::milliseconds delay,
                                std::chrono::milliseconds interval,
                                std::function<void()> callback) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        Timer timer;
        timer.due = std::chrono::steady_clock::now() + delay;
        timer.interval = interval;
        timer.seq = m_NextSeq++;
        timer.callback = std::move(callback);
        timer.cancelled = cancelled;
        m_Timers.push_back(std::move(timer));
    }
    m_Cv.notify_all();
    return TimerHandle(cancelled);
}

// ─────────────────────────────────────
void EventLoop::Post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Tasks.push_back(std::move(task));
    }
    m_Cv.notify_all();
}

// ─────────────────────────────────────
std::int64_t EventLoop::NowMs() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ─────────────────────────────────────
void EventLoop::Invoke(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const std::exception &e) {
        spdlog::error("EventLoop: task failed: {}", e.what());
    }
}

// ─────────────────────────────────────
void EventLoop::Run() {
    std::unique_lock<std::mutex> lock(m_Mutex);
    while (!m_Stop) {
        m_Timers.erase(std::remove_if(m_Timers.begin(), m_Timers.end(),
                                      [](const Timer &t) { return t.cancelled->load(); }),
                       m_Timers.end());

        if (!m_Tasks.empty()) {
            auto task = std::move(m_Tasks.front());
            m_Tasks.pop_front();
            lock.unlock();
            Invoke(task);
            lock.lock();
            continue;
        }

        if (m_Timers.empty()) {
            m_Cv.wait(lock, [this]() { return m_Stop || !m_Tasks.empty() || !m_Timers.empty(); });
            continue;
        }

        auto next = std::min_element(m_Timers.begin(), m_Timers.end(),
                                     [](const Timer &a, const Timer &b) {
                                         return a.due != b.due ? a.due < b.due : a.seq < b.seq;
                                     });
        const auto now = std::chrono::steady_clock::now();
        if (next->due > now) {
            const auto due = next->due;
            const std::size_t count = m_Timers.size();
            // Wake on stop, new work, or a new timer which might be due earlier.
            m_Cv.wait_until(lock, due, [this, count]() {
                return m_Stop || !m_Tasks.empty() || m_Timers.size() != count;
            });
            continue;
        }

        std::function<void()> callback = next->callback;
        auto cancelled = next->cancelled;
        if (next->interval.count() > 0) {
            next->due += next->interval;
            if (next->due < now) {
                next->due = now + next->interval;
            }
        } else {
            m_Timers.erase(next);
        }

        lock.unlock();
        if (!cancelled->load()) {
            Invoke(callback);
        }
        lock.lock();
    }
}
