#include "manual_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

// ─────────────────────────────────────
ManualScheduler::ManualScheduler(std::int64_t start_ms) : m_Now(start_ms) {}

// ─────────────────────────────────────
TimerHandle ManualScheduler::ScheduleRepeating(std::chrono::milliseconds interval,
                                               std::function<void()> callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("repeating interval must be positive");
    }
    return AddTimer(interval.count(), interval.count(), std::move(callback));
}

// ─────────────────────────────────────
TimerHandle ManualScheduler::ScheduleOnce(std::chrono::milliseconds delay,
                                          std::function<void()> callback) {
    return AddTimer(delay.count(), 0, std::move(callback));
}

// ─────────────────────────────────────
TimerHandle ManualScheduler::AddTimer(std::int64_t delay, std::int64_t interval,
                                      std::function<void()> callback) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    Timer timer;
    timer.due = m_Now + delay;
    timer.interval = interval;
    timer.seq = m_NextSeq++;
    timer.callback = std::move(callback);
    timer.cancelled = cancelled;
    m_Timers.push_back(std::move(timer));
    return TimerHandle(cancelled);
}

// ─────────────────────────────────────
void ManualScheduler::Post(std::function<void()> task) {
    m_Tasks.push_back(std::move(task));
}

// ─────────────────────────────────────
std::int64_t ManualScheduler::NowMs() const {
    return m_Now;
}

// ─────────────────────────────────────
std::size_t ManualScheduler::RunPending() {
    std::size_t ran = 0;
    while (!m_Tasks.empty()) {
        auto task = std::move(m_Tasks.front());
        m_Tasks.pop_front();
        task();
        ++ran;
    }
    return ran;
}

// ─────────────────────────────────────
void ManualScheduler::DropCancelled() {
    m_Timers.erase(std::remove_if(m_Timers.begin(), m_Timers.end(),
                                  [](const Timer &t) { return t.cancelled->load(); }),
                   m_Timers.end());
}

// ─────────────────────────────────────
void ManualScheduler::AdvanceBy(std::chrono::milliseconds delta) {
    const std::int64_t target = m_Now + delta.count();
    RunPending();

    for (;;) {
        DropCancelled();
        auto next = std::min_element(m_Timers.begin(), m_Timers.end(),
                                     [](const Timer &a, const Timer &b) {
                                         return a.due != b.due ? a.due < b.due : a.seq < b.seq;
                                     });
        if (next == m_Timers.end() || next->due > target) {
            break;
        }

        m_Now = std::max(m_Now, next->due);
        std::function<void()> callback = next->callback;
        if (next->interval > 0) {
            next->due += next->interval;
        } else {
            m_Timers.erase(next);
        }

        callback();
        RunPending();
    }

    m_Now = target;
}

// ─────────────────────────────────────
void ManualScheduler::SetNow(std::int64_t now_ms) {
    m_Now = now_ms;
}

// ─────────────────────────────────────
std::size_t ManualScheduler::PendingTimers() const {
    std::size_t count = 0;
    for (const auto &timer : m_Timers) {
        if (!timer.cancelled->load()) {
            ++count;
        }
    }
    return count;
}
