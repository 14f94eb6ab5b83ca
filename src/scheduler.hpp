#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

// Cancellation handle for a scheduled timer. Copies share the same timer.
class TimerHandle {
  public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<std::atomic<bool>> cancelled)
        : m_Cancelled(std::move(cancelled)) {}

    void Cancel() {
        if (m_Cancelled) {
            m_Cancelled->store(true);
        }
    }

    bool IsPending() const {
        return m_Cancelled && !m_Cancelled->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> m_Cancelled;
};

class Scheduler {
  public:
    virtual ~Scheduler() = default;

    virtual TimerHandle ScheduleRepeating(std::chrono::milliseconds interval,
                                          std::function<void()> callback) = 0;
    virtual TimerHandle ScheduleOnce(std::chrono::milliseconds delay,
                                     std::function<void()> callback) = 0;

    // Runs task on the scheduler's context as soon as possible, after already queued tasks.
    virtual void Post(std::function<void()> task) = 0;

    // Wall clock in epoch milliseconds, as seen by tasks on this scheduler.
    virtual std::int64_t NowMs() const = 0;
};
