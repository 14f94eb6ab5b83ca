#pragma once

#include <deque>
#include <vector>

#include "scheduler.hpp"

// Virtual clock scheduler. Nothing runs until the owner calls RunPending() or AdvanceBy(), so
// several peers sharing one ManualScheduler interleave deterministically.
class ManualScheduler : public Scheduler {
  public:
    explicit ManualScheduler(std::int64_t start_ms = 0);

    TimerHandle ScheduleRepeating(std::chrono::milliseconds interval,
                                  std::function<void()> callback) override;
    TimerHandle ScheduleOnce(std::chrono::milliseconds delay,
                             std::function<void()> callback) override;
    void Post(std::function<void()> task) override;
    std::int64_t NowMs() const override;

    // Runs posted tasks, including ones posted while running, until the queue is empty.
    std::size_t RunPending();

    // Moves the clock forward, firing due timers in order and draining posted tasks after each.
    void AdvanceBy(std::chrono::milliseconds delta);
    void SetNow(std::int64_t now_ms);

    std::size_t PendingTimers() const;

  private:
    struct Timer {
        std::int64_t due = 0;
        std::int64_t interval = 0;
        std::uint64_t seq = 0;
        std::function<void()> callback;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    TimerHandle AddTimer(std::int64_t delay, std::int64_t interval, std::function<void()> callback);
    void DropCancelled();

    std::int64_t m_Now;
    std::uint64_t m_NextSeq = 0;
    std::deque<std::function<void()>> m_Tasks;
    std::vector<Timer> m_Timers;
};
