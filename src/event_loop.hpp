#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "scheduler.hpp"

// Single worker thread running posted tasks and timers in order. Every callback scheduled on
// one EventLoop runs on the same thread, never concurrently with another.
class EventLoop : public Scheduler {
  public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void Start();
    void Stop();
    bool IsRunning() const;

    TimerHandle ScheduleRepeating(std::chrono::milliseconds interval,
                                  std::function<void()> callback) override;
    TimerHandle ScheduleOnce(std::chrono::milliseconds delay,
                             std::function<void()> callback) override;
    void Post(std::function<void()> task) override;
    std::int64_t NowMs() const override;

  private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        std::chrono::milliseconds interval{0};
        std::uint64_t seq = 0;
        std::function<void()> callback;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    TimerHandle AddTimer(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                         std::function<void()> callback);
    void Run();
    void Invoke(const std::function<void()> &fn);

    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::deque<std::function<void()>> m_Tasks;
    std::vector<Timer> m_Timers;
    std::uint64_t m_NextSeq = 0;
    bool m_Stop = false;
    bool m_Running = false;
    std::thread m_Thread;
};
