#include "common.hpp"
#include "config.hpp"
#include "dbus_bus.hpp"
#include "event_loop.hpp"
#include "instance_host.hpp"
#include "instance_lock.hpp"
#include "kv_store.hpp"
#include "process_probe.hpp"
#include "sqlite.hpp"
#include "tab_coordinator.hpp"
#include "window.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace {
// Terminal form of the "already running" surface: f asks the active peer to come forward,
// q quits.
class StandbyPrompt {
  public:
    explicit StandbyPrompt(TabCoordinator &coordinator) : m_Coordinator(coordinator) {}
    ~StandbyPrompt() {
        Stop();
    }

    void Start() {
        if (m_Thread.joinable()) {
            return;
        }
        std::cout << kAppName << " is already running in another window.\n";
        std::cout << "  [f] bring it to the front   [q] quit\n" << std::flush;
        m_Running = true;
        m_Thread = std::thread([this]() { Run(); });
    }

    void Stop() {
        m_Running = false;
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    }

  private:
    void Run() {
        while (m_Running) {
            pollfd pfd;
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            pfd.revents = 0;
            const int rc = ::poll(&pfd, 1, 200);
            if (rc <= 0 || (pfd.revents & POLLIN) == 0) {
                if ((pfd.revents & (POLLHUP | POLLNVAL)) != 0) {
                    return;
                }
                continue;
            }

            char c = 0;
            const ssize_t n = ::read(STDIN_FILENO, &c, 1);
            if (n <= 0) {
                return;
            }
            if (c == 'f' || c == 'F') {
                if (!m_Coordinator.RequestFocus()) {
                    spdlog::warn("Could not send focus request");
                }
            } else if (c == 'q' || c == 'Q') {
                ::kill(::getpid(), SIGTERM);
                return;
            }
        }
    }

    TabCoordinator &m_Coordinator;
    std::atomic<bool> m_Running{false};
    std::thread m_Thread;
};

std::unique_ptr<KeyValueStore> OpenStore(const Config &config) {
    try {
        return std::make_unique<SQLiteStore>(config.store_path.string());
    } catch (const std::runtime_error &e) {
        spdlog::error("Failed to open {}: {}, peers in other processes will not be seen",
                      config.store_path.string(), e.what());
        return std::make_unique<MemoryKeyValueStore>();
    }
}
} // namespace

int main(int argc, char **argv) {
    Config config = LoadConfig();
    const std::vector<std::string> args = ApplyCommandLine(config, argc, argv);
    SetLogLevel(config.log_level);
    for (const auto &arg : args) {
        spdlog::warn("Ignoring unknown argument '{}'", arg);
    }

    // Signals are handled by sigwait below; every thread started from here inherits the mask.
    // SIGUSR1 is raised internally when the coordinator steps down.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGCONT);
    sigaddset(&signals, SIGUSR1);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        spdlog::error("Failed to block signals");
        return 1;
    }

    std::unique_ptr<KeyValueStore> store = OpenStore(config);
    DBusMessageBus bus(config.channel_name);
    Window window;
    EventLoop loop;
    loop.Start();

    TabCoordinator coordinator(*store, bus, loop, window);
    coordinator.Start();

    auto probe = MakeProcessProbe();
    InstanceLock lock(config, *probe);
    StandbyPrompt prompt(coordinator);

    InstanceHost host(coordinator, lock, loop, []() { ::kill(::getpid(), SIGUSR1); });
    host.SetStandbyCallback([&coordinator, &prompt]() {
        coordinator.SetPongCallback([](const std::string &instance_id) {
            spdlog::info("Active instance {} is responsive", instance_id);
        });
        if (!coordinator.Ping()) {
            spdlog::debug("Ping to the active instance was not sent");
        }
        prompt.Start();
    });

    int exitCode = 0;
    bool running = true;
    switch (host.Start()) {
    case InstanceHost::HOST_ACTIVE:
        spdlog::info("{} running as {} ({})", kAppName, coordinator.InstanceId(),
                     coordinator.IsCoordinated() ? "coordinated" : "uncoordinated");
        break;
    case InstanceHost::HOST_STANDBY:
        break;
    case InstanceHost::HOST_LOCK_REFUSED:
        if (!lock.NotifyExistingInstance()) {
            spdlog::warn("Could not reach the existing instance");
        }
        running = false;
        exitCode = 1;
        break;
    }

    while (running) {
        int sig = 0;
        const int rc = sigwait(&signals, &sig);
        if (rc != 0) {
            spdlog::error("sigwait failed: {}", std::strerror(rc));
            break;
        }
        if (sig == SIGCONT) {
            coordinator.OnVisibilityChanged(true);
            continue;
        }
        if (sig == SIGUSR1) {
            if (host.Reconcile()) {
                spdlog::info("Another instance took over, now in standby");
            }
            continue;
        }
        spdlog::info("Received signal {}, shutting down", sig);
        running = false;
    }

    prompt.Stop();
    coordinator.OnUnload();
    lock.Release();
    loop.Stop();
    bus.Close();
    return exitCode;
}
