#include "tick_scheduler.hpp"
#include <chrono>
#include <iostream>

TickScheduler::TickScheduler(std::shared_ptr<CoreStateMachine> core_machine,
                             std::shared_ptr<TelemetryChannel> telemetry, int interval_ms)
    : core(std::move(core_machine)), channel(std::move(telemetry)),
      tick_interval_ms(interval_ms > 0 ? interval_ms : 1000), running(false), ticks(0),
      wake_pending(false) {}

TickScheduler::~TickScheduler() {
    stop();
}

void TickScheduler::start() {
    if (running) return;
    running = true;
    scheduler_thread = std::thread(&TickScheduler::run, this);
}

void TickScheduler::stop() {
    if (!running.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex);
    }
    wake_cv.notify_all();
    if (scheduler_thread.joinable()) {
        scheduler_thread.join();
    }
}

void TickScheduler::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex);
        wake_pending = true;
    }
    wake_cv.notify_all();
}

// Blocks while the core is at rest and nothing asked for a tick.
// Returns false when the scheduler is shutting down.
bool TickScheduler::waitForWork(bool& paused) {
    std::unique_lock<std::mutex> lock(wake_mutex);
    if (!wake_pending && !core->isActive()) {
        if (!paused) {
            std::cout << "Core at rest, ticking paused." << std::endl;
        }
        paused = true;
        wake_cv.wait(lock, [this] { return !running || wake_pending || core->isActive(); });
    }
    wake_pending = false;
    return running;
}

void TickScheduler::run() {
    std::cout << "Tick scheduler thread started." << std::endl;
    const auto period = std::chrono::milliseconds(tick_interval_ms);
    auto last_tick = std::chrono::steady_clock::now();
    bool paused = false;

    while (running) {
        if (!waitForWork(paused)) {
            break;
        }

        auto start_time = std::chrono::steady_clock::now();
        double dt = paused ? 0.0 : std::chrono::duration<double>(start_time - last_tick).count();
        paused = false;
        last_tick = start_time;

        channel->publish(core->tick(dt));
        ++ticks;

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        auto sleep_duration = period - elapsed;
        if (sleep_duration.count() > 0) {
            std::unique_lock<std::mutex> lock(wake_mutex);
            wake_cv.wait_for(lock, sleep_duration, [this] { return !running; });
        }
    }
    std::cout << "Tick scheduler thread stopped." << std::endl;
}
