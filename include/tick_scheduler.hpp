#ifndef TICK_SCHEDULER_H
#define TICK_SCHEDULER_H

#include "core_state_machine.hpp"
#include "telemetry_channel.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

class TickScheduler {
public:
    TickScheduler(std::shared_ptr<CoreStateMachine> core, std::shared_ptr<TelemetryChannel> channel,
                  int tick_interval_ms);
    ~TickScheduler();

    void start();
    void stop();

    /// Forces at least one tick, resuming the loop if it is paused on an idle core.
    void wake();

    bool isRunning() const { return running; }
    uint64_t tickCount() const { return ticks; }

private:
    void run();
    bool waitForWork(bool& paused);

    std::shared_ptr<CoreStateMachine> core;
    std::shared_ptr<TelemetryChannel> channel;
    int tick_interval_ms;

    std::thread scheduler_thread;
    std::atomic<bool> running;
    std::atomic<uint64_t> ticks;

    std::mutex wake_mutex;
    std::condition_variable wake_cv;
    bool wake_pending;
};

#endif // TICK_SCHEDULER_H
