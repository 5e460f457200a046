#pragma once

#include "chronicle/config.hpp"
#include "chronicle/record_store.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace chronicle {

/**
 * ChangeLogRetentionService - Background purge of old change-log entries
 *
 * Every retention interval, deletes change-log entries committed more than
 * retention_days ago. Tokens whose watermark falls inside the purged range
 * simply resume at the oldest remaining entry.
 *
 * Owned by the host process, never by the engines. start() is a no-op when
 * retention is disabled; run_once() still purges on demand.
 */
class ChangeLogRetentionService {
public:
    using Clock = std::function<Instant()>;

    ChangeLogRetentionService(std::shared_ptr<RecordStore> store,
                              const ChangeLogConfig& config,
                              Clock clock = now_instant);

    ~ChangeLogRetentionService();

    void start();
    void stop();
    bool is_running() const { return running_; }
    bool is_enabled() const { return enabled_; }

    // One purge cycle. Returns the number of entries removed.
    int run_once();

private:
    void run_loop();

    std::shared_ptr<RecordStore> store_;
    Clock clock_;
    int retention_days_;
    int retention_interval_ms_;
    bool enabled_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wakeup_;
    std::thread worker_;
};

} // namespace chronicle
