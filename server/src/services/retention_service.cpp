#include "chronicle/retention_service.hpp"
#include <stdexcept>

namespace chronicle {

ChangeLogRetentionService::ChangeLogRetentionService(
    std::shared_ptr<RecordStore> store,
    const ChangeLogConfig& config,
    Clock clock
) : store_(std::move(store)),
    clock_(std::move(clock)),
    retention_days_(config.retention_days),
    retention_interval_ms_(config.retention_interval_ms),
    enabled_(config.retention_enabled) {
    if (!store_) {
        throw std::invalid_argument("Record store cannot be null");
    }
}

ChangeLogRetentionService::~ChangeLogRetentionService() {
    stop();
}

void ChangeLogRetentionService::start() {
    if (!enabled_) {
        spdlog::info("ChangeLogRetentionService disabled, not starting");
        return;
    }
    if (running_) {
        spdlog::warn("ChangeLogRetentionService already running");
        return;
    }

    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });

    spdlog::info("ChangeLogRetentionService started: interval={}ms, retention_days={}",
                 retention_interval_ms_, retention_days_);
}

void ChangeLogRetentionService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wakeup_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("ChangeLogRetentionService stopped");
}

int ChangeLogRetentionService::run_once() {
    const Instant cutoff = clock_() - Millis(static_cast<int64_t>(retention_days_) * kMillisPerDay);
    int removed = store_->purge_change_logs_before(cutoff);
    if (removed > 0) {
        spdlog::info("ChangeLogRetentionService: purged {} change log entries older than {}",
                     removed, format_instant(cutoff));
    }
    return removed;
}

void ChangeLogRetentionService::run_loop() {
    while (running_) {
        auto cycle_start = std::chrono::steady_clock::now();
        try {
            run_once();
        } catch (const std::exception& e) {
            spdlog::error("ChangeLogRetentionService cycle error: {}", e.what());
        }

        auto cycle_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - cycle_start);
        spdlog::debug("ChangeLogRetentionService: cycle completed in {}ms", cycle_duration.count());

        auto sleep_time = std::chrono::milliseconds(retention_interval_ms_) - cycle_duration;
        if (sleep_time.count() < 0) sleep_time = std::chrono::milliseconds(0);

        std::unique_lock<std::mutex> lock(mutex_);
        wakeup_.wait_for(lock, sleep_time, [this] { return !running_; });
    }
}

} // namespace chronicle
