#include "keyward/manager/key_maintenance_scheduler.hpp"
#include "keyward/core/log.hpp"

namespace keyward::e2ee::manager {

namespace {

std::shared_ptr<spdlog::logger> Logger() {
    return log::Get(log::SCHEDULER_LOGGER);
}

}

KeyMaintenanceScheduler::KeyMaintenanceScheduler(
    KeyManager& key_manager,
    const std::chrono::milliseconds interval)
    : key_manager_(key_manager)
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)) {
}

KeyMaintenanceScheduler::~KeyMaintenanceScheduler() {
    Stop();
}

void KeyMaintenanceScheduler::Track(std::string account_id) {
    std::lock_guard lock(mutex_);
    accounts_.insert(std::move(account_id));
}

void KeyMaintenanceScheduler::Untrack(const std::string& account_id) {
    std::lock_guard lock(mutex_);
    accounts_.erase(account_id);
}

std::vector<std::string> KeyMaintenanceScheduler::GetTrackedAccounts() const {
    std::lock_guard lock(mutex_);
    return {accounts_.begin(), accounts_.end()};
}

void KeyMaintenanceScheduler::Start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&KeyMaintenanceScheduler::WorkerLoop, this);
    Logger()->info("Key maintenance started (interval {} ms)", interval_.count());
}

void KeyMaintenanceScheduler::Stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard lock(mutex_);
    running_ = false;
    Logger()->info("Key maintenance stopped after {} passes", completed_passes_.load());
}

bool KeyMaintenanceScheduler::IsRunning() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::vector<MaintenanceOutcome> KeyMaintenanceScheduler::RunOnce() {
    const auto accounts = GetTrackedAccounts();
    std::vector<MaintenanceOutcome> outcomes;
    outcomes.reserve(accounts.size());

    size_t failures = 0;
    for (const auto& account_id : accounts) {
        auto result = key_manager_.PerformKeyRotationCheck(account_id);
        if (result.IsErr()) {
            ++failures;
            const auto& failure = result.UnwrapErr();
            if (failure.IsFatal()) {
                Logger()->error("Maintenance of account {} failed: [{}] {}",
                    account_id, FailureTypeName(failure.type), failure.message);
            } else {
                Logger()->warn("Maintenance of account {} failed: [{}] {}",
                    account_id, FailureTypeName(failure.type), failure.message);
            }
        } else if (result.Unwrap().signed_pre_key_rotated || result.Unwrap().pre_keys_generated > 0) {
            Logger()->debug("Account {}: rotated={} generated={} unused={}",
                account_id,
                result.Unwrap().signed_pre_key_rotated,
                result.Unwrap().pre_keys_generated,
                result.Unwrap().unused_pre_key_count);
        }
        outcomes.push_back(MaintenanceOutcome{account_id, std::move(result)});
    }

    completed_passes_.fetch_add(1, std::memory_order_relaxed);
    if (failures > 0) {
        Logger()->warn("Maintenance pass finished with {} of {} accounts failing", failures, accounts.size());
    }
    return outcomes;
}

void KeyMaintenanceScheduler::WorkerLoop() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        RunOnce();
        lock.lock();
        wake_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }
}

}
