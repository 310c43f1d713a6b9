#pragma once

#include "keyward/manager/key_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace keyward::e2ee::manager {

struct MaintenanceOutcome {
    std::string account_id;
    Result<RotationCheckResult, KeywardFailure> result;
};

/**
 * Periodic rotation and replenishment for a set of tracked accounts.
 *
 * One worker thread runs PerformKeyRotationCheck for every tracked account
 * each interval. A failing account is logged and skipped; the loop keeps
 * going. The KeyManager must outlive the scheduler.
 */
class KeyMaintenanceScheduler {
public:
    explicit KeyMaintenanceScheduler(
        KeyManager& key_manager,
        std::chrono::milliseconds interval = std::chrono::duration_cast<std::chrono::milliseconds>(
            kDefaultMaintenanceInterval));
    ~KeyMaintenanceScheduler();

    KeyMaintenanceScheduler(const KeyMaintenanceScheduler&) = delete;
    KeyMaintenanceScheduler& operator=(const KeyMaintenanceScheduler&) = delete;

    void Track(std::string account_id);
    void Untrack(const std::string& account_id);
    [[nodiscard]] std::vector<std::string> GetTrackedAccounts() const;

    // Starting a running scheduler does nothing
    void Start();
    void Stop();
    [[nodiscard]] bool IsRunning() const;

    // One synchronous pass over the tracked accounts
    std::vector<MaintenanceOutcome> RunOnce();

    [[nodiscard]] uint64_t GetCompletedPasses() const noexcept {
        return completed_passes_.load(std::memory_order_relaxed);
    }

private:
    void WorkerLoop();

    KeyManager& key_manager_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::set<std::string> accounts_;
    std::thread worker_;
    bool running_{false};
    bool stop_requested_{false};

    std::atomic<uint64_t> completed_passes_{0};
};

}
