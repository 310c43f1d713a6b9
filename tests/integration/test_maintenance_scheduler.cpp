#include <catch2/catch_test_macros.hpp>
#include "keyward/manager/key_maintenance_scheduler.hpp"
#include "keyward/storage/in_memory_key_store.hpp"
#include "helpers/key_manager_fixture.hpp"
#include "helpers/fault_injecting_key_store.hpp"
#include <thread>
using namespace keyward::e2ee;
using namespace keyward::e2ee::manager;
using namespace keyward::e2ee::test_helpers;
using keyward::e2ee::storage::InMemoryKeyStore;
namespace {
template<typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}
}
TEST_CASE("KeyMaintenanceScheduler - Single pass", "[scheduler][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto inner = std::make_shared<InMemoryKeyStore>();
    auto store = std::make_shared<FaultInjectingKeyStore>(inner);
    const auto config = SmallPoolConfig();
    auto manager = MakeManager(store, config, clock);
    REQUIRE(manager->Initialize("alice").IsOk());
    REQUIRE(manager->Initialize("bob").IsOk());
    KeyMaintenanceScheduler scheduler(*manager, std::chrono::milliseconds(10));
    scheduler.Track("alice");
    scheduler.Track("bob");
    scheduler.Track("ghost");
    SECTION("Outcomes per account") {
        clock.Advance(config.rotation_interval);
        auto outcomes = scheduler.RunOnce();
        REQUIRE(outcomes.size() == 3);
        for (const auto& outcome : outcomes) {
            if (outcome.account_id == "ghost") {
                REQUIRE(outcome.result.IsErr());
                REQUIRE(outcome.result.UnwrapErr().type == KeywardFailureType::NotInitialized);
            } else {
                REQUIRE(outcome.result.IsOk());
                REQUIRE(outcome.result.Unwrap().signed_pre_key_rotated);
            }
        }
        REQUIRE(scheduler.GetCompletedPasses() == 1);
    }
    SECTION("A failing account does not block the others") {
        scheduler.Untrack("ghost");
        for (uint32_t id = 1; id <= 6; ++id) {
            REQUIRE(manager->ConsumePreKey("bob", id).IsOk());
        }
        store->FailNext(StoreOperation::LoadActiveSignedPreKey, KeywardFailure::Timeout("busy"));
        auto outcomes = scheduler.RunOnce();
        REQUIRE(outcomes.size() == 2);
        REQUIRE(outcomes[0].account_id == "alice");
        REQUIRE(outcomes[0].result.UnwrapErr().type == KeywardFailureType::Timeout);
        REQUIRE(outcomes[1].result.IsOk());
        REQUIRE(outcomes[1].result.Unwrap().pre_keys_generated == 6);
    }
    SECTION("Tracking") {
        scheduler.Untrack("ghost");
        scheduler.Track("alice");
        REQUIRE(scheduler.GetTrackedAccounts() == std::vector<std::string>{"alice", "bob"});
    }
}
TEST_CASE("KeyMaintenanceScheduler - Background worker", "[scheduler][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto store = std::make_shared<InMemoryKeyStore>();
    const auto config = SmallPoolConfig();
    auto manager = MakeManager(store, config, clock);
    REQUIRE(manager->Initialize("alice").IsOk());
    const uint32_t original = store->LoadActiveSignedPreKey("alice").Unwrap()->GetId();
    KeyMaintenanceScheduler scheduler(*manager, std::chrono::milliseconds(10));
    scheduler.Track("alice");
    scheduler.Start();
    scheduler.Start();
    REQUIRE(scheduler.IsRunning());
    REQUIRE(WaitFor([&] { return scheduler.GetCompletedPasses() >= 2; }));
    REQUIRE(store->LoadActiveSignedPreKey("alice").Unwrap()->GetId() == original);
    clock.Advance(config.rotation_interval);
    REQUIRE(WaitFor([&] { return store->LoadActiveSignedPreKey("alice").Unwrap()->GetId() == original + 1; }));
    scheduler.Stop();
    REQUIRE_FALSE(scheduler.IsRunning());
    const auto passes = scheduler.GetCompletedPasses();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(scheduler.GetCompletedPasses() == passes);
    scheduler.Stop();
}
TEST_CASE("KeyMaintenanceScheduler - Stop wakes a long wait", "[scheduler][integration]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto manager = MakeManager(std::make_shared<InMemoryKeyStore>(), SmallPoolConfig(), clock);
    KeyMaintenanceScheduler scheduler(*manager, std::chrono::hours(1));
    scheduler.Start();
    REQUIRE(WaitFor([&] { return scheduler.GetCompletedPasses() >= 1; }));
    const auto started = std::chrono::steady_clock::now();
    scheduler.Stop();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}
