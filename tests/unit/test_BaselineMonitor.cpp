#include <gtest/gtest.h>

#include "monitor/BaselineMonitor.hpp"
#include "host/ServiceHostAdapter.hpp"
#include "lifecycle/InFlightRegistry.hpp"
#include "storage/RecordStorage.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "fakes/FakeServiceHost.hpp"
#include "fakes/ScratchDir.hpp"

#include <future>

using namespace sw::monitor;
using namespace sw::types;
using namespace sw::test;
using sw::control::ControlState;
using namespace std::chrono_literals;

namespace {

class CountingStorage final : public sw::storage::RecordStorage {
public:
    std::atomic<int> saves{0};

    std::vector<ServiceRecord> loadAll() override { return {}; }
    void saveAll(const std::vector<ServiceRecord>&) override { ++saves; }
    std::optional<ServiceRecord> loadById(const std::string&) override { return std::nullopt; }
};

}

class BaselineMonitorTest : public ::testing::Test {
protected:
    ScratchDir scratch;
    std::shared_ptr<FakeServiceHost> host;
    std::shared_ptr<CountingStorage> backing;
    std::shared_ptr<sw::storage::ServiceRecordStore> store;
    std::shared_ptr<sw::host::ServiceHostAdapter> adapter;
    std::shared_ptr<sw::lifecycle::InFlightRegistry> inflight;
    std::unique_ptr<BaselineMonitor> monitor;

    void SetUp() override {
        host = std::make_shared<FakeServiceHost>();
        backing = std::make_shared<CountingStorage>();
        store = std::make_shared<sw::storage::ServiceRecordStore>(backing);
        adapter = std::make_shared<sw::host::ServiceHostAdapter>(scratch.adapterOptions(), host, host);
        inflight = std::make_shared<sw::lifecycle::InFlightRegistry>();
        monitor = std::make_unique<BaselineMonitor>(store, adapter, inflight, 50ms);
    }

    void addRecord(const std::string& id, const ServiceStatus status) const {
        ServiceRecord r;
        r.id = id;
        r.display_name = "svc " + id;
        r.status = status;
        store->add(r);
    }
};

TEST_F(BaselineMonitorTest, ReconcilesDriftedRecords) {
    addRecord("a", ServiceStatus::Running);
    addRecord("b", ServiceStatus::Stopped);
    host->setState("a", ControlState::Stopped);
    host->setState("b", ControlState::Stopped);

    const auto changed = monitor->sweep();
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].id, "a");
    EXPECT_EQ(changed[0].status, ServiceStatus::Stopped);
    EXPECT_EQ(store->get("a")->status, ServiceStatus::Stopped);
    EXPECT_EQ(backing->saves.load(), 1);
}

TEST_F(BaselineMonitorTest, NoChangesMeansNoPersistOrEvent) {
    addRecord("a", ServiceStatus::Running);
    host->setState("a", ControlState::Running);

    int events = 0;
    monitor->events().subscribe([&](const BaselineUpdate&) { ++events; });

    EXPECT_TRUE(monitor->sweep().empty());
    EXPECT_EQ(events, 0);
    EXPECT_EQ(backing->saves.load(), 0);
}

TEST_F(BaselineMonitorTest, SkipsIdsWithOperationInFlight) {
    addRecord("a", ServiceStatus::Stopping);
    host->setState("a", ControlState::Running);

    auto lease = inflight->tryAcquire("a");
    EXPECT_TRUE(monitor->sweep().empty());
    EXPECT_EQ(store->get("a")->status, ServiceStatus::Stopping);
    EXPECT_EQ(host->queryCalls.load(), 0);

    lease.release();
    EXPECT_EQ(monitor->sweep().size(), 1u);
}

TEST_F(BaselineMonitorTest, PublishesChangedSnapshots) {
    addRecord("a", ServiceStatus::Running);
    addRecord("b", ServiceStatus::Running);
    host->setState("b", ControlState::Paused);   // "a" has no unit at all

    BaselineUpdate update;
    monitor->events().subscribe([&](const BaselineUpdate& u) { update = u; });
    monitor->sweep();

    ASSERT_EQ(update.changed.size(), 2u);
    EXPECT_EQ(update.changed[0].status, ServiceStatus::NotInstalled);
    EXPECT_EQ(update.changed[1].status, ServiceStatus::Paused);
}

TEST_F(BaselineMonitorTest, RunsPeriodicallyInBackground) {
    addRecord("a", ServiceStatus::Running);
    host->setState("a", ControlState::Running);

    std::promise<void> seen;
    std::atomic<bool> fired{false};
    monitor->events().subscribe([&](const BaselineUpdate&) {
        if (!fired.exchange(true)) seen.set_value();
    });

    monitor->start();
    host->setState("a", ControlState::Stopped);

    EXPECT_EQ(seen.get_future().wait_for(3s), std::future_status::ready);
    monitor->stop();
    EXPECT_EQ(store->get("a")->status, ServiceStatus::Stopped);
}
