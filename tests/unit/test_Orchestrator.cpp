#include <gtest/gtest.h>

#include "lifecycle/InFlightRegistry.hpp"
#include "lifecycle/Orchestrator.hpp"
#include "monitor/PollingCoordinator.hpp"
#include "storage/JsonRecordStorage.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "types/ServiceRequest.hpp"
#include "fakes/FakeServiceHost.hpp"
#include "fakes/ScratchDir.hpp"

#include <future>
#include <thread>

using namespace sw::lifecycle;
using namespace sw::types;
using namespace sw::test;
namespace fs = std::filesystem;

// Switches the process working directory for the lifetime of the object
struct CurrentDirectory {
    fs::path saved = fs::current_path();
    explicit CurrentDirectory(const fs::path& dir) { fs::current_path(dir); }
    ~CurrentDirectory() { fs::current_path(saved); }
};

class OrchestratorTest : public ::testing::Test {
protected:
    ScratchDir scratch;
    std::shared_ptr<FakeServiceHost> host;
    std::shared_ptr<sw::storage::ServiceRecordStore> store;
    std::shared_ptr<sw::host::ServiceHostAdapter> adapter;
    std::shared_ptr<InFlightRegistry> inflight;
    std::shared_ptr<sw::monitor::PollingCoordinator> coordinator;
    std::unique_ptr<Orchestrator> orchestrator;

    void SetUp() override {
        host = std::make_shared<FakeServiceHost>();
        store = std::make_shared<sw::storage::ServiceRecordStore>(
            std::make_shared<sw::storage::JsonRecordStorage>(scratch.root() / "services.json"));
        adapter = std::make_shared<sw::host::ServiceHostAdapter>(scratch.adapterOptions(), host, host);
        inflight = std::make_shared<InFlightRegistry>();
        coordinator = std::make_shared<sw::monitor::PollingCoordinator>(adapter, sw::monitor::PollingCoordinator::Options{});
        orchestrator = std::make_unique<Orchestrator>(store, adapter, inflight, coordinator);
    }

    [[nodiscard]] ServiceRequest request(const std::string& name = "Report Worker", const bool autoStart = true) const {
        ServiceRequest r;
        r.display_name = name;
        r.executable_path = scratch.executable();
        r.working_directory = scratch.workDir();
        r.arguments = "  --queue reports ";
        r.auto_start = autoStart;
        return r;
    }

    std::string createRunning(const std::string& name = "Report Worker") {
        auto res = orchestrator->create(request(name));
        EXPECT_TRUE(res.outcome.success) << res.outcome.message;
        EXPECT_TRUE(res.value.has_value());
        return res.value ? res.value->id : std::string{};
    }

    ServiceStatus storedStatus(const std::string& id) const {
        const auto r = store->get(id);
        return r ? r->status : ServiceStatus::NotInstalled;
    }
};

TEST_F(OrchestratorTest, CreateInstallsAndStartsService) {
    const auto res = orchestrator->create(request());
    ASSERT_TRUE(res.outcome.success) << res.outcome.message;
    ASSERT_TRUE(res.value);

    const auto& record = *res.value;
    EXPECT_EQ(record.status, ServiceStatus::Running);
    EXPECT_EQ(record.arguments, "--queue reports");
    EXPECT_NE(record.created_at, 0);

    const auto box = adapter->sandbox(record.id);
    EXPECT_TRUE(fs::is_regular_file(box.configFile()));
    EXPECT_TRUE(fs::is_directory(box.logsDirectory()));
    EXPECT_EQ(fs::file_size(box.stdoutLog()), 0u);
    EXPECT_EQ(fs::file_size(box.stderrLog()), 0u);

    EXPECT_TRUE(coordinator->isTracking(record.id));
    EXPECT_TRUE(fs::exists(scratch.root() / "services.json"));
}

TEST_F(OrchestratorTest, CreateWithoutAutoStartLeavesStopped) {
    const auto res = orchestrator->create(request("Idle Worker", false));
    ASSERT_TRUE(res.outcome.success);
    EXPECT_EQ(res.value->status, ServiceStatus::Stopped);
    EXPECT_EQ(host->startCalls.load(), 0);
}

TEST_F(OrchestratorTest, CreateRejectsInvalidRequestWithoutSideEffects) {
    auto bad = request();
    bad.arguments = "--a; reboot";
    bad.executable_path = "../escape";

    const auto res = orchestrator->create(bad);
    EXPECT_FALSE(res.outcome.success);
    EXPECT_EQ(res.outcome.kind, ErrorKind::Validation);
    EXPECT_EQ(res.outcome.field_errors.size(), 2u);
    EXPECT_FALSE(res.value);
    EXPECT_EQ(store->size(), 0u);
    EXPECT_EQ(host->installCalls.load(), 0);
}

TEST_F(OrchestratorTest, CreateHostFailureLeavesErrorRecord) {
    host->failInstall = true;
    const auto res = orchestrator->create(request());
    EXPECT_FALSE(res.outcome.success);
    EXPECT_EQ(res.outcome.kind, ErrorKind::ExternalTool);
    ASSERT_TRUE(res.value);
    EXPECT_EQ(storedStatus(res.value->id), ServiceStatus::Error);
}

TEST_F(OrchestratorTest, CreateStagingFailureRollsBackRecord) {
    fs::remove(scratch.hostBinary());
    const auto res = orchestrator->create(request());
    EXPECT_FALSE(res.outcome.success);
    EXPECT_EQ(res.outcome.kind, ErrorKind::Internal);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(OrchestratorTest, CreateStartFailureLeavesStoppedRecord) {
    host->failStart = true;
    const auto res = orchestrator->create(request());
    EXPECT_FALSE(res.outcome.success);
    ASSERT_TRUE(res.value);
    EXPECT_EQ(res.value->status, ServiceStatus::Stopped);
    EXPECT_EQ(storedStatus(res.value->id), ServiceStatus::Stopped);
}

TEST_F(OrchestratorTest, StartOnRunningIsConflictWithNoExternalCalls) {
    const auto id = createRunning();
    const int starts = host->startCalls.load(), stops = host->stopCalls.load(), queries = host->queryCalls.load();

    const auto res = orchestrator->start(id);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.kind, ErrorKind::Conflict);
    EXPECT_EQ(host->startCalls.load(), starts);
    EXPECT_EQ(host->stopCalls.load(), stops);
    EXPECT_EQ(host->queryCalls.load(), queries);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Running);
}

TEST_F(OrchestratorTest, UnknownIdIsNotFound) {
    EXPECT_EQ(orchestrator->start("missing").kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->stop("missing").kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->restart("missing").kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->uninstall("missing").kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->update("missing", request()).outcome.kind, ErrorKind::NotFound);
    EXPECT_EQ(orchestrator->getStatus("missing"), ServiceStatus::NotInstalled);
}

TEST_F(OrchestratorTest, StopThenStart) {
    const auto id = createRunning();

    ASSERT_TRUE(orchestrator->stop(id).success);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Stopped);
    EXPECT_EQ(orchestrator->stop(id).kind, ErrorKind::Conflict);

    ASSERT_TRUE(orchestrator->start(id).success);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Running);
}

TEST_F(OrchestratorTest, StartFailureRevertsToPriorStatus) {
    const auto id = createRunning();
    ASSERT_TRUE(orchestrator->stop(id).success);

    host->failStart = true;
    const auto res = orchestrator->start(id);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.kind, ErrorKind::ExternalTool);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Stopped);
}

TEST_F(OrchestratorTest, RestartStopFailureNeverStartsAndRestoresStatus) {
    const auto id = createRunning();
    const int starts = host->startCalls.load();

    host->failStop = true;
    const auto res = orchestrator->restart(id);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.operation, OperationType::Restart);
    EXPECT_EQ(host->startCalls.load(), starts);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Running);
}

TEST_F(OrchestratorTest, RestartCyclesService) {
    const auto id = createRunning();
    const auto res = orchestrator->restart(id);
    EXPECT_TRUE(res.success) << res.message;
    EXPECT_EQ(storedStatus(id), ServiceStatus::Running);
}

TEST_F(OrchestratorTest, RestartRequiresStoppableStatus) {
    const auto res = orchestrator->create(request("Idle Worker", false));
    EXPECT_EQ(orchestrator->restart(res.value->id).kind, ErrorKind::Conflict);
}

TEST_F(OrchestratorTest, UninstallRunningServiceStopsAndRemoves) {
    const auto id = createRunning();

    const auto res = orchestrator->uninstall(id);
    ASSERT_TRUE(res.success) << res.message;
    EXPECT_GE(host->stopCalls.load(), 1);
    EXPECT_FALSE(adapter->sandbox(id).exists());
    EXPECT_TRUE(orchestrator->getAll().empty());
    EXPECT_EQ(adapter->queryStatus(id), ServiceStatus::NotInstalled);
}

TEST_F(OrchestratorTest, UninstallStopFailureKeepsRunning) {
    const auto id = createRunning();
    host->failStop = true;
    const auto res = orchestrator->uninstall(id);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Running);
    EXPECT_TRUE(adapter->sandbox(id).exists());
}

TEST_F(OrchestratorTest, UninstallHostFailureMarksError) {
    const auto res = orchestrator->create(request("Idle Worker", false));
    host->failUninstall = true;
    EXPECT_FALSE(orchestrator->uninstall(res.value->id).success);
    EXPECT_EQ(storedStatus(res.value->id), ServiceStatus::Error);

    host->failUninstall = false;
    EXPECT_TRUE(orchestrator->uninstall(res.value->id).success);
}

TEST_F(OrchestratorTest, CreateRunnerExceptionLeavesErrorRecord) {
    host->runThrows = true;
    const auto res = orchestrator->create(request());
    EXPECT_FALSE(res.outcome.success);
    EXPECT_EQ(res.outcome.kind, ErrorKind::ExternalTool);
    ASSERT_TRUE(res.value);
    EXPECT_EQ(storedStatus(res.value->id), ServiceStatus::Error);

    host->runThrows = false;
    EXPECT_TRUE(orchestrator->uninstall(res.value->id).success);
}

TEST_F(OrchestratorTest, UninstallRunnerExceptionMarksErrorAndAllowsRetry) {
    const auto res = orchestrator->create(request("Idle Worker", false));
    ASSERT_TRUE(res.value);

    host->runThrows = true;
    const auto failed = orchestrator->uninstall(res.value->id);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(storedStatus(res.value->id), ServiceStatus::Error);

    host->runThrows = false;
    EXPECT_TRUE(orchestrator->uninstall(res.value->id).success);
    EXPECT_FALSE(store->contains(res.value->id));
}

TEST_F(OrchestratorTest, RelativePathsAreStoredAbsolute) {
    const CurrentDirectory cwd(scratch.executable().parent_path());

    auto req = request();
    req.executable_path = scratch.executable().filename();
    req.working_directory.clear();

    const auto res = orchestrator->create(req);
    ASSERT_TRUE(res.outcome.success) << res.outcome.message;
    ASSERT_TRUE(res.value);
    EXPECT_TRUE(res.value->executable_path.is_absolute());
    EXPECT_EQ(res.value->executable_path, fs::current_path() / scratch.executable().filename());
    EXPECT_EQ(res.value->working_directory, fs::current_path());
}

TEST_F(OrchestratorTest, RelativePathOutsideAllowedRootIsRejected) {
    const CurrentDirectory cwd(scratch.executable().parent_path());
    Orchestrator rooted(store, adapter, inflight, coordinator,
                        RequestValidator(sw::security::PathGuard({.max_length = 4096,
                                                                  .allowed_root = scratch.workDir()})));

    auto req = request();
    req.executable_path = scratch.executable().filename();
    req.working_directory.clear();

    const auto res = rooted.create(req);
    EXPECT_FALSE(res.outcome.success);
    EXPECT_EQ(res.outcome.kind, ErrorKind::Validation);
    ASSERT_FALSE(res.outcome.field_errors.empty());
    EXPECT_EQ(res.outcome.field_errors.front().field, "executable_path");
    EXPECT_EQ(host->installCalls.load(), 0);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(OrchestratorTest, UninstallDropsIdFromDependents) {
    const auto base = orchestrator->create(request("Database", false));
    ASSERT_TRUE(base.value);

    auto req = request("Api Server", false);
    req.dependencies = {base.value->id};
    const auto dependent = orchestrator->create(req);
    ASSERT_TRUE(dependent.outcome.success) << dependent.outcome.message;
    const auto configFile = adapter->sandbox(dependent.value->id).configFile();
    ASSERT_NE(sw::util::readFileToString(configFile).find(base.value->id), std::string::npos);

    const auto removed = orchestrator->uninstall(base.value->id);
    ASSERT_TRUE(removed.success) << removed.message;

    EXPECT_TRUE(store->get(dependent.value->id)->dependencies.empty());
    EXPECT_EQ(sw::util::readFileToString(configFile).find(base.value->id), std::string::npos);

    auto renamed = request("Api Server v2", false);
    renamed.dependencies = store->get(dependent.value->id)->dependencies;
    const auto updated = orchestrator->update(dependent.value->id, renamed);
    EXPECT_TRUE(updated.outcome.success) << updated.outcome.message;
}

TEST_F(OrchestratorTest, UpdateRewritesConfigurationAndKeepsStatus) {
    const auto id = createRunning();
    const auto created = store->get(id)->created_at;

    auto changed = request("Renamed Worker");
    changed.environment_variables = {{"MODE", "prod"}};
    const auto res = orchestrator->update(id, changed);
    ASSERT_TRUE(res.outcome.success) << res.outcome.message;

    const auto stored = store->get(id);
    EXPECT_EQ(stored->display_name, "Renamed Worker");
    EXPECT_EQ(stored->environment_variables.at("MODE"), "prod");
    EXPECT_EQ(stored->status, ServiceStatus::Running);
    EXPECT_EQ(stored->created_at, created);

    const auto xml = sw::util::readFileToString(adapter->sandbox(id).configFile());
    EXPECT_NE(xml.find("Renamed Worker"), std::string::npos);
}

TEST_F(OrchestratorTest, UpdateRejectsSelfDependency) {
    const auto id = createRunning();
    auto changed = request();
    changed.dependencies = {id};
    const auto res = orchestrator->update(id, changed);
    EXPECT_EQ(res.outcome.kind, ErrorKind::Validation);
    ASSERT_EQ(res.outcome.field_errors.size(), 1u);
    EXPECT_EQ(res.outcome.field_errors[0].field, "dependencies");
}

TEST_F(OrchestratorTest, BusyIdIsConflict) {
    const auto id = createRunning();
    auto lease = inflight->tryAcquire(id);
    ASSERT_TRUE(lease);

    EXPECT_EQ(orchestrator->stop(id).kind, ErrorKind::Conflict);
    EXPECT_EQ(orchestrator->restart(id).kind, ErrorKind::Conflict);
    EXPECT_EQ(orchestrator->uninstall(id).kind, ErrorKind::Conflict);
    EXPECT_EQ(orchestrator->update(id, request()).outcome.kind, ErrorKind::Conflict);

    lease.release();
    EXPECT_TRUE(orchestrator->stop(id).success);
}

TEST_F(OrchestratorTest, RacingOperationsOnSameIdAdmitExactlyOne) {
    const auto id = createRunning();

    host->closeGate();
    auto first = std::async(std::launch::async, [&] { return orchestrator->stop(id); });
    ASSERT_TRUE(host->waitForGateWaiters(1));

    EXPECT_EQ(storedStatus(id), ServiceStatus::Stopping);
    EXPECT_EQ(orchestrator->getStatus(id), ServiceStatus::Stopping);

    const auto second = orchestrator->stop(id);
    EXPECT_EQ(second.kind, ErrorKind::Conflict);

    host->openGate();
    EXPECT_TRUE(first.get().success);
    EXPECT_EQ(host->stopCalls.load(), 1);
    EXPECT_EQ(storedStatus(id), ServiceStatus::Stopped);
}

TEST_F(OrchestratorTest, DistinctIdsDoNotSerialize) {
    const auto a = createRunning("Worker A");
    const auto b = createRunning("Worker B");

    host->closeGate();
    auto blocked = std::async(std::launch::async, [&] { return orchestrator->stop(a); });
    ASSERT_TRUE(host->waitForGateWaiters(1));

    // b proceeds while a is parked mid-operation
    const auto res = orchestrator->update(b, request("Worker B2"));
    EXPECT_TRUE(res.outcome.success);
    EXPECT_EQ(orchestrator->getStatus(b), ServiceStatus::Running);

    host->openGate();
    EXPECT_TRUE(blocked.get().success);
}

TEST_F(OrchestratorTest, StatePersistsAcrossReload) {
    const auto id = createRunning();
    ASSERT_TRUE(orchestrator->stop(id).success);

    // services.json has a single owner at a time
    orchestrator.reset();
    store.reset();

    sw::storage::ServiceRecordStore reloaded(std::make_shared<sw::storage::JsonRecordStorage>(scratch.root() / "services.json"));
    reloaded.load();
    ASSERT_TRUE(reloaded.get(id));
    EXPECT_EQ(reloaded.get(id)->status, ServiceStatus::Stopped);
}

TEST_F(OrchestratorTest, ApplyRequestDefaultsWorkingDirectory) {
    ServiceRecord r;
    auto req = request();
    req.working_directory.clear();
    req.description = "";
    Orchestrator::applyRequest(r, req);
    EXPECT_EQ(r.working_directory, scratch.executable().parent_path());
    EXPECT_EQ(r.description, "Managed by servicewarden");
}
