#include <gtest/gtest.h>

#include "protocols/shell/Client.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Server.hpp"
#include "protocols/shell/commands.hpp"
#include "runtime/Manager.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "fakes/FakeServiceHost.hpp"
#include "fakes/ScratchDir.hpp"

#include <future>

using namespace sw::shell;
using namespace sw::test;
using sw::types::ServiceStatus;

class ShellServerTest : public ::testing::Test {
protected:
    ScratchDir scratch;
    std::shared_ptr<FakeServiceHost> host;
    std::shared_ptr<sw::runtime::Manager> manager;
    std::unique_ptr<Server> server;

    void SetUp() override {
        sw::config::Config cfg;
        cfg.paths.data_dir = scratch.root();
        cfg.paths.services_dir = scratch.servicesDir();
        cfg.host_tool.template_path = scratch.hostBinary();
        cfg.host_tool.wrapper_template_path = scratch.wrapperTemplate();
        cfg.service_control.status_poll_interval = std::chrono::milliseconds(10);

        host = std::make_shared<FakeServiceHost>();
        manager = std::make_shared<sw::runtime::Manager>(cfg, host, host);

        const auto router = std::make_shared<Router>();
        registerAllCommands(router, manager);
        server = std::make_unique<Server>(router, socketPath(), 4);
        server->start();
    }

    void TearDown() override {
        host->openGate();
        server.reset();
    }

    [[nodiscard]] std::filesystem::path socketPath() const { return scratch.root() / "swctl.sock"; }

    [[nodiscard]] CommandResult send(const std::vector<std::string>& args,
                                     const std::filesystem::path& cwd = "/") const {
        return Client(socketPath()).execute(args, cwd);
    }

    std::string createService(const std::string& name) const {
        const auto res = send({"create", "--name", name, "--exe", scratch.executable().string(), "--json"});
        EXPECT_EQ(res.exit_code, 0) << res.stderr_text;
        return res.has_data ? res.data.at("service").at("id").get<std::string>() : std::string{};
    }
};

TEST_F(ShellServerTest, CommandsRunInTheDaemon) {
    const auto id = createService("Socket Worker");
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(manager->store()->get(id)->status, ServiceStatus::Running);

    const auto list = send({"list"});
    EXPECT_EQ(list.exit_code, 0);
    EXPECT_NE(list.stdout_text.find("Socket Worker"), std::string::npos);

    const auto status = send({"status", id, "--json"});
    ASSERT_TRUE(status.has_data);
    EXPECT_EQ(status.data.at("status"), "Running");
}

TEST_F(ShellServerTest, ErrorsKeepTheirExitCodes) {
    EXPECT_EQ(send({"frobnicate"}).exit_code, 2);

    const auto id = createService("Socket Worker");
    const auto res = send({"start", id});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_FALSE(res.stderr_text.empty());
}

TEST_F(ShellServerTest, RelativeExecutableResolvesAgainstCallerDirectory) {
    const auto bin = scratch.executable().parent_path();
    const auto res = send({"create", "--name", "Relative", "--exe", "worker", "--json"}, bin);
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;

    const auto id = res.data.at("service").at("id").get<std::string>();
    EXPECT_EQ(manager->store()->get(id)->executable_path, scratch.executable());
}

TEST_F(ShellServerTest, ConcurrentClientsShareOneInFlightRegistry) {
    const auto id = createService("Socket Worker");

    host->closeGate();
    auto first = std::async(std::launch::async, [&] { return send({"stop", id}); });
    ASSERT_TRUE(host->waitForGateWaiters(1));

    const auto second = send({"stop", id});
    EXPECT_EQ(second.exit_code, 1);

    host->openGate();
    EXPECT_EQ(first.get().exit_code, 0);
    EXPECT_EQ(host->stopCalls.load(), 1);
    EXPECT_EQ(manager->store()->get(id)->status, ServiceStatus::Stopped);
}

TEST_F(ShellServerTest, SecondServerOnSameSocketIsRefused) {
    Server other(std::make_shared<Router>(), socketPath(), 1);
    EXPECT_THROW(other.start(), std::runtime_error);

    // The first daemon keeps serving
    EXPECT_EQ(send({"version"}).exit_code, 0);
}

TEST_F(ShellServerTest, ClientWithoutDaemonReportsUnavailable) {
    server->stop();
    EXPECT_FALSE(std::filesystem::exists(socketPath()));
    EXPECT_THROW((void)send({"list"}), DaemonUnavailable);
}
