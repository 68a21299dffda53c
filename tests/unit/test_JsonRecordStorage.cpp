#include <gtest/gtest.h>

#include "storage/JsonRecordStorage.hpp"
#include "storage/ServiceRecordStore.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <paths.h>

using namespace sw::storage;
using namespace sw::types;
namespace fs = std::filesystem;

class JsonRecordStorageTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = sw::paths::getDataPath() / ("services_" + sw::util::generate_random_suffix() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(file, ec);
        fs::remove(fs::path(file.string() + ".lock"), ec);
    }

    static ServiceRecord makeRecord(const std::string& name) {
        ServiceRecord r;
        r.id = generateServiceId();
        r.display_name = name;
        r.executable_path = "/usr/bin/python3";
        r.script_path = fs::path("/opt/app/main.py");
        r.arguments = "--port 8080";
        r.working_directory = "/opt/app";
        r.dependencies = {"db"};
        r.environment_variables = {{"MODE", "prod"}};
        r.service_account = "svc-app";
        r.start_mode = StartMode::Manual;
        r.stop_timeout_ms = 5000;
        r.restart_on_exit = {true, 42};
        r.status = ServiceStatus::Running;
        r.touch();
        r.created_at = r.updated_at;
        return r;
    }
};

TEST_F(JsonRecordStorageTest, MissingFileLoadsEmpty) {
    JsonRecordStorage storage(file);
    EXPECT_TRUE(storage.loadAll().empty());
    EXPECT_FALSE(storage.loadById("nope").has_value());
}

TEST_F(JsonRecordStorageTest, BlankFileLoadsEmpty) {
    std::ofstream(file) << "  \n";
    JsonRecordStorage storage(file);
    EXPECT_TRUE(storage.loadAll().empty());
}

TEST_F(JsonRecordStorageTest, SaveThenLoadPreservesEveryField) {
    JsonRecordStorage storage(file);
    const auto a = makeRecord("alpha");
    auto b = makeRecord("beta");
    b.script_path.reset();
    b.service_account.reset();

    storage.saveAll({a, b});

    const auto loaded = storage.loadAll();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, a.id);
    EXPECT_EQ(loaded[0].display_name, "alpha");
    EXPECT_EQ(loaded[0].script_path, a.script_path);
    EXPECT_EQ(loaded[0].arguments, a.arguments);
    EXPECT_EQ(loaded[0].dependencies, a.dependencies);
    EXPECT_EQ(loaded[0].environment_variables, a.environment_variables);
    EXPECT_EQ(loaded[0].service_account, a.service_account);
    EXPECT_EQ(loaded[0].start_mode, StartMode::Manual);
    EXPECT_EQ(loaded[0].stop_timeout_ms, 5000u);
    EXPECT_EQ(loaded[0].restart_on_exit, a.restart_on_exit);
    EXPECT_EQ(loaded[0].status, ServiceStatus::Running);
    EXPECT_EQ(loaded[0].created_at, a.created_at);

    EXPECT_FALSE(loaded[1].script_path.has_value());
    EXPECT_FALSE(loaded[1].service_account.has_value());
}

TEST_F(JsonRecordStorageTest, LoadByIdFindsSingleRecord) {
    JsonRecordStorage storage(file);
    const auto a = makeRecord("alpha");
    const auto b = makeRecord("beta");
    storage.saveAll({a, b});

    const auto found = storage.loadById(b.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->display_name, "beta");
}

TEST_F(JsonRecordStorageTest, SaveReplacesWholeCollection) {
    JsonRecordStorage storage(file);
    storage.saveAll({makeRecord("alpha"), makeRecord("beta")});
    storage.saveAll({makeRecord("gamma")});

    const auto loaded = storage.loadAll();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].display_name, "gamma");
}

TEST_F(JsonRecordStorageTest, CorruptFileThrows) {
    std::ofstream(file) << "{ not json";
    JsonRecordStorage storage(file);
    EXPECT_THROW(storage.loadAll(), std::runtime_error);
}

TEST_F(JsonRecordStorageTest, SecondOwnerIsRefusedWhileFirstIsAlive) {
    JsonRecordStorage first(file);
    EXPECT_THROW(JsonRecordStorage second(file), sw::util::LockBusy);
}

TEST_F(JsonRecordStorageTest, StoresOnOneFileNeverDropEachOthersRecords) {
    const auto a = makeRecord("alpha");
    const auto b = makeRecord("beta");

    {
        ServiceRecordStore first(std::make_shared<JsonRecordStorage>(file));
        first.load();
        first.add(a);

        EXPECT_THROW({ ServiceRecordStore other(std::make_shared<JsonRecordStorage>(file)); }, sw::util::LockBusy);

        first.persist();
    }

    {
        ServiceRecordStore second(std::make_shared<JsonRecordStorage>(file));
        second.load();
        ASSERT_TRUE(second.contains(a.id));
        second.add(b);
        second.persist();
    }

    JsonRecordStorage reader(file);
    const auto loaded = reader.loadAll();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_TRUE(reader.loadById(a.id));
    EXPECT_TRUE(reader.loadById(b.id));
}
