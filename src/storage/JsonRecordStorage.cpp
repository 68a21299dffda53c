#include "storage/JsonRecordStorage.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace sw::storage;
using namespace sw::types;
using namespace sw::logging;
using json = nlohmann::json;

namespace {

std::filesystem::path lockFileFor(const std::filesystem::path& file) {
    auto lock = file;
    lock += ".lock";
    return lock;
}

}

JsonRecordStorage::JsonRecordStorage(std::filesystem::path file)
    : file_(std::move(file)), owner_(lockFileFor(file_), util::FileLock::Mode::TryOnce) {
    LogRegistry::store()->debug("[JsonRecordStorage] Took ownership of {}", file_.string());
}

std::vector<ServiceRecord> JsonRecordStorage::loadAll() {
    std::scoped_lock lock(mutex_);
    return readLocked();
}

void JsonRecordStorage::saveAll(const std::vector<ServiceRecord>& records) {
    std::scoped_lock lock(mutex_);

    const json doc = {{"version", 1}, {"services", records}};
    util::writeFileAtomic(file_, doc.dump(2));

    LogRegistry::store()->debug("[JsonRecordStorage] Saved {} services to {}", records.size(), file_.string());
}

std::optional<ServiceRecord> JsonRecordStorage::loadById(const std::string& id) {
    std::scoped_lock lock(mutex_);
    for (auto& record : readLocked())
        if (record.id == id) return record;
    return std::nullopt;
}

std::vector<ServiceRecord> JsonRecordStorage::readLocked() const {
    if (!std::filesystem::exists(file_)) {
        LogRegistry::store()->info("[JsonRecordStorage] {} does not exist, starting empty", file_.string());
        return {};
    }

    const auto content = util::readFileToString(file_);
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        LogRegistry::store()->warn("[JsonRecordStorage] {} is empty, starting empty", file_.string());
        return {};
    }

    try {
        const auto doc = json::parse(content);
        if (!doc.contains("services")) return {};
        return doc.at("services").get<std::vector<ServiceRecord>>();
    } catch (const std::exception& e) {
        LogRegistry::store()->error("[JsonRecordStorage] Failed to parse {}: {}", file_.string(), e.what());
        throw std::runtime_error("Corrupt service metadata file " + file_.string() + ": " + e.what());
    }
}
