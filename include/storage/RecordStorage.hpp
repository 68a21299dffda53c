#pragma once

#include "types/ServiceRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sw::storage {

// Persistence collaborator. saveAll rewrites the whole collection.
class RecordStorage {
public:
    virtual ~RecordStorage() = default;

    virtual std::vector<types::ServiceRecord> loadAll() = 0;
    virtual void saveAll(const std::vector<types::ServiceRecord>& records) = 0;
    virtual std::optional<types::ServiceRecord> loadById(const std::string& id) = 0;
};

}
