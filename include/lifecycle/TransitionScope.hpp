#pragma once

#include "types/ServiceStatus.hpp"

#include <memory>
#include <string>

namespace sw::storage { class ServiceRecordStore; }

namespace sw::lifecycle {

// Lives inside an operation, after its lease. If the operation unwinds with an
// exception while the record is still in a transitional status, the record is
// settled: Installing and Uninstalling become Error, Starting and Stopping
// return to the last known-good status. The settled status is persisted.
class TransitionScope {
public:
    TransitionScope(std::shared_ptr<storage::ServiceRecordStore> store, std::string id,
                    types::ServiceStatus lastGood);

    ~TransitionScope();

    TransitionScope(const TransitionScope&) = delete;
    TransitionScope& operator=(const TransitionScope&) = delete;

    // Records a status the service is known to have reached
    void checkpoint(const types::ServiceStatus status) { lastGood_ = status; }

    [[nodiscard]] types::ServiceStatus lastGood() const { return lastGood_; }

    static types::ServiceStatus settledStatus(types::ServiceStatus current, types::ServiceStatus lastGood);

private:
    std::shared_ptr<storage::ServiceRecordStore> store_;
    std::string id_;
    types::ServiceStatus lastGood_;
    int uncaught_;

    void settle() const;
};

}
