#pragma once

#include "lifecycle/RequestValidator.hpp"
#include "types/OperationResult.hpp"
#include "types/ServiceRecord.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sw::host { class ServiceHostAdapter; }
namespace sw::monitor { class PollingCoordinator; }
namespace sw::storage { class ServiceRecordStore; }
namespace sw::types { struct ServiceRequest; }

namespace sw::lifecycle {

class InFlightRegistry;

// Drives every status transition. Preconditions are checked before any
// external call; a second operation on a busy id gets ErrorKind::Conflict.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<storage::ServiceRecordStore> store,
                 std::shared_ptr<host::ServiceHostAdapter> adapter,
                 std::shared_ptr<InFlightRegistry> inflight,
                 std::shared_ptr<monitor::PollingCoordinator> coordinator,
                 RequestValidator validator = {});

    types::Result<types::ServiceRecord> create(const types::ServiceRequest& request);
    types::Result<types::ServiceRecord> update(const std::string& id, const types::ServiceRequest& request);

    types::OperationResult start(const std::string& id);
    types::OperationResult stop(const std::string& id);
    types::OperationResult restart(const std::string& id);
    types::OperationResult uninstall(const std::string& id);

    [[nodiscard]] std::vector<types::ServiceRecord> getAll() const;
    [[nodiscard]] std::optional<types::ServiceRecord> get(const std::string& id) const;

    // NotInstalled for unknown ids, the stored status while an operation is in flight
    types::ServiceStatus getStatus(const std::string& id);

    // Copies the request's configuration fields. id, status and created_at are untouched.
    // Paths are stored absolute and normalized.
    static void applyRequest(types::ServiceRecord& record, const types::ServiceRequest& request);

    // Relative executable, script and working directory paths resolved against the current directory
    static types::ServiceRequest withAbsolutePaths(const types::ServiceRequest& request);

private:
    std::shared_ptr<storage::ServiceRecordStore> store_;
    std::shared_ptr<host::ServiceHostAdapter> adapter_;
    std::shared_ptr<InFlightRegistry> inflight_;
    std::shared_ptr<monitor::PollingCoordinator> coordinator_;
    RequestValidator validator_;

    types::ServiceStatus transition(const std::string& id, types::ServiceStatus to);
    void persist(types::OperationResult& result);
    void track(const std::string& id);

    // Removes `removed` from every other record's dependency list
    void pruneDependents(const std::string& removed, types::OperationResult& result);

    // Converts unexpected exceptions into ErrorKind::Internal
    types::OperationResult guarded(types::OperationType op, const std::string& id,
                                   const std::function<types::OperationResult()>& body);
};

}
