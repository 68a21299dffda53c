#pragma once

#include "security/PathGuard.hpp"
#include "types/OperationResult.hpp"

#include <string>
#include <vector>

namespace sw::types { struct ServiceRecord; struct ServiceRequest; }

namespace sw::lifecycle {

inline constexpr size_t DISPLAY_NAME_MIN = 3;
inline constexpr size_t DISPLAY_NAME_MAX = 100;
inline constexpr size_t DESCRIPTION_MAX = 500;
inline constexpr unsigned int STOP_TIMEOUT_MAX_MS = 600000;

// Create/update gate. Collects every violation instead of stopping at the first one.
class RequestValidator {
public:
    RequestValidator() = default;
    explicit RequestValidator(security::PathGuard pathGuard);

    // `selfId` is the id the request will be stored under
    [[nodiscard]] std::vector<types::FieldError> validate(const types::ServiceRequest& request,
                                                          const std::string& selfId,
                                                          const std::vector<types::ServiceRecord>& fleet) const;

    static bool isValidEnvName(const std::string& name);
    static bool isValidEnvValue(const std::string& value);
    static bool isValidAccountName(const std::string& account);

private:
    security::PathGuard pathGuard_;

    void checkPath(std::vector<types::FieldError>& errors, const std::string& field,
                   const std::filesystem::path& path) const;
};

}
