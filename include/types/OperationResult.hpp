#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sw::types {

enum class OperationType { Install, Uninstall, Start, Stop, Restart, Update, QueryStatus };

enum class ErrorKind {
    None,
    Validation,     // guard or request rejection, nothing external was touched
    Conflict,       // illegal for the current status or another operation in flight
    ExternalTool,   // host tool or service control reported failure
    Timeout,        // external call or status wait exceeded its ceiling
    NotFound,       // unknown service id
    Internal        // unexpected fault (filesystem, persistence)
};

std::string to_string(OperationType op);
std::string to_string(ErrorKind kind);

struct FieldError {
    std::string field;
    std::string message;
};

struct OperationResult {
    bool success{false};
    OperationType operation{OperationType::QueryStatus};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::optional<std::string> detail;
    std::vector<FieldError> field_errors;
    std::chrono::milliseconds elapsed{0};

    static OperationResult ok(OperationType op, std::string message = "",
                              std::chrono::milliseconds elapsed = std::chrono::milliseconds{0});

    static OperationResult fail(OperationType op, ErrorKind kind, std::string message,
                                std::optional<std::string> detail = std::nullopt,
                                std::chrono::milliseconds elapsed = std::chrono::milliseconds{0});

    static OperationResult invalid(OperationType op, std::vector<FieldError> errors);

    explicit operator bool() const { return success; }
};

template <typename T>
struct Result {
    OperationResult outcome;
    std::optional<T> value;

    explicit operator bool() const { return outcome.success; }
};

void to_json(nlohmann::json& j, const FieldError& e);
void to_json(nlohmann::json& j, const OperationResult& r);

}
