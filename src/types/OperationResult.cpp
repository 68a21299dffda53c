#include "types/OperationResult.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace sw::types;

std::string sw::types::to_string(const OperationType op) {
    switch (op) {
        case OperationType::Install: return "install";
        case OperationType::Uninstall: return "uninstall";
        case OperationType::Start: return "start";
        case OperationType::Stop: return "stop";
        case OperationType::Restart: return "restart";
        case OperationType::Update: return "update";
        case OperationType::QueryStatus: return "query_status";
        default: return "unknown";
    }
}

std::string sw::types::to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::ExternalTool: return "external_tool";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Internal: return "internal";
        default: return "unknown";
    }
}

OperationResult OperationResult::ok(const OperationType op, std::string message, const std::chrono::milliseconds elapsed) {
    OperationResult r;
    r.success = true;
    r.operation = op;
    r.kind = ErrorKind::None;
    r.message = std::move(message);
    r.elapsed = elapsed;
    return r;
}

OperationResult OperationResult::fail(const OperationType op, const ErrorKind kind, std::string message,
                                      std::optional<std::string> detail, const std::chrono::milliseconds elapsed) {
    OperationResult r;
    r.success = false;
    r.operation = op;
    r.kind = kind;
    r.message = std::move(message);
    r.detail = std::move(detail);
    r.elapsed = elapsed;
    return r;
}

OperationResult OperationResult::invalid(const OperationType op, std::vector<FieldError> errors) {
    std::string summary;
    for (const auto& e : errors) {
        if (!summary.empty()) summary += "; ";
        summary += fmt::format("{}: {}", e.field, e.message);
    }

    auto r = fail(op, ErrorKind::Validation, "Validation failed: " + summary);
    r.field_errors = std::move(errors);
    return r;
}

void sw::types::to_json(nlohmann::json& j, const FieldError& e) {
    j = {{"field", e.field}, {"message", e.message}};
}

void sw::types::to_json(nlohmann::json& j, const OperationResult& r) {
    j = {
        {"success", r.success},
        {"operation", to_string(r.operation)},
        {"kind", to_string(r.kind)},
        {"message", r.message},
        {"elapsed_ms", r.elapsed.count()}
    };

    if (r.detail) j["detail"] = *r.detail;
    if (!r.field_errors.empty()) j["field_errors"] = r.field_errors;
}
