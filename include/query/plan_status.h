#pragma once

#include <string>
#include <utility>

namespace rolodex {

/// Outcome of registry lookups and plan building.
/// UNKNOWN_FIELD: the path is not registered for the requested capability.
/// VALIDATION_ERROR: the field exists but the operator or value does not fit it.
struct PlanStatus {
    enum class Code { OK, UNKNOWN_FIELD, VALIDATION_ERROR };

    Code code = Code::OK;
    std::string field;
    std::string message;

    bool ok() const { return code == Code::OK; }

    static PlanStatus OK() { return {}; }
    static PlanStatus UnknownField(std::string field, std::string msg) {
        return PlanStatus{Code::UNKNOWN_FIELD, std::move(field), std::move(msg)};
    }
    static PlanStatus Validation(std::string field, std::string reason) {
        return PlanStatus{Code::VALIDATION_ERROR, std::move(field), std::move(reason)};
    }

    static const char* codeToString(Code c) {
        switch (c) {
            case Code::OK: return "ok";
            case Code::UNKNOWN_FIELD: return "unknown_field";
            case Code::VALIDATION_ERROR: return "validation_error";
        }
        return "ok";
    }

    std::string toString() const {
        if (ok()) return "ok";
        return std::string(codeToString(code)) + " [" + field + "]: " + message;
    }
};

} // namespace rolodex
