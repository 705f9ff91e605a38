#pragma once
// Errors: typed failures surfaced to the host
//
// Validation and not-found errors carry enough structure for a host to
// phrase a user-facing message. Storage errors carry the failing path.

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace tether {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
    virtual const char* kind() const noexcept { return "error"; }
};

class NotFoundError : public Error {
public:
    NotFoundError(const std::string& id, std::vector<std::string> suggestions = {})
        : Error(format(id, suggestions)), id_(id), suggestions_(std::move(suggestions)) {}

    const char* kind() const noexcept override { return "not_found"; }
    const std::string& id() const { return id_; }
    const std::vector<std::string>& suggestions() const { return suggestions_; }

private:
    static std::string format(const std::string& id, const std::vector<std::string>& suggestions) {
        std::string msg = "Not found: " + id;
        if (!suggestions.empty()) {
            msg += ". Did you mean \"" + suggestions.front() + "\"?";
        }
        return msg;
    }

    std::string id_;
    std::vector<std::string> suggestions_;
};

class ValidationError : public Error {
public:
    ValidationError(const std::string& field, const std::string& msg)
        : Error(msg), field_(field) {}

    const char* kind() const noexcept override { return "validation"; }
    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class InvalidTransitionError : public Error {
public:
    InvalidTransitionError(Status from, Status to)
        : Error(std::string("Invalid status transition: ") + status_to_string(from)
                + " -> " + status_to_string(to)),
          from_(from), to_(to) {}

    const char* kind() const noexcept override { return "invalid_transition"; }
    Status from() const { return from_; }
    Status to() const { return to_; }

private:
    Status from_;
    Status to_;
};

class StaleAutomationError : public Error {
public:
    explicit StaleAutomationError(Timestamp age_ms)
        : Error("Automation decision is stale (" + std::to_string(age_ms / 1000) + "s old)"),
          age_ms_(age_ms) {}

    const char* kind() const noexcept override { return "stale_automation"; }
    Timestamp age_ms() const { return age_ms_; }

private:
    Timestamp age_ms_;
};

class StorageError : public Error {
public:
    StorageError(const std::string& op, const std::string& path, const std::string& detail = "")
        : Error("Storage " + op + " failed: " + path + (detail.empty() ? "" : " (" + detail + ")")),
          op_(op), path_(path) {}

    const char* kind() const noexcept override { return "storage"; }
    const std::string& op() const { return op_; }
    const std::string& path() const { return path_; }

private:
    std::string op_;
    std::string path_;
};

} // namespace tether
