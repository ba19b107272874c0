#pragma once

#include <string>

/**
 * Outcome of one step of a transfer or session.
 * A failed result carries a human-readable message; context() prefixes it
 * so that the final text reads as a cause chain ("outer: inner: root").
 */
struct StepResult {
    bool success;
    std::string error;

    StepResult(bool ok = true, const std::string& msg = "")
        : success(ok), error(msg) {}

    static StepResult ok() { return StepResult(true); }
    static StepResult fail(const std::string& msg) { return StepResult(false, msg); }

    StepResult context(const std::string& what) const {
        if (success) return *this;
        if (error.empty()) return StepResult(false, what);
        return StepResult(false, what + ": " + error);
    }

    explicit operator bool() const { return success; }
};
