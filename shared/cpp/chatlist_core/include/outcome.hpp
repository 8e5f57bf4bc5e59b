#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include "errors.hpp"

enum class OutcomeStatus { Success, Failure };

struct DispatchOutcome {
    int64_t provider_id{0};
    std::string provider_name;
    OutcomeStatus status{OutcomeStatus::Failure};
    std::string response_text;           // truncated text on success
    std::optional<ErrorKind> error_kind; // set on failure
    std::string error_detail;            // underlying cause, for diagnostics
    std::chrono::milliseconds elapsed{0};
    std::optional<int64_t> result_id;    // row written for this outcome, if any
    std::string persist_error;           // why the row could not be written
};
