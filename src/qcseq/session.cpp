#include "qcseq/session.h"

#include <cstdio>
#include <ctime>

namespace qcseq {

bool TestOutcome::MarkRunning(WallClock::time_point now, std::string command) {
    if (status != TestStatus::Pending) {
        return false;
    }
    status = TestStatus::Running;
    startedAt = now;
    commandSent = std::move(command);
    return true;
}

bool TestOutcome::MarkInterrupted(std::string reason) {
    if (status != TestStatus::Running) {
        return false;
    }
    details = "Interrupted: " + reason;
    return true;
}

bool TestOutcome::Conclude(TestStatus terminal, WallClock::time_point now, uint64_t elapsedMs,
                           std::string detailText, std::optional<std::string> response) {
    if (status != TestStatus::Running) {
        return false;
    }
    if (terminal != TestStatus::Pass && terminal != TestStatus::Fail &&
        terminal != TestStatus::Timeout) {
        return false;
    }
    status = terminal;
    completedAt = now;
    durationMs = elapsedMs;
    details = std::move(detailText);
    if (terminal == TestStatus::Pass) {
        responsePayload = std::move(response);
    }
    return true;
}

const LogEntry& Session::Append(LogLevel level, LogCategory category, std::string message,
                                std::optional<std::string> rawData,
                                std::optional<std::string> testName) {
    LogEntry entry;
    entry.timestamp = WallClock::now();
    entry.level = level;
    entry.category = category;
    entry.message = std::move(message);
    entry.rawData = std::move(rawData);
    entry.testName = std::move(testName);
    log.push_back(std::move(entry));
    return log.back();
}

std::size_t Session::CountWithStatus(TestStatus status) const {
    std::size_t count = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.status == status) {
            ++count;
        }
    }
    return count;
}

const char* ToString(TestStatus status) {
    switch (status) {
        case TestStatus::Pending: return "pending";
        case TestStatus::Running: return "running";
        case TestStatus::Pass: return "pass";
        case TestStatus::Fail: return "fail";
        case TestStatus::Timeout: return "timeout";
    }
    return "unknown";
}

const char* ToString(OverallResult result) {
    switch (result) {
        case OverallResult::Pending: return "pending";
        case OverallResult::Pass: return "pass";
        case OverallResult::Fail: return "fail";
    }
    return "unknown";
}

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Command: return "command";
        case LogLevel::Response: return "response";
    }
    return "unknown";
}

const char* ToString(LogCategory category) {
    switch (category) {
        case LogCategory::Connection: return "connection";
        case LogCategory::Bluetooth: return "bluetooth";
        case LogCategory::Command: return "command";
        case LogCategory::TestExecution: return "test_execution";
        case LogCategory::TestResult: return "test_result";
        case LogCategory::Persistence: return "database";
    }
    return "unknown";
}

namespace {
int MillisPart(WallClock::time_point tp) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    auto ms = static_cast<int>(sinceEpoch.count() % 1000);
    return ms < 0 ? ms + 1000 : ms;
}
} // namespace

std::string FormatIsoTimestamp(WallClock::time_point tp) {
    const std::time_t seconds = WallClock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, MillisPart(tp));
    return buffer;
}

std::string FormatTimeOfDay(WallClock::time_point tp) {
    const std::time_t seconds = WallClock::to_time_t(tp);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d",
                  local.tm_hour, local.tm_min, local.tm_sec, MillisPart(tp));
    return buffer;
}

} // namespace qcseq
