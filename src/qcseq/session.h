#pragma once

/**
 * @file session.h
 * @brief QC run data model: test definitions, outcomes, audit log and session.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qcseq {

using WallClock = std::chrono::system_clock;

/// Scalar value carried in a command payload.
using PayloadValue = std::variant<std::string, int64_t, double, bool>;

/// Command payload. std::map keeps key order canonical on the wire.
using Payload = std::map<std::string, PayloadValue>;

/**
 * @brief One hardware self-test, immutable once loaded.
 */
struct TestDefinition {
    std::string name;       ///< Unique within a catalog
    std::string commandId;  ///< Wire opcode
    Payload payload;        ///< Serialized verbatim after the command field
    uint32_t timeoutMs{0};  ///< Per-test response deadline
};

enum class TestStatus : uint8_t {
    Pending = 0,
    Running,
    Pass,
    Fail,
    Timeout,
};

enum class OverallResult : uint8_t {
    Pending = 0,
    Pass,
    Fail,
};

/**
 * @brief Execution record of one TestDefinition within one run.
 *
 * Status moves only Pending -> Running -> {Pass, Fail, Timeout}.
 * completedAt is set exactly when the status leaves Running.
 */
struct TestOutcome {
    std::string testName;
    TestStatus status{TestStatus::Pending};
    std::string commandSent;
    std::optional<std::string> responsePayload;  ///< Only set on Pass
    std::string details;
    std::optional<WallClock::time_point> startedAt;
    std::optional<WallClock::time_point> completedAt;
    uint64_t durationMs{0};

    bool IsTerminal() const {
        return status == TestStatus::Pass || status == TestStatus::Fail ||
               status == TestStatus::Timeout;
    }

    /// Pending -> Running. Returns false if the outcome was already armed.
    bool MarkRunning(WallClock::time_point now, std::string command);

    /// Record why a Running test was cut short. The status stays Running.
    bool MarkInterrupted(std::string reason);

    /// Running -> terminal. Returns false (and changes nothing) unless Running.
    bool Conclude(TestStatus terminal, WallClock::time_point now, uint64_t elapsedMs,
                  std::string detailText, std::optional<std::string> response = std::nullopt);
};

enum class LogLevel : uint8_t {
    Info = 0,
    Success,
    Warning,
    Error,
    Command,
    Response,
};

enum class LogCategory : uint8_t {
    Connection = 0,
    Bluetooth,
    Command,
    TestExecution,
    TestResult,
    Persistence,
};

struct LogEntry {
    WallClock::time_point timestamp{};
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::TestExecution};
    std::string message;
    std::optional<std::string> rawData;
    std::optional<std::string> testName;
};

/// Opaque identity reported by the transport for the connected device.
struct DeviceIdentity {
    std::string name;
    std::string id;
};

struct ConnectionInfo {
    uint64_t connectionTimeMs{0};
    std::string serviceUuid;
    std::string controlCharUuid;
    std::string eventCharUuid;
    bool notificationsEnabled{false};
};

/**
 * @brief Complete record of one battery run against one device.
 *
 * Owned by the TestSequencer while the run is active, then handed by value
 * to the ResultAggregator.
 */
struct Session {
    DeviceIdentity device;
    ConnectionInfo connection;
    std::vector<LogEntry> log;
    std::vector<TestOutcome> outcomes;
    OverallResult overallResult{OverallResult::Pending};
    WallClock::time_point startedAt{};
    std::string operatorName;

    /// Append-only audit log.
    const LogEntry& Append(LogLevel level, LogCategory category, std::string message,
                           std::optional<std::string> rawData = std::nullopt,
                           std::optional<std::string> testName = std::nullopt);

    std::size_t CountWithStatus(TestStatus status) const;
};

const char* ToString(TestStatus status);
const char* ToString(OverallResult result);
const char* ToString(LogLevel level);
const char* ToString(LogCategory category);

/// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
std::string FormatIsoTimestamp(WallClock::time_point tp);

/// Local wall-clock time of day, HH:MM:SS.mmm
std::string FormatTimeOfDay(WallClock::time_point tp);

} // namespace qcseq
