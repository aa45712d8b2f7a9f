#include "qcseq/result_aggregator.h"

#include <ArduinoJson.h>

#include <iostream>

namespace qcseq {

RunSummary ResultAggregator::Summarize(const std::vector<TestOutcome>& outcomes) {
    RunSummary summary;
    summary.total = outcomes.size();
    for (const auto& outcome : outcomes) {
        switch (outcome.status) {
            case TestStatus::Pass: ++summary.passed; break;
            case TestStatus::Fail: ++summary.failed; break;
            case TestStatus::Timeout: ++summary.timedOut; break;
            case TestStatus::Pending: ++summary.pending; break;
            case TestStatus::Running: ++summary.interrupted; break;
        }
    }
    return summary;
}

OverallResult ResultAggregator::ComputeVerdict(const std::vector<TestOutcome>& outcomes, bool completed) {
    for (const auto& outcome : outcomes) {
        if (outcome.status == TestStatus::Fail || outcome.status == TestStatus::Timeout) {
            return OverallResult::Fail;
        }
    }
    return completed ? OverallResult::Pass : OverallResult::Pending;
}

FinishedSession ResultAggregator::Finalize(Session session, bool completed,
                                           WallClock::time_point finishedAt) const {
    const RunSummary summary = Summarize(session.outcomes);
    session.overallResult = ComputeVerdict(session.outcomes, completed);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - session.startedAt);
    const uint64_t totalMs = elapsed.count() > 0 ? static_cast<uint64_t>(elapsed.count()) : 0;

    std::string line = completed ? "Tests finished: " : "Run aborted: ";
    line += std::to_string(summary.passed) + "/" + std::to_string(summary.total) + " passed, " +
            std::to_string(summary.failed) + " failed, " + std::to_string(summary.timedOut) +
            " timed out, " + std::to_string(summary.pending) + " pending, " + std::to_string(summary.interrupted) +
            " interrupted (" +
            std::to_string(totalMs) + " ms), result " + ToString(session.overallResult);
    session.Append(session.overallResult == OverallResult::Pass ? LogLevel::Success : LogLevel::Error,
                   LogCategory::TestResult, std::move(line));

    FinishedSession finished;
    finished.device = std::move(session.device);
    finished.connection = std::move(session.connection);
    finished.outcomes = std::move(session.outcomes);
    finished.log = std::move(session.log);
    finished.overallResult = session.overallResult;
    finished.startedAt = session.startedAt;
    finished.totalDurationMs = totalMs;
    finished.operatorName = std::move(session.operatorName);
    finished.summary = summary;
    finished.completed = completed;
    return finished;
}

PersistResult ResultAggregator::Persist(const FinishedSession& finished, ResultStore& store) const {
    PersistResult result = store.Persist(finished);
    if (!result.ok) {
        std::cerr << "Result store error: " << result.message << std::endl;
    }
    return result;
}

namespace {

void SetOptionalTime(JsonObject target, const char* key, const std::optional<WallClock::time_point>& tp) {
    if (tp) {
        target[key] = FormatIsoTimestamp(*tp);
    } else {
        target[key] = nullptr;
    }
}

void SetOptionalText(JsonObject target, const char* key, const std::optional<std::string>& text) {
    if (text) {
        target[key] = *text;
    } else {
        target[key] = nullptr;
    }
}

} // namespace

std::string ToJson(const FinishedSession& finished, bool pretty) {
    JsonDocument doc;

    JsonObject device = doc["device_info"].to<JsonObject>();
    device["name"] = finished.device.name;
    device["id"] = finished.device.id;

    doc["overall_result"] = ToString(finished.overallResult);
    doc["test_date"] = FormatIsoTimestamp(finished.startedAt);
    doc["operator"] = finished.operatorName;
    doc["completed"] = finished.completed;

    JsonArray results = doc["test_results"].to<JsonArray>();
    for (const auto& outcome : finished.outcomes) {
        JsonObject entry = results.add<JsonObject>();
        entry["test_name"] = outcome.testName;
        entry["status"] = ToString(outcome.status);
        SetOptionalTime(entry, "started_at", outcome.startedAt);
        SetOptionalTime(entry, "completed_at", outcome.completedAt);
        entry["duration_ms"] = outcome.durationMs;
        entry["details"] = outcome.details;
        entry["command_sent"] = outcome.commandSent;
        SetOptionalText(entry, "response_received", outcome.responsePayload);
    }

    JsonArray logs = doc["detailed_logs"].to<JsonArray>();
    for (const auto& logEntry : finished.log) {
        JsonObject entry = logs.add<JsonObject>();
        entry["timestamp"] = FormatIsoTimestamp(logEntry.timestamp);
        entry["log_type"] = ToString(logEntry.level);
        entry["category"] = ToString(logEntry.category);
        entry["message"] = logEntry.message;
        SetOptionalText(entry, "raw_data", logEntry.rawData);
        SetOptionalText(entry, "test_name", logEntry.testName);
    }

    JsonObject connection = doc["connection_info"].to<JsonObject>();
    connection["connection_time_ms"] = finished.connection.connectionTimeMs;
    connection["service_uuid"] = finished.connection.serviceUuid;
    connection["control_characteristic_uuid"] = finished.connection.controlCharUuid;
    connection["event_characteristic_uuid"] = finished.connection.eventCharUuid;
    connection["notifications_enabled"] = finished.connection.notificationsEnabled;

    doc["test_duration_ms"] = finished.totalDurationMs;
    doc["tests_passed"] = finished.summary.passed;
    doc["tests_failed"] = finished.summary.FailedOrTimedOut();
    doc["tests_total"] = finished.summary.total;

    std::string out;
    if (pretty) {
        serializeJsonPretty(doc, out);
    } else {
        serializeJson(doc, out);
    }
    return out;
}

} // namespace qcseq
