#pragma once

#include "qcseq/session.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qcseq {

struct RunSummary {
    std::size_t total{0};
    std::size_t passed{0};
    std::size_t failed{0};    ///< Fail only
    std::size_t timedOut{0};
    std::size_t pending{0};   ///< Not reached (aborted runs)
    std::size_t interrupted{0};  ///< Still Running when the run was aborted

    /// Tests without a verdict: not reached or cut short.
    std::size_t Unfinished() const { return pending + interrupted; }

    /// Count reported as tests_failed: Fail plus Timeout.
    std::size_t FailedOrTimedOut() const { return failed + timedOut; }
};

/**
 * @brief Immutable record handed to the result store.
 */
struct FinishedSession {
    DeviceIdentity device;
    ConnectionInfo connection;
    std::vector<TestOutcome> outcomes;
    std::vector<LogEntry> log;
    OverallResult overallResult{OverallResult::Pending};
    WallClock::time_point startedAt{};
    uint64_t totalDurationMs{0};
    std::string operatorName;
    RunSummary summary;
    bool completed{false};  ///< false when the run was aborted early
};

struct PersistResult {
    bool ok{false};
    std::string message;   ///< Error text on failure
    std::string location;  ///< Store-specific record id or path on success
};

/**
 * @brief External collaborator that keeps finished sessions.
 */
class ResultStore {
public:
    virtual ~ResultStore() = default;

    virtual PersistResult Persist(const FinishedSession& session) = 0;
};

/**
 * @brief Reduces a run into a verdict and hands it to a store.
 */
class ResultAggregator {
public:
    static RunSummary Summarize(const std::vector<TestOutcome>& outcomes);

    /**
     * @brief Fail if any outcome failed or timed out.
     *
     * Otherwise Pass for a completed run, Pending for an aborted one.
     */
    static OverallResult ComputeVerdict(const std::vector<TestOutcome>& outcomes, bool completed);

    /**
     * @brief Fix the verdict, append the summary log line and freeze the session.
     *
     * @param session Session taken by value from the sequencer
     * @param completed true if every test was reached
     * @param finishedAt End of the run, for the total duration
     */
    FinishedSession Finalize(Session session, bool completed,
                             WallClock::time_point finishedAt = WallClock::now()) const;

    /// Single persist call. Failure never alters the verdict.
    PersistResult Persist(const FinishedSession& finished, ResultStore& store) const;
};

/**
 * @brief Render the persistence hand-off document.
 *
 * Keys: device_info, overall_result, test_results[], detailed_logs[],
 * test_duration_ms, tests_passed, tests_failed, tests_total, test_date,
 * operator, connection_info.
 */
std::string ToJson(const FinishedSession& finished, bool pretty = false);

} // namespace qcseq
