#pragma once

/**
 * @file sequencer.h
 * @brief QC test battery state machine.
 *
 * Runs one test at a time against a connected device: encode and write the
 * command, then wait for either a response or the test's deadline. Both
 * completion sources are observed by a single loop reading the event inbox,
 * so at most one of them settles each test.
 */

#include "qcseq/connection_manager.h"
#include "qcseq/event_inbox.h"
#include "qcseq/event_router.h"
#include "qcseq/result_aggregator.h"
#include "qcseq/session.h"
#include "qcseq/test_catalog.h"
#include "qcseq/transport/adapter.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace qcseq {

struct SequencerConfig {
    /// Pause after the link is up before the first test
    std::chrono::milliseconds startDelay{1000};
    /// Pause between tests while stray notifications are drained
    std::chrono::milliseconds settleDelay{1000};
    EventInboxConfig inbox{};
    std::string operatorName;
};

enum class SequencerState : uint8_t {
    Idle = 0,
    Connecting,
    Armed,
    AwaitingResponse,
    Advancing,
    Completed,
    Aborted,
};

struct RunResult {
    FinishedSession finished;
    ConnectionError error{ConnectionError::None};  ///< Fatal connection-phase error, if any
    std::string errorMessage;                      ///< User-visible reason for an abort
    bool aborted{false};
};

class TestSequencer {
public:
    using LogObserver = std::function<void(const LogEntry&)>;
    using ProgressObserver = std::function<void(std::size_t completed, std::size_t total)>;

    TestSequencer(GattTransport& transport, TestCatalog catalog, SequencerConfig config = {});
    ~TestSequencer();

    TestSequencer(const TestSequencer&) = delete;
    TestSequencer& operator=(const TestSequencer&) = delete;

    /**
     * @brief Connect, run every test in catalog order and finalize the session.
     *
     * Blocks the calling thread for the whole run. Not reentrant.
     *
     * @param selector Device to open
     * @return Finished session plus the fatal error when the run was aborted
     */
    RunResult Run(const DeviceSelector& selector);

    /// Thread-safe. Aborts the current run at the next suspension point, or the next run if none is active.
    void Stop();

    /// Called for every audit log entry as it is appended (loop thread).
    void SetLogObserver(LogObserver observer) { m_logObserver = std::move(observer); }

    /// Called after each test concludes (loop thread).
    void SetProgressObserver(ProgressObserver observer) { m_progressObserver = std::move(observer); }

    SequencerState State() const { return m_state.load(); }

    /// Index of the test currently Running, if any. Thread-safe.
    std::optional<std::size_t> RunningTest() const;

    const TestCatalog& Catalog() const { return m_catalog; }

    const EventRouter& Router() const { return m_router; }

private:
    static constexpr std::size_t kNoTest = std::numeric_limits<std::size_t>::max();

    enum class Step : uint8_t {
        Continue,
        Interrupted,
    };

    RunResult Abort(ConnectionError error, const std::string& message);
    RunResult Complete();

    Step ExecuteTest(std::size_t index, const Endpoints& endpoints);
    Step DrainFor(std::chrono::milliseconds duration, const char* previousTest);
    Step HandleStrayEvent(const InboxEvent& event, const std::optional<std::string>& testName);

    /// Atomically take ownership of settling test index. True for exactly one caller.
    bool ClaimTest(std::size_t index);
    /// Conclude test index if this caller wins ClaimTest().
    void Settle(std::size_t index, TestStatus status, uint64_t elapsedMs, std::string details,
                std::optional<std::string> response = std::nullopt);
    void Interrupt(std::size_t index, const std::string& reason, uint64_t elapsedMs);

    void SetState(SequencerState state) { m_state.store(state); }
    void Log(LogLevel level, LogCategory category, std::string message,
             std::optional<std::string> rawData = std::nullopt,
             std::optional<std::string> testName = std::nullopt);

    static uint64_t ElapsedMs(std::chrono::steady_clock::time_point from,
                              std::chrono::steady_clock::time_point to);

    GattTransport& m_transport;
    TestCatalog m_catalog;
    SequencerConfig m_config;

    EventInbox<InboxEvent> m_inbox;
    EventRouter m_router;
    ConnectionManager m_connection;
    ResultAggregator m_aggregator;

    Session m_session;
    std::atomic<SequencerState> m_state{SequencerState::Idle};
    std::atomic<std::size_t> m_runningIndex{kNoTest};
    std::atomic<bool> m_stopRequested{false};
    std::optional<std::chrono::steady_clock::time_point> m_armedDeadline;
    ConnectionError m_interruptError{ConnectionError::None};
    std::string m_interruptReason;

    LogObserver m_logObserver;
    ProgressObserver m_progressObserver;
};

const char* ToString(SequencerState state);

} // namespace qcseq
