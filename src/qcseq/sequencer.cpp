/**
 * @file sequencer.cpp
 * @brief Implementation of the QC test battery state machine.
 *
 * All session mutation happens on the thread that called Run(). Transport
 * threads only post InboxEvents (through the EventRouter), and the running
 * test is settled through ClaimTest(), which clears the running index with a
 * single compare-and-swap.
 */

#include "qcseq/sequencer.h"

#include "qcseq/command_codec.h"

namespace qcseq {

TestSequencer::TestSequencer(GattTransport& transport, TestCatalog catalog, SequencerConfig config)
    : m_transport(transport),
      m_catalog(std::move(catalog)),
      m_config(std::move(config)),
      m_inbox(m_config.inbox),
      m_router(m_inbox, [this] { return RunningTest(); }),
      m_connection(transport) {
    m_connection.SetLogSink([this](LogLevel level, LogCategory category, const std::string& message,
                                   const std::optional<std::string>& rawData) {
        Log(level, category, message, rawData);
    });

    // Disconnect always drops the armed deadline before the link goes away
    m_connection.SetTeardownHook([this] {
        if (m_armedDeadline) {
            m_armedDeadline.reset();
            Log(LogLevel::Info, LogCategory::TestExecution, "Pending test timer cancelled");
        }
        m_runningIndex.store(kNoTest);
    });

    m_transport.SetNotificationHandler(
        [this](CharacteristicHandle characteristic, const uint8_t* data, std::size_t length) {
            m_router.OnNotification(characteristic, data, length);
        });
    m_transport.SetDisconnectHandler([this](const std::string& reason) { m_router.OnLinkLost(reason); });
}

TestSequencer::~TestSequencer() {
    m_transport.SetNotificationHandler({});
    m_transport.SetDisconnectHandler({});
}

RunResult TestSequencer::Run(const DeviceSelector& selector) {
    // A Stop() issued before this call still applies; the flag is cleared when a run ends
    m_inbox.Clear();
    m_runningIndex.store(kNoTest);
    m_armedDeadline.reset();
    m_interruptError = ConnectionError::None;
    m_interruptReason.clear();

    m_session = Session{};
    m_session.startedAt = WallClock::now();
    m_session.operatorName = m_config.operatorName;
    m_session.outcomes.reserve(m_catalog.tests.size());
    for (const auto& test : m_catalog.tests) {
        TestOutcome outcome;
        outcome.testName = test.name;
        m_session.outcomes.push_back(std::move(outcome));
    }

    std::string problem;
    if (ValidateCatalog(m_catalog, &problem) != CatalogError::None) {
        return Abort(ConnectionError::None, "Invalid test catalog: " + problem);
    }

    if (m_stopRequested.load()) {
        return Abort(ConnectionError::None, "Run stopped by operator");
    }

    // Connecting
    SetState(SequencerState::Connecting);
    Log(LogLevel::Info, LogCategory::Connection,
        "Starting QA run with " + std::to_string(m_catalog.tests.size()) + " tests",
        m_catalog.serviceUuid);

    DeviceSelector effective = selector;
    if (effective.serviceUuid.empty()) {
        effective.serviceUuid = m_catalog.serviceUuid;
    }

    const auto connectStart = std::chrono::steady_clock::now();
    const ConnectResult connected = m_connection.Connect(effective);
    if (!connected.connection) {
        return Abort(connected.error, connected.message);
    }
    m_session.device = connected.connection->device;
    if (m_stopRequested.load()) {
        return Abort(ConnectionError::None, "Run stopped by operator");
    }

    const EndpointsResult resolved = m_connection.ResolveEndpoints(
        *connected.connection, m_catalog.serviceUuid, m_catalog.controlCharUuid, m_catalog.eventCharUuid);
    if (!resolved.endpoints) {
        return Abort(resolved.error, resolved.message);
    }
    const Endpoints endpoints = *resolved.endpoints;
    m_router.SetEventCharacteristic(endpoints.event);

    const ConnectionError notifyError = m_connection.EnableNotifications(endpoints);
    if (notifyError != ConnectionError::None) {
        return Abort(notifyError, "Could not enable notifications on " + endpoints.eventUuid);
    }
    if (m_stopRequested.load()) {
        return Abort(ConnectionError::None, "Run stopped by operator");
    }

    m_session.connection.connectionTimeMs = ElapsedMs(connectStart, std::chrono::steady_clock::now());
    m_session.connection.serviceUuid = endpoints.serviceUuid;
    m_session.connection.controlCharUuid = endpoints.controlUuid;
    m_session.connection.eventCharUuid = endpoints.eventUuid;
    m_session.connection.notificationsEnabled = true;
    Log(LogLevel::Success, LogCategory::Connection,
        "Connection established (" + std::to_string(m_session.connection.connectionTimeMs) + " ms)");

    if (m_config.startDelay.count() > 0) {
        Log(LogLevel::Info, LogCategory::TestExecution,
            "Starting test sequence in " + std::to_string(m_config.startDelay.count()) + " ms");
        if (DrainFor(m_config.startDelay, nullptr) == Step::Interrupted) {
            return Abort(m_interruptError, m_interruptReason);
        }
    }

    const std::size_t total = m_catalog.tests.size();
    for (std::size_t i = 0; i < total; ++i) {
        if (m_stopRequested.load()) {
            return Abort(ConnectionError::None, "Run stopped by operator");
        }

        if (ExecuteTest(i, endpoints) == Step::Interrupted) {
            return Abort(m_interruptError, m_interruptReason);
        }

        if (m_progressObserver) {
            m_progressObserver(i + 1, total);
        }

        if (i + 1 < total && m_config.settleDelay.count() > 0) {
            if (DrainFor(m_config.settleDelay, m_catalog.tests[i].name.c_str()) == Step::Interrupted) {
                return Abort(m_interruptError, m_interruptReason);
            }
        }
    }

    return Complete();
}

void TestSequencer::Stop() {
    m_stopRequested.store(true);
    m_router.RequestStop();
}

std::optional<std::size_t> TestSequencer::RunningTest() const {
    const std::size_t index = m_runningIndex.load();
    if (index == kNoTest) {
        return std::nullopt;
    }
    return index;
}

/**
 * @brief Arm, send and await one test.
 *
 * Armed(i) -> AwaitingResponse(i) -> Advancing(i). A write failure goes
 * straight to Advancing(i) with the outcome marked Fail.
 *
 * @return Step::Interrupted if the run must abort
 */
TestSequencer::Step TestSequencer::ExecuteTest(std::size_t index, const Endpoints& endpoints) {
    const TestDefinition& test = m_catalog.tests[index];
    TestOutcome& outcome = m_session.outcomes[index];
    const std::optional<std::string> name = test.name;

    SetState(SequencerState::Armed);
    Log(LogLevel::Info, LogCategory::TestExecution,
        "Starting test " + std::to_string(index + 1) + "/" + std::to_string(m_catalog.tests.size()) +
            ": " + test.name,
        std::nullopt, name);

    const std::string command = EncodeCommand(test.commandId, test.payload);
    Log(LogLevel::Info, LogCategory::TestExecution,
        "Command " + test.commandId + ", timeout " + std::to_string(test.timeoutMs) + " ms", command, name);

    const auto start = std::chrono::steady_clock::now();
    if (!outcome.MarkRunning(WallClock::now(), command)) {
        Log(LogLevel::Error, LogCategory::TestExecution, "Test was already started, skipping", std::nullopt, name);
        SetState(SequencerState::Advancing);
        return Step::Continue;
    }
    m_runningIndex.store(index);

    Log(LogLevel::Command, LogCategory::Command, "Sending command for " + test.name, command, name);
    // The write may not outlast the test's own deadline
    const bool written = m_transport.Write(endpoints.control, reinterpret_cast<const uint8_t*>(command.data()),
                                           command.size(), std::chrono::milliseconds(test.timeoutMs));
    if (!written) {
        Log(LogLevel::Error, LogCategory::Command, "Command write failed", command, name);
        Settle(index, TestStatus::Fail, ElapsedMs(start, std::chrono::steady_clock::now()),
               "Failed to send command");
        SetState(SequencerState::Advancing);
        return Step::Continue;
    }
    Log(LogLevel::Success, LogCategory::Command, "Command sent", std::nullopt, name);

    SetState(SequencerState::AwaitingResponse);
    m_armedDeadline = start + std::chrono::milliseconds(test.timeoutMs);
    Log(LogLevel::Info, LogCategory::TestExecution,
        "Waiting for response (timeout " + std::to_string(test.timeoutMs) + " ms)", std::nullopt, name);

    while (m_armedDeadline) {
        std::optional<InboxEvent> event = m_inbox.WaitPopUntil(*m_armedDeadline);

        if (!event) {
            m_armedDeadline.reset();
            Settle(index, TestStatus::Timeout, ElapsedMs(start, std::chrono::steady_clock::now()),
                   "Timeout - no response after " + std::to_string(test.timeoutMs) + " ms");
            break;
        }

        if (event->kind != InboxEventKind::Response) {
            if (HandleStrayEvent(*event, name) == Step::Interrupted) {
                Interrupt(index, m_interruptReason, ElapsedMs(start, std::chrono::steady_clock::now()));
                return Step::Interrupted;
            }
            continue;
        }

        Log(LogLevel::Response, LogCategory::Bluetooth, "Notification received", event->text, name);
        if (event->activeTest != index || !event->decoded) {
            Log(LogLevel::Warning, LogCategory::Bluetooth,
                "Notification belongs to no running test, discarded", event->text, name);
            continue;
        }

        m_armedDeadline.reset();
        Settle(index, TestStatus::Pass, ElapsedMs(start, event->decoded->arrival), "Response received",
               event->decoded->raw);
    }

    SetState(SequencerState::Advancing);
    return Step::Continue;
}

/**
 * @brief Consume inbox events for a fixed time without a running test.
 *
 * Late responses are logged and discarded; link loss or stop interrupts.
 */
TestSequencer::Step TestSequencer::DrainFor(std::chrono::milliseconds duration, const char* previousTest) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    const std::optional<std::string> name =
        previousTest ? std::optional<std::string>(previousTest) : std::nullopt;

    while (auto event = m_inbox.WaitPopUntil(deadline)) {
        if (HandleStrayEvent(*event, name) == Step::Interrupted) {
            return Step::Interrupted;
        }
    }
    return Step::Continue;
}

TestSequencer::Step TestSequencer::HandleStrayEvent(const InboxEvent& event,
                                                    const std::optional<std::string>& testName) {
    switch (event.kind) {
        case InboxEventKind::Response:
            Log(LogLevel::Warning, LogCategory::Bluetooth, "Late notification discarded, no test running",
                event.text, testName);
            return Step::Continue;

        case InboxEventKind::DecodeFailure:
            Log(LogLevel::Warning, LogCategory::Bluetooth,
                std::string("Undecodable notification ignored (") + ToString(event.codecError) + ")",
                event.text, testName);
            return Step::Continue;

        case InboxEventKind::ForeignCharacteristic:
            Log(LogLevel::Info, LogCategory::Bluetooth, "Notification on unexpected characteristic ignored",
                event.text, testName);
            return Step::Continue;

        case InboxEventKind::LinkLost:
            m_interruptError = ConnectionError::ConnectError;
            m_interruptReason = "Device disconnected unexpectedly: " + event.text;
            Log(LogLevel::Error, LogCategory::Connection, m_interruptReason, std::nullopt, testName);
            return Step::Interrupted;

        case InboxEventKind::StopRequested:
            m_interruptError = ConnectionError::None;
            m_interruptReason = "Run stopped by operator";
            Log(LogLevel::Warning, LogCategory::TestExecution, m_interruptReason, std::nullopt, testName);
            return Step::Interrupted;
    }
    return Step::Continue;
}

bool TestSequencer::ClaimTest(std::size_t index) {
    std::size_t expected = index;
    return m_runningIndex.compare_exchange_strong(expected, kNoTest);
}

void TestSequencer::Settle(std::size_t index, TestStatus status, uint64_t elapsedMs, std::string details,
                           std::optional<std::string> response) {
    if (!ClaimTest(index)) {
        return;
    }

    TestOutcome& outcome = m_session.outcomes[index];
    const std::optional<std::string> name = outcome.testName;
    if (!outcome.Conclude(status, WallClock::now(), elapsedMs, details, response)) {
        Log(LogLevel::Error, LogCategory::TestResult,
            std::string("Outcome already final, ignoring ") + ToString(status), std::nullopt, name);
        return;
    }

    std::string upper = ToString(status);
    for (char& c : upper) {
        c = static_cast<char>(c - ('a' - 'A'));
    }
    Log(status == TestStatus::Pass ? LogLevel::Success : LogLevel::Error, LogCategory::TestResult,
        "Test " + outcome.testName + " completed: " + upper + " (" + std::to_string(elapsedMs) + " ms)",
        response ? response : std::optional<std::string>(details), name);
}

/**
 * @brief Leave the running test without a verdict.
 *
 * The outcome stays Running so an aborted run never reads like a device
 * failure. Only its details record the reason.
 */
void TestSequencer::Interrupt(std::size_t index, const std::string& reason, uint64_t elapsedMs) {
    m_armedDeadline.reset();
    if (!ClaimTest(index)) {
        return;
    }
    TestOutcome& outcome = m_session.outcomes[index];
    if (outcome.MarkInterrupted(reason)) {
        Log(LogLevel::Warning, LogCategory::TestResult,
            "Test " + outcome.testName + " interrupted after " + std::to_string(elapsedMs) + " ms",
            outcome.details, outcome.testName);
    }
}

RunResult TestSequencer::Abort(ConnectionError error, const std::string& message) {
    SetState(SequencerState::Aborted);
    Log(LogLevel::Error, LogCategory::TestExecution, "Run aborted: " + message);
    m_connection.Disconnect();
    m_stopRequested.store(false);

    RunResult result;
    result.aborted = true;
    result.error = error;
    result.errorMessage = message;
    result.finished = m_aggregator.Finalize(std::move(m_session), false);
    m_session = Session{};
    if (m_logObserver && !result.finished.log.empty()) {
        m_logObserver(result.finished.log.back());
    }
    return result;
}

RunResult TestSequencer::Complete() {
    SetState(SequencerState::Completed);
    m_connection.Disconnect();
    m_stopRequested.store(false);

    RunResult result;
    result.finished = m_aggregator.Finalize(std::move(m_session), true);
    m_session = Session{};
    if (m_logObserver && !result.finished.log.empty()) {
        m_logObserver(result.finished.log.back());
    }
    return result;
}

void TestSequencer::Log(LogLevel level, LogCategory category, std::string message,
                        std::optional<std::string> rawData, std::optional<std::string> testName) {
    const LogEntry& entry = m_session.Append(level, category, std::move(message), std::move(rawData),
                                             std::move(testName));
    if (m_logObserver) {
        m_logObserver(entry);
    }
}

uint64_t TestSequencer::ElapsedMs(std::chrono::steady_clock::time_point from,
                                  std::chrono::steady_clock::time_point to) {
    if (to <= from) {
        return 0;
    }
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

const char* ToString(SequencerState state) {
    switch (state) {
        case SequencerState::Idle: return "Idle";
        case SequencerState::Connecting: return "Connecting";
        case SequencerState::Armed: return "Armed";
        case SequencerState::AwaitingResponse: return "AwaitingResponse";
        case SequencerState::Advancing: return "Advancing";
        case SequencerState::Completed: return "Completed";
        case SequencerState::Aborted: return "Aborted";
    }
    return "Unknown";
}

} // namespace qcseq
