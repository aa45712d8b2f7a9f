#include "doctest.h"

#include "qcseq/command_codec.h"
#include "qcseq/connection_manager.h"
#include "qcseq/result_aggregator.h"
#include "qcseq/result_store.h"
#include "qcseq/sequencer.h"
#include "qcseq/test_catalog.h"
#include "qcseq/transport/scripted_transport.h"

#include <ArduinoJson.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

qcseq::SequencerConfig FastConfig() {
    qcseq::SequencerConfig config;
    config.startDelay = 0ms;
    config.settleDelay = 10ms;
    config.operatorName = "line-3";
    return config;
}

/// Default battery with every timeout replaced.
qcseq::TestCatalog ShortCatalog(uint32_t timeoutMs) {
    qcseq::TestCatalog catalog = qcseq::DefaultQaCatalog();
    for (auto& test : catalog.tests) {
        test.timeoutMs = timeoutMs;
    }
    return catalog;
}

std::vector<qcseq::TestStatus> Statuses(const qcseq::FinishedSession& finished) {
    std::vector<qcseq::TestStatus> statuses;
    for (const auto& outcome : finished.outcomes) {
        statuses.push_back(outcome.status);
    }
    return statuses;
}

bool LogContains(const qcseq::FinishedSession& finished, const std::string& fragment) {
    for (const auto& entry : finished.log) {
        if (entry.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

class FailingStore : public qcseq::ResultStore {
public:
    qcseq::PersistResult Persist(const qcseq::FinishedSession&) override {
        ++calls;
        qcseq::PersistResult result;
        result.message = "database unavailable";
        return result;
    }
    int calls{0};
};

class RecordingStore : public qcseq::ResultStore {
public:
    qcseq::PersistResult Persist(const qcseq::FinishedSession& finished) override {
        document = qcseq::ToJson(finished);
        qcseq::PersistResult result;
        result.ok = true;
        result.location = "memory";
        return result;
    }
    std::string document;
};

using qcseq::TestStatus;

} // namespace

// ============================================================================
// Connection manager
// ============================================================================

TEST_CASE("ConnectionManager: Full connection sequence emits log events") {
    qcseq::ScriptedTransport transport;
    std::vector<std::string> messages;
    qcseq::ConnectionManager manager(transport, [&](qcseq::LogLevel, qcseq::LogCategory category,
                                                    const std::string& message, const std::optional<std::string>&) {
        CHECK(category == qcseq::LogCategory::Connection);
        messages.push_back(message);
    });

    const qcseq::ConnectResult connected = manager.Connect({});
    REQUIRE(connected.connection.has_value());
    CHECK(connected.connection->device.id == "00:11:22:33:44:55");
    CHECK(manager.IsOpen());

    const qcseq::EndpointsResult resolved = manager.ResolveEndpoints(
        *connected.connection, qcseq::kQaServiceUuid, qcseq::kQaControlCharUuid, qcseq::kQaEventCharUuid);
    REQUIRE(resolved.endpoints.has_value());
    CHECK(resolved.endpoints->control == qcseq::ScriptedTransport::kControlHandle);
    CHECK(resolved.endpoints->event == qcseq::ScriptedTransport::kEventHandle);

    CHECK(manager.EnableNotifications(*resolved.endpoints) == qcseq::ConnectionError::None);
    CHECK(messages.size() >= 4);
}

TEST_CASE("ConnectionManager: Disconnect is idempotent and always runs the teardown hook") {
    qcseq::ScriptedTransport transport;
    qcseq::ConnectionManager manager(transport);
    int hookCalls = 0;
    manager.SetTeardownHook([&] { ++hookCalls; });

    manager.Disconnect();
    CHECK(hookCalls == 1);
    CHECK(transport.DisconnectCount() == 0);

    REQUIRE(manager.Connect({}).connection.has_value());
    manager.Disconnect();
    manager.Disconnect();
    CHECK(hookCalls == 3);
    CHECK(transport.DisconnectCount() == 1);
    CHECK_FALSE(manager.IsOpen());
    CHECK_FALSE(transport.IsConnected());
}

TEST_CASE("ConnectionManager: Lookup failures are classified") {
    qcseq::ScriptedTransport transport;
    qcseq::ConnectionManager manager(transport);
    const qcseq::ConnectResult connected = manager.Connect({});
    REQUIRE(connected.connection.has_value());

    const auto noService = manager.ResolveEndpoints(*connected.connection, "missing-service",
                                                    qcseq::kQaControlCharUuid, qcseq::kQaEventCharUuid);
    CHECK(noService.error == qcseq::ConnectionError::ServiceNotFound);

    const auto noChar = manager.ResolveEndpoints(*connected.connection, qcseq::kQaServiceUuid,
                                                 qcseq::kQaControlCharUuid, "missing-char");
    CHECK(noChar.error == qcseq::ConnectionError::CharacteristicNotFound);
}

// ============================================================================
// Test sequencer
// ============================================================================

TEST_CASE("TestSequencer: Always-responding device passes every test") {
    qcseq::ScriptedTransport transport;
    const qcseq::TestCatalog catalog = ShortCatalog(500);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());

    std::size_t observed = 0;
    std::vector<std::size_t> progress;
    sequencer.SetLogObserver([&](const qcseq::LogEntry&) { ++observed; });
    sequencer.SetProgressObserver([&](std::size_t completed, std::size_t total) {
        CHECK(total == 5);
        progress.push_back(completed);
    });

    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    CHECK_FALSE(result.aborted);
    CHECK(finished.completed);
    CHECK(finished.overallResult == qcseq::OverallResult::Pass);
    CHECK(Statuses(finished) == std::vector<TestStatus>(5, TestStatus::Pass));
    CHECK(sequencer.State() == qcseq::SequencerState::Completed);
    CHECK(progress == std::vector<std::size_t>({1, 2, 3, 4, 5}));
    CHECK(observed == finished.log.size());

    const std::vector<std::string> written = transport.WrittenCommands();
    REQUIRE(written.size() == 5);
    for (std::size_t i = 0; i < written.size(); ++i) {
        const auto& outcome = finished.outcomes[i];
        CHECK(written[i] == qcseq::EncodeCommand(catalog.tests[i].commandId, catalog.tests[i].payload));
        CHECK(outcome.commandSent == written[i]);
        CHECK(outcome.responsePayload == std::optional<std::string>("{\"status\":\"ok\"}"));
        CHECK(outcome.durationMs < 500);
        REQUIRE(outcome.startedAt.has_value());
        REQUIRE(outcome.completedAt.has_value());
        CHECK(*outcome.startedAt <= *outcome.completedAt);
    }

    CHECK(finished.device.name == "QA-Device");
    CHECK(finished.operatorName == "line-3");
    CHECK(finished.connection.notificationsEnabled);
    CHECK(finished.connection.serviceUuid == qcseq::kQaServiceUuid);
    CHECK_FALSE(transport.IsConnected());
    CHECK(transport.DisconnectCount() == 1);
}

TEST_CASE("TestSequencer: Silent device times out every test") {
    qcseq::ScriptedTransport transport;
    transport.SetDefaultReply(qcseq::ScriptedReply::Silent());
    qcseq::TestSequencer sequencer(transport, ShortCatalog(80), FastConfig());

    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    CHECK_FALSE(result.aborted);
    CHECK(finished.overallResult == qcseq::OverallResult::Fail);
    CHECK(Statuses(finished) == std::vector<TestStatus>(5, TestStatus::Timeout));
    for (const auto& outcome : finished.outcomes) {
        CHECK(outcome.durationMs >= 80);
        CHECK(outcome.durationMs < 400);
        CHECK(outcome.details.find("Timeout") != std::string::npos);
        CHECK_FALSE(outcome.responsePayload.has_value());
    }
    CHECK(finished.summary.timedOut == 5);
}

TEST_CASE("TestSequencer: One silent test fails the battery") {
    qcseq::ScriptedTransport transport;
    transport.Script("qa_mic_lr_test", qcseq::ScriptedReply::Silent());
    qcseq::TestSequencer sequencer(transport, ShortCatalog(150), FastConfig());

    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    CHECK(Statuses(finished) == std::vector<TestStatus>({TestStatus::Pass, TestStatus::Pass, TestStatus::Timeout,
                                                        TestStatus::Pass, TestStatus::Pass}));
    CHECK(finished.overallResult == qcseq::OverallResult::Fail);

    JsonDocument doc;
    REQUIRE(deserializeJson(doc, qcseq::ToJson(finished)) == DeserializationError::Ok);
    CHECK(std::string(doc["overall_result"] | "") == "fail");
    CHECK(doc["tests_passed"].as<int>() == 4);
    CHECK(doc["tests_failed"].as<int>() == 1);
    CHECK(doc["tests_total"].as<int>() == 5);
    CHECK(std::string(doc["test_results"][2]["status"] | "") == "timeout");
    CHECK(doc["test_results"][2]["response_received"].isNull());
}

TEST_CASE("TestSequencer: Response after the timeout never changes the outcome") {
    qcseq::ScriptedTransport transport;
    qcseq::TestCatalog catalog;
    catalog.tests = {
        {"Slow", "qa_slow", {}, 50},
        {"Next", "qa_next", {}, 1000},
    };
    transport.Script("qa_slow", qcseq::ScriptedReply::Respond("{\"status\":\"late\"}", 120ms));
    transport.Script("qa_next", qcseq::ScriptedReply::Respond("{\"status\":\"next\"}", 20ms));

    qcseq::SequencerConfig config = FastConfig();
    config.settleDelay = 250ms;
    qcseq::TestSequencer sequencer(transport, catalog, config);

    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    REQUIRE(finished.outcomes.size() == 2);
    CHECK(finished.outcomes[0].status == TestStatus::Timeout);
    CHECK_FALSE(finished.outcomes[0].responsePayload.has_value());
    CHECK(finished.outcomes[1].status == TestStatus::Pass);
    CHECK(finished.outcomes[1].responsePayload == std::optional<std::string>("{\"status\":\"next\"}"));
    CHECK(LogContains(finished, "Late notification discarded"));
}

TEST_CASE("TestSequencer: Undecodable notification does not settle a test") {
    qcseq::ScriptedTransport transport;
    transport.Script("qa_audio_play", qcseq::ScriptedReply::Respond("{\"status\":", 5ms));
    qcseq::TestCatalog catalog = ShortCatalog(100);
    catalog.tests.resize(1);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());

    const qcseq::RunResult result = sequencer.Run({});
    REQUIRE(result.finished.outcomes.size() == 1);
    CHECK(result.finished.outcomes[0].status == TestStatus::Timeout);
    CHECK(sequencer.Router().DecodeErrorCount() == 1);
    CHECK(LogContains(result.finished, "Undecodable notification"));
}

TEST_CASE("TestSequencer: Write failure fails only that test") {
    qcseq::ScriptedTransport transport;
    transport.Script("qa_mic_sensitivity_test", qcseq::ScriptedReply::FailWrite());
    qcseq::TestSequencer sequencer(transport, ShortCatalog(300), FastConfig());

    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    CHECK_FALSE(result.aborted);
    CHECK(finished.completed);
    CHECK(Statuses(finished) == std::vector<TestStatus>({TestStatus::Pass, TestStatus::Fail, TestStatus::Pass,
                                                        TestStatus::Pass, TestStatus::Pass}));
    CHECK(finished.outcomes[1].details == "Failed to send command");
    CHECK(finished.overallResult == qcseq::OverallResult::Fail);
}

TEST_CASE("TestSequencer: Link loss mid-run leaves later tests pending") {
    qcseq::ScriptedTransport transport;
    transport.Script("qa_mic_lr_test", qcseq::ScriptedReply::DropLink("supervision timeout", 10ms));
    qcseq::TestSequencer sequencer(transport, ShortCatalog(1000), FastConfig());

    const auto start = std::chrono::steady_clock::now();
    const qcseq::RunResult result = sequencer.Run({});
    const qcseq::FinishedSession& finished = result.finished;

    CHECK(std::chrono::steady_clock::now() - start < 900ms);
    CHECK(result.aborted);
    CHECK(result.error == qcseq::ConnectionError::ConnectError);
    CHECK(result.errorMessage.find("supervision timeout") != std::string::npos);
    CHECK(sequencer.State() == qcseq::SequencerState::Aborted);
    CHECK(Statuses(finished) == std::vector<TestStatus>({TestStatus::Pass, TestStatus::Pass, TestStatus::Running,
                                                        TestStatus::Pending, TestStatus::Pending}));
    CHECK(finished.outcomes[2].details.find("Interrupted") != std::string::npos);
    CHECK_FALSE(finished.outcomes[2].completedAt.has_value());
    CHECK(finished.overallResult == qcseq::OverallResult::Pending);
    CHECK_FALSE(finished.completed);
    CHECK(finished.summary.pending == 2);
    CHECK(finished.summary.interrupted == 1);
    CHECK(finished.summary.FailedOrTimedOut() == 0);
    CHECK_FALSE(transport.IsConnected());
}

TEST_CASE("TestSequencer: Stop interrupts the running test") {
    qcseq::ScriptedTransport transport;
    transport.SetDefaultReply(qcseq::ScriptedReply::Silent());
    qcseq::TestSequencer sequencer(transport, ShortCatalog(5000), FastConfig());

    std::thread stopper([&] {
        std::this_thread::sleep_for(100ms);
        sequencer.Stop();
    });
    const auto start = std::chrono::steady_clock::now();
    const qcseq::RunResult result = sequencer.Run({});
    stopper.join();

    CHECK(std::chrono::steady_clock::now() - start < 2s);
    CHECK(result.aborted);
    CHECK(result.error == qcseq::ConnectionError::None);
    CHECK(result.finished.outcomes[0].status == TestStatus::Running);
    CHECK(result.finished.outcomes[0].details == "Interrupted: Run stopped by operator");
    for (std::size_t i = 1; i < result.finished.outcomes.size(); ++i) {
        CHECK(result.finished.outcomes[i].status == TestStatus::Pending);
    }
    CHECK(result.finished.overallResult == qcseq::OverallResult::Pending);
    CHECK_FALSE(transport.IsConnected());
}

TEST_CASE("TestSequencer: Stop during the last test reads as aborted, not failed") {
    qcseq::ScriptedTransport transport;
    transport.SetDefaultReply(qcseq::ScriptedReply::Silent());
    qcseq::TestCatalog catalog = ShortCatalog(5000);
    catalog.tests.resize(1);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());

    std::thread stopper([&] {
        std::this_thread::sleep_for(100ms);
        sequencer.Stop();
    });
    const qcseq::RunResult result = sequencer.Run({});
    stopper.join();
    const qcseq::FinishedSession& finished = result.finished;

    CHECK(result.aborted);
    CHECK_FALSE(finished.completed);
    CHECK(Statuses(finished) == std::vector<TestStatus>({TestStatus::Running}));
    CHECK(finished.overallResult == qcseq::OverallResult::Pending);
    CHECK(finished.summary.Unfinished() == 1);
    CHECK(finished.summary.FailedOrTimedOut() == 0);
    CHECK(LogContains(finished, "1 interrupted"));

    JsonDocument doc;
    REQUIRE(deserializeJson(doc, qcseq::ToJson(finished)) == DeserializationError::Ok);
    CHECK(std::string(doc["overall_result"] | "") == "pending");
    CHECK(std::string(doc["test_results"][0]["status"] | "") == "running");
    CHECK(doc["tests_failed"].as<int>() == 0);
}

TEST_CASE("TestSequencer: Stop before the run starts is honoured") {
    qcseq::ScriptedTransport transport;
    qcseq::TestSequencer sequencer(transport, ShortCatalog(500), FastConfig());

    sequencer.Stop();
    const qcseq::RunResult stopped = sequencer.Run({});
    CHECK(stopped.aborted);
    CHECK(stopped.errorMessage == "Run stopped by operator");
    CHECK(transport.WrittenCommands().empty());
    CHECK_FALSE(transport.IsConnected());

    const qcseq::RunResult next = sequencer.Run({});
    CHECK_FALSE(next.aborted);
    CHECK(next.finished.overallResult == qcseq::OverallResult::Pass);
}

TEST_CASE("ScriptedTransport: Clearing a handler waits for a running notification") {
    qcseq::ScriptedTransport transport;
    REQUIRE(transport.Connect({}).status == qcseq::LinkStatus::Ok);
    REQUIRE(transport.StartNotifications(qcseq::ScriptedTransport::kEventHandle));

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    transport.SetNotificationHandler([&](qcseq::CharacteristicHandle, const uint8_t*, std::size_t) {
        entered = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });
    transport.InjectNotification("{\"status\":\"ok\"}");

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(entered);

    transport.SetNotificationHandler({});
    CHECK(finished);
    transport.Disconnect();
}

TEST_CASE("TestSequencer: Connection-phase failures abort before any test") {
    qcseq::ScriptedDeviceConfig device;
    qcseq::TestCatalog catalog = ShortCatalog(100);
    qcseq::DeviceSelector selector;
    qcseq::ConnectionError expected = qcseq::ConnectionError::None;

    SUBCASE("device not found") {
        device.discoverable = false;
        expected = qcseq::ConnectionError::DeviceNotFound;
    }
    SUBCASE("connect refused") {
        device.connectFails = true;
        expected = qcseq::ConnectionError::ConnectError;
    }
    SUBCASE("service missing") {
        selector.serviceUuid = qcseq::kQaServiceUuid;
        catalog.serviceUuid = "0000ffff-0000-1000-8000-00805f9b34fb";
        expected = qcseq::ConnectionError::ServiceNotFound;
    }
    SUBCASE("event characteristic missing") {
        catalog.eventCharUuid = "0000eeee-0000-1000-8000-00805f9b34fb";
        expected = qcseq::ConnectionError::CharacteristicNotFound;
    }
    SUBCASE("notifications refused") {
        device.notificationsFail = true;
        expected = qcseq::ConnectionError::NotificationEnableError;
    }

    qcseq::ScriptedTransport transport(device);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());
    const qcseq::RunResult result = sequencer.Run(selector);

    CHECK(result.aborted);
    CHECK(result.error == expected);
    CHECK_FALSE(result.errorMessage.empty());
    CHECK(result.finished.overallResult == qcseq::OverallResult::Pending);
    CHECK(Statuses(result.finished) == std::vector<TestStatus>(5, TestStatus::Pending));
    CHECK(transport.WrittenCommands().empty());
    CHECK_FALSE(transport.IsConnected());
    CHECK(LogContains(result.finished, "Run aborted"));
}

TEST_CASE("TestSequencer: Sequencer can run a second battery") {
    qcseq::ScriptedTransport transport;
    qcseq::TestCatalog catalog = ShortCatalog(200);
    catalog.tests.resize(2);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());

    const qcseq::RunResult first = sequencer.Run({});
    const qcseq::RunResult second = sequencer.Run({});
    CHECK(first.finished.overallResult == qcseq::OverallResult::Pass);
    CHECK(second.finished.overallResult == qcseq::OverallResult::Pass);
    CHECK(second.finished.outcomes.size() == 2);
    CHECK(transport.WrittenCommands().size() == 4);
}

// ============================================================================
// Result aggregator
// ============================================================================

TEST_CASE("ResultAggregator: Verdict rules") {
    std::vector<qcseq::TestOutcome> outcomes(3);
    CHECK(qcseq::ResultAggregator::ComputeVerdict(outcomes, false) == qcseq::OverallResult::Pending);

    for (auto& outcome : outcomes) {
        outcome.status = TestStatus::Pass;
    }
    CHECK(qcseq::ResultAggregator::ComputeVerdict(outcomes, true) == qcseq::OverallResult::Pass);

    outcomes[1].status = TestStatus::Timeout;
    CHECK(qcseq::ResultAggregator::ComputeVerdict(outcomes, true) == qcseq::OverallResult::Fail);

    outcomes[1].status = TestStatus::Running;
    outcomes[2].status = TestStatus::Pending;
    CHECK(qcseq::ResultAggregator::ComputeVerdict(outcomes, false) == qcseq::OverallResult::Pending);
    CHECK(qcseq::ResultAggregator::Summarize(outcomes).Unfinished() == 2);

    outcomes[1].status = TestStatus::Fail;
    CHECK(qcseq::ResultAggregator::ComputeVerdict(outcomes, false) == qcseq::OverallResult::Fail);

    const qcseq::RunSummary summary = qcseq::ResultAggregator::Summarize(outcomes);
    CHECK(summary.passed == 1);
    CHECK(summary.failed == 1);
    CHECK(summary.pending == 1);
}

TEST_CASE("ResultAggregator: Finalize appends the summary and measures duration") {
    qcseq::Session session;
    session.startedAt = qcseq::WallClock::now();
    session.outcomes.resize(2);
    session.outcomes[0].testName = "A";
    session.outcomes[0].status = TestStatus::Pass;
    session.outcomes[1].testName = "B";
    session.outcomes[1].status = TestStatus::Timeout;

    qcseq::ResultAggregator aggregator;
    const qcseq::FinishedSession finished =
        aggregator.Finalize(session, true, session.startedAt + std::chrono::milliseconds(1234));

    CHECK(finished.overallResult == qcseq::OverallResult::Fail);
    CHECK(finished.totalDurationMs == 1234);
    CHECK(finished.summary.FailedOrTimedOut() == 1);
    REQUIRE_FALSE(finished.log.empty());
    CHECK(finished.log.back().category == qcseq::LogCategory::TestResult);
    CHECK(finished.log.back().message.find("1/2 passed") != std::string::npos);
}

TEST_CASE("ResultAggregator: Persist failure leaves the verdict unchanged") {
    qcseq::ScriptedTransport transport;
    qcseq::TestCatalog catalog = ShortCatalog(200);
    catalog.tests.resize(2);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());
    const qcseq::RunResult result = sequencer.Run({});
    REQUIRE(result.finished.overallResult == qcseq::OverallResult::Pass);

    qcseq::ResultAggregator aggregator;
    FailingStore store;
    const qcseq::PersistResult persisted = aggregator.Persist(result.finished, store);
    CHECK_FALSE(persisted.ok);
    CHECK(persisted.message == "database unavailable");
    CHECK(store.calls == 1);
    CHECK(result.finished.overallResult == qcseq::OverallResult::Pass);
}

TEST_CASE("ResultAggregator: Hand-off document carries the full schema") {
    qcseq::ScriptedTransport transport;
    qcseq::TestCatalog catalog = ShortCatalog(200);
    catalog.tests.resize(1);
    qcseq::TestSequencer sequencer(transport, catalog, FastConfig());
    const qcseq::RunResult result = sequencer.Run({});

    RecordingStore store;
    REQUIRE(qcseq::ResultAggregator().Persist(result.finished, store).ok);

    JsonDocument doc;
    REQUIRE(deserializeJson(doc, store.document) == DeserializationError::Ok);
    CHECK(std::string(doc["device_info"]["name"] | "") == "QA-Device");
    CHECK(std::string(doc["device_info"]["id"] | "") == "00:11:22:33:44:55");
    CHECK(std::string(doc["overall_result"] | "") == "pass");
    CHECK(std::string(doc["operator"] | "") == "line-3");
    CHECK(doc["test_date"].is<const char*>());
    CHECK(doc["test_duration_ms"].is<uint64_t>());
    CHECK(doc["connection_info"]["notifications_enabled"].as<bool>());

    JsonObjectConst outcome = doc["test_results"][0];
    CHECK(std::string(outcome["test_name"] | "") == "Audio Test");
    CHECK(std::string(outcome["status"] | "") == "pass");
    CHECK(std::string(outcome["response_received"] | "") == "{\"status\":\"ok\"}");
    CHECK(outcome["started_at"].is<const char*>());
    CHECK(outcome["completed_at"].is<const char*>());

    JsonArrayConst logs = doc["detailed_logs"];
    REQUIRE(logs.size() == result.finished.log.size());
    CHECK(logs[0]["timestamp"].is<const char*>());
    CHECK(logs[0]["log_type"].is<const char*>());
    CHECK(logs[0]["category"].is<const char*>());
}

TEST_CASE("JsonFileResultStore: Writes one document per session") {
    qcseq::Session session;
    session.device = {"QA-Device", "AA:BB"};
    session.startedAt = qcseq::WallClock::now();
    const qcseq::FinishedSession finished = qcseq::ResultAggregator().Finalize(session, true);

    qcseq::JsonFileResultStore store(".");
    const qcseq::PersistResult persisted = store.Persist(finished);
    REQUIRE(persisted.ok);
    CHECK(persisted.location.find("qc_AA-BB_") != std::string::npos);

    std::ifstream file(persisted.location);
    REQUIRE(file.good());
    std::stringstream contents;
    contents << file.rdbuf();
    file.close();
    std::remove(persisted.location.c_str());

    JsonDocument doc;
    REQUIRE(deserializeJson(doc, contents.str()) == DeserializationError::Ok);
    CHECK(std::string(doc["overall_result"] | "") == "pass");

    qcseq::JsonFileResultStore missing("/nonexistent/qcseq");
    CHECK_FALSE(missing.Persist(finished).ok);
}
