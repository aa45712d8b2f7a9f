#include "qcseq/result_aggregator.h"
#include "qcseq/result_store.h"
#include "qcseq/sequencer.h"
#include "qcseq/test_catalog.h"
#include "qcseq/transport/scripted_transport.h"
#include "qcseq/transport/tcp_bridge.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_interrupted{false};

void SignalHandler(int) {
    g_interrupted = true;
}

struct RunnerOptions {
    bool simulate{false};
    qcseq::TcpBridgeConfig bridge;
    qcseq::DeviceSelector selector;
    std::string catalogPath;
    std::string outDir;
    std::string operatorName;
    std::chrono::milliseconds settleDelay{1000};
    std::chrono::milliseconds startDelay{1000};
    std::vector<std::string> silentCommands;
    bool help{false};
};

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --bridge HOST:PORT     GATT bridge address (default 127.0.0.1:8765)\n"
              << "  --simulate             Run against the built-in simulated device\n"
              << "  --name PREFIX          Device name prefix to scan for\n"
              << "  --id ID                Exact device id\n"
              << "  --catalog FILE         Test catalog JSON (default: built-in QA battery)\n"
              << "  --out DIR              Write the result JSON into DIR\n"
              << "  --operator NAME        Operator recorded in the result\n"
              << "  --settle-ms N          Pause between tests (default 1000)\n"
              << "  --start-delay-ms N     Pause before the first test (default 1000)\n"
              << "  --silent CMD           Simulated device ignores CMD (repeatable)\n"
              << "  --help                 Show this text\n";
}

/// Throws std::invalid_argument on bad input.
RunnerOptions ParseArgs(int argc, char** argv) {
    RunnerOptions options;
    const auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("missing value for ") + argv[i]);
        }
        return argv[++i];
    };
    const auto millis = [](const std::string& text) {
        const long parsed = std::stol(text);
        if (parsed < 0) {
            throw std::invalid_argument("negative duration: " + text);
        }
        return std::chrono::milliseconds(parsed);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--simulate") {
            options.simulate = true;
        } else if (arg == "--bridge") {
            const std::string address = value(i);
            const auto colon = address.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                throw std::invalid_argument("bridge address must be HOST:PORT");
            }
            const unsigned long port = std::stoul(address.substr(colon + 1));
            if (port == 0 || port > 65535) {
                throw std::invalid_argument("bridge port out of range");
            }
            options.bridge.host = address.substr(0, colon);
            options.bridge.port = static_cast<uint16_t>(port);
        } else if (arg == "--name") {
            options.selector.namePrefix = value(i);
        } else if (arg == "--id") {
            options.selector.deviceId = value(i);
        } else if (arg == "--catalog") {
            options.catalogPath = value(i);
        } else if (arg == "--out") {
            options.outDir = value(i);
        } else if (arg == "--operator") {
            options.operatorName = value(i);
        } else if (arg == "--settle-ms") {
            options.settleDelay = millis(value(i));
        } else if (arg == "--start-delay-ms") {
            options.startDelay = millis(value(i));
        } else if (arg == "--silent") {
            options.silentCommands.push_back(value(i));
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return options;
}

void EchoLogEntry(const qcseq::LogEntry& entry) {
    std::string level = qcseq::ToString(entry.level);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::cout << "[" << qcseq::FormatTimeOfDay(entry.timestamp) << "] [" << level << "] ["
              << qcseq::ToString(entry.category) << "] " << entry.message;
    if (entry.rawData) {
        std::cout << " | " << *entry.rawData;
    }
    std::cout << "\n";
}

void PrintSummary(const qcseq::FinishedSession& finished) {
    std::cout << "\n=== QC result for " << finished.device.name << " (" << finished.device.id << ") ===\n";
    for (const auto& outcome : finished.outcomes) {
        std::cout << "  " << outcome.testName << ": " << qcseq::ToString(outcome.status);
        if (outcome.IsTerminal()) {
            std::cout << " (" << outcome.durationMs << " ms)";
        }
        if (!outcome.details.empty()) {
            std::cout << " - " << outcome.details;
        }
        std::cout << "\n";
    }
    std::cout << "Overall: " << qcseq::ToString(finished.overallResult) << " ("
              << finished.summary.passed << "/" << finished.summary.total << " passed)\n";
}

} // namespace

int main(int argc, char** argv) {
    RunnerOptions options;
    try {
        options = ParseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "qc_runner: " << e.what() << "\n";
        PrintUsage(argv[0]);
        return 2;
    }
    if (options.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    qcseq::TestCatalog catalog = qcseq::DefaultQaCatalog();
    if (!options.catalogPath.empty()) {
        qcseq::CatalogResult loaded = qcseq::LoadCatalogFile(options.catalogPath);
        if (!loaded.catalog) {
            std::cerr << "qc_runner: catalog " << options.catalogPath << ": "
                      << qcseq::ToString(loaded.error) << ": " << loaded.message << "\n";
            return 2;
        }
        catalog = std::move(*loaded.catalog);
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    std::unique_ptr<qcseq::GattTransport> transport;
    if (options.simulate) {
        qcseq::ScriptedDeviceConfig device;
        device.serviceUuid = catalog.serviceUuid;
        device.controlCharUuid = catalog.controlCharUuid;
        device.eventCharUuid = catalog.eventCharUuid;
        auto scripted = std::make_unique<qcseq::ScriptedTransport>(device);
        scripted->SetDefaultReply(qcseq::ScriptedReply::Respond("{\"status\":\"ok\"}", 150ms));
        for (const auto& command : options.silentCommands) {
            scripted->Script(command, qcseq::ScriptedReply::Silent());
        }
        transport = std::move(scripted);
        std::cout << "[Runner] Simulated device\n";
    } else {
        transport = std::make_unique<qcseq::TcpBridgeTransport>(options.bridge);
        std::cout << "[Runner] GATT bridge " << options.bridge.host << ":" << options.bridge.port << "\n";
    }

    qcseq::SequencerConfig config;
    config.settleDelay = options.settleDelay;
    config.startDelay = options.startDelay;
    config.operatorName = options.operatorName;

    qcseq::TestSequencer sequencer(*transport, catalog, config);
    sequencer.SetLogObserver(EchoLogEntry);
    sequencer.SetProgressObserver([](std::size_t completed, std::size_t total) {
        std::cout << "[Runner] Progress " << completed << "/" << total << "\n";
    });

    std::atomic<bool> runFinished{false};
    std::thread watcher([&] {
        while (!runFinished) {
            if (g_interrupted) {
                sequencer.Stop();
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    });

    const qcseq::RunResult result = sequencer.Run(options.selector);
    runFinished = true;
    watcher.join();

    PrintSummary(result.finished);
    if (result.aborted) {
        std::cout << "Run aborted: " << result.errorMessage;
        if (result.error != qcseq::ConnectionError::None) {
            std::cout << " [" << qcseq::ToString(result.error) << "]";
        }
        std::cout << "\n";
    }

    if (!options.outDir.empty()) {
        qcseq::ResultAggregator aggregator;
        qcseq::JsonFileResultStore store(options.outDir);
        const qcseq::PersistResult persisted = aggregator.Persist(result.finished, store);
        if (persisted.ok) {
            std::cout << "[Runner] Result written to " << persisted.location << "\n";
        }
    }

    if (result.aborted) {
        return 2;
    }
    return result.finished.overallResult == qcseq::OverallResult::Pass ? 0 : 1;
}
