#pragma once

/**
 * @file scripted_transport.h
 * @brief In-process QA device with scripted per-command behaviour.
 *
 * Used by the test suite and by the runner's --simulate mode. Replies are
 * delivered from a worker thread after their configured delay, the same way
 * a radio stack delivers notifications from its own thread.
 */

#include "qcseq/test_catalog.h"
#include "qcseq/transport/adapter.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace qcseq {

struct ScriptedReply {
    enum class Kind : uint8_t {
        Respond = 0,  ///< Notify `text` on the event characteristic after `delay`
        Silent,       ///< Accept the write, never answer
        FailWrite,    ///< Reject the write
        DropLink,     ///< Accept the write, then lose the link after `delay`
    };

    Kind kind{Kind::Respond};
    std::string text;
    std::chrono::milliseconds delay{0};

    static ScriptedReply Respond(std::string text, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        return ScriptedReply{Kind::Respond, std::move(text), delay};
    }
    static ScriptedReply Silent() { return ScriptedReply{Kind::Silent, {}, std::chrono::milliseconds(0)}; }
    static ScriptedReply FailWrite() { return ScriptedReply{Kind::FailWrite, {}, std::chrono::milliseconds(0)}; }
    static ScriptedReply DropLink(std::string reason, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        return ScriptedReply{Kind::DropLink, std::move(reason), delay};
    }
};

struct ScriptedDeviceConfig {
    DeviceIdentity identity{"QA-Device", "00:11:22:33:44:55"};
    std::string serviceUuid{kQaServiceUuid};
    std::string controlCharUuid{kQaControlCharUuid};
    std::string eventCharUuid{kQaEventCharUuid};
    bool discoverable{true};
    bool connectFails{false};
    bool notificationsFail{false};
};

class ScriptedTransport : public GattTransport {
public:
    static constexpr ServiceHandle kServiceHandle = 1;
    static constexpr CharacteristicHandle kControlHandle = 2;
    static constexpr CharacteristicHandle kEventHandle = 3;

    explicit ScriptedTransport(ScriptedDeviceConfig config = {});
    ~ScriptedTransport() override;

    ScriptedTransport(const ScriptedTransport&) = delete;
    ScriptedTransport& operator=(const ScriptedTransport&) = delete;

    /// Behaviour for writes whose "command" field equals commandId.
    void Script(const std::string& commandId, ScriptedReply reply);

    /// Behaviour for commands without a script. Defaults to an immediate {"status":"ok"}.
    void SetDefaultReply(ScriptedReply reply);

    /// Deliver a notification regardless of any write.
    void InjectNotification(std::string text, std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                            CharacteristicHandle characteristic = kEventHandle);

    /// Lose the link and report it through the disconnect handler.
    void DropLink(const std::string& reason);

    std::vector<std::string> WrittenCommands() const;
    uint32_t DisconnectCount() const;

    LinkResult Connect(const DeviceSelector& selector) override;
    std::optional<ServiceHandle> FindService(const std::string& uuid) override;
    std::optional<CharacteristicHandle> FindCharacteristic(ServiceHandle service,
                                                           const std::string& uuid) override;
    bool StartNotifications(CharacteristicHandle characteristic) override;
    bool Write(CharacteristicHandle characteristic, const uint8_t* data, std::size_t length,
               std::chrono::milliseconds timeout) override;
    void Disconnect() override;
    bool IsConnected() const override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetDisconnectHandler(DisconnectHandler handler) override;

private:
    struct Delivery {
        std::chrono::steady_clock::time_point due;
        uint64_t order{0};
        bool linkLoss{false};
        CharacteristicHandle characteristic{kEventHandle};
        std::string text;
    };

    void Schedule(Delivery delivery);
    void WorkerLoop();
    void Deliver(const Delivery& delivery);

    ScriptedDeviceConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, ScriptedReply> m_scripts;
    ScriptedReply m_defaultReply{ScriptedReply::Respond("{\"status\":\"ok\"}")};
    std::vector<std::string> m_written;
    std::vector<Delivery> m_queue;
    uint64_t m_nextOrder{0};
    bool m_connected{false};
    bool m_subscribed{false};
    uint32_t m_disconnects{0};
    bool m_shutdown{false};

    std::mutex m_handlerMutex;
    NotificationHandler m_notificationHandler;
    DisconnectHandler m_disconnectHandler;

    std::thread m_worker;
};

} // namespace qcseq
