#pragma once

#include "qcseq/transport/adapter.h"
#include "qcseq/transport/line_framer.h"

#include <ArduinoJson.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace qcseq {

struct TcpBridgeConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{8765};
    std::chrono::milliseconds connectTimeout{3000};
    /// Deadline for a control request's result frame (scan time is added for connect)
    std::chrono::milliseconds requestTimeout{5000};
    std::size_t maxFrameSize{16384};
    std::chrono::milliseconds pollInterval{5};
};

/**
 * @brief GattTransport backed by a local GATT bridge daemon over TCP.
 *
 * The daemon owns the radio stack. Requests and replies are newline-delimited
 * JSON objects; each request carries "op" and "seq" and is answered by
 * {"op":"result","seq":n,"ok":bool,...}. Notifications and link loss arrive
 * unsolicited as "notify" and "disconnected" frames and are dispatched from
 * the receive thread.
 */
class TcpBridgeTransport : public GattTransport {
public:
    explicit TcpBridgeTransport(TcpBridgeConfig config = {});
    ~TcpBridgeTransport() override;

    TcpBridgeTransport(const TcpBridgeTransport&) = delete;
    TcpBridgeTransport& operator=(const TcpBridgeTransport&) = delete;

    /// Connect to the bridge and start the receive thread. Idempotent.
    bool Open();

    /// Stop the receive thread and close the bridge socket.
    void Close();

    bool IsBridgeOpen() const { return m_bridgeOpen.load(); }

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

    const TcpBridgeConfig& Config() const { return m_config; }

    uint64_t FramesDropped() const { return m_framesDropped.load(); }

private:
    struct PendingRequest {
        bool done{false};
        JsonDocument reply;
    };

    /**
     * @brief Send a request and block until its result frame or the deadline.
     * @param request Request object; "seq" is assigned here
     * @param reply Receives the result frame on success
     * @param error Receives the failure text
     * @return true if the bridge answered with "ok": true
     */
    bool Request(JsonDocument& request, JsonDocument& reply, std::string& error,
                 std::chrono::milliseconds timeout);

    bool SendFrame(const std::string& frame);
    void ReceiveLoop();
    void HandleFrame(const std::string& frame);
    void HandleBridgeLoss(const char* reason);
    void FailPendingRequests();

    bool ConfigureSocket(int sock);
    void TryFlushTxBuffer();
    bool EnqueueTx(const uint8_t* data, std::size_t length);
    void DropPendingTx();
    void LogError(const char* message);

    static constexpr std::size_t kTxBufferCapacity = 64 * 1024;

    TcpBridgeConfig m_config;

    int m_socket{-1};
    std::atomic<bool> m_bridgeOpen{false};
    std::atomic<bool> m_stopRx{false};
    std::atomic<bool> m_linkUp{false};
    std::thread m_rxThread;

    // Guards the socket write side and the TX ring
    std::mutex m_txMutex;
    std::unique_ptr<uint8_t[]> m_txBuffer;
    std::size_t m_txHead{0};
    std::size_t m_txTail{0};
    std::size_t m_txSize{0};

    std::mutex m_requestMutex;
    std::condition_variable m_requestCv;
    std::map<uint32_t, PendingRequest> m_pending;
    uint32_t m_nextSeq{1};

    // Characteristic UUIDs resolved by FindCharacteristic(), for notify frames
    std::mutex m_handleMutex;
    std::map<std::string, CharacteristicHandle> m_charByUuid;

    std::mutex m_handlerMutex;
    NotificationHandler m_notificationHandler;
    DisconnectHandler m_disconnectHandler;

    LineFramer m_framer;
    std::atomic<uint64_t> m_framesDropped{0};

    std::mutex m_logMutex;
    std::chrono::steady_clock::time_point m_lastErrorLog{};
};

} // namespace qcseq
