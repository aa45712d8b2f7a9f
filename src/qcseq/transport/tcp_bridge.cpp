/**
 * @file tcp_bridge.cpp
 * @brief GATT bridge transport over a local TCP socket.
 *
 * Client-only, non-blocking socket with a bounded TX ring. A dedicated
 * receive thread polls the socket, frames the stream into lines and either
 * completes a waiting request or dispatches a notification.
 *
 * @note POSIX only.
 *
 * @see TcpBridgeTransport
 */
#include "qcseq/transport/tcp_bridge.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace qcseq {

namespace {
/// @brief Minimum interval between error log messages to prevent spam.
constexpr auto kLogThrottle = std::chrono::seconds(1);

constexpr const char* kBridgeLost = "bridge connection lost";

int ToPollTimeout(std::chrono::milliseconds timeout) {
    const auto count = timeout.count();
    if (count <= 0) {
        return 0;
    }
    return count > 60000 ? 60000 : static_cast<int>(count);
}
} // namespace

/**
 * @brief Constructs an unopened bridge transport.
 *
 * Out-of-range settings fall back to their defaults. No socket is created
 * until Open() or Connect().
 */
TcpBridgeTransport::TcpBridgeTransport(TcpBridgeConfig config)
    : m_config(std::move(config)),
      m_txBuffer(std::make_unique<uint8_t[]>(kTxBufferCapacity)),
      m_framer([this](const std::string& frame) { HandleFrame(frame); },
               [this](const LineFramer::ErrorInfo&) {
                   ++m_framesDropped;
                   LogError("frame exceeds max size - dropped");
               },
               m_config.maxFrameSize) {
    const TcpBridgeConfig defaults{};
    if (m_config.host.empty()) {
        m_config.host = defaults.host;
    }
    if (m_config.port == 0) {
        m_config.port = defaults.port;
    }
    if (m_config.connectTimeout.count() <= 0) {
        m_config.connectTimeout = defaults.connectTimeout;
    }
    if (m_config.requestTimeout.count() <= 0) {
        m_config.requestTimeout = defaults.requestTimeout;
    }
    if (m_config.pollInterval.count() <= 0) {
        m_config.pollInterval = defaults.pollInterval;
    }
}

TcpBridgeTransport::~TcpBridgeTransport() {
    Close();
}

/**
 * @brief Connects to the bridge with a bounded non-blocking connect.
 *
 * @return true once the socket is connected and the receive thread runs
 */
bool TcpBridgeTransport::Open() {
    if (m_bridgeOpen.load()) {
        return true;
    }
    // A receive thread that ended on bridge loss is reaped here
    if (m_rxThread.joinable()) {
        m_rxThread.join();
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_config.port);
    if (inet_pton(AF_INET, m_config.host.c_str(), &addr.sin_addr) <= 0) {
        LogError("inet_pton (invalid bridge host)");
        return false;
    }

    const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LogError("socket");
        return false;
    }
    if (!ConfigureSocket(sock)) {
        ::close(sock);
        return false;
    }

    if (::connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS && errno != EALREADY) {
            LogError("connect");
            ::close(sock);
            return false;
        }

        pollfd pfd{sock, POLLOUT, 0};
        int ready;
        do {
            ready = ::poll(&pfd, 1, ToPollTimeout(m_config.connectTimeout));
        } while (ready < 0 && errno == EINTR);
        if (ready <= 0) {
            if (ready == 0) {
                errno = ETIMEDOUT;
            }
            LogError("connect (timeout)");
            ::close(sock);
            return false;
        }

        int err = 0;
        socklen_t errLen = sizeof(err);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &errLen) < 0 || err != 0) {
            if (err != 0) {
                errno = err;
            }
            LogError("connect (async)");
            ::close(sock);
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_txMutex);
        m_socket = sock;
        DropPendingTx();
    }
    m_framer.Reset();
    m_stopRx.store(false);
    m_bridgeOpen.store(true);
    m_rxThread = std::thread(&TcpBridgeTransport::ReceiveLoop, this);
    return true;
}

void TcpBridgeTransport::Close() {
    m_stopRx.store(true);
    if (m_rxThread.joinable()) {
        m_rxThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_txMutex);
        if (m_socket >= 0) {
            ::close(m_socket);
            m_socket = -1;
        }
        DropPendingTx();
    }
    m_linkUp.store(false);
    m_bridgeOpen.store(false);
    FailPendingRequests();
}

LinkResult TcpBridgeTransport::Connect(const DeviceSelector& selector) {
    LinkResult result;
    if (!Open()) {
        result.status = LinkStatus::Failed;
        result.message = "GATT bridge unreachable at " + m_config.host + ":" + std::to_string(m_config.port);
        return result;
    }

    JsonDocument request;
    request["op"] = "connect";
    request["name_prefix"] = selector.namePrefix;
    request["device_id"] = selector.deviceId;
    request["service"] = selector.serviceUuid;
    request["scan_ms"] = selector.scanTimeout.count();

    JsonDocument reply;
    std::string error;
    if (!Request(request, reply, error, m_config.requestTimeout + selector.scanTimeout)) {
        const char* code = reply["error"] | "";
        result.status = std::strcmp(code, "not_found") == 0 ? LinkStatus::NotFound : LinkStatus::Failed;
        result.message = error;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_handleMutex);
        m_charByUuid.clear();
    }
    result.status = LinkStatus::Ok;
    result.device.name = reply["name"] | "";
    result.device.id = reply["id"] | selector.deviceId.c_str();
    m_linkUp.store(true);
    return result;
}

std::optional<ServiceHandle> TcpBridgeTransport::FindService(const std::string& uuid) {
    JsonDocument request;
    request["op"] = "service";
    request["uuid"] = uuid;

    JsonDocument reply;
    std::string error;
    if (!Request(request, reply, error, m_config.requestTimeout)) {
        return std::nullopt;
    }
    const ServiceHandle handle = reply["handle"] | kInvalidHandle;
    if (handle == kInvalidHandle) {
        return std::nullopt;
    }
    return handle;
}

std::optional<CharacteristicHandle> TcpBridgeTransport::FindCharacteristic(ServiceHandle service,
                                                                           const std::string& uuid) {
    JsonDocument request;
    request["op"] = "characteristic";
    request["service"] = service;
    request["uuid"] = uuid;

    JsonDocument reply;
    std::string error;
    if (!Request(request, reply, error, m_config.requestTimeout)) {
        return std::nullopt;
    }
    const CharacteristicHandle handle = reply["handle"] | kInvalidHandle;
    if (handle == kInvalidHandle) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_handleMutex);
    m_charByUuid[uuid] = handle;
    return handle;
}

bool TcpBridgeTransport::StartNotifications(CharacteristicHandle characteristic) {
    JsonDocument request;
    request["op"] = "subscribe";
    request["char"] = characteristic;

    JsonDocument reply;
    std::string error;
    return Request(request, reply, error, m_config.requestTimeout);
}

/**
 * @brief Writes a characteristic value and waits for the bridge's confirmation.
 *
 * The wait is the shorter of timeout and requestTimeout.
 *
 * @return true if the bridge reported the write as delivered
 */
bool TcpBridgeTransport::Write(CharacteristicHandle characteristic, const uint8_t* data, std::size_t length,
                               std::chrono::milliseconds timeout) {
    if (!m_linkUp.load() || !data) {
        return false;
    }

    JsonDocument request;
    request["op"] = "write";
    request["char"] = characteristic;
    request["value"] = std::string(reinterpret_cast<const char*>(data), length);

    JsonDocument reply;
    std::string error;
    if (!Request(request, reply, error, std::min(timeout, m_config.requestTimeout))) {
        std::cerr << "TCP bridge: write failed: " << error << std::endl;
        return false;
    }
    return true;
}

void TcpBridgeTransport::Disconnect() {
    {
        std::lock_guard<std::mutex> lock(m_handleMutex);
        m_charByUuid.clear();
    }
    if (!m_linkUp.exchange(false) || !m_bridgeOpen.load()) {
        return;
    }

    JsonDocument request;
    request["op"] = "disconnect";
    JsonDocument reply;
    std::string error;
    if (!Request(request, reply, error, m_config.requestTimeout)) {
        std::cerr << "TCP bridge: disconnect request failed: " << error << std::endl;
    }
}

bool TcpBridgeTransport::IsConnected() const {
    return m_bridgeOpen.load() && m_linkUp.load();
}

void TcpBridgeTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_notificationHandler = std::move(handler);
}

void TcpBridgeTransport::SetDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_disconnectHandler = std::move(handler);
}

bool TcpBridgeTransport::Request(JsonDocument& request, JsonDocument& reply, std::string& error,
                                 std::chrono::milliseconds timeout) {
    if (!m_bridgeOpen.load()) {
        error = "bridge not connected";
        return false;
    }

    uint32_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(m_requestMutex);
        seq = m_nextSeq++;
        m_pending[seq];
    }
    request["seq"] = seq;

    std::string frame;
    serializeJson(request, frame);
    frame.push_back('\n');
    if (!SendFrame(frame)) {
        std::lock_guard<std::mutex> lock(m_requestMutex);
        m_pending.erase(seq);
        error = "bridge send failed";
        return false;
    }

    std::unique_lock<std::mutex> lock(m_requestMutex);
    m_requestCv.wait_until(lock, std::chrono::steady_clock::now() + timeout, [this, seq] {
        const auto it = m_pending.find(seq);
        return it == m_pending.end() || it->second.done || !m_bridgeOpen.load();
    });

    const auto it = m_pending.find(seq);
    if (it == m_pending.end() || !it->second.done) {
        error = m_bridgeOpen.load() ? "request timed out" : kBridgeLost;
        if (it != m_pending.end()) {
            m_pending.erase(it);
        }
        return false;
    }
    reply = std::move(it->second.reply);
    m_pending.erase(it);
    lock.unlock();

    if (reply["ok"] | false) {
        return true;
    }
    const char* message = reply["message"] | "";
    const char* code = reply["error"] | "";
    error = *message ? message : (*code ? code : kBridgeLost);
    return false;
}

/**
 * @brief Queues a frame in the TX ring and flushes what the socket accepts.
 *
 * Rejects new frames when the ring is more than half full.
 */
bool TcpBridgeTransport::SendFrame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(m_txMutex);
    if (m_socket < 0) {
        return false;
    }
    if (frame.size() > kTxBufferCapacity) {
        LogError("frame exceeds tx buffer capacity");
        return false;
    }
    if (!EnqueueTx(reinterpret_cast<const uint8_t*>(frame.data()), frame.size())) {
        return false;
    }
    TryFlushTxBuffer();
    return true;
}

void TcpBridgeTransport::ReceiveLoop() {
    uint8_t buffer[4096];

    while (!m_stopRx.load()) {
        {
            std::lock_guard<std::mutex> lock(m_txMutex);
            TryFlushTxBuffer();
        }

        pollfd pfd{m_socket, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, ToPollTimeout(m_config.pollInterval));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LogError("poll");
            HandleBridgeLoss(kBridgeLost);
            return;
        }
        if (ready == 0) {
            continue;
        }
        if ((pfd.revents & POLLIN) == 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            HandleBridgeLoss(kBridgeLost);
            return;
        }

        ssize_t received;
        do {
            received = ::recv(m_socket, buffer, sizeof(buffer), 0);
        } while (received < 0 && errno == EINTR);

        if (received > 0) {
            m_framer.Push(buffer, static_cast<std::size_t>(received));
        } else if (received == 0) {
            HandleBridgeLoss("bridge closed the connection");
            return;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LogError("recv");
            HandleBridgeLoss(kBridgeLost);
            return;
        }
    }
}

void TcpBridgeTransport::HandleFrame(const std::string& frame) {
    JsonDocument doc;
    const DeserializationError err = deserializeJson(doc, frame);
    if (err) {
        ++m_framesDropped;
        std::cerr << "TCP bridge: malformed frame dropped: " << err.c_str() << std::endl;
        return;
    }

    const char* op = doc["op"] | "";

    if (std::strcmp(op, "result") == 0) {
        const uint32_t seq = doc["seq"] | 0u;
        {
            std::lock_guard<std::mutex> lock(m_requestMutex);
            const auto it = m_pending.find(seq);
            if (it != m_pending.end()) {
                it->second.reply = std::move(doc);
                it->second.done = true;
                m_requestCv.notify_all();
                return;
            }
        }
        std::cerr << "TCP bridge: result for unknown request seq=" << seq << std::endl;
        return;
    }

    if (std::strcmp(op, "notify") == 0) {
        CharacteristicHandle handle = kInvalidHandle;
        JsonVariantConst characteristic = doc["char"];
        if (characteristic.is<uint32_t>()) {
            handle = characteristic.as<uint32_t>();
        } else if (characteristic.is<const char*>()) {
            std::lock_guard<std::mutex> lock(m_handleMutex);
            const auto it = m_charByUuid.find(characteristic.as<const char*>());
            if (it != m_charByUuid.end()) {
                handle = it->second;
            }
        }

        // A JSON value that is not a string is handed on as its JSON text
        std::string value;
        JsonVariantConst raw = doc["value"];
        if (raw.is<const char*>()) {
            value = raw.as<std::string>();
        } else if (!raw.isNull()) {
            serializeJson(raw, value);
        }

        // Handlers run under m_handlerMutex, Set*Handler waits for them
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        if (m_notificationHandler) {
            m_notificationHandler(handle, reinterpret_cast<const uint8_t*>(value.data()), value.size());
        }
        return;
    }

    if (std::strcmp(op, "disconnected") == 0) {
        const std::string reason = doc["reason"] | "device disconnected";
        if (!m_linkUp.exchange(false)) {
            return;
        }
        // Handlers run under m_handlerMutex, Set*Handler waits for them
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        if (m_disconnectHandler) {
            m_disconnectHandler(reason);
        }
        return;
    }

    std::cerr << "TCP bridge: unknown op '" << op << "' ignored" << std::endl;
}

/**
 * @brief Receive-thread cleanup after the bridge socket fails.
 *
 * Wakes every waiting request and reports link loss if a device was connected.
 */
void TcpBridgeTransport::HandleBridgeLoss(const char* reason) {
    const bool linkWasUp = m_linkUp.exchange(false);
    m_bridgeOpen.store(false);
    {
        std::lock_guard<std::mutex> lock(m_txMutex);
        if (m_socket >= 0) {
            ::close(m_socket);
            m_socket = -1;
        }
        DropPendingTx();
    }
    FailPendingRequests();

    if (!linkWasUp) {
        return;
    }
    // Handlers run under m_handlerMutex, Set*Handler waits for them
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    if (m_disconnectHandler) {
        m_disconnectHandler(reason);
    }
}

void TcpBridgeTransport::FailPendingRequests() {
    std::lock_guard<std::mutex> lock(m_requestMutex);
    for (auto& entry : m_pending) {
        entry.second.done = true;
    }
    m_requestCv.notify_all();
}

/**
 * @brief Configures socket options for the bridge link.
 *
 * Enables TCP_NODELAY and O_NONBLOCK.
 */
bool TcpBridgeTransport::ConfigureSocket(int sock) {
    int yes = 1;
    if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(int)) < 0) {
        LogError("setsockopt(TCP_NODELAY)");
        return false;
    }

    if (fcntl(sock, F_SETFL, O_NONBLOCK) < 0) {
        LogError("fcntl(O_NONBLOCK)");
        return false;
    }
    return true;
}

/// Caller holds m_txMutex. Uses MSG_NOSIGNAL to avoid SIGPIPE.
void TcpBridgeTransport::TryFlushTxBuffer() {
    uint8_t* buffer = m_txBuffer.get();
    if (!buffer) {
        return;
    }

    while (m_txSize > 0 && m_socket >= 0) {
        const std::size_t contiguous = std::min(m_txSize, kTxBufferCapacity - m_txHead);
        const ssize_t sent = ::send(m_socket, buffer + m_txHead, contiguous, MSG_NOSIGNAL);
        if (sent > 0) {
            const std::size_t consumed = static_cast<std::size_t>(sent);
            m_txHead = (m_txHead + consumed) % kTxBufferCapacity;
            m_txSize -= consumed;
            continue;
        }

        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }

        // The receive thread observes the broken socket and reports the loss
        LogError("send");
        DropPendingTx();
        return;
    }
}

/**
 * @brief Enqueues data to the circular TX buffer.
 *
 * Rejects new frames when the buffer exceeds 50% capacity.
 */
bool TcpBridgeTransport::EnqueueTx(const uint8_t* data, std::size_t length) {
    if (!data || length == 0) {
        return true;
    }

    if (m_txSize > kTxBufferCapacity / 2) {
        LogError("tx buffer congested - rejecting new frame");
        return false;
    }

    if (length > kTxBufferCapacity - m_txSize) {
        LogError("tx buffer full - dropping frame");
        return false;
    }

    const std::size_t firstChunk = std::min(length, kTxBufferCapacity - m_txTail);
    std::memcpy(m_txBuffer.get() + m_txTail, data, firstChunk);

    const std::size_t remaining = length - firstChunk;
    if (remaining > 0) {
        std::memcpy(m_txBuffer.get(), data + firstChunk, remaining);
    }

    m_txTail = (m_txTail + length) % kTxBufferCapacity;
    m_txSize += length;
    return true;
}

void TcpBridgeTransport::DropPendingTx() {
    m_txHead = 0;
    m_txTail = 0;
    m_txSize = 0;
}

/**
 * @brief Logs an error message with throttling.
 *
 * Only one message per kLogThrottle interval reaches std::cerr.
 */
void TcpBridgeTransport::LogError(const char* message) {
    const int savedErrno = errno;
    std::lock_guard<std::mutex> lock(m_logMutex);
    const auto now = std::chrono::steady_clock::now();
    if (now - m_lastErrorLog < kLogThrottle) {
        return;
    }
    m_lastErrorLog = now;
    std::cerr << "TCP bridge error: " << message << " errno=" << savedErrno << std::endl;
}

} // namespace qcseq
