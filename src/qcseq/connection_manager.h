#pragma once

#include "qcseq/session.h"
#include "qcseq/transport/adapter.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace qcseq {

enum class ConnectionError : uint8_t {
    None = 0,
    DeviceNotFound,
    ConnectError,
    ServiceNotFound,
    CharacteristicNotFound,
    NotificationEnableError,
};

/// An open link to one device.
struct Connection {
    DeviceIdentity device;
};

/// Logical control/event endpoints mapped to transport handles.
struct Endpoints {
    ServiceHandle service{kInvalidHandle};
    CharacteristicHandle control{kInvalidHandle};
    CharacteristicHandle event{kInvalidHandle};
    std::string serviceUuid;
    std::string controlUuid;
    std::string eventUuid;
};

struct ConnectResult {
    std::optional<Connection> connection;
    ConnectionError error{ConnectionError::None};
    std::string message;
};

struct EndpointsResult {
    std::optional<Endpoints> endpoints;
    ConnectionError error{ConnectionError::None};
    std::string message;
};

/// Receives connection-phase audit events.
using LogSink = std::function<void(LogLevel, LogCategory, const std::string& message,
                                   const std::optional<std::string>& rawData)>;

/**
 * @brief Owns the connection lifecycle of one device link.
 *
 * Not thread-safe; all calls come from the sequencer loop.
 */
class ConnectionManager {
public:
    explicit ConnectionManager(GattTransport& transport, LogSink sink = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void SetLogSink(LogSink sink) { m_sink = std::move(sink); }

    /// Runs at the start of every Disconnect(), before the link is released.
    void SetTeardownHook(std::function<void()> hook) { m_teardownHook = std::move(hook); }

    ConnectResult Connect(const DeviceSelector& selector);

    EndpointsResult ResolveEndpoints(const Connection& connection, const std::string& serviceId,
                                     const std::string& controlCharId, const std::string& eventCharId);

    ConnectionError EnableNotifications(const Endpoints& endpoints);

    /**
     * @brief Release the link.
     *
     * Idempotent and safe on a link that was never opened. Always runs the
     * teardown hook first.
     */
    void Disconnect();

    bool IsOpen() const { return m_open; }

private:
    void Emit(LogLevel level, const std::string& message,
              const std::optional<std::string>& rawData = std::nullopt);

    GattTransport& m_transport;
    LogSink m_sink;
    std::function<void()> m_teardownHook;
    bool m_open{false};
};

const char* ToString(ConnectionError error);

} // namespace qcseq
