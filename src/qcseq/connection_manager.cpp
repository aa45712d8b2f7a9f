/**
 * @file connection_manager.cpp
 * @brief Connect, endpoint resolution, notification enablement and teardown.
 *
 * Every step emits an audit event through the log sink. Failures are
 * reported as ConnectionError values; the caller decides to abort.
 */

#include "qcseq/connection_manager.h"

namespace qcseq {

ConnectionManager::ConnectionManager(GattTransport& transport, LogSink sink)
    : m_transport(transport), m_sink(std::move(sink)) {}

/**
 * @brief Destructor. Releases the link if still open.
 */
ConnectionManager::~ConnectionManager() {
    if (m_open) {
        m_transport.Disconnect();
    }
}

/**
 * @brief Scan for and connect to a device.
 *
 * @param selector Name/id/service filter handed to the transport
 * @return Connection on success, DeviceNotFound or ConnectError otherwise
 */
ConnectResult ConnectionManager::Connect(const DeviceSelector& selector) {
    ConnectResult result;
    Emit(LogLevel::Info, "Connecting: scanning for QA device",
         selector.serviceUuid.empty() ? std::nullopt : std::optional<std::string>(selector.serviceUuid));

    const auto start = std::chrono::steady_clock::now();
    const LinkResult link = m_transport.Connect(selector);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    switch (link.status) {
        case LinkStatus::Ok:
            break;
        case LinkStatus::NotFound:
            result.error = ConnectionError::DeviceNotFound;
            result.message = link.message.empty() ? "no matching device found" : link.message;
            Emit(LogLevel::Error, "Device not found: " + result.message);
            return result;
        case LinkStatus::Failed:
            result.error = ConnectionError::ConnectError;
            result.message = link.message.empty() ? "connection failed" : link.message;
            Emit(LogLevel::Error, "Connection failed: " + result.message);
            return result;
    }

    m_open = true;
    Connection connection;
    connection.device = link.device;
    result.connection = connection;

    Emit(LogLevel::Success,
         "Connected to " + link.device.name + " (" + link.device.id + ") in " +
             std::to_string(elapsed.count()) + " ms",
         link.device.id);
    return result;
}

/**
 * @brief Map the service and its control/event characteristics to transport handles.
 */
EndpointsResult ConnectionManager::ResolveEndpoints(const Connection& connection,
                                                    const std::string& serviceId,
                                                    const std::string& controlCharId,
                                                    const std::string& eventCharId) {
    EndpointsResult result;
    if (!m_open) {
        result.error = ConnectionError::ConnectError;
        result.message = "link to " + connection.device.name + " is not open";
        Emit(LogLevel::Error, result.message);
        return result;
    }

    const auto service = m_transport.FindService(serviceId);
    if (!service) {
        result.error = ConnectionError::ServiceNotFound;
        result.message = "QA service " + serviceId + " not found";
        Emit(LogLevel::Error, result.message, serviceId);
        return result;
    }
    Emit(LogLevel::Success, "Service resolved", serviceId);

    const auto control = m_transport.FindCharacteristic(*service, controlCharId);
    if (!control) {
        result.error = ConnectionError::CharacteristicNotFound;
        result.message = "control characteristic " + controlCharId + " not found";
        Emit(LogLevel::Error, result.message, controlCharId);
        return result;
    }

    const auto event = m_transport.FindCharacteristic(*service, eventCharId);
    if (!event) {
        result.error = ConnectionError::CharacteristicNotFound;
        result.message = "event characteristic " + eventCharId + " not found";
        Emit(LogLevel::Error, result.message, eventCharId);
        return result;
    }

    Endpoints endpoints;
    endpoints.service = *service;
    endpoints.control = *control;
    endpoints.event = *event;
    endpoints.serviceUuid = serviceId;
    endpoints.controlUuid = controlCharId;
    endpoints.eventUuid = eventCharId;
    result.endpoints = endpoints;

    Emit(LogLevel::Success, "Control and event characteristics resolved", controlCharId + " / " + eventCharId);
    return result;
}

ConnectionError ConnectionManager::EnableNotifications(const Endpoints& endpoints) {
    if (!m_open || !m_transport.StartNotifications(endpoints.event)) {
        Emit(LogLevel::Error, "Failed to enable notifications", endpoints.eventUuid);
        return ConnectionError::NotificationEnableError;
    }
    Emit(LogLevel::Success, "Notifications enabled, listening for device responses", endpoints.eventUuid);
    return ConnectionError::None;
}

void ConnectionManager::Disconnect() {
    if (m_teardownHook) {
        m_teardownHook();
    }

    if (!m_open && !m_transport.IsConnected()) {
        return;
    }

    Emit(LogLevel::Info, "Disconnecting from device");
    m_transport.Disconnect();
    m_open = false;
    Emit(LogLevel::Success, "Device disconnected");
}

void ConnectionManager::Emit(LogLevel level, const std::string& message,
                             const std::optional<std::string>& rawData) {
    if (m_sink) {
        m_sink(level, LogCategory::Connection, message, rawData);
    }
}

const char* ToString(ConnectionError error) {
    switch (error) {
        case ConnectionError::None: return "None";
        case ConnectionError::DeviceNotFound: return "DeviceNotFound";
        case ConnectionError::ConnectError: return "ConnectError";
        case ConnectionError::ServiceNotFound: return "ServiceNotFound";
        case ConnectionError::CharacteristicNotFound: return "CharacteristicNotFound";
        case ConnectionError::NotificationEnableError: return "NotificationEnableError";
    }
    return "Unknown";
}

} // namespace qcseq
