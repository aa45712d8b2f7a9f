#pragma once

#include "qcseq/session.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace qcseq {

using ServiceHandle = uint32_t;
using CharacteristicHandle = uint32_t;

/// Never returned by a successful lookup.
constexpr uint32_t kInvalidHandle = 0;

/**
 * @brief Which device to open. Empty fields match anything.
 */
struct DeviceSelector {
    std::string namePrefix;
    std::string deviceId;
    std::string serviceUuid;  ///< Advertised service filter
    std::chrono::milliseconds scanTimeout{10000};
};

enum class LinkStatus : uint8_t {
    Ok = 0,
    NotFound,
    Failed,
};

struct LinkResult {
    LinkStatus status{LinkStatus::Failed};
    DeviceIdentity device;
    std::string message;  ///< Transport-specific failure text
};

/**
 * @brief Interface for writing a value to a remote characteristic.
 */
class GattWriter {
public:
    virtual ~GattWriter() = default;

    /**
     * @brief Write bytes to a characteristic.
     * @param characteristic Handle returned by FindCharacteristic()
     * @param data Pointer to value bytes
     * @param length Number of bytes
     * @param timeout Longest time to wait for the link to accept the write
     * @return true if the write was accepted by the link, false on error or timeout
     */
    virtual bool Write(CharacteristicHandle characteristic, const uint8_t* data, std::size_t length,
                       std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Interface for the asynchronous notification stream.
 *
 * Handlers are invoked on a transport-owned thread and must not block.
 * Once a Set*Handler call returns, the previous handler is not running and
 * will not be called again.
 */
class NotificationSource {
public:
    using NotificationHandler =
        std::function<void(CharacteristicHandle, const uint8_t*, std::size_t)>;
    using DisconnectHandler = std::function<void(const std::string& reason)>;

    virtual ~NotificationSource() = default;

    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    /// Called on unsolicited link loss only, never from Disconnect().
    virtual void SetDisconnectHandler(DisconnectHandler handler) = 0;
};

/**
 * @brief GATT-style wireless link: discovery, lookup, one write path, one notification path.
 */
class GattTransport : public GattWriter, public NotificationSource {
public:
    ~GattTransport() override = default;

    /// Scan for and connect to the first device matching the selector.
    virtual LinkResult Connect(const DeviceSelector& selector) = 0;

    virtual std::optional<ServiceHandle> FindService(const std::string& uuid) = 0;

    virtual std::optional<CharacteristicHandle> FindCharacteristic(ServiceHandle service,
                                                                   const std::string& uuid) = 0;

    /// Subscribe to notifications of a characteristic.
    virtual bool StartNotifications(CharacteristicHandle characteristic) = 0;

    /// Release the link. Must be safe to call repeatedly.
    virtual void Disconnect() = 0;

    virtual bool IsConnected() const = 0;
};

} // namespace qcseq
