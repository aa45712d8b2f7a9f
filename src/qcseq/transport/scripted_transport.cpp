#include "qcseq/transport/scripted_transport.h"

#include "qcseq/command_codec.h"

#include <algorithm>

namespace qcseq {

ScriptedTransport::ScriptedTransport(ScriptedDeviceConfig config)
    : m_config(std::move(config)) {
    m_worker = std::thread(&ScriptedTransport::WorkerLoop, this);
}

ScriptedTransport::~ScriptedTransport() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void ScriptedTransport::Script(const std::string& commandId, ScriptedReply reply) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scripts[commandId] = std::move(reply);
}

void ScriptedTransport::SetDefaultReply(ScriptedReply reply) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultReply = std::move(reply);
}

void ScriptedTransport::InjectNotification(std::string text, std::chrono::milliseconds delay,
                                           CharacteristicHandle characteristic) {
    Delivery delivery;
    delivery.due = std::chrono::steady_clock::now() + delay;
    delivery.characteristic = characteristic;
    delivery.text = std::move(text);
    Schedule(std::move(delivery));
}

void ScriptedTransport::DropLink(const std::string& reason) {
    Delivery delivery;
    delivery.due = std::chrono::steady_clock::now();
    delivery.linkLoss = true;
    delivery.text = reason;
    Schedule(std::move(delivery));
}

std::vector<std::string> ScriptedTransport::WrittenCommands() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_written;
}

uint32_t ScriptedTransport::DisconnectCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disconnects;
}

LinkResult ScriptedTransport::Connect(const DeviceSelector& selector) {
    LinkResult result;
    const bool nameMatches = selector.namePrefix.empty() ||
                             m_config.identity.name.compare(0, selector.namePrefix.size(), selector.namePrefix) == 0;
    const bool idMatches = selector.deviceId.empty() || selector.deviceId == m_config.identity.id;
    const bool serviceMatches = selector.serviceUuid.empty() || selector.serviceUuid == m_config.serviceUuid;

    if (!m_config.discoverable || !nameMatches || !idMatches || !serviceMatches) {
        result.status = LinkStatus::NotFound;
        result.message = "no matching device advertising";
        return result;
    }
    if (m_config.connectFails) {
        result.status = LinkStatus::Failed;
        result.message = "connection refused by device";
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected = true;
    m_subscribed = false;
    result.status = LinkStatus::Ok;
    result.device = m_config.identity;
    return result;
}

std::optional<ServiceHandle> ScriptedTransport::FindService(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected || uuid != m_config.serviceUuid) {
        return std::nullopt;
    }
    return kServiceHandle;
}

std::optional<CharacteristicHandle> ScriptedTransport::FindCharacteristic(ServiceHandle service,
                                                                          const std::string& uuid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected || service != kServiceHandle) {
        return std::nullopt;
    }
    if (uuid == m_config.controlCharUuid) {
        return kControlHandle;
    }
    if (uuid == m_config.eventCharUuid) {
        return kEventHandle;
    }
    return std::nullopt;
}

bool ScriptedTransport::StartNotifications(CharacteristicHandle characteristic) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected || m_config.notificationsFail || characteristic != kEventHandle) {
        return false;
    }
    m_subscribed = true;
    return true;
}

/**
 * @brief Accept a command write and schedule the scripted reaction.
 *
 * The command id is read from the written JSON's "command" field.
 */
bool ScriptedTransport::Write(CharacteristicHandle characteristic, const uint8_t* data, std::size_t length,
                              std::chrono::milliseconds /*timeout*/) {
    if (!data || length == 0) {
        return false;
    }
    const std::string text(reinterpret_cast<const char*>(data), length);

    std::string commandId;
    const DecodeResult decoded = DecodeNotification(data, length);
    if (decoded.event && decoded.event->fields) {
        const auto it = decoded.event->fields->find(kCommandKey);
        if (it != decoded.event->fields->end()) {
            if (const auto* id = std::get_if<std::string>(&it->second)) {
                commandId = *id;
            }
        }
    }

    ScriptedReply reply;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected || characteristic != kControlHandle) {
            return false;
        }
        m_written.push_back(text);
        const auto it = m_scripts.find(commandId);
        reply = it != m_scripts.end() ? it->second : m_defaultReply;
    }

    switch (reply.kind) {
        case ScriptedReply::Kind::FailWrite:
            return false;
        case ScriptedReply::Kind::Silent:
            return true;
        case ScriptedReply::Kind::Respond: {
            InjectNotification(reply.text, reply.delay);
            return true;
        }
        case ScriptedReply::Kind::DropLink: {
            Delivery delivery;
            delivery.due = std::chrono::steady_clock::now() + reply.delay;
            delivery.linkLoss = true;
            delivery.text = reply.text.empty() ? "device disconnected" : reply.text;
            Schedule(std::move(delivery));
            return true;
        }
    }
    return true;
}

void ScriptedTransport::Disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_disconnects;
    m_connected = false;
    m_subscribed = false;
    m_queue.clear();
}

bool ScriptedTransport::IsConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
}

void ScriptedTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_notificationHandler = std::move(handler);
}

void ScriptedTransport::SetDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_disconnectHandler = std::move(handler);
}

void ScriptedTransport::Schedule(Delivery delivery) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        delivery.order = m_nextOrder++;
        m_queue.push_back(std::move(delivery));
    }
    m_cv.notify_all();
}

void ScriptedTransport::WorkerLoop() {
    const auto earlier = [](const Delivery& a, const Delivery& b) {
        return a.due < b.due || (a.due == b.due && a.order < b.order);
    };

    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shutdown) {
        if (m_queue.empty()) {
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            continue;
        }

        auto next = std::min_element(m_queue.begin(), m_queue.end(), earlier);
        const auto due = next->due;
        if (std::chrono::steady_clock::now() < due) {
            // Woken early by a new delivery, shutdown or Disconnect(); re-evaluate
            m_cv.wait_until(lock, due);
            continue;
        }

        Delivery delivery = std::move(*next);
        m_queue.erase(next);
        lock.unlock();
        Deliver(delivery);
        lock.lock();
    }
}

void ScriptedTransport::Deliver(const Delivery& delivery) {
    if (delivery.linkLoss) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_connected) {
                return;
            }
            m_connected = false;
            m_subscribed = false;
            m_queue.clear();
        }
        // Handlers run under m_handlerMutex, Set*Handler waits for them
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        if (m_disconnectHandler) {
            m_disconnectHandler(delivery.text);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected || !m_subscribed) {
            return;
        }
    }
    // Handlers run under m_handlerMutex, Set*Handler waits for them
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    if (m_notificationHandler) {
        m_notificationHandler(delivery.characteristic,
                              reinterpret_cast<const uint8_t*>(delivery.text.data()), delivery.text.size());
    }
}

} // namespace qcseq
