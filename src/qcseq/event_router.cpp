/**
 * @file event_router.cpp
 * @brief Decodes device notifications and forwards them to the sequencer inbox.
 */

#include "qcseq/event_router.h"

#include <iostream>

namespace qcseq {

EventRouter::EventRouter(EventInbox<InboxEvent>& inbox, ActiveTestQuery activeTest)
    : m_inbox(inbox), m_activeTest(std::move(activeTest)) {}

void EventRouter::SetEventCharacteristic(CharacteristicHandle handle) {
    m_eventChar.store(handle);
}

/**
 * @brief Decode one notification and post it to the inbox.
 *
 * The active test is sampled before decoding so the tag reflects the
 * arrival moment, not the end of decoding.
 *
 * @param characteristic Characteristic the notification arrived on
 * @param data Notification value
 * @param length Value length in bytes
 */
void EventRouter::OnNotification(CharacteristicHandle characteristic, const uint8_t* data,
                                 std::size_t length) {
    InboxEvent event;
    event.activeTest = m_activeTest ? m_activeTest() : std::nullopt;

    if (characteristic != m_eventChar.load()) {
        event.kind = InboxEventKind::ForeignCharacteristic;
        if (data && length > 0) {
            event.text.assign(reinterpret_cast<const char*>(data), length);
        }
        Post(std::move(event));
        return;
    }

    DecodeResult decoded = DecodeNotification(data, length);
    if (!decoded.event) {
        ++m_decodeErrors;
        event.kind = InboxEventKind::DecodeFailure;
        event.codecError = decoded.error;
        event.text = decoded.message.empty() ? decoded.raw : decoded.message + ": " + decoded.raw;
        Post(std::move(event));
        return;
    }

    event.kind = InboxEventKind::Response;
    event.text = decoded.event->raw;
    event.decoded = std::move(decoded.event);
    Post(std::move(event));
}

void EventRouter::OnLinkLost(const std::string& reason) {
    InboxEvent event;
    event.kind = InboxEventKind::LinkLost;
    event.activeTest = m_activeTest ? m_activeTest() : std::nullopt;
    event.text = reason;
    Post(std::move(event));
}

void EventRouter::RequestStop() {
    InboxEvent event;
    event.kind = InboxEventKind::StopRequested;
    Post(std::move(event));
}

void EventRouter::Post(InboxEvent event) {
    if (!m_inbox.Post(std::move(event))) {
        ++m_dropped;
        std::cerr << "Event router: inbox full, dropping event" << std::endl;
    }
}

} // namespace qcseq
