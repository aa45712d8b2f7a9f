#pragma once

#include "qcseq/command_codec.h"
#include "qcseq/event_inbox.h"
#include "qcseq/transport/adapter.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace qcseq {

enum class InboxEventKind : uint8_t {
    Response = 0,           ///< Decoded notification on the event characteristic
    DecodeFailure,          ///< Notification that could not be decoded
    ForeignCharacteristic,  ///< Notification on a characteristic we did not subscribe for
    LinkLost,               ///< Transport reported an unsolicited disconnect
    StopRequested,          ///< Operator asked the run to stop
};

/**
 * @brief Immutable value posted from transport threads to the sequencer loop.
 */
struct InboxEvent {
    InboxEventKind kind{InboxEventKind::Response};
    /// Index of the test that was Running when the event arrived
    std::optional<std::size_t> activeTest;
    std::optional<DecodedEvent> decoded;
    CodecError codecError{CodecError::None};
    std::string text;  ///< Raw payload, diagnostic or reason
};

/**
 * @brief Turns raw transport notifications into inbox events.
 *
 * Each notification is decoded and tagged with the test active at arrival
 * time. The router never touches session state; the sequencer decides
 * whether an event settles the current test.
 *
 * Thread-safe: OnNotification() and OnLinkLost() run on transport threads.
 */
class EventRouter {
public:
    /// Returns the index of the test currently Running, if any.
    using ActiveTestQuery = std::function<std::optional<std::size_t>()>;

    EventRouter(EventInbox<InboxEvent>& inbox, ActiveTestQuery activeTest);

    /// Characteristic whose notifications are test responses.
    void SetEventCharacteristic(CharacteristicHandle handle);

    void OnNotification(CharacteristicHandle characteristic, const uint8_t* data, std::size_t length);

    void OnLinkLost(const std::string& reason);

    void RequestStop();

    uint64_t DecodeErrorCount() const { return m_decodeErrors.load(); }
    uint64_t DroppedEventCount() const { return m_dropped.load(); }

private:
    void Post(InboxEvent event);

    EventInbox<InboxEvent>& m_inbox;
    ActiveTestQuery m_activeTest;
    std::atomic<CharacteristicHandle> m_eventChar{kInvalidHandle};
    std::atomic<uint64_t> m_decodeErrors{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace qcseq
