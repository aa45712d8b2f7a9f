#pragma once

/**
 * @file command_codec.h
 * @brief JSON wire codec for QA commands and device notifications.
 *
 * Commands are compact JSON objects: {"command":"<id>", <payload fields>}.
 * Notifications are opaque text; JSON objects additionally expose their
 * top-level fields. Decoding never throws.
 */

#include "qcseq/session.h"

#include <ArduinoJson.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace qcseq {

/// Reserved key carrying the opcode in every command.
constexpr const char* kCommandKey = "command";

enum class CodecError : uint8_t {
    None = 0,
    EmptyPayload,
    InvalidText,    ///< Embedded NUL bytes
    MalformedJson,  ///< Looked like JSON but did not parse
};

/**
 * @brief A notification that decoded into a usable response.
 */
struct DecodedEvent {
    std::string raw;                         ///< Payload text as received
    std::optional<Payload> fields;           ///< Top-level fields when raw is a JSON object
    WallClock::time_point receivedAt{};      ///< Wall clock, for the audit log
    std::chrono::steady_clock::time_point arrival{};  ///< Monotonic, for durations
};

struct DecodeResult {
    std::optional<DecodedEvent> event;
    CodecError error{CodecError::None};
    std::string raw;      ///< Best-effort text of the rejected payload
    std::string message;  ///< Parser diagnostic on failure
};

/// Serialize {"command": commandId, ...payload} as compact JSON.
std::string EncodeCommand(const std::string& commandId, const Payload& payload);

DecodeResult DecodeNotification(const uint8_t* data, std::size_t length);

inline DecodeResult DecodeNotification(const std::string& text) {
    return DecodeNotification(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

const char* ToString(CodecError error);

/// Copy payload entries into a JSON object.
void WritePayload(JsonObject target, const Payload& payload);

/**
 * @brief Read scalar members of a JSON object into a Payload.
 *
 * @param source Object to read
 * @param out Destination (entries are added)
 * @param allowNested When true, nested objects, arrays and nulls are kept as
 *                    JSON text; when false they are rejected
 * @param badKey Receives the offending key on failure (optional)
 * @return false if a member could not be represented
 */
bool ReadPayload(JsonObjectConst source, Payload& out, bool allowNested, std::string* badKey = nullptr);

} // namespace qcseq
