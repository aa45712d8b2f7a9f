/**
 * @file command_codec.cpp
 * @brief ArduinoJson-backed implementation of the QA command codec.
 */

#include "qcseq/command_codec.h"

#include <algorithm>
#include <cstring>

namespace qcseq {

namespace {

struct MemberWriter {
    JsonObject object;
    const std::string& key;

    template<typename T>
    void operator()(const T& value) const {
        object[key] = value;
    }
};

char FirstNonSpace(const uint8_t* data, std::size_t length) {
    for (std::size_t i = 0; i < length; ++i) {
        const char c = static_cast<char>(data[i]);
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return c;
        }
    }
    return '\0';
}

} // namespace

void WritePayload(JsonObject target, const Payload& payload) {
    for (const auto& [key, value] : payload) {
        std::visit(MemberWriter{target, key}, value);
    }
}

bool ReadPayload(JsonObjectConst source, Payload& out, bool allowNested, std::string* badKey) {
    for (JsonPairConst member : source) {
        const std::string key = member.key().c_str();
        JsonVariantConst value = member.value();

        if (value.is<bool>()) {
            out[key] = value.as<bool>();
        } else if (value.is<int64_t>()) {
            out[key] = value.as<int64_t>();
        } else if (value.is<double>()) {
            out[key] = value.as<double>();
        } else if (value.is<const char*>()) {
            out[key] = std::string(value.as<const char*>());
        } else if (allowNested) {
            std::string nested;
            serializeJson(value, nested);
            out[key] = std::move(nested);
        } else {
            if (badKey) {
                *badKey = key;
            }
            return false;
        }
    }
    return true;
}

std::string EncodeCommand(const std::string& commandId, const Payload& payload) {
    JsonDocument doc;
    JsonObject root = doc.to<JsonObject>();
    root[kCommandKey] = commandId;

    for (const auto& [key, value] : payload) {
        // The opcode is authoritative; catalog validation rejects this key anyway
        if (key == kCommandKey) {
            continue;
        }
        std::visit(MemberWriter{root, key}, value);
    }

    std::string wire;
    serializeJson(doc, wire);
    return wire;
}

DecodeResult DecodeNotification(const uint8_t* data, std::size_t length) {
    DecodeResult result;
    if (!data || length == 0) {
        result.error = CodecError::EmptyPayload;
        result.message = "empty notification";
        return result;
    }

    result.raw.assign(reinterpret_cast<const char*>(data), length);

    if (std::find(data, data + length, uint8_t{0}) != data + length) {
        result.error = CodecError::InvalidText;
        result.message = "notification contains NUL bytes";
        return result;
    }

    DecodedEvent event;
    event.receivedAt = WallClock::now();
    event.arrival = std::chrono::steady_clock::now();
    event.raw = result.raw;

    const char first = FirstNonSpace(data, length);
    if (first == '{' || first == '[') {
        JsonDocument doc;
        const DeserializationError error = deserializeJson(doc, event.raw);
        if (error) {
            result.error = CodecError::MalformedJson;
            result.message = error.c_str();
            return result;
        }

        if (doc.is<JsonObjectConst>()) {
            Payload fields;
            if (ReadPayload(doc.as<JsonObjectConst>(), fields, true)) {
                event.fields = std::move(fields);
            }
        }
    }

    result.event = std::move(event);
    return result;
}

const char* ToString(CodecError error) {
    switch (error) {
        case CodecError::None: return "None";
        case CodecError::EmptyPayload: return "EmptyPayload";
        case CodecError::InvalidText: return "InvalidText";
        case CodecError::MalformedJson: return "MalformedJson";
    }
    return "Unknown";
}

} // namespace qcseq
