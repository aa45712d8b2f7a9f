#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace qcseq {

enum class FramerError : uint8_t {
    None = 0,
    FrameTooLarge,  ///< No newline within the configured maximum
};

/**
 * @brief Splits a byte stream into newline-terminated text frames.
 *
 * A trailing '\r' is stripped and empty lines are skipped. Bytes of an
 * oversized frame are discarded up to and including its terminating newline.
 */
class LineFramer {
public:
    using FrameCallback = std::function<void(const std::string&)>;
    struct ErrorInfo {
        FramerError code{FramerError::None};
        std::size_t offset{0};  ///< Stream offset where the bad frame started
        uint64_t consecutiveErrors{0};
    };
    using ErrorCallback = std::function<void(const ErrorInfo&)>;

    static constexpr std::size_t kMinFrameSize = 64;

    LineFramer(FrameCallback onFrame, ErrorCallback onError = {}, std::size_t maxFrameSize = 16384);

    void Push(const uint8_t* data, std::size_t length);

    void Reset(bool resetErrorState = true);

    std::size_t Buffered() const { return m_buffer.size(); }
    uint64_t FramesEmitted() const { return m_framesEmitted; }
    uint64_t FramesDropped() const { return m_framesDropped; }

private:
    void EmitFrame();
    void EmitError(FramerError error);

    FrameCallback m_onFrame;
    ErrorCallback m_onError;
    std::size_t m_maxFrameSize;
    std::string m_buffer;
    std::size_t m_frameStart{0};
    std::size_t m_streamOffset{0};
    bool m_discarding{false};
    uint64_t m_consecutiveErrors{0};
    uint64_t m_framesEmitted{0};
    uint64_t m_framesDropped{0};
};

} // namespace qcseq
