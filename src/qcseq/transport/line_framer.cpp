/**
 * @file line_framer.cpp
 * @brief Newline framing for the bridge byte stream.
 */

#include "qcseq/transport/line_framer.h"

namespace qcseq {

/**
 * @brief Construct a framer with callbacks and a frame size limit.
 *
 * @param onFrame Callback invoked for each complete, non-empty frame
 * @param onError Callback invoked when a frame is dropped (optional)
 * @param maxFrameSize Longest accepted frame without its newline (minimum: kMinFrameSize)
 */
LineFramer::LineFramer(FrameCallback onFrame, ErrorCallback onError, std::size_t maxFrameSize)
    : m_onFrame(std::move(onFrame)), m_onError(std::move(onError)), m_maxFrameSize(maxFrameSize) {
    if (m_maxFrameSize < kMinFrameSize) {
        m_maxFrameSize = kMinFrameSize;
    }
    m_buffer.reserve(m_maxFrameSize);
}

/**
 * @brief Push raw bytes; frames are delivered synchronously from this call.
 *
 * Partial frames are kept until a later Push() completes them.
 */
void LineFramer::Push(const uint8_t* data, std::size_t length) {
    if (!data || length == 0) {
        return;
    }

    for (std::size_t i = 0; i < length; ++i) {
        const char c = static_cast<char>(data[i]);
        ++m_streamOffset;

        if (c == '\n') {
            if (m_discarding) {
                m_discarding = false;
            } else {
                EmitFrame();
            }
            m_buffer.clear();
            m_frameStart = m_streamOffset;
            continue;
        }

        if (m_discarding) {
            continue;
        }

        if (m_buffer.size() >= m_maxFrameSize) {
            m_buffer.clear();
            m_discarding = true;
            ++m_framesDropped;
            EmitError(FramerError::FrameTooLarge);
            continue;
        }
        m_buffer.push_back(c);
    }
}

void LineFramer::Reset(bool resetErrorState) {
    m_buffer.clear();
    m_discarding = false;
    m_frameStart = m_streamOffset;
    if (resetErrorState) {
        m_consecutiveErrors = 0;
    }
}

void LineFramer::EmitFrame() {
    if (!m_buffer.empty() && m_buffer.back() == '\r') {
        m_buffer.pop_back();
    }
    if (m_buffer.empty()) {
        return;
    }

    m_consecutiveErrors = 0;
    ++m_framesEmitted;
    if (m_onFrame) {
        m_onFrame(m_buffer);
    }
}

void LineFramer::EmitError(FramerError error) {
    ++m_consecutiveErrors;
    if (m_onError) {
        m_onError(ErrorInfo{error, m_frameStart, m_consecutiveErrors});
    }
}

} // namespace qcseq
