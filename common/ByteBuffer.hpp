#pragma once

#include <cstdint>
#include <vector>
#include <cstring>
#include "protocol.hpp"

namespace port_watch::common
{
    struct Frame
    {
        port_watch::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    enum class FrameStatus
    {
        Incomplete, // need more bytes
        Ready,      // one frame extracted
        Invalid     // bad magic or oversize payload; the stream cannot be resynchronised
    };

    // Reassembles framed messages from a byte stream that may arrive in arbitrary
    // fragments. Consumed bytes are reclaimed lazily.
    class ByteBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;
        size_t m_read_pos = 0;

        void Compact();

    public:
        ByteBuffer() = default;
        void Append(const uint8_t *data, size_t size);

        FrameStatus NextFrame(Frame &out);

        bool HasHeader() const;
        port_watch::protocol::Header PeekHeader() const;
        bool IsHeaderValid(const port_watch::protocol::Header &hdr) const;
        bool HasCompleteMessage(const port_watch::protocol::Header &hdr) const;
        void Consume(size_t bytes);
        std::vector<uint8_t> ExtractPayload(size_t payload_len) const;

        size_t Size() const { return m_buffer.size() - m_read_pos; }
        void Clear()
        {
            m_buffer.clear();
            m_read_pos = 0;
        }
    };

}
