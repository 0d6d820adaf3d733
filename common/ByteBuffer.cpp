#include "ByteBuffer.hpp"
#include <stdexcept>

namespace port_watch::common
{
    namespace
    {
        // Reclaim the consumed prefix once it dominates the buffer.
        constexpr size_t kCompactThreshold = 64 * 1024;
    }

    void ByteBuffer::Compact()
    {
        if (m_read_pos == 0)
            return;
        if (m_read_pos == m_buffer.size())
        {
            m_buffer.clear();
            m_read_pos = 0;
            return;
        }
        if (m_read_pos >= kCompactThreshold || m_read_pos * 2 >= m_buffer.size())
        {
            m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_read_pos));
            m_read_pos = 0;
        }
    }

    void ByteBuffer::Append(const uint8_t *data, size_t size)
    {
        Compact();
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    bool ByteBuffer::HasHeader() const
    {
        return Size() >= port_watch::protocol::HEADER_SIZE;
    }

    port_watch::protocol::Header ByteBuffer::PeekHeader() const
    {
        if (!HasHeader())
            throw std::runtime_error("ByteBuffer::PeekHeader - Not enough bytes");
        return port_watch::protocol::DeserializeHeader(m_buffer.data() + m_read_pos);
    }

    bool ByteBuffer::IsHeaderValid(const port_watch::protocol::Header &hdr) const
    {
        return hdr.magic == port_watch::protocol::EXPECTED_MAGIC &&
               hdr.payload_length <= port_watch::protocol::MAX_PAYLOAD_LENGTH;
    }

    bool ByteBuffer::HasCompleteMessage(const port_watch::protocol::Header &hdr) const
    {
        if (hdr.payload_length > port_watch::protocol::MAX_PAYLOAD_LENGTH)
            return false;
        return Size() >= port_watch::protocol::HEADER_SIZE + hdr.payload_length;
    }

    void ByteBuffer::Consume(size_t bytes)
    {
        if (bytes >= Size())
        {
            Clear();
            return;
        }
        m_read_pos += bytes;
    }

    std::vector<uint8_t> ByteBuffer::ExtractPayload(size_t payload_len) const
    {
        if (port_watch::protocol::HEADER_SIZE + payload_len > Size())
            throw std::runtime_error("ByteBuffer::ExtractPayload - Buffer underflow");

        auto start_it = m_buffer.begin() + static_cast<std::ptrdiff_t>(m_read_pos + port_watch::protocol::HEADER_SIZE);
        return std::vector<uint8_t>(start_it, start_it + static_cast<std::ptrdiff_t>(payload_len));
    }

    FrameStatus ByteBuffer::NextFrame(Frame &out)
    {
        if (!HasHeader())
            return FrameStatus::Incomplete;

        auto hdr = PeekHeader();
        if (!IsHeaderValid(hdr))
            return FrameStatus::Invalid;
        if (!HasCompleteMessage(hdr))
            return FrameStatus::Incomplete;

        out.type = static_cast<port_watch::protocol::MessageType>(hdr.msg_type);
        out.payload = ExtractPayload(hdr.payload_length);
        Consume(port_watch::protocol::HEADER_SIZE + hdr.payload_length);
        return FrameStatus::Ready;
    }
}
