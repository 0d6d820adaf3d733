#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace port_watch::common::wire
{
    inline void append_u8(std::vector<std::uint8_t>& out, std::uint8_t value)
    {
        out.push_back(value);
    }

    inline bool read_u8(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint8_t& value_out)
    {
        if (offset + 1 > in.size())
            return false;

        value_out = in[offset];
        offset += 1;
        return true;
    }

    inline void append_u32_be(std::vector<std::uint8_t>& out, std::uint32_t value)
    {
        std::uint32_t be = htonl(value);
        const auto* p = reinterpret_cast<const std::uint8_t*>(&be);
        out.insert(out.end(), p, p + 4);
    }

    inline bool read_u32_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint32_t& value_out)
    {
        if (offset + 4 > in.size())
            return false;

        std::uint32_t be = 0;
        std::memcpy(&be, in.data() + offset, 4);
        value_out = ntohl(be);
        offset += 4;
        return true;
    }

    inline void append_u64_be(std::vector<std::uint8_t>& out, std::uint64_t value)
    {
        append_u32_be(out, static_cast<std::uint32_t>(value >> 32));
        append_u32_be(out, static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
    }

    inline bool read_u64_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint64_t& value_out)
    {
        std::size_t tmp = offset;

        std::uint32_t hi = 0;
        std::uint32_t lo = 0;
        if (!read_u32_be(in, tmp, hi) || !read_u32_be(in, tmp, lo))
            return false;

        value_out = (static_cast<std::uint64_t>(hi) << 32) | lo;
        offset = tmp;
        return true;
    }

    inline void append_i64_be(std::vector<std::uint8_t>& out, std::int64_t value)
    {
        append_u64_be(out, static_cast<std::uint64_t>(value));
    }

    inline bool read_i64_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::int64_t& value_out)
    {
        std::uint64_t raw = 0;
        if (!read_u64_be(in, offset, raw))
            return false;

        value_out = static_cast<std::int64_t>(raw);
        return true;
    }

    // IEEE-754 bit pattern carried as a big-endian u64.
    inline void append_f64_be(std::vector<std::uint8_t>& out, double value)
    {
        std::uint64_t bits = 0;
        static_assert(sizeof(bits) == sizeof(value), "double must be 64-bit");
        std::memcpy(&bits, &value, sizeof(bits));
        append_u64_be(out, bits);
    }

    inline bool read_f64_be(const std::vector<std::uint8_t>& in, std::size_t& offset, double& value_out)
    {
        std::uint64_t bits = 0;
        if (!read_u64_be(in, offset, bits))
            return false;

        std::memcpy(&value_out, &bits, sizeof(bits));
        return true;
    }

    inline void append_string(std::vector<std::uint8_t>& out, std::string_view s)
    {
        append_u32_be(out, static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }

    inline bool read_string(const std::vector<std::uint8_t>& in, std::size_t& offset, std::string& out)
    {
        std::size_t tmp = offset;

        std::uint32_t len = 0;
        if (!read_u32_be(in, tmp, len))
            return false;

        if (tmp + len > in.size())
            return false;

        out.assign(reinterpret_cast<const char*>(in.data() + tmp), len);
        tmp += len;

        offset = tmp;
        return true;
    }
}
