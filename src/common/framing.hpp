// SPDX-License-Identifier: Apache-2.0
// framing.hpp - length-prefixed frames for the TCP API: u32 big-endian payload size, then the payload.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bulletsim::netutil {

// Upper bound for a single API frame; fire requests and stats replies are far below this.
inline constexpr uint32_t kMaxFrameBytes = 1u << 20;
inline constexpr size_t kFrameHeaderBytes = 4;

inline void put_be32(char *dst, uint32_t v)
{
    dst[0] = static_cast<char>((v >> 24) & 0xff);
    dst[1] = static_cast<char>((v >> 16) & 0xff);
    dst[2] = static_cast<char>((v >> 8) & 0xff);
    dst[3] = static_cast<char>(v & 0xff);
}

inline uint32_t get_be32(const char *src)
{
    auto b = [src](int i) { return static_cast<uint32_t>(static_cast<unsigned char>(src[i])); };
    return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

inline void append_frame(std::string &out, std::string_view payload)
{
    char header[kFrameHeaderBytes];
    put_be32(header, static_cast<uint32_t>(payload.size()));
    out.append(header, kFrameHeaderBytes);
    out.append(payload);
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    frame.reserve(kFrameHeaderBytes + payload.size());
    append_frame(frame, payload);
    return frame;
}

enum class extract_status
{
    complete,
    need_more,
    invalid
};

// Receive side of one connection. Callers append raw bytes to `buffer`; consumed bytes are
// compacted away lazily.
struct FrameParseState
{
    std::vector<char> buffer;
    size_t read_pos{0};
};

// Extracts at most one payload into `out`. `invalid` means the peer sent a zero or oversized length
// prefix; the stream cannot be resynchronised and the connection should be dropped.
inline extract_status try_extract(FrameParseState &st, std::string &out)
{
    const size_t avail = st.buffer.size() - st.read_pos;
    if (avail < kFrameHeaderBytes)
        return extract_status::need_more;
    const uint32_t len = get_be32(st.buffer.data() + st.read_pos);
    if (len == 0 || len > kMaxFrameBytes)
        return extract_status::invalid;
    if (avail < kFrameHeaderBytes + len)
        return extract_status::need_more;
    out.assign(st.buffer.data() + st.read_pos + kFrameHeaderBytes, len);
    st.read_pos += kFrameHeaderBytes + len;
    if (st.read_pos == st.buffer.size()) {
        st.buffer.clear();
        st.read_pos = 0;
    } else if (st.read_pos > st.buffer.size() / 2) {
        st.buffer.erase(st.buffer.begin(), st.buffer.begin() + static_cast<std::ptrdiff_t>(st.read_pos));
        st.read_pos = 0;
    }
    return extract_status::complete;
}

} // namespace bulletsim::netutil
