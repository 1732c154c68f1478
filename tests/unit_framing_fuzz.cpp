// SPDX-License-Identifier: Apache-2.0
// unit_framing_fuzz.cpp - randomized streams through the frame parser.
#include "common/framing.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace nu = bulletsim::netutil;

namespace {

std::string random_bytes(std::mt19937 &rng, size_t n)
{
    std::uniform_int_distribution<int> byte{0, 255};
    std::string s(n, '\0');
    for (auto &c : s)
        c = static_cast<char>(byte(rng));
    return s;
}

// Pushes `stream` through the parser in slices of at most `slice` bytes, collecting every payload.
std::vector<std::string> drain(const std::string &stream, size_t slice, nu::extract_status &last)
{
    nu::FrameParseState st;
    std::vector<std::string> got;
    std::string payload;
    last = nu::extract_status::need_more;
    for (size_t pos = 0; pos < stream.size(); pos += slice) {
        auto end = std::min(stream.size(), pos + slice);
        st.buffer.insert(st.buffer.end(), stream.begin() + pos, stream.begin() + end);
        while ((last = nu::try_extract(st, payload)) == nu::extract_status::complete)
            got.push_back(payload);
        if (last == nu::extract_status::invalid)
            break;
    }
    return got;
}

void concatenated_streams_survive_any_slicing(std::mt19937 &rng)
{
    std::uniform_int_distribution<size_t> frames_per_stream{1, 8};
    std::uniform_int_distribution<size_t> payload_len{1, 1500};
    std::uniform_int_distribution<size_t> slice_len{1, 97};
    for (int round = 0; round < 150; ++round) {
        std::vector<std::string> sent(frames_per_stream(rng));
        std::string stream;
        for (auto &p : sent) {
            p = random_bytes(rng, payload_len(rng));
            nu::append_frame(stream, p);
        }
        nu::extract_status last;
        auto got = drain(stream, slice_len(rng), last);
        assert(last == nu::extract_status::need_more);
        assert(got == sent);
    }
}

void truncated_frame_never_completes(std::mt19937 &rng)
{
    for (int round = 0; round < 100; ++round) {
        auto frame = nu::build_frame(random_bytes(rng, 16 + round * 7));
        std::uniform_int_distribution<size_t> cut{1, frame.size() - 1};
        frame.resize(frame.size() - cut(rng));
        nu::extract_status last;
        auto got = drain(frame, 13, last);
        assert(got.empty());
        assert(last == nu::extract_status::need_more);
    }
}

void garbage_after_valid_frame_is_contained(std::mt19937 &rng)
{
    for (int round = 0; round < 100; ++round) {
        std::string stream = nu::build_frame("fire");
        stream += random_bytes(rng, 4 + round % 40);
        nu::extract_status last;
        auto got = drain(stream, 5, last);
        assert(!got.empty());
        assert(got.front() == "fire");
        for (auto &p : got)
            assert(!p.empty() && p.size() <= nu::kMaxFrameBytes);
    }
}

} // namespace

int main()
{
    std::mt19937 rng(0xB011E7u);
    concatenated_streams_survive_any_slicing(rng);
    truncated_frame_never_completes(rng);
    garbage_after_valid_frame_is_contained(rng);
    std::cout << "unit_framing_fuzz OK" << std::endl;
    return 0;
}
