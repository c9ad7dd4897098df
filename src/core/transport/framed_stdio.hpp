// src/core/transport/framed_stdio.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport
{

    // Inbound envelopes are small requests; 1 MiB matches the host's own cap.
    constexpr uint32_t kMaxInboundBytes = 1024u * 1024u;

    // Outbound envelopes carry whole chunks and are bounded only by the u32 prefix.
    constexpr uint32_t kMaxOutboundBytes = 0xFFFFFFFFu;

    enum class ReadStatus
    {
        Ok,      // frame read into out
        Eof,     // clean EOF before a length prefix
        Skipped, // zero-length or oversized frame consumed and discarded (err set)
        Error    // truncated frame or stream failure (err set)
    };

    // Reads exactly n bytes into buf. Returns false on EOF or stream failure before n bytes.
    bool read_exact(std::istream &in, uint8_t *buf, size_t n);

    // Reads and discards exactly n bytes. Returns false on EOF or stream failure.
    bool skip_exact(std::istream &in, uint64_t n);

    // Reads one length-prefixed frame (uint32_le + payload bytes).
    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                          uint32_t max_len = kMaxInboundBytes);

    // Writes one length-prefixed frame (uint32_le + payload bytes) and flushes.
    // Returns false on error and sets err.
    bool write_frame(std::ostream &out, const uint8_t *data, size_t len, std::string &err,
                     uint32_t max_len = kMaxOutboundBytes);

} // namespace transport
