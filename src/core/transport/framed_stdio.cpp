// src/core/transport/framed_stdio.cpp
#include "framed_stdio.hpp"

#include <algorithm>
#include <array>

#include "protocol/byte_order.hpp"

namespace transport
{

    using bridge_protocol::decode_u32_le;
    using bridge_protocol::encode_u32_le;

    bool read_exact(std::istream &in, uint8_t *buf, size_t n)
    {
        size_t got = 0;
        while (got < n)
        {
            in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
            const std::streamsize r = in.gcount();

            if (r > 0)
            {
                got += static_cast<size_t>(r);
                continue;
            }

            // No bytes read: either EOF or error
            return false;
        }
        return true;
    }

    bool skip_exact(std::istream &in, uint64_t n)
    {
        std::array<uint8_t, 64 * 1024> scratch;
        while (n > 0)
        {
            const size_t step = static_cast<size_t>(std::min<uint64_t>(n, scratch.size()));
            if (!read_exact(in, scratch.data(), step))
            {
                return false;
            }
            n -= step;
        }
        return true;
    }

    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();

        uint8_t hdr[4] = {0, 0, 0, 0};

        // Distinguish clean EOF (0 bytes) from a truncated header.
        in.read(reinterpret_cast<char *>(hdr), 1);
        if (in.gcount() == 0)
        {
            return ReadStatus::Eof;
        }
        if (!read_exact(in, hdr + 1, 3))
        {
            err = "unexpected EOF while reading frame header";
            return ReadStatus::Error;
        }

        const uint32_t len = decode_u32_le(hdr);
        if (len == 0)
        {
            err = "invalid frame length: 0";
            return ReadStatus::Skipped;
        }
        if (len > max_len)
        {
            // Drain the oversized body so the next prefix is read in sync.
            if (!skip_exact(in, len))
            {
                err = "unexpected EOF while skipping oversized frame";
                return ReadStatus::Error;
            }
            err = "frame length " + std::to_string(len) + " exceeds max " + std::to_string(max_len);
            return ReadStatus::Skipped;
        }

        out.assign(len, 0);
        if (!read_exact(in, out.data(), len))
        {
            err = "unexpected EOF while reading frame payload";
            return ReadStatus::Error;
        }

        return ReadStatus::Ok;
    }

    bool write_frame(std::ostream &out, const uint8_t *data, size_t len, std::string &err, uint32_t max_len)
    {
        err.clear();

        if (len == 0)
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (len > max_len)
        {
            err = "frame length exceeds max";
            return false;
        }
        if (len > 0xFFFFFFFFu)
        {
            err = "frame length exceeds uint32";
            return false;
        }

        uint8_t hdr[4];
        encode_u32_le(static_cast<uint32_t>(len), hdr);

        out.write(reinterpret_cast<const char *>(hdr), 4);
        if (!out.good())
        {
            err = "failed writing frame header";
            return false;
        }

        out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
        if (!out.good())
        {
            err = "failed writing frame payload";
            return false;
        }

        out.flush();
        if (!out.good())
        {
            err = "failed flushing output";
            return false;
        }

        return true;
    }

} // namespace transport
