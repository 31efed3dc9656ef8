#include "../../include/segment_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <zlib.h>

namespace mender {

    namespace {

        constexpr std::array<std::uint8_t, 8> kPngSignature{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

        std::uint32_t be32(const std::span<const std::uint8_t> b, const std::size_t at) {
            return static_cast<std::uint32_t>(b[at]) << 24 |
                   static_cast<std::uint32_t>(b[at + 1]) << 16 |
                   static_cast<std::uint32_t>(b[at + 2]) << 8 |
                   static_cast<std::uint32_t>(b[at + 3]);
        }

        bool is_chunk_letter(const std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        std::string hex32(const std::uint32_t v) {
            char buf[11];
            std::snprintf(buf, sizeof(buf), "0x%08X", v);
            return buf;
        }

    } // namespace

    ContainerStructure parse_png(const std::span<const std::uint8_t> b) {
        const std::size_t n = b.size();
        const auto sig = std::search(b.begin(), b.end(), kPngSignature.begin(), kPngSignature.end());
        if (sig == b.end()) {
            throw MalformedContainer("no PNG signature", n);
        }

        ContainerStructure s;
        s.format = ImageFormat::Png;
        s.start_offset = static_cast<std::size_t>(sig - b.begin());
        s.has_start_marker = s.start_offset == 0;
        s.segments.push_back({"signature", 0, s.start_offset, kPngSignature.size()});

        std::size_t pos = s.start_offset + kPngSignature.size();
        for (;;) {
            if (pos >= n) {
                s.stop_reason = StopReason::EndOfStream;
                break;
            }
            if (pos + 8 > n) {
                s.segments.push_back({"partial", 0, pos, n - pos, false, "chunk header truncated"});
                s.stop_reason = StopReason::TruncatedSegment;
                pos = n;
                break;
            }

            const std::uint32_t len = be32(b, pos);
            const std::uint32_t type = be32(b, pos + 4);
            const bool letters = std::all_of(b.begin() + static_cast<std::ptrdiff_t>(pos + 4),
                                             b.begin() + static_cast<std::ptrdiff_t>(pos + 8),
                                             is_chunk_letter);
            if (!letters || len > 0x7FFFFFFFu) {
                s.stop_reason = StopReason::InvalidMarker;
                break;
            }

            std::string kind(reinterpret_cast<const char*>(b.data() + pos + 4), 4);
            Segment seg{kind, type, pos, 12 + static_cast<std::size_t>(len)};
            if (seg.end() > n) {
                seg.length = n - pos;
                seg.intact = false;
                seg.issue = "chunk runs past end of stream";
                if (kind == "IDAT") {
                    s.has_scan_data = true;
                    s.ended_in_scan_data = true;
                }
                s.segments.push_back(std::move(seg));
                s.stop_reason = StopReason::TruncatedSegment;
                pos = n;
                break;
            }

            const std::uint32_t stored = be32(b, pos + 8 + len);
            const auto computed = static_cast<std::uint32_t>(
                crc32(crc32(0L, Z_NULL, 0), b.data() + pos + 4, static_cast<uInt>(len + 4)));
            if (stored != computed) {
                seg.intact = false;
                seg.issue = "CRC mismatch (stored " + hex32(stored) + ", computed " + hex32(computed) + ")";
            }

            if (kind == "IHDR") s.has_frame_header = true;
            if (kind == "IDAT" && len > 0) s.has_scan_data = true;
            pos = seg.end();
            s.segments.push_back(std::move(seg));

            if (kind == "IEND") {
                s.has_end_marker = true;
                s.end_offset = pos;
                s.trailing_bytes = n - pos;
                s.stop_reason = StopReason::EndMarker;
                break;
            }
        }

        s.stopped_at_offset = std::min(pos, n);
        if (s.stop_reason == StopReason::EndOfStream && s.segments.back().kind == "IDAT") {
            s.ended_in_scan_data = true;
        }

        Logger::log(LogLevel::Debug,
                    "PNG walk: " + std::to_string(s.segments.size()) + " chunks, " +
                    std::to_string(s.inconsistent_segments()) + " inconsistent, stopped at " +
                    std::to_string(s.stopped_at_offset),
                    "segment_parser");
        return s;
    }

} // namespace mender
