#include "../../include/segment_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <optional>

namespace mender {

    namespace {

        constexpr std::string_view kTag = "segment_parser";

        std::size_t be16(const std::span<const std::uint8_t> b, const std::size_t at) {
            return static_cast<std::size_t>(b[at]) << 8 | b[at + 1];
        }

        // markers that may legitimately start the next segment of a header walk
        bool plausible_segment_marker(const std::uint8_t m) {
            return m >= 0xC0 && m <= 0xFE && !(m >= 0xD0 && m <= 0xD8);
        }

        std::optional<std::size_t> find_soi(const std::span<const std::uint8_t> b) {
            for (std::size_t i = 0; i + 1 < b.size(); ++i) {
                if (b[i] == 0xFF && b[i + 1] == 0xD8 && (i + 2 >= b.size() || b[i + 2] == 0xFF)) {
                    return i;
                }
            }
            return std::nullopt;
        }

        std::size_t resync(const std::span<const std::uint8_t> b, const std::size_t from) {
            for (std::size_t i = from; i + 1 < b.size(); ++i) {
                if (b[i] == 0xFF && plausible_segment_marker(b[i + 1])) {
                    return i;
                }
            }
            return b.size();
        }

        /**
         * @brief Walk entropy-coded data.
         * @return Offset of the marker that terminates the scan, or the stream size.
         */
        std::size_t walk_scan(const std::span<const std::uint8_t> b,
                              const std::size_t from,
                              std::size_t& embedded_start_markers) {
            std::size_t q = from;
            while (q + 1 < b.size()) {
                if (b[q] != 0xFF) {
                    ++q;
                    continue;
                }
                const std::uint8_t next = b[q + 1];
                if (next == 0x00 || (next >= 0xD0 && next <= 0xD7)) {
                    q += 2; // byte stuffing or restart marker
                    continue;
                }
                if (next == 0xFF) {
                    ++q;
                    continue;
                }
                if (next == 0xD8 && q + 2 < b.size() && b[q + 2] == 0xFF) {
                    ++embedded_start_markers;
                    q += 2;
                    continue;
                }
                return q;
            }
            return b.size();
        }

        bool plausible_length(const std::uint8_t m, const std::span<const std::uint8_t> b,
                              const std::size_t pos, const std::size_t declared) {
            if (declared < 2 || pos + 2 + declared > b.size()) return false;
            if (m == 0xDB) return (declared - 2) % 65 == 0 || (declared - 2) % 129 == 0;
            if (m == 0xC4) return declared >= 19;
            if (m == 0xDD) return declared == 4;
            if (m == 0xDA) return pos + 4 < b.size() && declared == 6 + 2 * static_cast<std::size_t>(b[pos + 4]);
            if (is_jpeg_sof(m)) return pos + 9 < b.size() && declared == 8 + 3 * static_cast<std::size_t>(b[pos + 9]);
            return false;
        }

    } // namespace

    std::string jpeg_marker_name(const std::uint8_t marker) {
        if (marker == 0xC4) return "DHT";
        if (marker == 0xC8) return "JPG";
        if (marker == 0xCC) return "DAC";
        if (marker >= 0xC0 && marker <= 0xCF) return "SOF" + std::to_string(marker - 0xC0);
        if (marker >= 0xD0 && marker <= 0xD7) return "RST" + std::to_string(marker - 0xD0);
        if (marker >= 0xE0 && marker <= 0xEF) return "APP" + std::to_string(marker - 0xE0);
        if (marker >= 0xF0 && marker <= 0xFD) return "JPG" + std::to_string(marker - 0xF0);
        switch (marker) {
            case 0x01: return "TEM";
            case 0xD8: return "SOI";
            case 0xD9: return "EOI";
            case 0xDA: return "SOS";
            case 0xDB: return "DQT";
            case 0xDC: return "DNL";
            case 0xDD: return "DRI";
            case 0xDE: return "DHP";
            case 0xDF: return "EXP";
            case 0xFE: return "COM";
            default:   return "RES";
        }
    }

    ContainerStructure parse_jpeg(const std::span<const std::uint8_t> b) {
        const std::size_t n = b.size();
        const auto soi = find_soi(b);
        if (!soi) {
            throw MalformedContainer("no JPEG start-of-image marker", n);
        }

        ContainerStructure s;
        s.format = ImageFormat::Jpeg;
        s.start_offset = *soi;
        s.has_start_marker = *soi == 0;
        s.segments.push_back({"SOI", 0xD8, *soi, 2});

        std::size_t pos = *soi + 2;
        for (;;) {
            if (pos >= n) {
                s.stop_reason = StopReason::EndOfStream;
                break;
            }
            if (b[pos] != 0xFF) {
                if (s.segments.size() > 1) {
                    auto& prev = s.segments.back();
                    prev.intact = false;
                    prev.issue = "followed by non-marker bytes";
                }
                pos = resync(b, pos);
                continue;
            }
            while (pos + 1 < n && b[pos + 1] == 0xFF) ++pos; // fill bytes
            if (pos + 1 >= n) {
                s.stop_reason = StopReason::EndOfStream;
                break;
            }

            const std::uint8_t m = b[pos + 1];
            if (m == 0xD9) {
                s.segments.push_back({"EOI", m, pos, 2});
                s.has_end_marker = true;
                s.end_offset = pos + 2;
                s.trailing_bytes = n - s.end_offset;
                s.stop_reason = StopReason::EndMarker;
                pos = s.end_offset;
                break;
            }
            if (m == 0xD8 || m == 0x00 || (m >= 0x02 && m <= 0xBF)) {
                s.stop_reason = StopReason::InvalidMarker;
                break;
            }
            if (is_jpeg_standalone(m)) {
                s.segments.push_back({jpeg_marker_name(m), m, pos, 2});
                pos += 2;
                continue;
            }
            if (pos + 4 > n) {
                s.segments.push_back({jpeg_marker_name(m), m, pos, n - pos, false, "segment header truncated"});
                s.stop_reason = StopReason::TruncatedSegment;
                pos = n;
                break;
            }

            const std::size_t declared = be16(b, pos + 2);
            Segment seg{jpeg_marker_name(m), m, pos, 2 + declared};
            if (declared < 2) {
                seg.length = 4;
                seg.intact = false;
                seg.issue = "declared length below 2";
                s.segments.push_back(std::move(seg));
                pos = resync(b, pos + 2);
                continue;
            }
            if (seg.end() > n) {
                seg.length = n - pos;
                seg.intact = false;
                seg.issue = "segment runs past end of stream";
                s.segments.push_back(std::move(seg));
                s.stop_reason = StopReason::TruncatedSegment;
                pos = n;
                break;
            }
            if (is_jpeg_sof(m)) {
                s.has_frame_header = true;
                s.progressive = s.progressive || m == 0xC2 || m == 0xC6 || m == 0xCA || m == 0xCE;
            }

            if (m == 0xDA) {
                const std::size_t scan_begin = seg.end();
                s.segments.push_back(std::move(seg));
                const std::size_t scan_end = walk_scan(b, scan_begin, s.embedded_start_markers);
                if (scan_end > scan_begin) {
                    s.segments.push_back({"SCAN", 0, scan_begin, scan_end - scan_begin});
                    s.has_scan_data = true;
                }
                pos = scan_end;
                continue;
            }

            if (seg.end() < n && b[seg.end()] != 0xFF) {
                seg.intact = false;
                seg.issue = "declared length does not end at a marker";
                s.segments.push_back(std::move(seg));
                pos = resync(b, pos + 4);
                continue;
            }
            pos = seg.end();
            s.segments.push_back(std::move(seg));
        }

        s.stopped_at_offset = std::min(pos, n);
        if (s.stop_reason == StopReason::EndOfStream && s.segments.back().kind == "SCAN") {
            s.ended_in_scan_data = true;
        }

        Logger::log(LogLevel::Debug,
                    "JPEG walk: " + std::to_string(s.segments.size()) + " segments, stopped at " +
                    std::to_string(s.stopped_at_offset) + " (" + std::string(to_string(s.stop_reason)) + ")",
                    kTag);
        return s;
    }

    std::vector<Segment> locate_jpeg_segments(const std::span<const std::uint8_t> b, const std::size_t from) {
        std::vector<Segment> found;
        std::size_t pos = from;
        while (pos + 4 <= b.size()) {
            if (b[pos] != 0xFF) {
                ++pos;
                continue;
            }
            const std::uint8_t m = b[pos + 1];
            const bool wanted = m == 0xDB || m == 0xC4 || m == 0xDD || m == 0xDA || is_jpeg_sof(m);
            const std::size_t declared = be16(b, pos + 2);
            if (!wanted || !plausible_length(m, b, pos, declared)) {
                ++pos;
                continue;
            }
            Segment seg{jpeg_marker_name(m), m, pos, 2 + declared};
            pos = seg.end();
            found.push_back(std::move(seg));
            if (m == 0xDA) {
                std::size_t embedded = 0;
                const std::size_t scan_end = walk_scan(b, pos, embedded);
                found.push_back({"SCAN", 0, pos, scan_end - pos});
                break;
            }
        }
        return found;
    }

} // namespace mender
