/**
 * @file segment_stripping.cpp
 * @brief Removes locally inconsistent metadata segments and chunks.
 */

#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/repair_technique.hpp"

#include <zlib.h>

namespace mender {

    namespace {

        void put_be32(std::vector<std::uint8_t>& out, const std::size_t at, const std::uint32_t v) {
            out[at] = static_cast<std::uint8_t>(v >> 24);
            out[at + 1] = static_cast<std::uint8_t>(v >> 16);
            out[at + 2] = static_cast<std::uint8_t>(v >> 8);
            out[at + 3] = static_cast<std::uint8_t>(v);
        }

        bool is_critical(const Segment& seg, const ImageFormat format) {
            return format == ImageFormat::Png ? is_critical_png_chunk(seg.kind) : is_critical_jpeg_segment(seg);
        }

    } // namespace

    std::string_view SegmentStripping::variant_name(std::size_t) const noexcept {
        return "strip_inconsistent";
    }

    RepairCandidate SegmentStripping::attempt(const std::size_t index,
                                              const ImageArtifact& artifact,
                                              const ContainerStructure& structure) const {
        RepairCandidate candidate{std::string(variant_name(index)), std::nullopt, {}};
        const auto in = artifact.bytes();
        const ImageFormat format = artifact.format();

        std::vector<std::uint8_t> out;
        out.reserve(in.size());
        std::size_t stripped = 0;
        std::size_t crc_fixed = 0;

        for (const Segment& seg : structure.segments) {
            if (seg.end() > in.size()) {
                candidate.diagnostic = seg.kind + " at offset " + std::to_string(seg.offset) + " runs past the end";
                return candidate;
            }
            if (!seg.intact && !is_critical(seg, format)) {
                Logger::log(LogLevel::Debug,
                            artifact.id() + ": stripping " + seg.kind + " at " + std::to_string(seg.offset) +
                            " (" + seg.issue + ")",
                            "repair_engine");
                ++stripped;
                continue;
            }

            const std::size_t at = out.size();
            out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(seg.offset),
                       in.begin() + static_cast<std::ptrdiff_t>(seg.end()));

            if (!seg.intact && format == ImageFormat::Png && seg.length >= 12) {
                const std::size_t data_len = seg.length - 12;
                const auto crc = static_cast<std::uint32_t>(
                    crc32(crc32(0L, Z_NULL, 0), out.data() + at + 4, static_cast<uInt>(data_len + 4)));
                put_be32(out, at + 8 + data_len, crc);
                ++crc_fixed;
            }
        }

        if (stripped == 0 && crc_fixed == 0) {
            candidate.diagnostic = "no strippable segment; inconsistent segments are all critical";
            return candidate;
        }

        try {
            const auto s = parse_container(format, out);
            if (!s.has_end_marker) {
                candidate.diagnostic = "re-parse found no end marker";
                return candidate;
            }
            if (const std::size_t left = s.inconsistent_segments(); left > 0) {
                candidate.diagnostic = std::to_string(left) + " inconsistent segments remain";
                return candidate;
            }
        } catch (const MalformedContainer& e) {
            candidate.diagnostic = std::string("re-parse failed: ") + e.what();
            return candidate;
        }

        candidate.diagnostic = "stripped " + std::to_string(stripped) + " segments, recomputed " +
                               std::to_string(crc_fixed) + " CRCs";
        candidate.bytes = std::move(out);
        return candidate;
    }

} // namespace mender
