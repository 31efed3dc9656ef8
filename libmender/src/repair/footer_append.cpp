/**
 * @file footer_append.cpp
 * @brief Completes streams that lost their EOI marker or IEND chunk.
 */

#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/repair_technique.hpp"

#include <array>

namespace mender {

    namespace {

        constexpr std::array<std::uint8_t, 12> kPngIend{
            0x00, 0x00, 0x00, 0x00, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82};

        void append_end_marker(std::vector<std::uint8_t>& out, const ImageFormat format) {
            if (format == ImageFormat::Png) {
                out.insert(out.end(), kPngIend.begin(), kPngIend.end());
                return;
            }
            // a dangling FF is the first half of the marker
            if (out.empty() || out.back() != 0xFF) {
                out.push_back(0xFF);
            }
            out.push_back(0xD9);
        }

        /**
         * @brief Offset of the last point the stream can be cut at while
         * keeping only complete units: the last RSTn inside the final scan,
         * or the end of the last intact segment or closed scan.
         */
        std::optional<std::size_t> last_boundary(std::span<const std::uint8_t> b, const ContainerStructure& s) {
            if (s.format == ImageFormat::Jpeg && !s.segments.empty() && s.segments.back().kind == "SCAN") {
                const Segment& scan = s.segments.back();
                std::optional<std::size_t> last_rst;
                for (std::size_t i = scan.offset; i + 1 < scan.end() && i + 1 < b.size(); ++i) {
                    if (b[i] == 0xFF && b[i + 1] >= 0xD0 && b[i + 1] <= 0xD7) {
                        last_rst = i;
                        ++i;
                    }
                }
                if (last_rst) return last_rst;
            }

            // a scan followed by another segment ended at a marker
            for (auto it = s.segments.rbegin(); it != s.segments.rend(); ++it) {
                const bool open_scan = it->kind == "SCAN" && it == s.segments.rbegin();
                if (it->intact && !open_scan && it->end() <= b.size()) {
                    return it->end();
                }
            }
            return std::nullopt;
        }

        std::string self_check(const std::vector<std::uint8_t>& out, const ImageFormat format) {
            try {
                const auto s = parse_container(format, out);
                if (!s.has_end_marker) {
                    return "re-parse found no end marker (stopped at " + std::to_string(s.stopped_at_offset) +
                           ", " + std::string(to_string(s.stop_reason)) + ")";
                }
            } catch (const MalformedContainer& e) {
                return std::string("re-parse failed: ") + e.what();
            }
            return {};
        }

    } // namespace

    std::string_view FooterAppend::variant_name(const std::size_t index) const noexcept {
        return index == 0 ? "append_end_marker" : "truncate_and_append";
    }

    RepairCandidate FooterAppend::attempt(const std::size_t index,
                                          const ImageArtifact& artifact,
                                          const ContainerStructure& structure) const {
        RepairCandidate candidate{std::string(variant_name(index)), std::nullopt, {}};
        const auto in = artifact.bytes();
        std::vector<std::uint8_t> out;
        std::size_t kept = in.size();

        if (index == 0) {
            out.assign(in.begin(), in.end());
        } else {
            const auto cut = last_boundary(in, structure);
            if (!cut || *cut >= in.size()) {
                candidate.diagnostic = "no marker boundary before the end of the stream";
                return candidate;
            }
            kept = *cut;
            out.assign(in.begin(), in.begin() + static_cast<std::ptrdiff_t>(kept));
            Logger::log(LogLevel::Debug,
                        artifact.id() + ": truncating at offset " + std::to_string(*cut) + " of " +
                        std::to_string(in.size()),
                        "repair_engine");
        }
        append_end_marker(out, artifact.format());

        if (std::string problem = self_check(out, artifact.format()); !problem.empty()) {
            candidate.diagnostic = std::move(problem);
            return candidate;
        }
        candidate.diagnostic = "kept " + std::to_string(kept) + " bytes, appended " +
                               std::to_string(out.size() - kept);
        candidate.bytes = std::move(out);
        return candidate;
    }

} // namespace mender
