/**
 * @file header_reconstruction.cpp
 * @brief Rebuilds the start of a stream whose header is displaced or damaged.
 */

#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/repair_technique.hpp"

#include <algorithm>
#include <array>

namespace mender {

    namespace {

        constexpr std::array<std::uint8_t, 8> kPngSignature{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

        // SOI followed by a JFIF 1.01 APP0, aspect ratio 1:1, no thumbnail
        constexpr std::array<std::uint8_t, 20> kJfifHeader{
            0xFF, 0xD8,
            0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00,
            0x01, 0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00};

        // ITU-T T.81 Annex K.3 typical Huffman tables
        constexpr std::array<std::uint8_t, 16> kDcLumaBits{0, 1, 5, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0, 0, 0};
        constexpr std::array<std::uint8_t, 16> kDcChromaBits{0, 3, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0};
        constexpr std::array<std::uint8_t, 12> kDcValues{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

        constexpr std::array<std::uint8_t, 16> kAcLumaBits{0, 2, 1, 3, 3, 2, 4, 3, 5, 5, 4, 4, 0, 0, 1, 0x7d};
        constexpr std::array<std::uint8_t, 162> kAcLumaValues{
            0x01, 0x02, 0x03, 0x00, 0x04, 0x11, 0x05, 0x12, 0x21, 0x31, 0x41, 0x06, 0x13, 0x51, 0x61, 0x07,
            0x22, 0x71, 0x14, 0x32, 0x81, 0x91, 0xa1, 0x08, 0x23, 0x42, 0xb1, 0xc1, 0x15, 0x52, 0xd1, 0xf0,
            0x24, 0x33, 0x62, 0x72, 0x82, 0x09, 0x0a, 0x16, 0x17, 0x18, 0x19, 0x1a, 0x25, 0x26, 0x27, 0x28,
            0x29, 0x2a, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3a, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48, 0x49,
            0x4a, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59, 0x5a, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69,
            0x6a, 0x73, 0x74, 0x75, 0x76, 0x77, 0x78, 0x79, 0x7a, 0x83, 0x84, 0x85, 0x86, 0x87, 0x88, 0x89,
            0x8a, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9a, 0xa2, 0xa3, 0xa4, 0xa5, 0xa6, 0xa7,
            0xa8, 0xa9, 0xaa, 0xb2, 0xb3, 0xb4, 0xb5, 0xb6, 0xb7, 0xb8, 0xb9, 0xba, 0xc2, 0xc3, 0xc4, 0xc5,
            0xc6, 0xc7, 0xc8, 0xc9, 0xca, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8, 0xd9, 0xda, 0xe1, 0xe2,
            0xe3, 0xe4, 0xe5, 0xe6, 0xe7, 0xe8, 0xe9, 0xea, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7, 0xf8,
            0xf9, 0xfa};

        constexpr std::array<std::uint8_t, 16> kAcChromaBits{0, 2, 1, 2, 4, 4, 3, 4, 7, 5, 4, 4, 0, 1, 2, 0x77};
        constexpr std::array<std::uint8_t, 162> kAcChromaValues{
            0x00, 0x01, 0x02, 0x03, 0x11, 0x04, 0x05, 0x21, 0x31, 0x06, 0x12, 0x41, 0x51, 0x07, 0x61, 0x71,
            0x13, 0x22, 0x32, 0x81, 0x08, 0x14, 0x42, 0x91, 0xa1, 0xb1, 0xc1, 0x09, 0x23, 0x33, 0x52, 0xf0,
            0x15, 0x62, 0x72, 0xd1, 0x0a, 0x16, 0x24, 0x34, 0xe1, 0x25, 0xf1, 0x17, 0x18, 0x19, 0x1a, 0x26,
            0x27, 0x28, 0x29, 0x2a, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3a, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48,
            0x49, 0x4a, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59, 0x5a, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68,
            0x69, 0x6a, 0x73, 0x74, 0x75, 0x76, 0x77, 0x78, 0x79, 0x7a, 0x82, 0x83, 0x84, 0x85, 0x86, 0x87,
            0x88, 0x89, 0x8a, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9a, 0xa2, 0xa3, 0xa4, 0xa5,
            0xa6, 0xa7, 0xa8, 0xa9, 0xaa, 0xb2, 0xb3, 0xb4, 0xb5, 0xb6, 0xb7, 0xb8, 0xb9, 0xba, 0xc2, 0xc3,
            0xc4, 0xc5, 0xc6, 0xc7, 0xc8, 0xc9, 0xca, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8, 0xd9, 0xda,
            0xe2, 0xe3, 0xe4, 0xe5, 0xe6, 0xe7, 0xe8, 0xe9, 0xea, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7, 0xf8,
            0xf9, 0xfa};

        template <std::size_t B, std::size_t V>
        void put_table(std::vector<std::uint8_t>& out, const std::uint8_t class_and_id,
                       const std::array<std::uint8_t, B>& bits, const std::array<std::uint8_t, V>& values) {
            out.push_back(class_and_id);
            out.insert(out.end(), bits.begin(), bits.end());
            out.insert(out.end(), values.begin(), values.end());
        }

        /// One DHT segment carrying all four standard tables.
        void append_standard_dht(std::vector<std::uint8_t>& out) {
            std::vector<std::uint8_t> body;
            put_table(body, 0x00, kDcLumaBits, kDcValues);
            put_table(body, 0x10, kAcLumaBits, kAcLumaValues);
            put_table(body, 0x01, kDcChromaBits, kDcValues);
            put_table(body, 0x11, kAcChromaBits, kAcChromaValues);
            const std::size_t len = body.size() + 2;
            out.push_back(0xFF);
            out.push_back(0xC4);
            out.push_back(static_cast<std::uint8_t>(len >> 8));
            out.push_back(static_cast<std::uint8_t>(len & 0xFF));
            out.insert(out.end(), body.begin(), body.end());
        }

        void copy_range(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> in, const Segment& seg) {
            const std::size_t end = std::min(seg.end(), in.size());
            out.insert(out.end(), in.begin() + static_cast<std::ptrdiff_t>(seg.offset),
                       in.begin() + static_cast<std::ptrdiff_t>(end));
        }

        std::string check_start(const std::vector<std::uint8_t>& out, const ImageFormat format, const bool need_end) {
            try {
                const auto s = parse_container(format, out);
                if (!s.has_start_marker) return "re-parse found no start marker at offset 0";
                if (!s.has_frame_header) return "re-parse found no frame header";
                if (need_end && !s.has_end_marker) return "re-parse found no end marker";
            } catch (const MalformedContainer& e) {
                return std::string("re-parse failed: ") + e.what();
            }
            return {};
        }

        RepairCandidate synthesize_jpeg(RepairCandidate candidate, std::span<const std::uint8_t> in) {
            const std::vector<Segment> found = locate_jpeg_segments(in);

            const auto has = [&](const auto& pred) { return std::ranges::any_of(found, pred); };
            if (!has([](const Segment& s) { return s.tag == 0xDB; })) {
                candidate.diagnostic = "no quantization table (DQT) found";
                return candidate;
            }
            if (!has([](const Segment& s) { return s.kind != "SCAN" && is_jpeg_sof(static_cast<std::uint8_t>(s.tag)); })) {
                candidate.diagnostic = "no frame header (SOF) found";
                return candidate;
            }
            const auto sos = std::ranges::find(found, std::uint32_t{0xDA}, &Segment::tag);
            if (sos == found.end() || std::next(sos) == found.end() || std::next(sos)->length == 0) {
                candidate.diagnostic = "no scan data found";
                return candidate;
            }
            const bool has_dht = has([](const Segment& s) { return s.tag == 0xC4; });

            std::vector<std::uint8_t> out(kJfifHeader.begin(), kJfifHeader.end());
            for (auto it = found.begin(); it != sos; ++it) {
                copy_range(out, in, *it);
            }
            if (!has_dht) {
                append_standard_dht(out);
            }
            copy_range(out, in, *sos);
            copy_range(out, in, *std::next(sos));
            if (out.back() == 0xFF) out.pop_back();
            out.push_back(0xFF);
            out.push_back(0xD9);

            if (std::string problem = check_start(out, ImageFormat::Jpeg, true); !problem.empty()) {
                candidate.diagnostic = std::move(problem);
                return candidate;
            }
            candidate.diagnostic = "synthesized header from " + std::to_string(std::distance(found.begin(), sos)) +
                                   " located segments" + (has_dht ? "" : ", standard Huffman tables inserted");
            candidate.bytes = std::move(out);
            return candidate;
        }

        RepairCandidate resign_png(RepairCandidate candidate, std::span<const std::uint8_t> in) {
            static constexpr std::array<std::uint8_t, 8> kIhdrHead{0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'};
            const auto it = std::search(in.begin(), in.end(), kIhdrHead.begin(), kIhdrHead.end());
            if (it == in.end()) {
                candidate.diagnostic = "no IHDR chunk found";
                return candidate;
            }
            std::vector<std::uint8_t> out(kPngSignature.begin(), kPngSignature.end());
            out.insert(out.end(), it, in.end());

            if (std::string problem = check_start(out, ImageFormat::Png, false); !problem.empty()) {
                candidate.diagnostic = std::move(problem);
                return candidate;
            }
            candidate.diagnostic = "signature re-emitted before IHDR at offset " +
                                   std::to_string(std::distance(in.begin(), it));
            candidate.bytes = std::move(out);
            return candidate;
        }

    } // namespace

    std::string_view HeaderReconstruction::variant_name(const std::size_t index) const noexcept {
        return index == 0 ? "strip_prefix" : "synthesize_header";
    }

    RepairCandidate HeaderReconstruction::attempt(const std::size_t index,
                                                  const ImageArtifact& artifact,
                                                  const ContainerStructure& structure) const {
        RepairCandidate candidate{std::string(variant_name(index)), std::nullopt, {}};
        const auto in = artifact.bytes();

        if (index != 0) {
            return artifact.format() == ImageFormat::Png ? resign_png(std::move(candidate), in)
                                                         : synthesize_jpeg(std::move(candidate), in);
        }

        if (structure.start_offset == 0) {
            candidate.diagnostic = "start marker already at offset 0";
            return candidate;
        }
        if (structure.start_offset > search_window_) {
            candidate.diagnostic = "start marker at offset " + std::to_string(structure.start_offset) +
                                   " lies outside the " + std::to_string(search_window_) + "-byte search window";
            return candidate;
        }

        std::vector<std::uint8_t> out(in.begin() + static_cast<std::ptrdiff_t>(structure.start_offset), in.end());
        if (std::string problem = check_start(out, artifact.format(), false); !problem.empty()) {
            candidate.diagnostic = std::move(problem);
            return candidate;
        }
        Logger::log(LogLevel::Debug,
                    artifact.id() + ": discarding " + std::to_string(structure.start_offset) + " prefix bytes",
                    "repair_engine");
        candidate.diagnostic = "discarded " + std::to_string(structure.start_offset) + " bytes before the start marker";
        candidate.bytes = std::move(out);
        return candidate;
    }

} // namespace mender
