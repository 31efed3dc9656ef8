/**
 * @file structural_checks.cpp
 * @brief Size, signature, structure and segment audit checks.
 */

#include "../../include/builtin_checks.hpp"
#include <array>
#include <cstdio>
#include <string>

namespace mender {

    namespace {

        constexpr std::array<std::uint8_t, 3> kJpegSignature = {0xFF, 0xD8, 0xFF};
        constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

        std::string hex_prefix(std::span<const std::uint8_t> bytes, const std::size_t count) {
            std::string out;
            char buf[4];
            for (std::size_t i = 0; i < count && i < bytes.size(); ++i) {
                std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
                if (!out.empty()) out += ' ';
                out += buf;
            }
            return out.empty() ? "nothing" : out;
        }

        template <std::size_t N>
        bool starts_with(std::span<const std::uint8_t> bytes, const std::array<std::uint8_t, N>& sig) {
            if (bytes.size() < N) return false;
            for (std::size_t i = 0; i < N; ++i) {
                if (bytes[i] != sig[i]) return false;
            }
            return true;
        }

    } // namespace

    ValidationVerdict SizeCheck::check(const CheckContext& ctx) const {
        const std::size_t size = ctx.artifact.size();
        if (size == 0) {
            return fail("zero-byte file");
        }
        if (size < min_size_) {
            return fail("only " + std::to_string(size) + " bytes, minimum is " + std::to_string(min_size_));
        }
        return pass();
    }

    ValidationVerdict MagicBytesCheck::check(const CheckContext& ctx) const {
        const auto bytes = ctx.artifact.bytes();
        switch (ctx.artifact.format()) {
            case ImageFormat::Jpeg:
                if (starts_with(bytes, kJpegSignature)) return pass();
                return fail("expected FF D8 FF at offset 0, found " + hex_prefix(bytes, kJpegSignature.size()));
            case ImageFormat::Png:
                if (starts_with(bytes, kPngSignature)) return pass();
                return fail("expected PNG signature at offset 0, found " + hex_prefix(bytes, kPngSignature.size()));
            case ImageFormat::Unknown:
                break;
        }
        return fail("unknown container format");
    }

    ValidationVerdict StructureCheck::check(const CheckContext& ctx) const {
        if (!ctx.parse.ok()) {
            return fail("malformed container at offset " + std::to_string(ctx.parse.error_offset) +
                        ": " + ctx.parse.error);
        }
        const ContainerStructure& s = *ctx.parse.structure;

        if (!s.has_start_marker) {
            return fail("start marker found at offset " + std::to_string(s.start_offset) + " instead of 0");
        }
        if (!s.has_frame_header) {
            return fail(s.format == ImageFormat::Png ? "no IHDR chunk" : "no SOF frame header");
        }
        if (!s.has_scan_data) {
            return fail(s.format == ImageFormat::Png ? "no IDAT data" : "no entropy-coded scan data");
        }
        switch (s.stop_reason) {
            case StopReason::EndMarker:
                return pass();
            case StopReason::TruncatedSegment:
                return fail("segment cut off at offset " + std::to_string(s.stopped_at_offset));
            case StopReason::InvalidMarker:
                return fail("invalid marker at offset " + std::to_string(s.stopped_at_offset));
            case StopReason::EndOfStream:
                break;
        }
        return fail(std::string(s.format == ImageFormat::Png ? "no IEND chunk" : "no EOI marker") +
                    ", stream ends at offset " + std::to_string(s.stopped_at_offset));
    }

    ValidationVerdict SegmentAuditCheck::check(const CheckContext& ctx) const {
        if (!ctx.parse.ok()) {
            return fail("no segments to audit");
        }
        const ContainerStructure& s = *ctx.parse.structure;
        const Segment* first = nullptr;
        for (const auto& seg : s.segments) {
            if (!seg.intact) {
                first = &seg;
                break;
            }
        }
        if (!first) {
            return pass();
        }
        std::string diag = first->kind + " at offset " + std::to_string(first->offset) + ": " + first->issue;
        if (const std::size_t n = s.inconsistent_segments(); n > 1) {
            diag += " (" + std::to_string(n - 1) + " more)";
        }
        return fail(std::move(diag));
    }

} // namespace mender
