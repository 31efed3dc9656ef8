/**
 * @file partial_decode_reencode.cpp
 * @brief Salvages the rows decoded before the damage into a new image.
 */

#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/repair_technique.hpp"

#include <new>
#include <stdexcept>

namespace mender {

    std::string_view PartialDecodeReencode::variant_name(std::size_t) const noexcept {
        return "reencode_clean_rows";
    }

    RepairCandidate PartialDecodeReencode::attempt(const std::size_t index,
                                                   const ImageArtifact& artifact,
                                                   const ContainerStructure&) const {
        RepairCandidate candidate{std::string(variant_name(index)), std::nullopt, {}};
        const bool png = artifact.format() == ImageFormat::Png;

        DecodedImage img;
        try {
            img = png ? decode_png(artifact.bytes(), max_decode_bytes_)
                      : decode_jpeg(artifact.bytes(), max_decode_bytes_);
        } catch (const std::bad_alloc&) {
            candidate.diagnostic = "out of memory while decoding";
            return candidate;
        }
        if (!img.header_ok) {
            candidate.diagnostic = "decoder could not read the image header: " + img.first_problem();
            return candidate;
        }
        if (img.layered) {
            candidate.diagnostic = png ? "interlaced PNG rows cannot be salvaged partially"
                                       : "progressive JPEG rows cannot be salvaged partially";
            return candidate;
        }

        // only whole decoder row groups are trusted
        std::uint32_t rows = img.clean_rows;
        if (!png && img.row_group > 1 && rows < img.height) {
            rows -= rows % img.row_group;
        }
        if (rows == 0) {
            candidate.diagnostic = "no row decoded cleanly";
            return candidate;
        }

        const std::size_t stride = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.channels);
        const std::span<const std::uint8_t> pixels(img.pixels.data(), stride * rows);
        try {
            candidate.bytes = png ? encode_png(pixels, img.width, rows, img.channels)
                                  : encode_jpeg(pixels, img.width, rows, img.channels, jpeg_quality_);
        } catch (const std::runtime_error& e) {
            Logger::log(LogLevel::Warning, artifact.id() + ": re-encode failed: " + e.what(), "repair_engine");
            candidate.diagnostic = std::string("re-encode failed: ") + e.what();
            return candidate;
        }
        candidate.diagnostic = "re-encoded " + std::to_string(rows) + " of " + std::to_string(img.height) + " rows";
        return candidate;
    }

} // namespace mender
