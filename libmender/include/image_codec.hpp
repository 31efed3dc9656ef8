/**
 * @file image_codec.hpp
 * @brief In-memory libjpeg / libpng decode and encode helpers.
 *
 * Decoding is lenient: library errors and data exhaustion are recorded in
 * DecodedImage instead of propagating, so callers can tell how far the
 * decoder got before the data went bad.
 */

#ifndef MENDER_IMAGE_CODEC_HPP
#define MENDER_IMAGE_CODEC_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mender {

    /// Largest pixel buffer (width * height * components) a decode may allocate.
    inline constexpr std::uint64_t kDefaultMaxDecodeBytes = 512ULL * 1024 * 1024;

    /**
     * @brief Result of a lenient decode.
     */
    struct DecodedImage {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        int channels = 0;                  ///< 1 gray, 3 RGB, 4 RGBA/CMYK
        bool cmyk = false;
        std::vector<std::uint8_t> pixels;  ///< height * width * channels, rows past rows_read are zero

        std::uint32_t rows_read = 0;       ///< Rows handed out by the decoder
        std::uint32_t clean_rows = 0;      ///< Rows decoded before the first warning, error or data exhaustion
        std::uint32_t row_group = 1;       ///< Rows decoded as one unit (JPEG iMCU height, PNG 1)
        bool header_ok = false;            ///< Dimensions were read
        bool data_exhausted = false;       ///< Decoder asked for bytes past the end of the stream
        bool layered = false;              ///< Progressive JPEG or interlaced PNG

        std::vector<std::string> warnings;
        std::optional<std::string> error;

        /// Decoded every row with no warning and no error.
        [[nodiscard]] bool complete() const noexcept {
            return header_ok && !error && warnings.empty() && rows_read == height && height > 0;
        }

        /// First problem reported by the decoder.
        [[nodiscard]] std::string first_problem() const;
    };

    /**
     * @brief Lenient decode. A header declaring more than @p max_bytes of
     * pixels is rejected before any pixel buffer is allocated, leaving
     * header_ok false and the reason in error.
     */
    [[nodiscard]] DecodedImage decode_jpeg(std::span<const std::uint8_t> bytes,
                                           std::uint64_t max_bytes = kDefaultMaxDecodeBytes);

    [[nodiscard]] DecodedImage decode_png(std::span<const std::uint8_t> bytes,
                                          std::uint64_t max_bytes = kDefaultMaxDecodeBytes);

    /// Diagnostic for a declared size above the decode limit.
    [[nodiscard]] std::string oversized_image_message(std::uint64_t width, std::uint64_t height,
                                                      int components, std::uint64_t max_bytes);

    /**
     * @brief Encode rows as a baseline JPEG.
     * @param pixels Row-major samples, at least width * height * channels bytes.
     * @param channels 1 (gray), 3 (RGB) or 4 (CMYK).
     * @throws std::runtime_error on encoder failure.
     */
    [[nodiscard]] std::vector<std::uint8_t> encode_jpeg(std::span<const std::uint8_t> pixels,
                                                        std::uint32_t width,
                                                        std::uint32_t height,
                                                        int channels,
                                                        int quality = 95);

    /**
     * @brief Encode rows as an 8-bit non-interlaced PNG.
     * @param channels 1 (gray), 2 (gray+alpha), 3 (RGB) or 4 (RGBA).
     * @throws std::runtime_error on encoder failure.
     */
    [[nodiscard]] std::vector<std::uint8_t> encode_png(std::span<const std::uint8_t> pixels,
                                                       std::uint32_t width,
                                                       std::uint32_t height,
                                                       int channels);

} // namespace mender

#endif // MENDER_IMAGE_CODEC_HPP
