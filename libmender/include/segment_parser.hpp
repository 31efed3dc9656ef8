/**
 * @file segment_parser.hpp
 * @brief Structural parsing of JPEG marker segments and PNG chunks.
 *
 * The parser inspects bytes only. It never decodes pixel data and never
 * calls an external tool. Damage is reported as structural facts in
 * ContainerStructure; the only thrown error is MalformedContainer when no
 * start marker exists anywhere in the stream.
 */

#ifndef MENDER_SEGMENT_PARSER_HPP
#define MENDER_SEGMENT_PARSER_HPP

#include "artifact.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mender {

    /**
     * @brief A typed span within an artifact.
     */
    struct Segment {
        std::string kind;          ///< Marker or chunk name ("DQT", "SOF0", "SCAN", "IDAT", ...)
        std::uint32_t tag = 0;     ///< JPEG marker byte, or PNG chunk type as big-endian u32
        std::size_t offset = 0;    ///< Offset of the marker / chunk length field
        std::size_t length = 0;    ///< Total bytes including marker, length and CRC fields
        bool intact = true;        ///< False when declared length or CRC is inconsistent
        std::string issue;         ///< Why the segment is not intact

        [[nodiscard]] std::size_t end() const noexcept { return offset + length; }
        bool operator==(const Segment&) const = default;
    };

    /**
     * @brief Why the structural walk ended.
     */
    enum class StopReason {
        EndMarker,        ///< EOI / IEND reached
        EndOfStream,      ///< Bytes ran out between or inside entropy data
        TruncatedSegment, ///< Bytes ran out inside a declared segment
        InvalidMarker     ///< A non-standard marker or chunk type was met
    };

    [[nodiscard]] std::string_view to_string(StopReason reason) noexcept;

    /**
     * @brief Structural facts about one container.
     */
    struct ContainerStructure {
        ImageFormat format = ImageFormat::Unknown;
        std::vector<Segment> segments;

        bool has_start_marker = false;     ///< Start marker found at offset 0
        std::size_t start_offset = 0;      ///< Offset of the first start marker
        bool has_end_marker = false;
        std::size_t end_offset = 0;        ///< Offset just past the end marker
        std::size_t trailing_bytes = 0;    ///< Bytes after the end marker
        bool has_frame_header = false;     ///< SOFn / IHDR present
        bool has_scan_data = false;        ///< Non-empty entropy data / IDAT present
        bool ended_in_scan_data = false;   ///< Stream ran out right after or inside scan data
        bool progressive = false;          ///< JPEG SOF2/SOF6/SOF10/SOF14
        std::size_t embedded_start_markers = 0; ///< Foreign start markers inside scan data

        std::size_t stopped_at_offset = 0;
        StopReason stop_reason = StopReason::EndOfStream;

        [[nodiscard]] std::size_t inconsistent_segments() const noexcept;

        /// First segment with the given kind, if any.
        [[nodiscard]] const Segment* find(std::string_view kind) const noexcept;
    };

    /**
     * @brief Outcome of a non-throwing parse: either a structure or the
     * MalformedContainer details.
     */
    struct ParseOutcome {
        std::optional<ContainerStructure> structure;
        std::string error;
        std::size_t error_offset = 0;

        [[nodiscard]] bool ok() const noexcept { return structure.has_value(); }
    };

    /**
     * @brief Parse a JPEG stream.
     * @throws MalformedContainer if no SOI marker exists.
     */
    [[nodiscard]] ContainerStructure parse_jpeg(std::span<const std::uint8_t> bytes);

    /**
     * @brief Parse a PNG stream.
     * @throws MalformedContainer if no PNG signature exists.
     */
    [[nodiscard]] ContainerStructure parse_png(std::span<const std::uint8_t> bytes);

    /**
     * @brief Dispatch on format.
     * @throws MalformedContainer for unknown formats or missing start markers.
     */
    [[nodiscard]] ContainerStructure parse_container(ImageFormat format, std::span<const std::uint8_t> bytes);

    /**
     * @brief Parse without throwing; MalformedContainer is captured as data.
     */
    [[nodiscard]] ParseOutcome try_parse(const ImageArtifact& artifact);

    /**
     * @brief Lenient marker scan for header synthesis.
     *
     * Finds length-prefixed JPEG segments (DQT, DHT, SOFn, DRI, SOS) by
     * pattern search starting at @p from, without requiring an SOI or a
     * consistent walk. The SOS entry is followed by a SCAN pseudo-segment
     * running to the next non-RST marker or the end of the stream.
     */
    [[nodiscard]] std::vector<Segment> locate_jpeg_segments(std::span<const std::uint8_t> bytes,
                                                            std::size_t from = 0);

    /// Canonical name of a JPEG marker byte ("SOF0", "DHT", "APP1", ...).
    [[nodiscard]] std::string jpeg_marker_name(std::uint8_t marker);

    /// True if @p marker is a start-of-frame marker.
    [[nodiscard]] constexpr bool is_jpeg_sof(const std::uint8_t marker) noexcept {
        return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
    }

    /// True if @p marker has no length field (TEM, RSTn, SOI, EOI).
    [[nodiscard]] constexpr bool is_jpeg_standalone(const std::uint8_t marker) noexcept {
        return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD9);
    }

} // namespace mender

#endif // MENDER_SEGMENT_PARSER_HPP
