/**
 * @file repair_technique.hpp
 * @brief Byte-level reconstruction techniques and their fallback variants.
 */

#ifndef MENDER_REPAIR_TECHNIQUE_HPP
#define MENDER_REPAIR_TECHNIQUE_HPP

#include "artifact.hpp"
#include "corruption.hpp"
#include "image_codec.hpp"
#include "segment_parser.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

    struct RepairConfig {
        std::size_t header_search_window = 64 * 1024; ///< Max garbage prefix stripped by header repair
        int jpeg_quality = 95;                        ///< Quality of partial re-encodes
        std::uint64_t max_decode_bytes = kDefaultMaxDecodeBytes;
    };

    /**
     * @brief Output of one technique variant before oracle re-verification.
     */
    struct RepairCandidate {
        std::string variant;
        std::optional<std::vector<std::uint8_t>> bytes; ///< Set when the variant's own self-check passed
        std::string diagnostic;

        [[nodiscard]] bool produced() const noexcept { return bytes.has_value(); }
    };

    /**
     * @brief Interface for a repair technique.
     *
     * @details A technique reads the original bytes and the parser facts and
     * builds a new byte sequence. It never modifies the input, never throws
     * on malformed input and never invents pixel data. Variants are tried in
     * index order by the RepairEngine until one survives re-verification.
     */
    class IRepairTechnique {
    public:
        virtual ~IRepairTechnique() = default;

        [[nodiscard]] virtual RepairTechnique id() const noexcept = 0;

        [[nodiscard]] virtual std::size_t variant_count() const noexcept = 0;

        [[nodiscard]] virtual std::string_view variant_name(std::size_t index) const noexcept = 0;

        [[nodiscard]] virtual RepairCandidate attempt(std::size_t index,
                                                      const ImageArtifact& artifact,
                                                      const ContainerStructure& structure) const = 0;
    };

    /// Appends the missing end marker, or truncates to the last boundary first.
    class FooterAppend final : public IRepairTechnique {
    public:
        [[nodiscard]] RepairTechnique id() const noexcept override { return RepairTechnique::FooterAppend; }
        [[nodiscard]] std::size_t variant_count() const noexcept override { return 2; }
        [[nodiscard]] std::string_view variant_name(std::size_t index) const noexcept override;
        [[nodiscard]] RepairCandidate attempt(std::size_t index, const ImageArtifact& artifact,
                                              const ContainerStructure& structure) const override;
    };

    /// Strips a garbage prefix, or synthesizes a minimal header around located segments.
    class HeaderReconstruction final : public IRepairTechnique {
    public:
        explicit HeaderReconstruction(const std::size_t search_window) : search_window_(search_window) {}

        [[nodiscard]] RepairTechnique id() const noexcept override { return RepairTechnique::HeaderReconstruction; }
        [[nodiscard]] std::size_t variant_count() const noexcept override { return 2; }
        [[nodiscard]] std::string_view variant_name(std::size_t index) const noexcept override;
        [[nodiscard]] RepairCandidate attempt(std::size_t index, const ImageArtifact& artifact,
                                              const ContainerStructure& structure) const override;

    private:
        std::size_t search_window_;
    };

    /// Drops inconsistent non-critical segments; recomputes CRCs of critical PNG chunks.
    class SegmentStripping final : public IRepairTechnique {
    public:
        [[nodiscard]] RepairTechnique id() const noexcept override { return RepairTechnique::SegmentStripping; }
        [[nodiscard]] std::size_t variant_count() const noexcept override { return 1; }
        [[nodiscard]] std::string_view variant_name(std::size_t index) const noexcept override;
        [[nodiscard]] RepairCandidate attempt(std::size_t index, const ImageArtifact& artifact,
                                              const ContainerStructure& structure) const override;
    };

    /// Re-encodes the rows that decoded cleanly before the damage.
    class PartialDecodeReencode final : public IRepairTechnique {
    public:
        explicit PartialDecodeReencode(const int jpeg_quality,
                                       const std::uint64_t max_decode_bytes = kDefaultMaxDecodeBytes)
            : jpeg_quality_(jpeg_quality), max_decode_bytes_(max_decode_bytes) {}

        [[nodiscard]] RepairTechnique id() const noexcept override { return RepairTechnique::PartialDecodeReencode; }
        [[nodiscard]] std::size_t variant_count() const noexcept override { return 1; }
        [[nodiscard]] std::string_view variant_name(std::size_t index) const noexcept override;
        [[nodiscard]] RepairCandidate attempt(std::size_t index, const ImageArtifact& artifact,
                                              const ContainerStructure& structure) const override;

    private:
        int jpeg_quality_;
        std::uint64_t max_decode_bytes_;
    };

    /**
     * @brief Instantiate the technique for an enumerator.
     */
    [[nodiscard]] std::unique_ptr<IRepairTechnique> make_technique(RepairTechnique technique,
                                                                   const RepairConfig& config);

    /// PNG chunks that must never be stripped.
    [[nodiscard]] bool is_critical_png_chunk(std::string_view kind) noexcept;

    /// JPEG segments that must never be stripped.
    [[nodiscard]] bool is_critical_jpeg_segment(const Segment& segment) noexcept;

} // namespace mender

#endif // MENDER_REPAIR_TECHNIQUE_HPP
