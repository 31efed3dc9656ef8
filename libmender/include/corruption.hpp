/**
 * @file corruption.hpp
 * @brief Corruption taxonomy, repairability tiers and technique routing.
 */

#ifndef MENDER_CORRUPTION_HPP
#define MENDER_CORRUPTION_HPP

#include <optional>
#include <string>
#include <string_view>

namespace mender {

    enum class Classification {
        Valid,
        Corrupted,
        Unrecoverable
    };

    enum class CorruptionType {
        None,
        MissingFooter,
        Truncated,
        InvalidHeader,
        CorruptSegments,
        CorruptData,
        Fragmented,
        FalsePositive,
        Unknown
    };

    enum class RepairTechnique {
        FooterAppend,
        HeaderReconstruction,
        SegmentStripping,
        PartialDecodeReencode
    };

    enum class Confidence {
        High,
        Medium,
        Low
    };

    [[nodiscard]] std::string_view to_string(Classification c) noexcept;
    [[nodiscard]] std::string_view to_string(CorruptionType t) noexcept;
    [[nodiscard]] std::string_view to_string(RepairTechnique t) noexcept;
    [[nodiscard]] std::string_view to_string(Confidence c) noexcept;

    [[nodiscard]] std::optional<Classification> parse_classification(std::string_view s) noexcept;
    [[nodiscard]] std::optional<CorruptionType> parse_corruption_type(std::string_view s) noexcept;

    /**
     * @brief Fixed tier lookup: 1 easiest .. 5 not repairable, 0 for None.
     */
    [[nodiscard]] int repairability_tier(CorruptionType type) noexcept;

    /// Tiers 1-3.
    [[nodiscard]] constexpr bool is_repairable_tier(const int tier) noexcept {
        return tier >= 1 && tier <= 3;
    }

    /**
     * @brief Technique routing; std::nullopt when no technique applies.
     */
    [[nodiscard]] std::optional<RepairTechnique> technique_for(CorruptionType type) noexcept;

    /**
     * @brief Derived classification of one artifact. Never mutated.
     */
    struct CorruptionRecord {
        Classification classification = Classification::Unrecoverable;
        CorruptionType type = CorruptionType::Unknown;
        int tier = 3;
        std::optional<RepairTechnique> technique;
        Confidence confidence = Confidence::High;

        bool operator==(const CorruptionRecord&) const = default;
    };

} // namespace mender

#endif // MENDER_CORRUPTION_HPP
