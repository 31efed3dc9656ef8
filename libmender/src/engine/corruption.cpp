#include "../../include/corruption.hpp"

#include <array>
#include <utility>

namespace mender {

    namespace {

        constexpr std::array kTypeNames{
            std::pair{CorruptionType::None, std::string_view{"none"}},
            std::pair{CorruptionType::MissingFooter, std::string_view{"missing_footer"}},
            std::pair{CorruptionType::Truncated, std::string_view{"truncated"}},
            std::pair{CorruptionType::InvalidHeader, std::string_view{"invalid_header"}},
            std::pair{CorruptionType::CorruptSegments, std::string_view{"corrupt_segments"}},
            std::pair{CorruptionType::CorruptData, std::string_view{"corrupt_data"}},
            std::pair{CorruptionType::Fragmented, std::string_view{"fragmented"}},
            std::pair{CorruptionType::FalsePositive, std::string_view{"false_positive"}},
            std::pair{CorruptionType::Unknown, std::string_view{"unknown"}},
        };

    } // namespace

    std::string_view to_string(const Classification c) noexcept {
        switch (c) {
            case Classification::Valid:         return "valid";
            case Classification::Corrupted:     return "corrupted";
            case Classification::Unrecoverable: return "unrecoverable";
        }
        return "unrecoverable";
    }

    std::string_view to_string(const CorruptionType t) noexcept {
        for (const auto& [type, name] : kTypeNames) {
            if (type == t) return name;
        }
        return "unknown";
    }

    std::string_view to_string(const RepairTechnique t) noexcept {
        switch (t) {
            case RepairTechnique::FooterAppend:          return "footer_append";
            case RepairTechnique::HeaderReconstruction:  return "header_reconstruction";
            case RepairTechnique::SegmentStripping:      return "segment_stripping";
            case RepairTechnique::PartialDecodeReencode: return "partial_decode_reencode";
        }
        return "";
    }

    std::string_view to_string(const Confidence c) noexcept {
        switch (c) {
            case Confidence::High:   return "high";
            case Confidence::Medium: return "medium";
            case Confidence::Low:    return "low";
        }
        return "low";
    }

    std::optional<Classification> parse_classification(const std::string_view s) noexcept {
        if (s == "valid") return Classification::Valid;
        if (s == "corrupted") return Classification::Corrupted;
        if (s == "unrecoverable") return Classification::Unrecoverable;
        return std::nullopt;
    }

    std::optional<CorruptionType> parse_corruption_type(const std::string_view s) noexcept {
        for (const auto& [type, name] : kTypeNames) {
            if (name == s) return type;
        }
        return std::nullopt;
    }

    int repairability_tier(const CorruptionType type) noexcept {
        switch (type) {
            case CorruptionType::None:            return 0;
            case CorruptionType::MissingFooter:   return 1;
            case CorruptionType::InvalidHeader:
            case CorruptionType::CorruptSegments: return 2;
            case CorruptionType::CorruptData:
            case CorruptionType::Truncated:
            case CorruptionType::Unknown:         return 3;
            case CorruptionType::Fragmented:      return 4;
            case CorruptionType::FalsePositive:   return 5;
        }
        return 5;
    }

    std::optional<RepairTechnique> technique_for(const CorruptionType type) noexcept {
        switch (type) {
            case CorruptionType::MissingFooter:
                return RepairTechnique::FooterAppend;
            case CorruptionType::InvalidHeader:
                return RepairTechnique::HeaderReconstruction;
            case CorruptionType::CorruptSegments:
                return RepairTechnique::SegmentStripping;
            case CorruptionType::CorruptData:
            case CorruptionType::Truncated:
                return RepairTechnique::PartialDecodeReencode;
            case CorruptionType::Unknown:
            case CorruptionType::Fragmented:
            case CorruptionType::FalsePositive:
            case CorruptionType::None:
                return std::nullopt;
        }
        return std::nullopt;
    }

} // namespace mender
