#include "../../include/corruption_classifier.hpp"

#include <algorithm>

namespace mender {

    namespace {

        Confidence confidence_of(const OracleResult& result) {
            if (result.unavailable.empty()) {
                return Confidence::High;
            }
            const bool optional_ran = std::ranges::any_of(result.verdicts, [](const ValidationVerdict& v) {
                return !v.required;
            });
            return optional_ran ? Confidence::Medium : Confidence::Low;
        }

        CorruptionRecord unrecoverable(const Confidence confidence) {
            return {Classification::Unrecoverable, CorruptionType::FalsePositive,
                    repairability_tier(CorruptionType::FalsePositive), std::nullopt, confidence};
        }

        bool decode_failed(const OracleResult& result) {
            return std::ranges::any_of(result.verdicts, [](const ValidationVerdict& v) {
                return (v.check_name == "jpeg_decode" || v.check_name == "png_decode") && !v.passed;
            });
        }

    } // namespace

    CorruptionRecord CorruptionClassifier::classify(const OracleResult& result) const {
        const Confidence confidence = confidence_of(result);

        if (const auto* size = result.find("size"); size && !size->passed) {
            return unrecoverable(confidence);
        }
        if (!result.parse.ok()) {
            return unrecoverable(confidence);
        }

        const auto& verdicts = result.verdicts;
        if (std::ranges::all_of(verdicts, &ValidationVerdict::passed)) {
            return {Classification::Valid, CorruptionType::None, 0, std::nullopt, confidence};
        }
        if (std::ranges::none_of(verdicts, &ValidationVerdict::passed)) {
            return unrecoverable(confidence);
        }

        const CorruptionType type = corruption_type(result);
        if (type == CorruptionType::FalsePositive) {
            return unrecoverable(confidence);
        }
        return {Classification::Corrupted, type, repairability_tier(type), technique_for(type), confidence};
    }

    CorruptionType CorruptionClassifier::corruption_type(const OracleResult& result) const {
        const ContainerStructure& s = *result.parse.structure;

        if (!s.has_frame_header && !s.has_scan_data) {
            return CorruptionType::FalsePositive;
        }
        if (!s.has_start_marker) {
            return CorruptionType::InvalidHeader;
        }
        if (s.embedded_start_markers > 0) {
            return CorruptionType::Fragmented;
        }
        if (!s.has_end_marker) {
            return footer_or_truncated(result);
        }
        if (s.inconsistent_segments() > 0) {
            return CorruptionType::CorruptSegments;
        }
        if (decode_failed(result)) {
            return CorruptionType::CorruptData;
        }
        return CorruptionType::Unknown;
    }

    CorruptionType CorruptionClassifier::footer_or_truncated(const OracleResult& result) const {
        const auto with_progress = std::ranges::find_if(result.verdicts, [](const ValidationVerdict& v) {
            return v.progress.has_value() && v.progress->rows_total > 0;
        });

        if (with_progress != result.verdicts.end()) {
            const DecodeProgress& p = *with_progress->progress;
            const std::uint32_t missing = p.rows_total - std::min(p.rows_decoded, p.rows_total);
            const std::uint64_t slack = static_cast<std::uint64_t>(config_.footer_tolerance_rows) * p.row_group;
            return missing <= slack ? CorruptionType::MissingFooter : CorruptionType::Truncated;
        }

        // no decoder ran: judge by where the structural walk stopped
        const ContainerStructure& s = *result.parse.structure;
        if (s.ended_in_scan_data && s.stop_reason == StopReason::EndOfStream) {
            return CorruptionType::MissingFooter;
        }
        return CorruptionType::Truncated;
    }

} // namespace mender
