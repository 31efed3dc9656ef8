/**
 * @file events.hpp
 * @brief Events published by the RecoveryPipeline.
 *
 * Plain data carriers, delivered through EventBus to front ends that
 * render progress.
 */

#ifndef MENDER_EVENTS_HPP
#define MENDER_EVENTS_HPP

#include "corruption.hpp"
#include "decision_engine.hpp"
#include "repair_engine.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace mender {

    // --- classification ---

    /**
     * @brief One artifact went through the oracle and the classifier.
     */
    struct ArtifactClassifiedEvent {
        std::string id;
        std::filesystem::path path;
        ImageFormat format = ImageFormat::Unknown;
        CorruptionRecord record;
        std::size_t completed = 0;  ///< Artifacts classified so far, this one included
        std::size_t total = 0;
    };

    /**
     * @brief An input could not be classified (unreadable, unsupported, interrupted).
     */
    struct ArtifactSkippedEvent {
        std::string id;
        std::filesystem::path path;
        std::string reason;
    };

    // --- decision ---

    struct BatchDecisionEvent {
        DecisionRecord decision;
        double integrity_score = 0.0;
    };

    // --- repair ---

    struct RepairStartEvent {
        std::string id;
        CorruptionType type = CorruptionType::Unknown;
        std::optional<RepairTechnique> technique;
    };

    struct RepairCompleteEvent {
        std::string id;
        RepairStatus status = RepairStatus::Failed;
        Classification final_classification = Classification::Corrupted;
        std::chrono::milliseconds duration{0};
        std::size_t completed = 0;
        std::size_t total = 0;
    };

} // namespace mender

#endif // MENDER_EVENTS_HPP
