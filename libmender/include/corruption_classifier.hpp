/**
 * @file corruption_classifier.hpp
 * @brief Derives a CorruptionRecord from oracle verdicts and parser facts.
 */

#ifndef MENDER_CORRUPTION_CLASSIFIER_HPP
#define MENDER_CORRUPTION_CLASSIFIER_HPP

#include "corruption.hpp"
#include "validation_oracle.hpp"
#include <cstdint>

namespace mender {

    struct ClassifierConfig {
        /**
         * Decoder row groups (JPEG iMCU rows, PNG rows) an image may fall
         * short of and still count as complete but unterminated.
         */
        std::uint32_t footer_tolerance_rows = 3;
    };

    /**
     * @brief Pure, deterministic classifier.
     *
     * The same OracleResult always yields an identical record.
     */
    class CorruptionClassifier {
    public:
        explicit CorruptionClassifier(ClassifierConfig config = {}) : config_(config) {}

        [[nodiscard]] CorruptionRecord classify(const OracleResult& result) const;

        [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

    private:
        [[nodiscard]] CorruptionType corruption_type(const OracleResult& result) const;
        [[nodiscard]] CorruptionType footer_or_truncated(const OracleResult& result) const;

        ClassifierConfig config_;
    };

} // namespace mender

#endif // MENDER_CORRUPTION_CLASSIFIER_HPP
