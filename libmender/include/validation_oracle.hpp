/**
 * @file validation_oracle.hpp
 * @brief Registry of validity checks and the verdict list they produce.
 */

#ifndef MENDER_VALIDATION_ORACLE_HPP
#define MENDER_VALIDATION_ORACLE_HPP

#include "image_codec.hpp"
#include "validation_check.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mender {

    struct OracleConfig {
        std::size_t min_size = 32;          ///< Smaller artifacts fail the size check
        bool decode_checks = true;          ///< In-process libjpeg / libpng decode
        bool mime_check = true;             ///< libmagic
        bool external_tools = false;        ///< jpeginfo, pngcheck, identify
        std::chrono::milliseconds tool_timeout{30000};
        std::uint64_t max_decode_bytes = kDefaultMaxDecodeBytes;  ///< Larger declared images fail decode unallocated
    };

    /**
     * @brief Everything the oracle learned about one artifact.
     */
    struct OracleResult {
        std::vector<ValidationVerdict> verdicts;   ///< In execution order
        std::vector<std::string> unavailable;      ///< Checks that could not run
        ParseOutcome parse;

        [[nodiscard]] bool passes_required() const noexcept;

        /// Verdict for a check by name, or nullptr if it did not run.
        [[nodiscard]] const ValidationVerdict* find(std::string_view check_name) const noexcept;
    };

    /// True when every required verdict passed.
    [[nodiscard]] bool passes_required(const std::vector<ValidationVerdict>& verdicts) noexcept;

    /**
     * @brief Runs every enabled and available check on an artifact, cheapest first.
     *
     * @details validate() is const and the checks are stateless, so one oracle
     * can be shared by all pool workers.
     */
    class ValidationOracle {
    public:
        explicit ValidationOracle(OracleConfig config = {});

        /// Register an extra check. Order by cost is preserved.
        void add_check(std::unique_ptr<IValidationCheck> check);

        [[nodiscard]] OracleResult validate(const ImageArtifact& artifact) const;

        [[nodiscard]] const OracleConfig& config() const noexcept { return config_; }

        /// Names of the registered checks, in execution order.
        [[nodiscard]] std::vector<std::string> check_names() const;

    private:
        OracleConfig config_;
        std::vector<std::unique_ptr<IValidationCheck>> checks_;
    };

} // namespace mender

#endif // MENDER_VALIDATION_ORACLE_HPP
