/**
 * @file validation_check.hpp
 * @brief Capability interface for independent validity checks.
 */

#ifndef MENDER_VALIDATION_CHECK_HPP
#define MENDER_VALIDATION_CHECK_HPP

#include "artifact.hpp"
#include "segment_parser.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

    /**
     * @brief How far a full decode got before the data ran out or went bad.
     */
    struct DecodeProgress {
        std::uint32_t rows_decoded = 0;
        std::uint32_t rows_total = 0;
        std::uint32_t row_group = 1;

        bool operator==(const DecodeProgress&) const = default;
    };

    /**
     * @brief The pass/fail outcome of one check on one artifact.
     */
    struct ValidationVerdict {
        std::string check_name;
        bool passed = false;
        std::optional<std::string> diagnostic;
        bool required = false;
        std::optional<DecodeProgress> progress;

        bool operator==(const ValidationVerdict&) const = default;
    };

    /**
     * @brief Relative cost of a check; the oracle runs cheaper checks first.
     */
    enum class CheckCost {
        Trivial,  ///< size, magic bytes
        Cheap,    ///< structural walk results
        Moderate, ///< in-process decode, libmagic
        Expensive ///< external process
    };

    /**
     * @brief Everything a check may inspect.
     */
    struct CheckContext {
        const ImageArtifact& artifact;
        const ParseOutcome& parse;
    };

    /**
     * @brief Interface for a single validity check.
     *
     * @details Callers depend only on "produces a verdict". A check that
     * cannot run on this machine reports is_available() == false or throws
     * CheckUnavailable from check(); either way it is left out of the
     * verdict list.
     */
    class IValidationCheck {
    public:
        virtual ~IValidationCheck() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual CheckCost cost() const noexcept = 0;

        /// Required checks decide RepairAttempt success.
        [[nodiscard]] virtual bool is_required() const noexcept { return false; }

        [[nodiscard]] virtual bool supports(ImageFormat format) const noexcept = 0;

        [[nodiscard]] virtual bool is_available() const { return true; }

        /**
         * @brief Run the check.
         * @throws CheckUnavailable if the check could not run.
         */
        [[nodiscard]] virtual ValidationVerdict check(const CheckContext& ctx) const = 0;

        /**
         * @brief Whether the oracle should stop running further checks.
         */
        [[nodiscard]] virtual bool short_circuits(const CheckContext&, const ValidationVerdict&) const {
            return false;
        }

    protected:
        [[nodiscard]] ValidationVerdict pass() const {
            return {std::string(name()), true, std::nullopt, is_required()};
        }

        [[nodiscard]] ValidationVerdict fail(std::string diagnostic) const {
            return {std::string(name()), false, std::move(diagnostic), is_required()};
        }
    };

} // namespace mender

#endif // MENDER_VALIDATION_CHECK_HPP
