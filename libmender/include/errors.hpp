/**
 * @file errors.hpp
 * @brief Exception taxonomy used across the classification and repair engine.
 *
 * Only MalformedContainer and CheckUnavailable cross component boundaries as
 * exceptions, and both are caught before the Classifier. The remaining types
 * describe per-artifact outcomes and are carried as diagnostics, except
 * FatalPipelineError which halts a batch.
 */

#ifndef MENDER_ERRORS_HPP
#define MENDER_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mender {

    /**
     * @brief No recognizable start marker anywhere in the stream.
     */
    class MalformedContainer : public std::runtime_error {
    public:
        MalformedContainer(const std::string& what, const std::size_t offset)
            : std::runtime_error(what), offset_(offset) {}

        /// Offset at which parsing broke.
        [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

    private:
        std::size_t offset_;
    };

    /**
     * @brief An optional validation check could not run (tool missing, timeout).
     */
    class CheckUnavailable : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief No technique is mapped for a corruption type.
     */
    class TechniqueNotApplicable : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief A technique produced output that failed re-validation.
     */
    class RepairVerificationFailed : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Irrecoverable environment failure; the batch cannot continue.
     */
    class FatalPipelineError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace mender

#endif // MENDER_ERRORS_HPP
