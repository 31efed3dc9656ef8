/**
 * @file builtin_checks.hpp
 * @brief Concrete validity checks registered by the ValidationOracle.
 */

#ifndef MENDER_BUILTIN_CHECKS_HPP
#define MENDER_BUILTIN_CHECKS_HPP

#include "image_codec.hpp"
#include "validation_check.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mender {

    /**
     * @brief Rejects empty and implausibly short byte sequences.
     * A failure short-circuits every other check.
     */
    class SizeCheck final : public IValidationCheck {
    public:
        explicit SizeCheck(std::size_t min_size) : min_size_(min_size) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "size"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Trivial; }
        [[nodiscard]] bool is_required() const noexcept override { return true; }
        [[nodiscard]] bool supports(ImageFormat) const noexcept override { return true; }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;
        [[nodiscard]] bool short_circuits(const CheckContext&, const ValidationVerdict& v) const override {
            return !v.passed;
        }

    private:
        std::size_t min_size_;
    };

    /**
     * @brief Leading signature at offset 0.
     */
    class MagicBytesCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "magic_bytes"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Trivial; }
        [[nodiscard]] bool is_required() const noexcept override { return true; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override {
            return format != ImageFormat::Unknown;
        }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;
    };

    /**
     * @brief Container structure from the Segment Parser: start marker at 0,
     * frame header, scan data, end marker, no cut-off segment.
     *
     * Segment-level inconsistencies are left to SegmentAuditCheck.
     */
    class StructureCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "structure"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Cheap; }
        [[nodiscard]] bool is_required() const noexcept override { return true; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override {
            return format != ImageFormat::Unknown;
        }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;
        [[nodiscard]] bool short_circuits(const CheckContext& ctx, const ValidationVerdict&) const override {
            return !ctx.parse.ok();
        }
    };

    /**
     * @brief Every segment the parser walked is locally consistent
     * (declared lengths, PNG CRCs).
     */
    class SegmentAuditCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "segment_audit"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Cheap; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override {
            return format != ImageFormat::Unknown;
        }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;
    };

    /**
     * @brief libmagic identifies the buffer as the artifact's image type.
     */
    class MimeTypeCheck final : public IValidationCheck {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "mime_type"; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Moderate; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override {
            return format != ImageFormat::Unknown;
        }
        [[nodiscard]] bool is_available() const override;
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;
    };

    /**
     * @brief Full pixel decode through libjpeg or libpng.
     *
     * Passes only when every row decodes with no warning and no error, and
     * reports how many rows decoded cleanly.
     */
    class DecodeCheck final : public IValidationCheck {
    public:
        explicit DecodeCheck(ImageFormat format, std::uint64_t max_bytes = kDefaultMaxDecodeBytes)
            : format_(format), max_bytes_(max_bytes) {}

        [[nodiscard]] std::string_view name() const noexcept override {
            return format_ == ImageFormat::Png ? "png_decode" : "jpeg_decode";
        }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Moderate; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override { return format == format_; }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;

    private:
        ImageFormat format_;
        std::uint64_t max_bytes_;
    };

    /**
     * @brief Runs a forensic command-line checker on a temporary copy.
     *
     * Exit status 0 passes. A missing binary makes the check unavailable; so
     * does exceeding the timeout, in which case the child is killed.
     */
    class ExternalToolCheck final : public IValidationCheck {
    public:
        ExternalToolCheck(std::string name,
                          std::string program,
                          std::vector<std::string> args,
                          std::vector<ImageFormat> formats,
                          std::chrono::milliseconds timeout);

        [[nodiscard]] std::string_view name() const noexcept override { return name_; }
        [[nodiscard]] CheckCost cost() const noexcept override { return CheckCost::Expensive; }
        [[nodiscard]] bool supports(ImageFormat format) const noexcept override;
        [[nodiscard]] bool is_available() const override { return !executable_.empty(); }
        [[nodiscard]] ValidationVerdict check(const CheckContext& ctx) const override;

    private:
        std::string name_;
        std::filesystem::path executable_;
        std::vector<std::string> args_;
        std::vector<ImageFormat> formats_;
        std::chrono::milliseconds timeout_;
    };

} // namespace mender

#endif // MENDER_BUILTIN_CHECKS_HPP
