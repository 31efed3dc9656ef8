#include "../../include/validation_oracle.hpp"
#include "../../include/builtin_checks.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <algorithm>

namespace mender {

    bool passes_required(const std::vector<ValidationVerdict>& verdicts) noexcept {
        return std::ranges::all_of(verdicts, [](const ValidationVerdict& v) {
            return !v.required || v.passed;
        });
    }

    bool OracleResult::passes_required() const noexcept {
        return mender::passes_required(verdicts);
    }

    const ValidationVerdict* OracleResult::find(const std::string_view check_name) const noexcept {
        const auto it = std::ranges::find(verdicts, check_name, &ValidationVerdict::check_name);
        return it == verdicts.end() ? nullptr : &*it;
    }

    ValidationOracle::ValidationOracle(OracleConfig config) : config_(std::move(config)) {
        add_check(std::make_unique<SizeCheck>(config_.min_size));
        add_check(std::make_unique<MagicBytesCheck>());
        add_check(std::make_unique<StructureCheck>());
        add_check(std::make_unique<SegmentAuditCheck>());
        if (config_.mime_check) {
            add_check(std::make_unique<MimeTypeCheck>());
        }
        if (config_.decode_checks) {
            add_check(std::make_unique<DecodeCheck>(ImageFormat::Jpeg, config_.max_decode_bytes));
            add_check(std::make_unique<DecodeCheck>(ImageFormat::Png, config_.max_decode_bytes));
        }
        if (config_.external_tools) {
            add_check(std::make_unique<ExternalToolCheck>(
                "jpeginfo", "jpeginfo", std::vector<std::string>{"-c"},
                std::vector{ImageFormat::Jpeg}, config_.tool_timeout));
            add_check(std::make_unique<ExternalToolCheck>(
                "pngcheck", "pngcheck", std::vector<std::string>{"-v"},
                std::vector{ImageFormat::Png}, config_.tool_timeout));
            add_check(std::make_unique<ExternalToolCheck>(
                "identify", "identify", std::vector<std::string>{"-regard-warnings"},
                std::vector{ImageFormat::Jpeg, ImageFormat::Png}, config_.tool_timeout));
        }
    }

    void ValidationOracle::add_check(std::unique_ptr<IValidationCheck> check) {
        const auto pos = std::ranges::upper_bound(checks_, check->cost(), std::less{},
                                                  [](const auto& c) { return c->cost(); });
        checks_.insert(pos, std::move(check));
    }

    std::vector<std::string> ValidationOracle::check_names() const {
        std::vector<std::string> names;
        names.reserve(checks_.size());
        for (const auto& c : checks_) {
            names.emplace_back(c->name());
        }
        return names;
    }

    OracleResult ValidationOracle::validate(const ImageArtifact& artifact) const {
        OracleResult result;
        result.parse = try_parse(artifact);
        const CheckContext ctx{artifact, result.parse};

        for (const auto& check : checks_) {
            if (!check->supports(artifact.format())) {
                continue;
            }
            if (!check->is_available()) {
                result.unavailable.emplace_back(check->name());
                continue;
            }

            ValidationVerdict verdict;
            try {
                verdict = check->check(ctx);
            } catch (const CheckUnavailable& e) {
                Logger::log(LogLevel::Info,
                            artifact.id() + ": " + std::string(check->name()) + " unavailable: " + e.what(),
                            "oracle");
                result.unavailable.emplace_back(check->name());
                continue;
            }

            if (!verdict.passed) {
                Logger::log(LogLevel::Debug,
                            artifact.id() + ": " + verdict.check_name + " failed: " +
                            verdict.diagnostic.value_or(""),
                            "oracle");
            }
            const bool stop = check->short_circuits(ctx, verdict);
            result.verdicts.push_back(std::move(verdict));
            if (stop) {
                break;
            }
        }
        return result;
    }

} // namespace mender
