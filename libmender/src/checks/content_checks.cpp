/**
 * @file content_checks.cpp
 * @brief libmagic MIME and full-decode checks.
 */

#include "../../include/builtin_checks.hpp"
#include "../../include/errors.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/mime_detector.hpp"

#include <new>

namespace mender {

    bool MimeTypeCheck::is_available() const {
        return MimeDetector::available();
    }

    ValidationVerdict MimeTypeCheck::check(const CheckContext& ctx) const {
        const std::string mime = MimeDetector::detect(ctx.artifact.bytes());
        if (mime.empty()) {
            throw CheckUnavailable("libmagic returned no MIME type");
        }
        if (format_from_mime(mime) == ctx.artifact.format()) {
            return pass();
        }
        return fail("libmagic reports " + mime);
    }

    ValidationVerdict DecodeCheck::check(const CheckContext& ctx) const {
        DecodedImage img;
        try {
            img = format_ == ImageFormat::Png ? decode_png(ctx.artifact.bytes(), max_bytes_)
                                              : decode_jpeg(ctx.artifact.bytes(), max_bytes_);
        } catch (const std::bad_alloc&) {
            return fail("out of memory while decoding");
        }

        if (img.complete()) {
            ValidationVerdict verdict = pass();
            verdict.progress = DecodeProgress{img.rows_read, img.height, img.row_group};
            return verdict;
        }

        std::string problem = img.first_problem();
        ValidationVerdict verdict = fail(problem.empty() ? "decode incomplete" : std::move(problem));
        if (img.header_ok) {
            const std::uint32_t decoded = (img.data_exhausted || img.error) ? img.clean_rows : img.rows_read;
            verdict.progress = DecodeProgress{decoded, img.height, img.row_group};
        }
        return verdict;
    }

} // namespace mender
