#include "../../include/artifact.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace mender {

    namespace {
        constexpr std::array<std::uint8_t, 3> kJpegSignature{0xFF, 0xD8, 0xFF};
        constexpr std::array<std::uint8_t, 8> kPngSignature{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

        template <std::size_t N>
        bool starts_with(const std::span<const std::uint8_t> bytes, const std::array<std::uint8_t, N>& sig) {
            return bytes.size() >= N && std::equal(sig.begin(), sig.end(), bytes.begin());
        }

        template <std::size_t N>
        bool contains(const std::span<const std::uint8_t> bytes, const std::array<std::uint8_t, N>& sig) {
            return std::search(bytes.begin(), bytes.end(), sig.begin(), sig.end()) != bytes.end();
        }
    } // namespace

    std::string_view to_string(const ImageFormat format) noexcept {
        switch (format) {
            case ImageFormat::Jpeg:    return "jpeg";
            case ImageFormat::Png:     return "png";
            case ImageFormat::Unknown: return "unknown";
        }
        return "unknown";
    }

    ImageArtifact::ImageArtifact(std::string id,
                                 std::vector<std::uint8_t> bytes,
                                 Provenance provenance,
                                 const std::optional<ImageFormat> format)
        : id_(std::move(id)),
          data_(std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes))),
          provenance_(std::move(provenance)),
          format_(format.value_or(detect_format(*data_, provenance_.source_path))) {}

    ImageArtifact ImageArtifact::derive(const std::string_view suffix,
                                        std::vector<std::uint8_t> bytes) const {
        Provenance p = provenance_;
        p.derived_from = id_;
        return ImageArtifact(id_ + "#" + std::string(suffix), std::move(bytes), std::move(p), format_);
    }

    ImageFormat format_from_mime(const std::string_view mime) noexcept {
        if (mime == "image/jpeg" || mime == "image/jpg" || mime == "image/pjpeg") return ImageFormat::Jpeg;
        if (mime == "image/png" || mime == "image/x-png") return ImageFormat::Png;
        return ImageFormat::Unknown;
    }

    ImageFormat format_from_extension(const std::filesystem::path& path) {
        auto ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".jpg" || ext == ".jpeg" || ext == ".jpe" || ext == ".jfif") return ImageFormat::Jpeg;
        if (ext == ".png") return ImageFormat::Png;
        return ImageFormat::Unknown;
    }

    ImageFormat detect_format(const std::span<const std::uint8_t> bytes,
                              const std::filesystem::path& path_hint) {
        if (starts_with(bytes, kJpegSignature)) return ImageFormat::Jpeg;
        if (starts_with(bytes, kPngSignature)) return ImageFormat::Png;

        if (!bytes.empty()) {
            if (const auto by_mime = format_from_mime(MimeDetector::detect(bytes));
                by_mime != ImageFormat::Unknown) {
                return by_mime;
            }
        }

        // damaged header: trust the extension when the stream agrees with it,
        // or when there is nothing else to go on
        const auto by_ext = format_from_extension(path_hint);
        if (by_ext == ImageFormat::Jpeg && contains(bytes, std::array<std::uint8_t, 2>{0xFF, 0xD8})) return by_ext;
        if (by_ext == ImageFormat::Png && contains(bytes, std::array<std::uint8_t, 4>{'I', 'H', 'D', 'R'})) return by_ext;
        if (contains(bytes, kJpegSignature)) return ImageFormat::Jpeg;
        if (contains(bytes, kPngSignature)) return ImageFormat::Png;
        return by_ext;
    }

    std::string unique_artifact_id(const std::string& id, std::set<std::string>& taken) {
        if (taken.insert(id).second) return id;
        const std::filesystem::path p(id);
        for (int n = 1;; ++n) {
            std::string candidate = p.stem().string() + "_" + std::to_string(n) + p.extension().string();
            if (taken.insert(candidate).second) return candidate;
        }
    }

} // namespace mender
