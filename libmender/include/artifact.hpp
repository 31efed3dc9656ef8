/**
 * @file artifact.hpp
 * @brief Immutable handle to a recovered image byte sequence plus provenance.
 */

#ifndef MENDER_ARTIFACT_HPP
#define MENDER_ARTIFACT_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

    /**
     * @brief Container formats understood by the engine.
     */
    enum class ImageFormat {
        Jpeg,
        Png,
        Unknown
    };

    [[nodiscard]] std::string_view to_string(ImageFormat format) noexcept;

    /**
     * @brief Where an artifact came from.
     */
    struct Provenance {
        std::filesystem::path source_path;  ///< Storage location of the evidence bytes
        std::string recovery_method;        ///< e.g. "fs_based", "carved"
        std::string derived_from;           ///< Id of the parent artifact, empty for evidence
    };

    /**
     * @brief Immutable recovered image.
     *
     * @details Bytes are held through a shared pointer to const, so copies of
     * an ImageArtifact are cheap and no holder can mutate the content. A
     * repaired artifact is always created through derive(), which yields a
     * new id and a new byte buffer.
     */
    class ImageArtifact {
    public:
        ImageArtifact(std::string id,
                      std::vector<std::uint8_t> bytes,
                      Provenance provenance,
                      std::optional<ImageFormat> format = std::nullopt);

        [[nodiscard]] const std::string& id() const noexcept { return id_; }
        [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return {*data_}; }
        [[nodiscard]] std::size_t size() const noexcept { return data_->size(); }
        [[nodiscard]] const Provenance& provenance() const noexcept { return provenance_; }
        [[nodiscard]] ImageFormat format() const noexcept { return format_; }

        /// True for artifacts read straight from evidence storage.
        [[nodiscard]] bool is_evidence() const noexcept { return provenance_.derived_from.empty(); }

        /**
         * @brief Create a new artifact derived from this one.
         * @param suffix Appended to the id as "<id>#<suffix>".
         * @param bytes Content of the new artifact.
         */
        [[nodiscard]] ImageArtifact derive(std::string_view suffix,
                                           std::vector<std::uint8_t> bytes) const;

    private:
        std::string id_;
        std::shared_ptr<const std::vector<std::uint8_t>> data_;
        Provenance provenance_;
        ImageFormat format_;
    };

    /**
     * @brief Detect the container format of a byte sequence.
     *
     * Leading signature first, then the libmagic MIME type, then the
     * extension of @p path_hint. A JPEG or PNG signature found later in the
     * stream (garbage prefix) is accepted when the extension agrees.
     */
    [[nodiscard]] ImageFormat detect_format(std::span<const std::uint8_t> bytes,
                                            const std::filesystem::path& path_hint = {});

    [[nodiscard]] ImageFormat format_from_mime(std::string_view mime) noexcept;

    [[nodiscard]] ImageFormat format_from_extension(const std::filesystem::path& path);

    /**
     * @brief Returns @p id, or "<stem>_<n><ext>" with the smallest n >= 1
     * not yet in @p taken. The returned id is inserted into @p taken.
     */
    [[nodiscard]] std::string unique_artifact_id(const std::string& id, std::set<std::string>& taken);

} // namespace mender

#endif // MENDER_ARTIFACT_HPP
