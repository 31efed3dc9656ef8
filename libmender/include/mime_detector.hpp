#ifndef MENDER_MIME_DETECTOR_HPP
#define MENDER_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace mender {

    /**
     * @brief MIME type detection backed by libmagic.
     *
     * Each thread keeps its own loaded magic database, libmagic handles
     * are not safe to share.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return e.g. "image/jpeg", or an empty string if libmagic is not usable.
         */
        static std::string detect(std::span<const std::uint8_t> bytes);

        /**
         * @brief Detect the MIME type of a file.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief True if a magic database could be loaded on this thread.
         */
        static bool available();
    };

} // namespace mender

#endif //MENDER_MIME_DETECTOR_HPP
