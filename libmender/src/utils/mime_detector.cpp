#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>
#include <type_traits>

namespace {

    struct MagicCloser {
        void operator()(const magic_t m) const { if (m) magic_close(m); }
    };
    using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

    magic_t thread_magic() {
        thread_local bool tried = false;
        thread_local unique_magic handle;
        if (!tried) {
            tried = true;
            unique_magic m(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
            if (!m) {
                Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
                return nullptr;
            }
            if (magic_load(m.get(), nullptr) != 0) {
                const char* err = magic_error(m.get());
                Logger::log(LogLevel::Warning,
                            std::string("magic_load failed: ") + (err ? err : "unknown error"),
                            "libmagic");
                return nullptr;
            }
            handle = std::move(m);
        }
        return handle.get();
    }

} // namespace

namespace mender {

    std::string MimeDetector::detect(const std::span<const std::uint8_t> bytes) {
        const magic_t magic = thread_magic();
        if (!magic || bytes.empty()) return {};
        const char* mime = magic_buffer(magic, bytes.data(), bytes.size());
        return mime ? mime : "";
    }

    std::string MimeDetector::detect(const std::filesystem::path& path) {
        const magic_t magic = thread_magic();
        if (!magic) return {};
        const char* mime = magic_file(magic, path.string().c_str());
        return mime ? mime : "";
    }

    bool MimeDetector::available() {
        return thread_magic() != nullptr;
    }

} // namespace mender
