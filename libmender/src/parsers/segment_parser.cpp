#include "../../include/segment_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace mender {

    std::string_view to_string(const StopReason reason) noexcept {
        switch (reason) {
            case StopReason::EndMarker:        return "end_marker";
            case StopReason::EndOfStream:      return "end_of_stream";
            case StopReason::TruncatedSegment: return "truncated_segment";
            case StopReason::InvalidMarker:    return "invalid_marker";
        }
        return "end_of_stream";
    }

    std::size_t ContainerStructure::inconsistent_segments() const noexcept {
        return static_cast<std::size_t>(std::ranges::count_if(segments, [](const Segment& s) { return !s.intact; }));
    }

    const Segment* ContainerStructure::find(const std::string_view kind) const noexcept {
        const auto it = std::ranges::find_if(segments, [kind](const Segment& s) { return s.kind == kind; });
        return it != segments.end() ? &*it : nullptr;
    }

    ContainerStructure parse_container(const ImageFormat format, const std::span<const std::uint8_t> bytes) {
        switch (format) {
            case ImageFormat::Jpeg:    return parse_jpeg(bytes);
            case ImageFormat::Png:     return parse_png(bytes);
            case ImageFormat::Unknown: break;
        }
        throw MalformedContainer("unsupported container format", 0);
    }

    ParseOutcome try_parse(const ImageArtifact& artifact) {
        ParseOutcome out;
        try {
            out.structure = parse_container(artifact.format(), artifact.bytes());
        } catch (const MalformedContainer& e) {
            Logger::log(LogLevel::Debug,
                        artifact.id() + ": malformed container at offset " + std::to_string(e.offset()) + ": " + e.what(),
                        "segment_parser");
            out.error = e.what();
            out.error_offset = e.offset();
        }
        return out;
    }

} // namespace mender
