#include "../../include/repair_technique.hpp"

namespace mender {

    std::unique_ptr<IRepairTechnique> make_technique(const RepairTechnique technique, const RepairConfig& config) {
        switch (technique) {
            case RepairTechnique::FooterAppend:
                return std::make_unique<FooterAppend>();
            case RepairTechnique::HeaderReconstruction:
                return std::make_unique<HeaderReconstruction>(config.header_search_window);
            case RepairTechnique::SegmentStripping:
                return std::make_unique<SegmentStripping>();
            case RepairTechnique::PartialDecodeReencode:
                return std::make_unique<PartialDecodeReencode>(config.jpeg_quality, config.max_decode_bytes);
        }
        return nullptr;
    }

    bool is_critical_png_chunk(const std::string_view kind) noexcept {
        return kind == "signature" || kind == "IHDR" || kind == "PLTE" || kind == "IDAT" || kind == "IEND";
    }

    bool is_critical_jpeg_segment(const Segment& segment) noexcept {
        if (segment.kind == "SCAN") return true;
        const auto m = static_cast<std::uint8_t>(segment.tag);
        return m == 0xD8 || m == 0xD9 || m == 0xDB || m == 0xC4 || m == 0xDD || m == 0xDA ||
               (m >= 0xD0 && m <= 0xD7) || is_jpeg_sof(m);
    }

} // namespace mender
