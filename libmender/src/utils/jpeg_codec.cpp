#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <jerror.h>
#include <new>
#include <stdexcept>

namespace {

    constexpr std::size_t kMaxWarnings = 8;

    // error manager (jpeg error -> c++ exception, warnings -> collected)
    struct JpegErrorMgr {
        jpeg_error_mgr pub{};
        char msg[JMSG_LENGTH_MAX]{};
        mender::DecodedImage* image = nullptr;
        j_decompress_ptr dinfo = nullptr;
        bool warned = false;
        JDIMENSION first_warning_scanline = 0;
    };

    /**
     * @brief libjpeg error handler that throws a C++ exception.
     */
    void jpeg_error_exit_throw(const j_common_ptr cinfo) {
        auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
        (*cinfo->err->format_message)(cinfo, err->msg);
        Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
        throw std::runtime_error(err->msg);
    }

    /**
     * @brief Records corrupt-data warnings instead of printing them.
     */
    void jpeg_emit_message_collect(const j_common_ptr cinfo, const int msg_level) {
        if (msg_level >= 0) return; // trace messages
        auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
        ++cinfo->err->num_warnings;
        if (!err->warned) {
            err->warned = true;
            err->first_warning_scanline = err->dinfo ? err->dinfo->output_scanline : 0;
        }
        if (err->image && err->image->warnings.size() < kMaxWarnings) {
            char buf[JMSG_LENGTH_MAX];
            (*cinfo->err->format_message)(cinfo, buf);
            err->image->warnings.emplace_back(buf);
        }
    }

    // memory source that notes when the decoder runs out of real bytes
    struct MemorySource {
        jpeg_source_mgr pub{};
        bool exhausted = false;
        JDIMENSION exhausted_at = 0;
    };

    const JOCTET kFakeEoi[2] = {0xFF, JPEG_EOI};

    void source_init(j_decompress_ptr) {}

    boolean source_fill(const j_decompress_ptr cinfo) {
        auto* src = reinterpret_cast<MemorySource*>(cinfo->src);
        if (!src->exhausted) {
            src->exhausted = true;
            src->exhausted_at = cinfo->output_scanline;
        }
        WARNMS(cinfo, JWRN_JPEG_EOF);
        src->pub.next_input_byte = kFakeEoi;
        src->pub.bytes_in_buffer = 2;
        return TRUE;
    }

    void source_skip(const j_decompress_ptr cinfo, long num_bytes) {
        auto* src = reinterpret_cast<MemorySource*>(cinfo->src);
        if (num_bytes <= 0) return;
        while (num_bytes > static_cast<long>(src->pub.bytes_in_buffer)) {
            num_bytes -= static_cast<long>(src->pub.bytes_in_buffer);
            (void) source_fill(cinfo);
        }
        src->pub.next_input_byte += num_bytes;
        src->pub.bytes_in_buffer -= static_cast<std::size_t>(num_bytes);
    }

    void source_term(j_decompress_ptr) {}

} // namespace

namespace mender {

    std::string DecodedImage::first_problem() const {
        if (!warnings.empty()) return warnings.front();
        if (error) return *error;
        if (rows_read < height) return "decoded " + std::to_string(rows_read) + " of " + std::to_string(height) + " rows";
        return {};
    }

    std::string oversized_image_message(const std::uint64_t width, const std::uint64_t height,
                                       const int components, const std::uint64_t max_bytes) {
        return "declared size " + std::to_string(width) + "x" + std::to_string(height) + "x" +
               std::to_string(components) + " exceeds the decode limit of " + std::to_string(max_bytes) + " bytes";
    }

    DecodedImage decode_jpeg(const std::span<const std::uint8_t> bytes, const std::uint64_t max_bytes) {
        DecodedImage img;
        jpeg_decompress_struct cinfo{};
        JpegErrorMgr jerr{};
        MemorySource src{};

        // error handlers must be set before any possible error
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;
        jerr.pub.emit_message = jpeg_emit_message_collect;
        jerr.image = &img;
        jerr.dinfo = &cinfo;

        try {
            jpeg_create_decompress(&cinfo);

            src.pub.init_source = source_init;
            src.pub.fill_input_buffer = source_fill;
            src.pub.skip_input_data = source_skip;
            src.pub.resync_to_restart = jpeg_resync_to_restart;
            src.pub.term_source = source_term;
            src.pub.next_input_byte = bytes.data();
            src.pub.bytes_in_buffer = bytes.size();
            cinfo.src = &src.pub;

            jpeg_read_header(&cinfo, TRUE);

            // progressive decoders buffer the whole coefficient image in start_decompress
            const std::uint64_t declared = static_cast<std::uint64_t>(cinfo.image_width) * cinfo.image_height *
                                           static_cast<std::uint64_t>(cinfo.num_components);
            if (declared > max_bytes) {
                img.width = cinfo.image_width;
                img.height = cinfo.image_height;
                throw std::runtime_error(oversized_image_message(cinfo.image_width, cinfo.image_height,
                                                                 cinfo.num_components, max_bytes));
            }
            jpeg_start_decompress(&cinfo);

            img.width = cinfo.output_width;
            img.height = cinfo.output_height;
            img.channels = cinfo.output_components;
            img.cmyk = cinfo.out_color_space == JCS_CMYK;
            img.layered = cinfo.progressive_mode != 0;
            img.row_group = static_cast<std::uint32_t>(cinfo.max_v_samp_factor * DCTSIZE);
            img.header_ok = true;

            const std::size_t stride = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.channels);
            img.pixels.assign(stride * img.height, 0);

            while (cinfo.output_scanline < cinfo.output_height) {
                JSAMPROW row = img.pixels.data() + static_cast<std::size_t>(cinfo.output_scanline) * stride;
                if (jpeg_read_scanlines(&cinfo, &row, 1) != 1) break;
                img.rows_read = cinfo.output_scanline;
            }
            jpeg_finish_decompress(&cinfo);
        } catch (const std::runtime_error& e) {
            img.error = e.what();
        } catch (const std::bad_alloc&) {
            Logger::log(LogLevel::Warning, "out of memory decoding a " + std::to_string(cinfo.image_width) + "x" +
                        std::to_string(cinfo.image_height) + " JPEG", "libjpeg");
            img.error = "out of memory while decoding";
        }
        jpeg_destroy_decompress(&cinfo);

        img.data_exhausted = src.exhausted;
        img.clean_rows = img.rows_read;
        if (src.exhausted) img.clean_rows = std::min<std::uint32_t>(img.clean_rows, src.exhausted_at);
        if (jerr.warned) img.clean_rows = std::min<std::uint32_t>(img.clean_rows, jerr.first_warning_scanline);
        return img;
    }

    std::vector<std::uint8_t> encode_jpeg(const std::span<const std::uint8_t> pixels,
                                          const std::uint32_t width,
                                          const std::uint32_t height,
                                          const int channels,
                                          const int quality) {
        if (width == 0 || height == 0) {
            throw std::runtime_error("cannot encode an empty JPEG");
        }
        if (channels != 1 && channels != 3 && channels != 4) {
            throw std::runtime_error("unsupported JPEG channel count: " + std::to_string(channels));
        }
        const std::size_t stride = static_cast<std::size_t>(width) * static_cast<std::size_t>(channels);
        if (pixels.size() < stride * height) {
            throw std::runtime_error("pixel buffer smaller than image");
        }

        jpeg_compress_struct cinfo{};
        JpegErrorMgr jerr{};
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;

        unsigned char* out = nullptr;
        unsigned long out_size = 0;
        std::vector<std::uint8_t> result;

        try {
            jpeg_create_compress(&cinfo);
            jpeg_mem_dest(&cinfo, &out, &out_size);

            cinfo.image_width = width;
            cinfo.image_height = height;
            cinfo.input_components = channels;
            cinfo.in_color_space = channels == 1 ? JCS_GRAYSCALE : channels == 3 ? JCS_RGB : JCS_CMYK;
            jpeg_set_defaults(&cinfo);
            jpeg_set_quality(&cinfo, quality, TRUE);

            jpeg_start_compress(&cinfo, TRUE);
            while (cinfo.next_scanline < cinfo.image_height) {
                auto row = const_cast<JSAMPROW>(pixels.data() + static_cast<std::size_t>(cinfo.next_scanline) * stride);
                jpeg_write_scanlines(&cinfo, &row, 1);
            }
            jpeg_finish_compress(&cinfo);
            result.assign(out, out + out_size);
        } catch (const std::runtime_error& e) {
            jpeg_destroy_compress(&cinfo);
            std::free(out);
            Logger::log(LogLevel::Error, std::string("JPEG encode failed: ") + e.what(), "libjpeg");
            throw;
        }

        jpeg_destroy_compress(&cinfo);
        std::free(out);
        return result;
    }

} // namespace mender
