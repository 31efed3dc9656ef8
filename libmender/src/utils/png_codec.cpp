#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cstring>
#include <new>
#include <optional>
#include <png.h>
#include <stdexcept>

namespace {

    constexpr std::size_t kMaxWarnings = 8;

    // small IDAT reads keep the rows inflated before the data ran out
    // independent of the bytes that were never there
    constexpr png_size_t kIdatReadSize = 512;

    struct PngDecodeState {
        std::span<const std::uint8_t> bytes;
        std::size_t pos = 0;
        mender::DecodedImage* image = nullptr;
        png_uint_32 current_row = 0;
        std::optional<png_uint_32> first_warning_row;
        std::optional<png_uint_32> exhausted_row;   ///< Row being decoded when real bytes ran out
        bool exhausted = false;
    };

    /**
     * @brief libpng error handler that throws a C++ exception.
     */
    void png_error_throw(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    void png_warning_collect(const png_structp png, const png_const_charp msg) {
        auto* st = static_cast<PngDecodeState*>(png_get_error_ptr(png));
        if (!st || !st->image) {
            Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
            return;
        }
        if (!st->first_warning_row) st->first_warning_row = st->current_row;
        if (st->image->warnings.size() < kMaxWarnings) st->image->warnings.emplace_back(msg);
    }

    /**
     * @brief Feeds the buffer to libpng. The request that crosses the end gets
     * the remaining bytes plus zero fill; the request after it is an error.
     */
    void png_read_from_memory(const png_structp png, const png_bytep out, const png_size_t len) {
        auto* st = static_cast<PngDecodeState*>(png_get_io_ptr(png));
        if (st->exhausted) {
            png_error(png, "Read beyond end of data");
        }
        const std::size_t available = st->bytes.size() - std::min(st->pos, st->bytes.size());
        if (len > available) {
            st->exhausted = true;
            st->exhausted_row = st->current_row;
            std::memcpy(out, st->bytes.data() + st->pos, available);
            std::memset(out + available, 0, len - available);
            st->pos = st->bytes.size();
            return;
        }
        std::memcpy(out, st->bytes.data() + st->pos, len);
        st->pos += len;
    }

    void png_write_to_memory(const png_structp png, const png_bytep data, const png_size_t len) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + len);
    }

    void png_flush_noop(png_structp) {}

    /**
     * @brief RAII wrapper for libpng read structs.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    void expand_to_rgba8(const png_structp png, const png_infop info) {
        const int bit_depth = png_get_bit_depth(png, info);
        const int color_type = png_get_color_type(png, info);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
    }

} // namespace

namespace mender {

    DecodedImage decode_png(const std::span<const std::uint8_t> bytes, const std::uint64_t max_bytes) {
        DecodedImage img;
        PngDecodeState st{bytes, 0, &img};

        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &st, png_error_throw, png_warning_collect);
        if (!rd.png) {
            img.error = "png_create_read_struct failed";
            return img;
        }
        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) {
            img.error = "png_create_info_struct failed";
            return img;
        }

        try {
            if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error");
            png_set_read_fn(rd.png, &st, png_read_from_memory);
            png_set_compression_buffer_size(rd.png, kIdatReadSize);
            png_read_info(rd.png, rd.info);

            png_uint_32 width = 0, height = 0;
            int bit_depth = 0, color_type = 0, interlace = 0;
            png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, &interlace, nullptr, nullptr);

            const std::uint64_t declared = static_cast<std::uint64_t>(width) * height * 4;
            if (declared > max_bytes) {
                img.width = width;
                img.height = height;
                throw std::runtime_error(oversized_image_message(width, height, 4, max_bytes));
            }

            expand_to_rgba8(rd.png, rd.info);
            const int passes = png_set_interlace_handling(rd.png);
            png_read_update_info(rd.png, rd.info);

            const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
            if (rowbytes != static_cast<std::size_t>(width) * 4) {
                throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
            }

            img.width = width;
            img.height = height;
            img.channels = 4;
            img.layered = interlace != PNG_INTERLACE_NONE;
            img.header_ok = true;
            img.pixels.assign(rowbytes * height, 0);

            for (int pass = 0; pass < passes; ++pass) {
                for (png_uint_32 y = 0; y < height; ++y) {
                    st.current_row = y;
                    png_read_row(rd.png, img.pixels.data() + static_cast<std::size_t>(y) * rowbytes, nullptr);
                    if (pass == passes - 1) img.rows_read = y + 1;
                }
            }
            st.current_row = height;
            png_read_end(rd.png, nullptr);
        } catch (const std::runtime_error& e) {
            img.error = e.what();
        } catch (const std::bad_alloc&) {
            Logger::log(LogLevel::Warning, "out of memory decoding a " + std::to_string(img.width) + "x" +
                        std::to_string(img.height) + " PNG", "libpng");
            img.error = "out of memory while decoding";
        }

        img.data_exhausted = st.exhausted;
        img.clean_rows = img.rows_read;
        if (st.exhausted_row) img.clean_rows = std::min<std::uint32_t>(img.clean_rows, *st.exhausted_row);
        if (st.first_warning_row) img.clean_rows = std::min<std::uint32_t>(img.clean_rows, *st.first_warning_row);
        if (img.layered && (img.error || !img.warnings.empty())) img.clean_rows = 0;
        return img;
    }

    std::vector<std::uint8_t> encode_png(const std::span<const std::uint8_t> pixels,
                                         const std::uint32_t width,
                                         const std::uint32_t height,
                                         const int channels) {
        int color_type = 0;
        switch (channels) {
            case 1: color_type = PNG_COLOR_TYPE_GRAY; break;
            case 2: color_type = PNG_COLOR_TYPE_GRAY_ALPHA; break;
            case 3: color_type = PNG_COLOR_TYPE_RGB; break;
            case 4: color_type = PNG_COLOR_TYPE_RGBA; break;
            default:
                throw std::runtime_error("unsupported PNG channel count: " + std::to_string(channels));
        }
        if (width == 0 || height == 0) {
            throw std::runtime_error("cannot encode an empty PNG");
        }
        const std::size_t stride = static_cast<std::size_t>(width) * static_cast<std::size_t>(channels);
        if (pixels.size() < stride * height) {
            throw std::runtime_error("pixel buffer smaller than image");
        }

        std::vector<std::uint8_t> out;
        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_throw, png_warning_collect);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
        if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

        png_set_write_fn(wr.png, &out, png_write_to_memory, png_flush_noop);
        png_set_IHDR(wr.png, wr.info, width, height, 8, color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        png_write_info(wr.png, wr.info);
        for (std::uint32_t y = 0; y < height; ++y) {
            png_write_row(wr.png, const_cast<png_bytep>(pixels.data() + static_cast<std::size_t>(y) * stride));
        }
        png_write_end(wr.png, nullptr);
        return out;
    }

} // namespace mender
