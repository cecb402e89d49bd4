#include "ktextools/ktex.h"
#include "ktextools/parallel.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <string>

namespace ktextools::ktex {

namespace {

std::optional<bcn::Format> block_format(PixelFormat fmt) {
    switch (fmt) {
        case PixelFormat::BC1: return bcn::Format::BC1;
        case PixelFormat::BC2: return bcn::Format::BC2;
        case PixelFormat::BC3: return bcn::Format::BC3;
        default: return std::nullopt;
    }
}

[[noreturn]] void unsupported(PixelFormat fmt) {
    throw Error(ErrorKind::UnsupportedPixelFormat,
                "ktex: unsupported pixel format " + std::string(to_string(fmt)) + " (" +
                    std::to_string(static_cast<uint32_t>(fmt)) + ")");
}

void check_pixels(std::span<const uint8_t> pixels, uint16_t width, uint16_t height, size_t channels) {
    const size_t expected = static_cast<size_t>(width) * height * channels;
    if (pixels.size() != expected)
        throw Error(ErrorKind::InvalidBufferShape,
                    "ktex: " + std::to_string(pixels.size()) + " bytes for " + std::to_string(width) +
                        "x" + std::to_string(height) + " with " + std::to_string(channels) +
                        " channels, expected " + std::to_string(expected));
}

// Stored pitch is 16 bits wide; larger values wrap.
uint16_t pitch16(size_t pitch) {
    return static_cast<uint16_t>(pitch);
}

} // namespace

std::vector<uint8_t> decompress(const Mipmap& mipmap, PixelFormat fmt, bool premultiplied) {
    if (mipmap.data.size() != mipmap.data_size)
        throw Error(ErrorKind::MalformedHeader,
                    "ktex: payload holds " + std::to_string(mipmap.data.size()) +
                        " bytes, declared " + std::to_string(mipmap.data_size));

    if (auto bf = block_format(fmt)) {
        const size_t need = bcn::compressed_size(*bf, mipmap.width, mipmap.height);
        if (mipmap.data.size() < need)
            throw Error(ErrorKind::TruncatedData,
                        "ktex: " + std::string(to_string(fmt)) + " level " +
                            std::to_string(mipmap.width) + "x" + std::to_string(mipmap.height) +
                            " needs " + std::to_string(need) + " bytes, got " +
                            std::to_string(mipmap.data.size()));
        auto rgba = bcn::decompress(*bf, mipmap.data, mipmap.width, mipmap.height);
        if (premultiplied)
            return pixel::flip_vertical_and_unpremultiply(rgba, mipmap.width, mipmap.height);
        return pixel::flip_vertical(rgba, mipmap.width, mipmap.height);
    }

    switch (fmt) {
        case PixelFormat::RGBA:
            return mipmap.data;
        case PixelFormat::RGB: {
            if (mipmap.data.size() % 3 != 0)
                throw Error(ErrorKind::InvalidBufferShape,
                            "ktex: RGB payload of " + std::to_string(mipmap.data.size()) +
                                " bytes is not divisible by 3");
            const size_t count = mipmap.data.size() / 3;
            std::vector<uint8_t> rgba(count * 4);
            for (size_t i = 0; i < count; i++) {
                rgba[i*4]   = mipmap.data[i*3];
                rgba[i*4+1] = mipmap.data[i*3+1];
                rgba[i*4+2] = mipmap.data[i*3+2];
                rgba[i*4+3] = 255;
            }
            return rgba;
        }
        default:
            unsupported(fmt);
    }
}

Mipmap compress(PixelFormat fmt, uint16_t width, uint16_t height, std::span<const uint8_t> pixels,
                bool premultiply, const bcn::Params& params) {
    Mipmap m;
    m.width = width;
    m.height = height;

    if (auto bf = block_format(fmt)) {
        check_pixels(pixels, width, height, 4);
        m.pitch = pitch16((static_cast<size_t>(width) + 3) / 4 * bcn::block_bytes(*bf));
        if (premultiply) {
            auto pre = pixel::premultiply(pixels);
            m.data = bcn::compress(*bf, pre, width, height, params);
        } else {
            m.data = bcn::compress(*bf, pixels, width, height, params);
        }
    } else if (fmt == PixelFormat::RGBA) {
        check_pixels(pixels, width, height, 4);
        m.pitch = pitch16(static_cast<size_t>(width) * 4);
        m.data.assign(pixels.begin(), pixels.end());
    } else if (fmt == PixelFormat::RGB) {
        check_pixels(pixels, width, height, 3);
        m.pitch = pitch16(static_cast<size_t>(width) * 3);
        m.data.assign(pixels.begin(), pixels.end());
    } else {
        unsupported(fmt);
    }

    if (m.data.size() > std::numeric_limits<uint32_t>::max())
        throw Error(ErrorKind::MalformedHeader,
                    "ktex: level payload of " + std::to_string(m.data.size()) + " bytes exceeds 32 bits");
    m.data_size = static_cast<uint32_t>(m.data.size());
    return m;
}

Mipmap compress_level(PixelFormat fmt, const pixel::Image& image, bool premultiply,
                      const bcn::Params& params) {
    if (image.width < 0 || image.height < 0 || image.width > 65535 || image.height > 65535)
        throw Error(ErrorKind::InvalidBufferShape,
                    "ktex: image size " + std::to_string(image.width) + "x" +
                        std::to_string(image.height) + " does not fit 16 bits");
    const auto w = static_cast<uint16_t>(image.width);
    const auto h = static_cast<uint16_t>(image.height);
    if (fmt == PixelFormat::RGB) {
        check_pixels(image.pixels, w, h, 4);
        auto rgb = pixel::strip_alpha(image.pixels);
        return compress(fmt, w, h, rgb, premultiply, params);
    }
    return compress(fmt, w, h, image.pixels, premultiply, params);
}

std::vector<std::pair<uint16_t, uint16_t>> mipmap_dimensions(uint32_t max_count, uint16_t width,
                                                             uint16_t height) {
    std::vector<std::pair<uint16_t, uint16_t>> dims;
    uint16_t w = width, h = height;
    for (uint32_t i = 2; i <= max_count; i++) {
        w = std::max<uint16_t>(1, static_cast<uint16_t>(w / 2));
        h = std::max<uint16_t>(1, static_cast<uint16_t>(h / 2));
        dims.emplace_back(w, h);
        if (w <= 1 && h <= 1) break;
    }
    return dims;
}

std::vector<Mipmap> generate_mipmaps(uint32_t max_count, const pixel::Image& base, PixelFormat fmt,
                                     bool premultiply, const bcn::Params& params) {
    if (base.width <= 0 || base.height <= 0 || base.width > 65535 || base.height > 65535 ||
        base.pixels.size() != pixel::rgba_size(base.width, base.height))
        throw Error(ErrorKind::InvalidBufferShape,
                    "ktex: invalid base image " + std::to_string(base.width) + "x" +
                        std::to_string(base.height) + " with " + std::to_string(base.pixels.size()) +
                        " bytes");

    const auto dims = mipmap_dimensions(max_count, static_cast<uint16_t>(base.width),
                                        static_cast<uint16_t>(base.height));
    // One float copy of the base is shared by every level.
    const pixel::PremultipliedImage source = pixel::to_premultiplied(base);
    std::vector<Mipmap> levels(dims.size());
    parallel::for_each_index(dims.size(), [&](size_t i) {
        auto resized = pixel::resize(source, dims[i].first, dims[i].second);
        levels[i] = compress_level(fmt, resized, premultiply, params);
    });
    return levels;
}

} // namespace ktextools::ktex
