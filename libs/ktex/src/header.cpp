#include "ktextools/ktex.h"

#include <string>

namespace ktextools::ktex {

namespace {

// Bits 14..31 hold the fill field in the Pre layout.
constexpr uint32_t k_pre_fill_span = 0x3FFFF;

uint32_t extract(uint32_t word, const Field& f) {
    return (word >> f.offset) & f.max;
}

Platform to_platform(uint32_t v) {
    switch (v) {
        case 0: return Platform::Default;
        case 10: return Platform::PS3;
        case 11: return Platform::Xbox360;
        case 12: return Platform::PC;
        default:
            throw Error(ErrorKind::MalformedHeader, "ktex: unknown platform " + std::to_string(v));
    }
}

PixelFormat to_pixel_format(uint32_t v) {
    switch (v) {
        case 0: return PixelFormat::BC1;
        case 1: return PixelFormat::BC2;
        case 2: return PixelFormat::BC3;
        case 4: return PixelFormat::RGBA;
        case 5: return PixelFormat::RGB;
        case 7: return PixelFormat::Unknown;
        default:
            throw Error(ErrorKind::MalformedHeader, "ktex: unknown pixel format " + std::to_string(v));
    }
}

TextureType to_texture_type(uint32_t v) {
    if (v > 3)
        throw Error(ErrorKind::MalformedHeader, "ktex: unknown texture type " + std::to_string(v));
    return static_cast<TextureType>(v);
}

uint64_t pack(uint32_t value, const Field& f, const char* name) {
    if (value > f.max)
        throw Error(ErrorKind::MalformedHeader,
                    std::string("ktex: ") + name + " " + std::to_string(value) +
                        " exceeds field maximum " + std::to_string(f.max));
    return static_cast<uint64_t>(value) << f.offset;
}

} // namespace

const Specification& specification(Layout layout) {
    return layout == Layout::Pre ? k_pre_specification : k_post_specification;
}

Layout detect_layout(uint32_t word) {
    return ((word >> 14) & k_pre_fill_span) == k_pre_fill_span ? Layout::Pre : Layout::Post;
}

bool has_alpha(PixelFormat fmt) {
    return fmt == PixelFormat::RGBA || fmt == PixelFormat::BC2 || fmt == PixelFormat::BC3;
}

Header make_header(Platform platform, PixelFormat fmt, TextureType type, Premultiply premultiply) {
    Header h;
    h.layout = Layout::Post;
    h.platform = platform;
    h.pixel_format = fmt;
    h.texture_type = type;
    h.mipmap_count = 0;
    h.flag = k_post_specification.flag.max;
    h.fill = k_post_specification.fill.max;
    h.premultiply = premultiply;
    return h;
}

Header decode_header(uint32_t word) {
    Header h;
    h.layout = detect_layout(word);
    const Specification& spec = specification(h.layout);

    h.platform = to_platform(extract(word, spec.platform));
    h.pixel_format = to_pixel_format(extract(word, spec.pixel_format));
    h.texture_type = to_texture_type(extract(word, spec.texture_type));
    h.mipmap_count = extract(word, spec.mipmap_count);
    h.flag = extract(word, spec.flag);
    h.fill = extract(word, spec.fill);
    h.premultiply = has_alpha(h.pixel_format) ? Premultiply::Yes : Premultiply::No;
    return h;
}

uint32_t encode_header(const Header& header) {
    const Specification& spec = specification(header.layout);
    uint64_t word = pack(static_cast<uint32_t>(header.platform), spec.platform, "platform") |
                    pack(static_cast<uint32_t>(header.pixel_format), spec.pixel_format, "pixel format") |
                    pack(static_cast<uint32_t>(header.texture_type), spec.texture_type, "texture type") |
                    pack(header.mipmap_count, spec.mipmap_count, "mipmap count") |
                    pack(header.flag, spec.flag, "flag") |
                    pack(header.fill, spec.fill, "fill");
    if (word > 0xFFFFFFFFull)
        throw Error(ErrorKind::MalformedHeader, "ktex: header word overflows 32 bits");
    return static_cast<uint32_t>(word);
}

} // namespace ktextools::ktex
