#include "ktextools/ktex.h"
#include "ktextools/binutil.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace ktextools::ktex {

// --- Container decode ---

Container decode(std::vector<uint8_t> bytes) {
    Container c;
    try {
        binutil::ByteReader r(bytes);
        if (r.read_string(4) != k_magic)
            throw Error(ErrorKind::FormatMismatch, "ktex: not a KTEX file (bad magic)");

        c.header = decode_header(r.read_u32());

        // Metadata table precedes all payloads.
        c.mipmaps.resize(c.header.mipmap_count);
        for (auto& m : c.mipmaps) {
            m.width = r.read_u16();
            m.height = r.read_u16();
            m.pitch = r.read_u16();
            m.data_size = r.read_u32();
        }
        for (auto& m : c.mipmaps)
            m.data = r.read_bytes(m.data_size);

        if (r.remaining() == 1) {
            c.trailing = r.read_u8() == 1 ? Premultiply::Yes : Premultiply::No;
            c.header.premultiply = c.trailing;
        }
    } catch (const binutil::eof_error& e) {
        throw Error(ErrorKind::TruncatedData, std::string("ktex: truncated file: ") + e.what());
    }
    c.bytes = std::move(bytes);
    return c;
}

// --- Container encode ---

Container encode(Header header, const pixel::Image& image, bool generate_mipmaps_flag,
                 const bcn::Params& params) {
    if (image.width <= 0 || image.height <= 0 || image.width > 65535 || image.height > 65535 ||
        image.pixels.size() != pixel::rgba_size(image.width, image.height))
        throw Error(ErrorKind::InvalidBufferShape,
                    "ktex: invalid image " + std::to_string(image.width) + "x" +
                        std::to_string(image.height) + " with " + std::to_string(image.pixels.size()) +
                        " bytes");

    const bool premultiply = header.premultiply != Premultiply::No && has_alpha(header.pixel_format);

    Container c;
    c.header = header;

    // On-disk rows run bottom-up.
    pixel::Image flipped(image.width, image.height,
                         pixel::flip_vertical(image.pixels, image.width, image.height));

    c.mipmaps.push_back(compress_level(header.pixel_format, flipped, premultiply, params));
    if (generate_mipmaps_flag) {
        auto chain = generate_mipmaps(specification(header.layout).mipmap_count.max, flipped,
                                      header.pixel_format, premultiply, params);
        c.mipmaps.insert(c.mipmaps.end(), std::make_move_iterator(chain.begin()),
                         std::make_move_iterator(chain.end()));
    }

    c.header.mipmap_count = static_cast<uint32_t>(c.mipmaps.size());
    c.trailing = premultiply ? Premultiply::Yes : Premultiply::No;
    c.bytes = serialize(c);
    return c;
}

// --- Serialization ---

void serialize(const Container& c, std::ostream& out) {
    if (c.header.mipmap_count != c.mipmaps.size())
        throw Error(ErrorKind::MalformedHeader,
                    "ktex: header declares " + std::to_string(c.header.mipmap_count) +
                        " mipmaps, container holds " + std::to_string(c.mipmaps.size()));
    for (size_t i = 0; i < c.mipmaps.size(); i++) {
        if (c.mipmaps[i].data.size() != c.mipmaps[i].data_size)
            throw Error(ErrorKind::MalformedHeader,
                        "ktex: mipmap " + std::to_string(i) + " holds " +
                            std::to_string(c.mipmaps[i].data.size()) + " bytes, declared " +
                            std::to_string(c.mipmaps[i].data_size));
    }
    const uint32_t word = encode_header(c.header);

    binutil::write_signature(out, k_magic);
    binutil::write_u32(out, word);
    for (const auto& m : c.mipmaps) {
        binutil::write_u16(out, m.width);
        binutil::write_u16(out, m.height);
        binutil::write_u16(out, m.pitch);
        binutil::write_u32(out, m.data_size);
    }
    for (const auto& m : c.mipmaps)
        binutil::write_bytes(out, m.data);
    if (c.trailing != Premultiply::Absent)
        binutil::write_u8(out, c.trailing == Premultiply::Yes ? 1 : 0);
}

std::vector<uint8_t> serialize(const Container& c) {
    std::ostringstream out(std::ios::binary);
    serialize(c, out);
    const std::string s = out.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

// --- Image access ---

pixel::Image decompress_level(const Container& c, size_t level) {
    if (level >= c.mipmaps.size())
        throw std::out_of_range("ktex: level " + std::to_string(level) + " out of range (" +
                                std::to_string(c.mipmaps.size()) + " levels)");
    const Mipmap& m = c.mipmaps[level];
    auto rgba = decompress(m, c.header.pixel_format, c.header.premultiply != Premultiply::No);
    if (rgba.size() != pixel::rgba_size(m.width, m.height))
        throw Error(ErrorKind::MalformedHeader,
                    "ktex: level " + std::to_string(level) + " decodes to " +
                        std::to_string(rgba.size()) + " bytes, expected " + std::to_string(m.width) +
                        "x" + std::to_string(m.height) + " RGBA");
    return pixel::Image(m.width, m.height, std::move(rgba));
}

pixel::Image to_image(const Container& c) {
    if (c.mipmaps.empty())
        throw Error(ErrorKind::MalformedHeader, "ktex: container has no mipmaps");
    return decompress_level(c, 0);
}

std::vector<uint8_t> encode_rgba(int width, int height, std::span<const uint8_t> rgba,
                                 const EncodeOptions& options) {
    if (width <= 0 || height <= 0 || rgba.size() != pixel::rgba_size(width, height))
        throw Error(ErrorKind::InvalidBufferShape,
                    "ktex: " + std::to_string(rgba.size()) + " bytes do not match " +
                        std::to_string(width) + "x" + std::to_string(height) + " RGBA");
    pixel::Image img(width, height, std::vector<uint8_t>(rgba.begin(), rgba.end()));
    Header h = make_header(options.platform, options.pixel_format, options.texture_type,
                           options.premultiply);
    return encode(h, img, options.generate_mipmaps, options.params).bytes;
}

// --- Names ---

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FormatMismatch: return "format mismatch";
        case ErrorKind::MalformedHeader: return "malformed header";
        case ErrorKind::TruncatedData: return "truncated data";
        case ErrorKind::UnsupportedPixelFormat: return "unsupported pixel format";
        case ErrorKind::InvalidBufferShape: return "invalid buffer shape";
    }
    return "";
}

std::string_view to_string(Platform platform) {
    switch (platform) {
        case Platform::Default: return "default";
        case Platform::PS3: return "ps3";
        case Platform::Xbox360: return "xbox360";
        case Platform::PC: return "pc";
    }
    return "";
}

std::string_view to_string(PixelFormat fmt) {
    switch (fmt) {
        case PixelFormat::BC1: return "bc1";
        case PixelFormat::BC2: return "bc2";
        case PixelFormat::BC3: return "bc3";
        case PixelFormat::RGBA: return "rgba";
        case PixelFormat::RGB: return "rgb";
        case PixelFormat::Unknown: return "unknown";
    }
    return "";
}

std::string_view to_string(TextureType type) {
    switch (type) {
        case TextureType::OneD: return "1d";
        case TextureType::TwoD: return "2d";
        case TextureType::ThreeD: return "3d";
        case TextureType::CubeMapped: return "cube";
    }
    return "";
}

std::string_view to_string(Layout layout) {
    return layout == Layout::Pre ? "pre" : "post";
}

std::optional<Platform> parse_platform(std::string_view name) {
    const auto n = lower(name);
    if (n == "default" || n == "unknown") return Platform::Default;
    if (n == "pc") return Platform::PC;
    if (n == "ps3") return Platform::PS3;
    if (n == "xbox360" || n == "xbox") return Platform::Xbox360;
    return std::nullopt;
}

std::optional<PixelFormat> parse_pixel_format(std::string_view name) {
    const auto n = lower(name);
    if (n == "bc1" || n == "dxt1") return PixelFormat::BC1;
    if (n == "bc2" || n == "dxt3") return PixelFormat::BC2;
    if (n == "bc3" || n == "dxt5") return PixelFormat::BC3;
    if (n == "rgba") return PixelFormat::RGBA;
    if (n == "rgb") return PixelFormat::RGB;
    return std::nullopt;
}

std::optional<TextureType> parse_texture_type(std::string_view name) {
    const auto n = lower(name);
    if (n == "1d") return TextureType::OneD;
    if (n == "2d") return TextureType::TwoD;
    if (n == "3d") return TextureType::ThreeD;
    if (n == "cube" || n == "cubemap") return TextureType::CubeMapped;
    return std::nullopt;
}

} // namespace ktextools::ktex
