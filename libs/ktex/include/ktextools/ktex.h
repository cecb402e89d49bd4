#pragma once

#include "ktextools/bcn.h"
#include "ktextools/pixel.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ktextools::ktex {

// --- Enumerants (values are stored in the header word) ---

enum class Platform : uint32_t {
    Default = 0, // unknown
    PS3 = 10,
    Xbox360 = 11,
    PC = 12,
};

enum class PixelFormat : uint32_t {
    BC1 = 0, // DXT1
    BC2 = 1, // DXT3
    BC3 = 2, // DXT5
    RGBA = 4,
    RGB = 5,
    Unknown = 7,
};

enum class TextureType : uint32_t {
    OneD = 0,
    TwoD = 1,
    ThreeD = 2,
    CubeMapped = 3,
};

// Premultiplied-alpha state. Absent means the file (or caller) did not say.
enum class Premultiply { Absent, Yes, No };

// --- Errors ---

enum class ErrorKind {
    FormatMismatch,         // missing "KTEX" magic
    MalformedHeader,        // unknown enumerant, field overflow, inconsistent container
    TruncatedData,          // fewer bytes than a declared length requires
    UnsupportedPixelFormat, // no codec for the pixel format
    InvalidBufferShape,     // pixel buffer does not match its dimensions
};

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

std::string_view to_string(ErrorKind kind);

// --- Header bit layouts ---

// Two historical layouts of the 32-bit header word.
enum class Layout { Pre, Post };

struct Field {
    uint32_t max;    // 2^width - 1
    uint32_t offset; // bit offset in the header word
};

struct Specification {
    Field platform;
    Field pixel_format;
    Field texture_type;
    Field mipmap_count;
    Field flag;
    Field fill;
};

inline constexpr Specification k_pre_specification = {
    {7, 0}, {7, 3}, {7, 6}, {15, 9}, {1, 13}, {262143, 14},
};

inline constexpr Specification k_post_specification = {
    {15, 0}, {31, 4}, {15, 9}, {31, 13}, {3, 18}, {4095, 20},
};

const Specification& specification(Layout layout);

// detect_layout returns Pre when bits 14..31 are all set, Post otherwise.
// A Post word with flag == 3 and fill == 4095 and mipmap_count >= 30 is
// misdetected as Pre.
Layout detect_layout(uint32_t word);

// --- Header ---

struct Header {
    Layout layout = Layout::Post;
    Platform platform = Platform::Default;
    PixelFormat pixel_format = PixelFormat::BC3;
    TextureType texture_type = TextureType::TwoD;
    uint32_t mipmap_count = 0;
    uint32_t flag = k_post_specification.flag.max;
    uint32_t fill = k_post_specification.fill.max;
    Premultiply premultiply = Premultiply::Yes;
};

// has_alpha is true for RGBA, BC2 and BC3.
bool has_alpha(PixelFormat fmt);

// make_header builds a fresh Post header with saturated flag/fill and no mipmaps.
Header make_header(Platform platform, PixelFormat fmt, TextureType type,
                   Premultiply premultiply = Premultiply::Absent);

// decode_header unpacks a header word. The premultiply state is inferred from
// the pixel format. Throws Error(MalformedHeader) for unknown enumerants.
Header decode_header(uint32_t word);

// encode_header packs a header with its own layout. Throws Error(MalformedHeader)
// when a field does not fit its width.
uint32_t encode_header(const Header& header);

// --- Mipmaps ---

struct Mipmap {
    uint16_t width = 0;
    uint16_t height = 0;
    uint16_t pitch = 0;     // bytes per row as stored
    uint32_t data_size = 0; // == data.size()
    std::vector<uint8_t> data;
};

// decompress returns straight-alpha RGBA. Block formats are flipped back to
// top-down rows (and unpremultiplied when premultiplied is set); RGBA payloads
// are returned as stored and RGB payloads gain an opaque alpha channel.
std::vector<uint8_t> decompress(const Mipmap& mipmap, PixelFormat fmt, bool premultiplied);

// compress stores one level. Block formats take RGBA in on-disk row order and
// are premultiplied first when requested; RGBA and RGB payloads are stored
// verbatim (RGB input must already be 3 bytes per pixel).
Mipmap compress(PixelFormat fmt, uint16_t width, uint16_t height, std::span<const uint8_t> pixels,
                bool premultiply, const bcn::Params& params = {});

// compress_level compresses an RGBA image, dropping alpha for RGB targets.
Mipmap compress_level(PixelFormat fmt, const pixel::Image& image, bool premultiply,
                      const bcn::Params& params = {});

// mipmap_dimensions lists the sizes of levels 2..max_count, halving the
// previous target and stopping after the first 1x1 level.
std::vector<std::pair<uint16_t, uint16_t>> mipmap_dimensions(uint32_t max_count, uint16_t width,
                                                             uint16_t height);

// generate_mipmaps resamples every level of mipmap_dimensions() from base and
// compresses it. Levels are built in parallel and returned largest first.
std::vector<Mipmap> generate_mipmaps(uint32_t max_count, const pixel::Image& base, PixelFormat fmt,
                                     bool premultiply, const bcn::Params& params = {});

// --- Container ---

inline constexpr char k_magic[5] = "KTEX";

struct Container {
    Header header;
    std::vector<Mipmap> mipmaps;     // index 0 is full resolution
    Premultiply trailing = Premultiply::Absent; // trailing byte, if present
    std::vector<uint8_t> bytes;      // source bytes (decode) or serialized bytes (encode)
};

// decode parses a complete file held in memory. A single trailing byte after
// the payloads overrides the inferred premultiply state.
Container decode(std::vector<uint8_t> bytes);

// encode compresses image (top-down RGBA) as level 0 and, optionally, the
// mipmap chain, then serializes into Container::bytes.
Container encode(Header header, const pixel::Image& image, bool generate_mipmaps = true,
                 const bcn::Params& params = {});

// serialize writes magic, header word, metadata table, payloads and the
// trailing byte when Container::trailing is not Absent.
void serialize(const Container& container, std::ostream& out);
std::vector<uint8_t> serialize(const Container& container);

// decompress_level decodes one level to a straight-alpha image. An absent
// premultiply state counts as premultiplied.
pixel::Image decompress_level(const Container& container, size_t level);

// to_image decodes level 0.
pixel::Image to_image(const Container& container);

// --- Options ---

struct EncodeOptions {
    Platform platform = Platform::Default;
    PixelFormat pixel_format = PixelFormat::BC3;
    TextureType texture_type = TextureType::TwoD;
    Premultiply premultiply = Premultiply::Absent; // Absent: premultiply when the format has alpha
    bool generate_mipmaps = true;
    bcn::Params params;
};

// encode_rgba encodes a tightly packed RGBA buffer and returns the file bytes.
std::vector<uint8_t> encode_rgba(int width, int height, std::span<const uint8_t> rgba,
                                 const EncodeOptions& options = {});

// --- Names ---

std::string_view to_string(Platform platform);
std::string_view to_string(PixelFormat fmt);
std::string_view to_string(TextureType type);
std::string_view to_string(Layout layout);

std::optional<Platform> parse_platform(std::string_view name);
std::optional<PixelFormat> parse_pixel_format(std::string_view name);
std::optional<TextureType> parse_texture_type(std::string_view name);

} // namespace ktextools::ktex
