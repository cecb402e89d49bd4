#include "ktextools/ktex.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <functional>

using namespace ktextools;
using namespace ktextools::ktex;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ktex::Error";
    return ErrorKind::FormatMismatch;
}

std::vector<uint8_t> fill_rgba(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    std::vector<uint8_t> out;
    for (int i = 0; i < w * h; ++i) out.insert(out.end(), {r, g, b, a});
    return out;
}

} // namespace

// --- Level codec ---

TEST(Mipmap, PitchAndSizePerFormat) {
    auto rgba = fill_rgba(5, 3, 10, 20, 30, 255);

    Mipmap bc1 = compress(PixelFormat::BC1, 5, 3, rgba, false);
    EXPECT_EQ(bc1.pitch, 16);
    EXPECT_EQ(bc1.data_size, 16u);
    EXPECT_EQ(bc1.data.size(), 16u);

    Mipmap bc2 = compress(PixelFormat::BC2, 5, 3, rgba, false);
    EXPECT_EQ(bc2.pitch, 32);
    EXPECT_EQ(bc2.data_size, 32u);

    Mipmap bc3 = compress(PixelFormat::BC3, 9, 3, fill_rgba(9, 3, 0, 0, 0, 255), true);
    EXPECT_EQ(bc3.pitch, 48);
    EXPECT_EQ(bc3.data_size, 48u);

    Mipmap rgba_level = compress(PixelFormat::RGBA, 5, 3, rgba, true);
    EXPECT_EQ(rgba_level.pitch, 20);
    EXPECT_EQ(rgba_level.data, rgba);
    EXPECT_EQ(rgba_level.data_size, rgba.size());

    std::vector<uint8_t> rgb(5 * 3 * 3, 7);
    Mipmap rgb_level = compress(PixelFormat::RGB, 5, 3, rgb, false);
    EXPECT_EQ(rgb_level.pitch, 15);
    EXPECT_EQ(rgb_level.data, rgb);
}

TEST(Mipmap, PitchWrapsAtSixteenBits) {
    // 65535 RGBA texels per row need 262140 bytes; only the low 16 bits are stored.
    std::vector<uint8_t> row(65535u * 4u, 0);
    Mipmap m = compress(PixelFormat::RGBA, 65535, 1, row, false);
    EXPECT_EQ(m.pitch, static_cast<uint16_t>(65535u * 4u));
}

TEST(Mipmap, RgbExpandsWithOpaqueAlpha) {
    Mipmap m;
    m.width = 2;
    m.height = 1;
    m.data = {1, 2, 3, 4, 5, 6};
    m.data_size = 6;
    EXPECT_EQ(decompress(m, PixelFormat::RGB, true),
              (std::vector<uint8_t>{1, 2, 3, 255, 4, 5, 6, 255}));

    m.data = {1, 2, 3, 4};
    m.data_size = 4;
    EXPECT_EQ(kind_of([&] { decompress(m, PixelFormat::RGB, false); }), ErrorKind::InvalidBufferShape);
}

TEST(Mipmap, RgbaPayloadIsReturnedAsStored) {
    Mipmap m;
    m.width = 1;
    m.height = 2;
    m.data = {10, 20, 30, 40, 50, 60, 70, 0};
    m.data_size = 8;
    EXPECT_EQ(decompress(m, PixelFormat::RGBA, true), m.data);
}

TEST(Mipmap, UnsupportedFormat) {
    auto rgba = fill_rgba(4, 4, 0, 0, 0, 255);
    EXPECT_EQ(kind_of([&] { compress(PixelFormat::Unknown, 4, 4, rgba, false); }),
              ErrorKind::UnsupportedPixelFormat);
    Mipmap m;
    EXPECT_EQ(kind_of([&] { decompress(m, PixelFormat::Unknown, false); }),
              ErrorKind::UnsupportedPixelFormat);
}

TEST(Mipmap, ShapeMismatch) {
    std::vector<uint8_t> short_buf(4 * 4 * 4 - 4);
    EXPECT_EQ(kind_of([&] { compress(PixelFormat::BC1, 4, 4, short_buf, false); }),
              ErrorKind::InvalidBufferShape);
    EXPECT_EQ(kind_of([&] { compress(PixelFormat::RGBA, 4, 4, short_buf, false); }),
              ErrorKind::InvalidBufferShape);
    // RGB wants three bytes per pixel.
    auto rgba = fill_rgba(2, 2, 0, 0, 0, 255);
    EXPECT_EQ(kind_of([&] { compress(PixelFormat::RGB, 2, 2, rgba, false); }),
              ErrorKind::InvalidBufferShape);
}

TEST(Mipmap, ShortBlockPayloadIsTruncated) {
    Mipmap m;
    m.width = 8;
    m.height = 8;
    m.data.assign(16, 0);
    m.data_size = 16;
    EXPECT_EQ(kind_of([&] { decompress(m, PixelFormat::BC1, false); }), ErrorKind::TruncatedData);
}

TEST(Mipmap, BlockDecodeFlipsRows) {
    // On-disk order: top half red, bottom half blue.
    std::vector<uint8_t> rgba;
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x) {
            if (y < 4) rgba.insert(rgba.end(), {255, 0, 0, 255});
            else rgba.insert(rgba.end(), {0, 0, 255, 255});
        }
    Mipmap m = compress(PixelFormat::BC1, 8, 8, rgba, false);
    auto out = decompress(m, PixelFormat::BC1, false);
    ASSERT_EQ(out.size(), rgba.size());
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[2], 255);
    const size_t last = out.size() - 4;
    EXPECT_EQ(out[last], 255);
    EXPECT_EQ(out[last + 2], 0);
}

TEST(Mipmap, PremultipliedBlockDecodesToStraightAlpha) {
    auto rgba = fill_rgba(8, 8, 200, 100, 48, 128);
    Mipmap m = compress(PixelFormat::BC3, 8, 8, rgba, true);
    auto out = decompress(m, PixelFormat::BC3, true);
    ASSERT_EQ(out.size(), rgba.size());
    for (size_t i = 0; i < out.size(); i += 4) {
        EXPECT_NEAR(out[i], 200, 12);
        EXPECT_NEAR(out[i + 1], 100, 12);
        EXPECT_NEAR(out[i + 2], 48, 12);
        EXPECT_NEAR(out[i + 3], 128, 3);
    }
}

// --- Chain generation ---

TEST(Mipmap, ChainDimensionsHalvePreviousTarget) {
    auto dims = mipmap_dimensions(k_post_specification.mipmap_count.max, 256, 256);
    ASSERT_EQ(dims.size(), 8u);
    uint16_t expected = 128;
    for (const auto& [w, h] : dims) {
        EXPECT_EQ(w, expected);
        EXPECT_EQ(h, expected);
        expected = static_cast<uint16_t>(expected / 2);
    }

    auto wide = mipmap_dimensions(31, 256, 64);
    const std::vector<std::pair<uint16_t, uint16_t>> want = {
        {128, 32}, {64, 16}, {32, 8}, {16, 4}, {8, 2}, {4, 1}, {2, 1}, {1, 1}};
    EXPECT_EQ(wide, want);

    auto odd = mipmap_dimensions(31, 5, 3);
    const std::vector<std::pair<uint16_t, uint16_t>> want_odd = {{2, 1}, {1, 1}};
    EXPECT_EQ(odd, want_odd);
}

TEST(Mipmap, ChainIsCappedByMaxCount) {
    // Levels 2..max_count, so max_count - 1 generated levels at most.
    EXPECT_EQ(mipmap_dimensions(4, 256, 256).size(), 3u);
    EXPECT_EQ(mipmap_dimensions(k_pre_specification.mipmap_count.max, 65535, 65535).size(), 14u);
    EXPECT_TRUE(mipmap_dimensions(1, 256, 256).empty());
    EXPECT_TRUE(mipmap_dimensions(0, 256, 256).empty());
}

TEST(Mipmap, GenerateMipmapsProducesEveryLevel) {
    pixel::Image base(64, 32, fill_rgba(64, 32, 90, 180, 30, 255));
    auto levels = generate_mipmaps(31, base, PixelFormat::BC1, false);
    ASSERT_EQ(levels.size(), 6u);
    const int want[][2] = {{32, 16}, {16, 8}, {8, 4}, {4, 2}, {2, 1}, {1, 1}};
    for (size_t i = 0; i < levels.size(); ++i) {
        EXPECT_EQ(levels[i].width, want[i][0]);
        EXPECT_EQ(levels[i].height, want[i][1]);
        EXPECT_EQ(levels[i].data_size,
                  bcn::compressed_size(bcn::Format::BC1, want[i][0], want[i][1]));
        auto out = decompress(levels[i], PixelFormat::BC1, false);
        for (size_t p = 0; p < out.size(); p += 4) {
            EXPECT_NEAR(out[p], 90, 6);
            EXPECT_NEAR(out[p + 1], 180, 6);
            EXPECT_NEAR(out[p + 2], 30, 6);
        }
    }
}

TEST(Mipmap, GenerateMipmapsStripsAlphaForRgb) {
    pixel::Image base(4, 4, fill_rgba(4, 4, 1, 2, 3, 4));
    auto levels = generate_mipmaps(31, base, PixelFormat::RGB, false);
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0].pitch, 6);
    EXPECT_EQ(levels[0].data_size, 2u * 2u * 3u);
    EXPECT_EQ(levels[1].data.size(), 3u);
}

TEST(Mipmap, GenerateMipmapsRejectsBadBase) {
    pixel::Image empty;
    EXPECT_EQ(kind_of([&] { generate_mipmaps(31, empty, PixelFormat::BC3, true); }),
              ErrorKind::InvalidBufferShape);
}
