#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace ktextools::pixel {

// RGBA pixel buffer (4 bytes per pixel, row-major, no padding).
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, size = width * height * 4

    Image() = default;
    Image(int w, int h);
    Image(int w, int h, std::vector<uint8_t> rgba);

    void set(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        pixels[off] = r; pixels[off+1] = g; pixels[off+2] = b; pixels[off+3] = a;
    }

    void get(int x, int y, uint8_t& r, uint8_t& g, uint8_t& b, uint8_t& a) const {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        r = pixels[off]; g = pixels[off+1]; b = pixels[off+2]; a = pixels[off+3];
    }
};

// Expected RGBA byte count for w x h.
size_t rgba_size(int width, int height);

// All transforms below require rgba.size() == width * height * 4 and throw
// std::invalid_argument otherwise. Rows are processed in parallel.

// flip_vertical returns a copy with rows reversed top-to-bottom.
std::vector<uint8_t> flip_vertical(std::span<const uint8_t> rgba, int width, int height);

// flip_vertical_and_premultiply flips rows and scales R, G, B by a/255,
// truncating to 8 bits.
std::vector<uint8_t> flip_vertical_and_premultiply(std::span<const uint8_t> rgba, int width, int height);

// flip_vertical_and_unpremultiply flips rows and divides R, G, B by a/255
// (clamped to 255). Pixels with a == 0 become (0, 0, 0, 0).
std::vector<uint8_t> flip_vertical_and_unpremultiply(std::span<const uint8_t> rgba, int width, int height);

// premultiply scales R, G, B by a/255 without flipping. Pixels with a == 0
// become (0, 0, 0, 0). Only requires a multiple of 4 bytes.
std::vector<uint8_t> premultiply(std::span<const uint8_t> rgba);

// unpremultiply is the inverse of premultiply, within truncation error.
std::vector<uint8_t> unpremultiply(std::span<const uint8_t> rgba);

// strip_alpha packs RGBA into tightly packed RGB.
std::vector<uint8_t> strip_alpha(std::span<const uint8_t> rgba);

// Float RGBA with colour premultiplied by alpha (alpha kept in 0..255). One
// instance can feed any number of resize calls.
struct PremultipliedImage {
    int width = 0;
    int height = 0;
    std::vector<float> texels; // size = width * height * 4
};

PremultipliedImage to_premultiplied(const Image& src);

// resize resamples with a separable Lanczos3 filter (clamped edges). Colour is
// filtered premultiplied by alpha so transparent texels do not bleed.
Image resize(const Image& src, int new_width, int new_height);
Image resize(const PremultipliedImage& src, int new_width, int new_height);

} // namespace ktextools::pixel
