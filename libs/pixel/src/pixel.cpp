#include "ktextools/pixel.h"
#include "ktextools/parallel.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>
#include <stdexcept>
#include <string>

namespace ktextools::pixel {

Image::Image(int w, int h) : width(w), height(h), pixels(rgba_size(w, h), 0) {}

Image::Image(int w, int h, std::vector<uint8_t> rgba)
    : width(w), height(h), pixels(std::move(rgba)) {
    if (pixels.size() != rgba_size(w, h))
        throw std::invalid_argument("pixel: buffer of " + std::to_string(pixels.size()) +
                                    " bytes does not match " + std::to_string(w) + "x" +
                                    std::to_string(h) + " RGBA");
}

size_t rgba_size(int width, int height) {
    if (width < 0 || height < 0) return 0;
    return static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
}

namespace {

// Rows smaller than this are not worth a thread each.
constexpr size_t k_min_bytes_per_job = 64 * 1024;

void check_shape(std::span<const uint8_t> rgba, int width, int height) {
    if (width < 0 || height < 0 || rgba.size() != rgba_size(width, height))
        throw std::invalid_argument("pixel: buffer of " + std::to_string(rgba.size()) +
                                    " bytes does not match " + std::to_string(width) + "x" +
                                    std::to_string(height) + " RGBA");
}

size_t rows_per_job(int width) {
    const size_t row_bytes = std::max<size_t>(1, static_cast<size_t>(width) * 4);
    return std::max<size_t>(1, k_min_bytes_per_job / row_bytes);
}

inline uint8_t scale_by_alpha(uint8_t c, float alpha) {
    return static_cast<uint8_t>(static_cast<float>(c) * alpha);
}

inline uint8_t divide_by_alpha(uint8_t c, float alpha) {
    return static_cast<uint8_t>(std::min(255.0f, static_cast<float>(c) / alpha));
}

inline void premultiply_pixel(const uint8_t* src, uint8_t* dst) {
    const uint8_t a = src[3];
    if (a == 0) {
        dst[0] = dst[1] = dst[2] = dst[3] = 0;
        return;
    }
    const float alpha = static_cast<float>(a) / 255.0f;
    dst[0] = scale_by_alpha(src[0], alpha);
    dst[1] = scale_by_alpha(src[1], alpha);
    dst[2] = scale_by_alpha(src[2], alpha);
    dst[3] = a;
}

inline void unpremultiply_pixel(const uint8_t* src, uint8_t* dst) {
    const uint8_t a = src[3];
    if (a == 0) {
        dst[0] = dst[1] = dst[2] = dst[3] = 0;
        return;
    }
    const float alpha = static_cast<float>(a) / 255.0f;
    dst[0] = divide_by_alpha(src[0], alpha);
    dst[1] = divide_by_alpha(src[1], alpha);
    dst[2] = divide_by_alpha(src[2], alpha);
    dst[3] = a;
}

template <typename PixelFn>
std::vector<uint8_t> flip_rows(std::span<const uint8_t> rgba, int width, int height, PixelFn fn) {
    check_shape(rgba, width, height);
    std::vector<uint8_t> out(rgba.size());
    const size_t row_bytes = static_cast<size_t>(width) * 4;
    const size_t h = static_cast<size_t>(height);
    parallel::for_each_index(h, [&](size_t y) {
        const uint8_t* src = rgba.data() + (h - 1 - y) * row_bytes;
        uint8_t* dst = out.data() + y * row_bytes;
        fn(src, dst, static_cast<size_t>(width));
    }, rows_per_job(width));
    return out;
}

template <typename PixelFn>
std::vector<uint8_t> map_pixels(std::span<const uint8_t> rgba, PixelFn fn) {
    if (rgba.size() % 4 != 0)
        throw std::invalid_argument("pixel: buffer of " + std::to_string(rgba.size()) +
                                    " bytes is not RGBA");
    std::vector<uint8_t> out(rgba.size());
    const size_t count = rgba.size() / 4;
    constexpr size_t chunk = 4096;
    const size_t chunks = (count + chunk - 1) / chunk;
    parallel::for_each_index(chunks, [&](size_t c) {
        const size_t end = std::min(count, (c + 1) * chunk);
        for (size_t i = c * chunk; i < end; ++i)
            fn(rgba.data() + i * 4, out.data() + i * 4);
    }, k_min_bytes_per_job / (chunk * 4) + 1);
    return out;
}

} // namespace

std::vector<uint8_t> flip_vertical(std::span<const uint8_t> rgba, int width, int height) {
    return flip_rows(rgba, width, height, [](const uint8_t* src, uint8_t* dst, size_t n) {
        std::memcpy(dst, src, n * 4);
    });
}

std::vector<uint8_t> flip_vertical_and_premultiply(std::span<const uint8_t> rgba, int width, int height) {
    return flip_rows(rgba, width, height, [](const uint8_t* src, uint8_t* dst, size_t n) {
        for (size_t i = 0; i < n; ++i)
            premultiply_pixel(src + i * 4, dst + i * 4);
    });
}

std::vector<uint8_t> flip_vertical_and_unpremultiply(std::span<const uint8_t> rgba, int width, int height) {
    return flip_rows(rgba, width, height, [](const uint8_t* src, uint8_t* dst, size_t n) {
        for (size_t i = 0; i < n; ++i)
            unpremultiply_pixel(src + i * 4, dst + i * 4);
    });
}

std::vector<uint8_t> premultiply(std::span<const uint8_t> rgba) {
    return map_pixels(rgba, premultiply_pixel);
}

std::vector<uint8_t> unpremultiply(std::span<const uint8_t> rgba) {
    return map_pixels(rgba, unpremultiply_pixel);
}

std::vector<uint8_t> strip_alpha(std::span<const uint8_t> rgba) {
    if (rgba.size() % 4 != 0)
        throw std::invalid_argument("pixel: buffer of " + std::to_string(rgba.size()) +
                                    " bytes is not RGBA");
    const size_t count = rgba.size() / 4;
    std::vector<uint8_t> out(count * 3);
    for (size_t i = 0; i < count; ++i) {
        out[i*3]   = rgba[i*4];
        out[i*3+1] = rgba[i*4+1];
        out[i*3+2] = rgba[i*4+2];
    }
    return out;
}

// --- Resampling ---

namespace {

constexpr int k_lanczos_a = 3;

float sinc(float x) {
    if (std::fabs(x) < 1e-6f) return 1.0f;
    const float px = std::numbers::pi_v<float> * x;
    return std::sin(px) / px;
}

float lanczos_weight(float x) {
    const float ax = std::fabs(x);
    if (ax >= static_cast<float>(k_lanczos_a)) return 0.0f;
    return sinc(x) * sinc(x / static_cast<float>(k_lanczos_a));
}

// Taps for one output sample: weights[k] applies to source index first + k.
struct Taps {
    int first = 0;
    std::vector<float> weights;
};

// When minifying, the kernel is stretched by the scale factor so every source
// texel contributes. Out-of-range taps are clamped onto the edge texel.
std::vector<Taps> build_taps(int in_size, int out_size) {
    const float scale = static_cast<float>(in_size) / static_cast<float>(out_size);
    const float filter_scale = std::max(1.0f, scale);
    const float support = static_cast<float>(k_lanczos_a) * filter_scale;

    std::vector<Taps> taps(static_cast<size_t>(out_size));
    for (int i = 0; i < out_size; ++i) {
        const float center = (static_cast<float>(i) + 0.5f) * scale;
        const int left = static_cast<int>(std::floor(center - support));
        const int right = static_cast<int>(std::ceil(center + support));
        const int first = std::clamp(left, 0, in_size - 1);
        const int last = std::clamp(right, 0, in_size - 1);

        Taps& t = taps[static_cast<size_t>(i)];
        t.first = first;
        t.weights.assign(static_cast<size_t>(last - first + 1), 0.0f);
        float sum = 0.0f;
        for (int j = left; j <= right; ++j) {
            const float w = lanczos_weight((static_cast<float>(j) + 0.5f - center) / filter_scale);
            if (w == 0.0f) continue;
            const int idx = std::clamp(j, 0, in_size - 1);
            t.weights[static_cast<size_t>(idx - first)] += w;
            sum += w;
        }
        if (sum != 0.0f) {
            for (float& w : t.weights) w /= sum;
        } else {
            const int nearest = std::clamp(static_cast<int>(center), 0, in_size - 1);
            std::fill(t.weights.begin(), t.weights.end(), 0.0f);
            t.weights[static_cast<size_t>(nearest - first)] = 1.0f;
        }
    }
    return taps;
}

uint8_t to_u8(float v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

PremultipliedImage to_premultiplied(const Image& src) {
    check_shape(src.pixels, src.width, src.height);
    PremultipliedImage out;
    out.width = src.width;
    out.height = src.height;
    const size_t count = static_cast<size_t>(src.width) * static_cast<size_t>(src.height);
    out.texels.resize(count * 4);
    for (size_t i = 0; i < count; ++i) {
        const float a = static_cast<float>(src.pixels[i*4+3]);
        const float k = a / 255.0f;
        out.texels[i*4]   = static_cast<float>(src.pixels[i*4]) * k;
        out.texels[i*4+1] = static_cast<float>(src.pixels[i*4+1]) * k;
        out.texels[i*4+2] = static_cast<float>(src.pixels[i*4+2]) * k;
        out.texels[i*4+3] = a;
    }
    return out;
}

Image resize(const Image& src, int new_width, int new_height) {
    check_shape(src.pixels, src.width, src.height);
    if (src.width > 0 && src.height > 0 && src.width == new_width && src.height == new_height)
        return src;
    return resize(to_premultiplied(src), new_width, new_height);
}

Image resize(const PremultipliedImage& src, int new_width, int new_height) {
    if (src.width <= 0 || src.height <= 0 || new_width <= 0 || new_height <= 0)
        throw std::invalid_argument("pixel: cannot resize " + std::to_string(src.width) + "x" +
                                    std::to_string(src.height) + " to " +
                                    std::to_string(new_width) + "x" + std::to_string(new_height));
    if (src.texels.size() != rgba_size(src.width, src.height))
        throw std::invalid_argument("pixel: premultiplied buffer of " +
                                    std::to_string(src.texels.size()) + " floats does not match " +
                                    std::to_string(src.width) + "x" + std::to_string(src.height));

    const size_t in_w = static_cast<size_t>(src.width);
    const size_t in_h = static_cast<size_t>(src.height);
    const size_t out_w = static_cast<size_t>(new_width);
    const size_t out_h = static_cast<size_t>(new_height);
    const std::vector<float>& pre = src.texels;

    const auto htaps = build_taps(src.width, new_width);
    const auto vtaps = build_taps(src.height, new_height);

    // Horizontal pass: in_h rows of out_w samples.
    std::vector<float> tmp(out_w * in_h * 4);
    parallel::for_each_index(in_h, [&](size_t y) {
        const float* row = pre.data() + y * in_w * 4;
        float* dst = tmp.data() + y * out_w * 4;
        for (size_t x = 0; x < out_w; ++x) {
            const Taps& t = htaps[x];
            float acc[4] = {0, 0, 0, 0};
            for (size_t k = 0; k < t.weights.size(); ++k) {
                const float w = t.weights[k];
                const float* p = row + (static_cast<size_t>(t.first) + k) * 4;
                acc[0] += p[0] * w; acc[1] += p[1] * w; acc[2] += p[2] * w; acc[3] += p[3] * w;
            }
            std::memcpy(dst + x * 4, acc, sizeof(acc));
        }
    }, rows_per_job(new_width));

    // Vertical pass and conversion back to straight alpha.
    Image out(new_width, new_height);
    parallel::for_each_index(out_h, [&](size_t y) {
        const Taps& t = vtaps[y];
        uint8_t* dst = out.pixels.data() + y * out_w * 4;
        for (size_t x = 0; x < out_w; ++x) {
            float acc[4] = {0, 0, 0, 0};
            for (size_t k = 0; k < t.weights.size(); ++k) {
                const float w = t.weights[k];
                const float* p = tmp.data() + ((static_cast<size_t>(t.first) + k) * out_w + x) * 4;
                acc[0] += p[0] * w; acc[1] += p[1] * w; acc[2] += p[2] * w; acc[3] += p[3] * w;
            }
            const uint8_t a = to_u8(acc[3]);
            uint8_t* px = dst + x * 4;
            if (a == 0) {
                px[0] = px[1] = px[2] = px[3] = 0;
                continue;
            }
            const float inv = 255.0f / acc[3];
            px[0] = to_u8(acc[0] * inv);
            px[1] = to_u8(acc[1] * inv);
            px[2] = to_u8(acc[2] * inv);
            px[3] = a;
        }
    }, rows_per_job(new_width));

    return out;
}

} // namespace ktextools::pixel
