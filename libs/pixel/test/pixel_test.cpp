#include "ktextools/pixel.h"
#include "ktextools/parallel.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <utility>

namespace px = ktextools::pixel;

namespace {

// Each row is filled with its own index so row order is observable.
std::vector<uint8_t> make_row_tagged(int w, int h) {
    std::vector<uint8_t> buf(px::rgba_size(w, h));
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x) {
            size_t off = (static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x)) * 4;
            buf[off] = static_cast<uint8_t>(y);
            buf[off + 1] = static_cast<uint8_t>(x);
            buf[off + 2] = static_cast<uint8_t>(y ^ x);
            buf[off + 3] = 255;
        }
    return buf;
}

} // namespace

TEST(Pixel, FlipVerticalReversesRows) {
    auto buf = make_row_tagged(3, 4);
    auto flipped = px::flip_vertical(buf, 3, 4);
    ASSERT_EQ(flipped.size(), buf.size());
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 3; ++x)
            EXPECT_EQ(flipped[static_cast<size_t>((y * 3 + x) * 4)], 3 - y);
    EXPECT_EQ(px::flip_vertical(flipped, 3, 4), buf);
}

TEST(Pixel, FlipVerticalLargeImageMatchesSerial) {
    const int w = 300, h = 257;
    auto buf = make_row_tagged(w, h);
    auto flipped = px::flip_vertical(buf, w, h);
    const size_t row = static_cast<size_t>(w) * 4;
    for (int y = 0; y < h; ++y) {
        auto src = buf.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(h - 1 - y) * row);
        auto dst = flipped.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(y) * row);
        ASSERT_TRUE(std::equal(src, src + static_cast<std::ptrdiff_t>(row), dst)) << "row " << y;
    }
}

TEST(Pixel, ShapeMismatchIsRejected) {
    std::vector<uint8_t> buf(15);
    EXPECT_THROW(px::flip_vertical(buf, 2, 2), std::invalid_argument);
    EXPECT_THROW(px::flip_vertical_and_premultiply(buf, 2, 2), std::invalid_argument);
    EXPECT_THROW(px::flip_vertical_and_unpremultiply(buf, 2, 2), std::invalid_argument);
    EXPECT_THROW(px::premultiply(buf), std::invalid_argument);
    EXPECT_THROW(px::Image(2, 2, buf), std::invalid_argument);
}

TEST(Pixel, PremultiplyTruncates) {
    std::vector<uint8_t> buf = {200, 100, 254, 128};
    auto out = px::premultiply(buf);
    // 200 * 128/255 = 100.39, 100 * 128/255 = 50.19, 254 * 128/255 = 127.5
    EXPECT_EQ(out[0], 100);
    EXPECT_EQ(out[1], 50);
    EXPECT_EQ(out[2], 127);
    EXPECT_EQ(out[3], 128);
}

TEST(Pixel, ZeroAlphaMapsToTransparentBlack) {
    std::vector<uint8_t> buf = {10, 20, 30, 0};
    EXPECT_EQ(px::premultiply(buf), (std::vector<uint8_t>{0, 0, 0, 0}));
    EXPECT_EQ(px::unpremultiply(buf), (std::vector<uint8_t>{0, 0, 0, 0}));
    EXPECT_EQ(px::flip_vertical_and_unpremultiply(buf, 1, 1), (std::vector<uint8_t>{0, 0, 0, 0}));
    EXPECT_EQ(px::flip_vertical_and_premultiply(buf, 1, 1), (std::vector<uint8_t>{0, 0, 0, 0}));
}

TEST(Pixel, OpaquePremultiplyIsIdentity) {
    std::vector<uint8_t> buf;
    for (int c = 0; c < 256; ++c) {
        buf.push_back(static_cast<uint8_t>(c));
        buf.push_back(static_cast<uint8_t>(255 - c));
        buf.push_back(static_cast<uint8_t>(c / 2));
        buf.push_back(255);
    }
    auto pre = px::premultiply(buf);
    EXPECT_EQ(pre, buf);
    EXPECT_EQ(px::unpremultiply(pre), buf);
}

TEST(Pixel, UnpremultiplyInvertsWithinQuantisation) {
    for (int a = 1; a < 256; ++a) {
        std::vector<uint8_t> buf;
        for (int c = 0; c < 256; c += 5) {
            buf.push_back(static_cast<uint8_t>(c));
            buf.push_back(static_cast<uint8_t>(255 - c));
            buf.push_back(static_cast<uint8_t>(c));
            buf.push_back(static_cast<uint8_t>(a));
        }
        auto back = px::unpremultiply(px::premultiply(buf));
        // Truncation loses up to one step of 255/a in straight space.
        const int tolerance = 255 / a + 2;
        for (size_t i = 0; i < buf.size(); ++i) {
            if (i % 4 == 3) {
                EXPECT_EQ(back[i], buf[i]);
            } else {
                EXPECT_LE(std::abs(static_cast<int>(back[i]) - static_cast<int>(buf[i])), tolerance)
                    << "alpha " << a << " index " << i;
            }
        }
    }
}

TEST(Pixel, HighAlphaRoundTripWithinOne) {
    std::vector<uint8_t> buf;
    for (int c = 0; c < 256; ++c) {
        buf.insert(buf.end(), {static_cast<uint8_t>(c), static_cast<uint8_t>(c), static_cast<uint8_t>(c), 255});
    }
    auto back = px::flip_vertical_and_unpremultiply(px::flip_vertical_and_premultiply(buf, 16, 16), 16, 16);
    for (size_t i = 0; i < buf.size(); ++i)
        EXPECT_LE(std::abs(static_cast<int>(back[i]) - static_cast<int>(buf[i])), 1);
}

TEST(Pixel, StripAlpha) {
    std::vector<uint8_t> buf = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(px::strip_alpha(buf), (std::vector<uint8_t>{1, 2, 3, 5, 6, 7}));
}

TEST(Pixel, ResizeKeepsConstantColour) {
    px::Image img(64, 32);
    for (int y = 0; y < img.height; ++y)
        for (int x = 0; x < img.width; ++x) img.set(x, y, 40, 120, 200, 255);

    auto small = px::resize(img, 16, 5);
    ASSERT_EQ(small.width, 16);
    ASSERT_EQ(small.height, 5);
    ASSERT_EQ(small.pixels.size(), 16u * 5u * 4u);
    for (size_t i = 0; i < small.pixels.size(); i += 4) {
        EXPECT_EQ(small.pixels[i], 40);
        EXPECT_EQ(small.pixels[i + 1], 120);
        EXPECT_EQ(small.pixels[i + 2], 200);
        EXPECT_EQ(small.pixels[i + 3], 255);
    }
}

TEST(Pixel, ResizeToSinglePixelAverages) {
    px::Image img(8, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x) {
            uint8_t v = ((x + y) % 2 == 0) ? 0 : 255;
            img.set(x, y, v, v, v, 255);
        }
    auto one = px::resize(img, 1, 1);
    ASSERT_EQ(one.pixels.size(), 4u);
    EXPECT_NEAR(one.pixels[0], 128, 8);
    EXPECT_EQ(one.pixels[3], 255);
}

TEST(Pixel, ResizeDoesNotBleedTransparentColour) {
    px::Image img(16, 16);
    for (int y = 0; y < 16; ++y)
        for (int x = 0; x < 16; ++x) {
            if (x < 8) img.set(x, y, 255, 0, 0, 255);
            else img.set(x, y, 0, 255, 0, 0);
        }
    auto half = px::resize(img, 8, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x) {
            uint8_t r, g, b, a;
            half.get(x, y, r, g, b, a);
            if (a == 0) continue;
            EXPECT_EQ(g, 0) << x << "," << y;
            EXPECT_GE(r, 250) << x << "," << y;
        }
}

TEST(Pixel, ResizeIsDeterministic) {
    auto buf = make_row_tagged(37, 29);
    px::Image img(37, 29, buf);
    auto a = px::resize(img, 9, 7);
    auto b = px::resize(img, 9, 7);
    EXPECT_EQ(a.pixels, b.pixels);
}

TEST(Pixel, PremultipliedSourceIsReusable) {
    px::Image img(31, 17, make_row_tagged(31, 17));
    for (int x = 0; x < 31; ++x) img.set(x, 3, 200, 10, 90, static_cast<uint8_t>(x * 8));

    const auto pre = px::to_premultiplied(img);
    ASSERT_EQ(pre.width, 31);
    ASSERT_EQ(pre.height, 17);
    ASSERT_EQ(pre.texels.size(), 31u * 17u * 4u);
    const size_t off = (3u * 31u + 10u) * 4u;
    EXPECT_FLOAT_EQ(pre.texels[off], 200.0f * 80.0f / 255.0f);
    EXPECT_FLOAT_EQ(pre.texels[off + 3], 80.0f);

    // Every target size from one conversion matches resizing the image directly.
    for (auto [w, h] : {std::pair{15, 8}, std::pair{7, 4}, std::pair{1, 1}}) {
        EXPECT_EQ(px::resize(pre, w, h).pixels, px::resize(img, w, h).pixels) << w << "x" << h;
    }
}

TEST(Pixel, PremultipliedShapeMismatchIsRejected) {
    px::PremultipliedImage pre;
    pre.width = 4;
    pre.height = 4;
    pre.texels.resize(10);
    EXPECT_THROW(px::resize(pre, 2, 2), std::invalid_argument);
}

TEST(Pixel, ResizeRejectsEmptyTarget) {
    px::Image img(4, 4);
    EXPECT_THROW(px::resize(img, 0, 2), std::invalid_argument);
}

TEST(Parallel, VisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(1000);
    ktextools::parallel::for_each_index(hits.size(), [&](size_t i) { hits[i]++; });
    for (auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(Parallel, RethrowsWorkerException) {
    EXPECT_THROW(ktextools::parallel::for_each_index(64, [](size_t i) {
        if (i == 40) throw std::runtime_error("boom");
    }), std::runtime_error);
}

TEST(Parallel, NestedCallsStayOnTheWorker) {
    std::vector<int> moved(8, 0);
    ktextools::parallel::for_each_index(moved.size(), [&](size_t i) {
        const auto self = std::this_thread::get_id();
        ktextools::parallel::for_each_index(512, [&](size_t) {
            if (std::this_thread::get_id() != self) moved[i]++;
        });
    });
    for (int m : moved) EXPECT_EQ(m, 0);
}

TEST(Parallel, WorkersAreJoinedBeforeRethrow) {
    std::atomic<int> finished{0};
    EXPECT_THROW(ktextools::parallel::for_each_index(64, [&](size_t i) {
        if (i == 0) throw std::runtime_error("first stripe");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        finished++;
    }), std::runtime_error);
    // No worker is still running once the exception reaches the caller.
    const int total = finished.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(finished.load(), total);
}
