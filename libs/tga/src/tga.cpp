#include "ktextools/tga.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace ktextools::tga {

namespace {

constexpr uint8_t k_type_truecolor = 2;
constexpr uint8_t k_type_truecolor_rle = 10;

void read_exact(std::istream& r, uint8_t* dst, size_t n, const char* what) {
    if (!r.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n)))
        throw std::runtime_error(std::string("tga: failed to read ") + what);
}

// Reads w*h pixels of bpp bytes each, in file order.
std::vector<uint8_t> read_pixels(std::istream& r, size_t count, int bpp, bool rle) {
    const size_t bytes = static_cast<size_t>(bpp);
    std::vector<uint8_t> out(count * bytes);
    if (!rle) {
        read_exact(r, out.data(), out.size(), "pixel data");
        return out;
    }

    size_t i = 0;
    uint8_t px[4];
    while (i < count) {
        uint8_t packet;
        read_exact(r, &packet, 1, "RLE packet");
        size_t run = static_cast<size_t>(packet & 0x7F) + 1;
        if (run > count - i)
            throw std::runtime_error("tga: RLE packet overruns image (" + std::to_string(run) +
                                     " pixels at " + std::to_string(i) + " of " +
                                     std::to_string(count) + ")");
        if (packet & 0x80) {
            read_exact(r, px, bytes, "RLE pixel");
            for (size_t k = 0; k < run; k++, i++)
                std::copy(px, px + bytes, out.begin() + static_cast<std::ptrdiff_t>(i * bytes));
        } else {
            read_exact(r, out.data() + i * bytes, run * bytes, "RLE literal run");
            i += run;
        }
    }
    return out;
}

} // namespace

pixel::Image decode(std::istream& r) {
    uint8_t hdr[18];
    read_exact(r, hdr, 18, "header");

    int id_len = hdr[0];
    uint8_t color_map_type = hdr[1];
    uint8_t image_type = hdr[2];

    if (color_map_type != 0)
        throw std::runtime_error("tga: color-mapped images are not supported");
    if (image_type != k_type_truecolor && image_type != k_type_truecolor_rle)
        throw std::runtime_error("tga: only true-color images (type 2 or 10) are supported, got " +
                                 std::to_string(image_type));

    int w = static_cast<int>(hdr[12]) | (static_cast<int>(hdr[13]) << 8);
    int h = static_cast<int>(hdr[14]) | (static_cast<int>(hdr[15]) << 8);
    int bpp = hdr[16];
    uint8_t desc = hdr[17];

    if (w <= 0 || h <= 0)
        throw std::runtime_error("tga: invalid dimensions " + std::to_string(w) + "x" + std::to_string(h));
    if (bpp != 24 && bpp != 32)
        throw std::runtime_error("tga: only 24/32 bpp is supported, got " + std::to_string(bpp));

    // Skip ID field
    if (id_len > 0) {
        std::vector<uint8_t> dummy(static_cast<size_t>(id_len));
        read_exact(r, dummy.data(), dummy.size(), "ID field");
    }

    const bool top_origin = (desc & 0x20) != 0;
    const int bytes_per_pixel = bpp / 8;
    const auto src = read_pixels(r, static_cast<size_t>(w) * static_cast<size_t>(h), bytes_per_pixel,
                                 image_type == k_type_truecolor_rle);

    pixel::Image img(w, h);
    for (int yy = 0; yy < h; yy++) {
        int y = top_origin ? yy : (h - 1 - yy);
        for (int x = 0; x < w; x++) {
            size_t off = (static_cast<size_t>(yy) * static_cast<size_t>(w) + static_cast<size_t>(x)) *
                         static_cast<size_t>(bytes_per_pixel);
            uint8_t a = (bytes_per_pixel == 4) ? src[off + 3] : uint8_t(255);
            img.set(x, y, src[off + 2], src[off + 1], src[off], a);
        }
    }
    return img;
}

void encode(std::ostream& w, const pixel::Image& img) {
    if (img.width <= 0 || img.height <= 0 || img.width > 65535 || img.height > 65535)
        throw std::runtime_error("tga: invalid dimensions " + std::to_string(img.width) + "x" +
                                 std::to_string(img.height));
    if (img.pixels.size() != pixel::rgba_size(img.width, img.height))
        throw std::runtime_error("tga: pixel buffer does not match dimensions");

    uint8_t hdr[18] = {};
    hdr[2] = k_type_truecolor;
    hdr[12] = static_cast<uint8_t>(img.width & 0xFF);
    hdr[13] = static_cast<uint8_t>((img.width >> 8) & 0xFF);
    hdr[14] = static_cast<uint8_t>(img.height & 0xFF);
    hdr[15] = static_cast<uint8_t>((img.height >> 8) & 0xFF);
    hdr[16] = 32;   // pixel depth
    hdr[17] = 0x28;  // 8 alpha bits + top-left origin
    if (!w.write(reinterpret_cast<const char*>(hdr), 18))
        throw std::runtime_error("tga: failed to write header");

    std::vector<uint8_t> row(static_cast<size_t>(img.width) * 4);
    for (int y = 0; y < img.height; y++) {
        for (int x = 0; x < img.width; x++) {
            uint8_t r, g, b, a;
            img.get(x, y, r, g, b, a);
            size_t dst = static_cast<size_t>(x) * 4;
            row[dst] = b;
            row[dst + 1] = g;
            row[dst + 2] = r;
            row[dst + 3] = a;
        }
        if (!w.write(reinterpret_cast<const char*>(row.data()),
                     static_cast<std::streamsize>(row.size())))
            throw std::runtime_error("tga: failed to write pixel row");
    }
}

} // namespace ktextools::tga
