#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace ktextools::bcn {

// Block-compressed formats. BC1 = DXT1, BC2 = DXT3, BC3 = DXT5.
enum class Format { BC1, BC2, BC3 };

// Colour endpoint search, fastest to slowest.
enum class Algorithm {
    RangeFit,            // endpoints at the extremes of the principal axis
    ClusterFit,          // best partition of the points ordered along the principal axis
    IterativeClusterFit, // cluster fit, re-ordering along the fitted axis until stable
};

inline constexpr std::array<float, 3> k_weights_uniform = {1.0f, 1.0f, 1.0f};
inline constexpr std::array<float, 3> k_weights_perceptual = {0.2126f, 0.7152f, 0.0722f};

struct Params {
    Algorithm algorithm = Algorithm::ClusterFit;
    std::array<float, 3> weights = k_weights_perceptual; // per-channel error weights (R, G, B)
    bool weigh_colour_by_alpha = false;
};

// Algorithm names: "range-fit", "cluster-fit", "iterative-cluster-fit".
std::string_view to_string(Algorithm alg);
std::optional<Algorithm> parse_algorithm(std::string_view name);

// Bytes per 4x4 block: 8 for BC1, 16 for BC2/BC3.
size_t block_bytes(Format fmt);

// ceil(w/4) * ceil(h/4) * block_bytes(fmt).
size_t compressed_size(Format fmt, int width, int height);

// --- Block level ---

// compress_block encodes 16 RGBA pixels (row-major 4x4). Bit i of mask marks
// pixel i as inside the image; pixels outside are ignored by the fit.
void compress_block(Format fmt, const uint8_t* rgba, uint32_t mask, const Params& params, uint8_t* out);

// decompress_block decodes one block into 16 RGBA pixels.
std::array<uint8_t, 64> decompress_block(Format fmt, const uint8_t* block);

// --- Image level ---

// compress encodes a tightly packed RGBA image. Blocks on the right/bottom edge
// are partially masked when the dimensions are not multiples of 4.
// Throws std::invalid_argument if rgba.size() != width * height * 4.
std::vector<uint8_t> compress(Format fmt, std::span<const uint8_t> rgba, int width, int height,
                              const Params& params = {});

// decompress decodes into a tightly packed RGBA image of width * height pixels.
// Throws std::invalid_argument if data is shorter than compressed_size().
std::vector<uint8_t> decompress(Format fmt, std::span<const uint8_t> data, int width, int height);

} // namespace ktextools::bcn
