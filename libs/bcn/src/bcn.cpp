#include "ktextools/bcn.h"
#include "ktextools/parallel.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace ktextools::bcn {

std::string_view to_string(Algorithm alg) {
    switch (alg) {
        case Algorithm::RangeFit: return "range-fit";
        case Algorithm::ClusterFit: return "cluster-fit";
        case Algorithm::IterativeClusterFit: return "iterative-cluster-fit";
    }
    return "";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    if (name == "range-fit" || name == "range") return Algorithm::RangeFit;
    if (name == "cluster-fit" || name == "cluster") return Algorithm::ClusterFit;
    if (name == "iterative-cluster-fit" || name == "iterative") return Algorithm::IterativeClusterFit;
    return std::nullopt;
}

size_t block_bytes(Format fmt) {
    return fmt == Format::BC1 ? 8 : 16;
}

size_t compressed_size(Format fmt, int width, int height) {
    if (width <= 0 || height <= 0) return 0;
    const size_t bw = (static_cast<size_t>(width) + 3) / 4;
    const size_t bh = (static_cast<size_t>(height) + 3) / 4;
    return bw * bh * block_bytes(fmt);
}

namespace {

// --- Decoding ---

struct RGB { uint8_t r, g, b; };

RGB rgb565(uint16_t c) {
    uint8_t r5 = static_cast<uint8_t>((c >> 11) & 0x1F);
    uint8_t g6 = static_cast<uint8_t>((c >> 5) & 0x3F);
    uint8_t b5 = static_cast<uint8_t>(c & 0x1F);
    return {static_cast<uint8_t>((r5 << 3) | (r5 >> 2)),
            static_cast<uint8_t>((g6 << 2) | (g6 >> 4)),
            static_cast<uint8_t>((b5 << 3) | (b5 >> 2))};
}

uint16_t get_u16(const uint8_t* p) { uint16_t v; std::memcpy(&v, p, 2); return v; }
uint32_t get_u32(const uint8_t* p) { uint32_t v; std::memcpy(&v, p, 4); return v; }

using Pixel4 = std::array<uint8_t, 4>;

// BC1 switches to three colours + transparent black when c0 <= c1. BC2/BC3
// colour blocks always use four colours.
void decode_colour(const uint8_t* block, bool bc1, uint8_t* out) {
    uint16_t c0 = get_u16(block), c1 = get_u16(block + 2);
    auto [r0, g0, b0] = rgb565(c0);
    auto [r1, g1, b1] = rgb565(c1);

    std::array<Pixel4, 4> colors;
    colors[0] = {r0, g0, b0, 255};
    colors[1] = {r1, g1, b1, 255};
    if (c0 > c1 || !bc1) {
        colors[2] = {static_cast<uint8_t>((2u*r0 + r1) / 3),
                     static_cast<uint8_t>((2u*g0 + g1) / 3),
                     static_cast<uint8_t>((2u*b0 + b1) / 3), 255};
        colors[3] = {static_cast<uint8_t>((r0 + 2u*r1) / 3),
                     static_cast<uint8_t>((g0 + 2u*g1) / 3),
                     static_cast<uint8_t>((b0 + 2u*b1) / 3), 255};
    } else {
        colors[2] = {static_cast<uint8_t>((r0 + r1) / 2u),
                     static_cast<uint8_t>((g0 + g1) / 2u),
                     static_cast<uint8_t>((b0 + b1) / 2u), 255};
        colors[3] = {0, 0, 0, 0};
    }

    uint32_t indices = get_u32(block + 4);
    for (size_t i = 0; i < 16; i++)
        std::memcpy(out + i * 4, colors[(indices >> (i * 2)) & 3].data(), 4);
}

void decode_bc2_alpha(const uint8_t* block, uint8_t* out) {
    for (size_t i = 0; i < 16; i++) {
        uint8_t nibble = (i % 2 == 0) ? (block[i / 2] & 0x0F) : (block[i / 2] >> 4);
        out[i * 4 + 3] = static_cast<uint8_t>(nibble * 17);
    }
}

std::array<uint8_t, 8> bc3_alpha_palette(uint8_t a0, uint8_t a1) {
    std::array<uint8_t, 8> ap = {a0, a1};
    if (a0 > a1) {
        for (unsigned i = 1; i <= 6; i++)
            ap[i + 1] = static_cast<uint8_t>(((7u - i) * a0 + i * a1) / 7);
    } else {
        for (unsigned i = 1; i <= 4; i++)
            ap[i + 1] = static_cast<uint8_t>(((5u - i) * a0 + i * a1) / 5);
        ap[6] = 0;
        ap[7] = 255;
    }
    return ap;
}

void decode_bc3_alpha(const uint8_t* block, uint8_t* out) {
    auto alphas = bc3_alpha_palette(block[0], block[1]);
    uint64_t bits = 0;
    for (int i = 0; i < 6; i++)
        bits |= static_cast<uint64_t>(block[2 + i]) << (8 * i);
    for (size_t i = 0; i < 16; i++)
        out[i * 4 + 3] = alphas[(bits >> (i * 3)) & 7];
}

// --- Colour encoding ---

struct Vec3 {
    float x = 0.0f, y = 0.0f, z = 0.0f;
};

Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
Vec3 operator*(Vec3 a, Vec3 b) { return {a.x * b.x, a.y * b.y, a.z * b.z}; }
Vec3 operator*(Vec3 a, float s) { return {a.x * s, a.y * s, a.z * s}; }
Vec3& operator+=(Vec3& a, Vec3 b) { a = a + b; return a; }
float dot(Vec3 a, Vec3 b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

float clamp_unit(float v) { return std::clamp(v, 0.0f, 1.0f); }

// Snap to the representable 5:6:5 grid.
Vec3 clamp_to_grid(Vec3 v) {
    return {std::floor(31.0f * clamp_unit(v.x) + 0.5f) / 31.0f,
            std::floor(63.0f * clamp_unit(v.y) + 0.5f) / 63.0f,
            std::floor(31.0f * clamp_unit(v.z) + 0.5f) / 31.0f};
}

uint16_t pack565(Vec3 c) {
    int r = std::clamp(static_cast<int>(31.0f * c.x + 0.5f), 0, 31);
    int g = std::clamp(static_cast<int>(63.0f * c.y + 0.5f), 0, 63);
    int b = std::clamp(static_cast<int>(31.0f * c.z + 0.5f), 0, 31);
    return static_cast<uint16_t>((r << 11) | (g << 5) | b);
}

// Distinct colours of one block with accumulated weights.
struct ColourSet {
    int count = 0;
    std::array<Vec3, 16> points{};
    std::array<float, 16> weights{};
    std::array<int, 16> remap{};
    bool transparent = false;

    ColourSet(const uint8_t* rgba, uint32_t mask, bool bc1, bool weigh_by_alpha) {
        for (int i = 0; i < 16; ++i) {
            remap[static_cast<size_t>(i)] = -1;
            if ((mask & (1u << i)) == 0) continue;

            const uint8_t* p = rgba + i * 4;
            if (bc1 && p[3] < 128) {
                transparent = true;
                continue;
            }

            const float w = weigh_by_alpha ? static_cast<float>(p[3] + 1) / 256.0f : 1.0f;
            bool merged = false;
            for (int j = 0; j < i; ++j) {
                const int idx = remap[static_cast<size_t>(j)];
                if (idx < 0) continue;
                const uint8_t* q = rgba + j * 4;
                if (p[0] == q[0] && p[1] == q[1] && p[2] == q[2]) {
                    weights[static_cast<size_t>(idx)] += w;
                    remap[static_cast<size_t>(i)] = idx;
                    merged = true;
                    break;
                }
            }
            if (merged) continue;

            points[static_cast<size_t>(count)] = {static_cast<float>(p[0]) / 255.0f,
                                                  static_cast<float>(p[1]) / 255.0f,
                                                  static_cast<float>(p[2]) / 255.0f};
            weights[static_cast<size_t>(count)] = w;
            remap[static_cast<size_t>(i)] = count;
            ++count;
        }
    }

    // Expand per-point indices to 16 per-pixel indices. Excluded pixels get 3,
    // which is transparent black in three-colour BC1 blocks.
    std::array<uint8_t, 16> remap_indices(const std::array<uint8_t, 16>& source) const {
        std::array<uint8_t, 16> out{};
        for (size_t i = 0; i < 16; ++i) {
            const int j = remap[i];
            out[i] = j < 0 ? uint8_t(3) : source[static_cast<size_t>(j)];
        }
        return out;
    }
};

Vec3 principal_component(const ColourSet& set) {
    float total = 0.0f;
    Vec3 centroid;
    for (int i = 0; i < set.count; ++i) {
        centroid += set.points[static_cast<size_t>(i)] * set.weights[static_cast<size_t>(i)];
        total += set.weights[static_cast<size_t>(i)];
    }
    if (total > 0.0f) centroid = centroid * (1.0f / total);

    // Weighted covariance (symmetric 3x3).
    float xx = 0, xy = 0, xz = 0, yy = 0, yz = 0, zz = 0;
    for (int i = 0; i < set.count; ++i) {
        const Vec3 d = set.points[static_cast<size_t>(i)] - centroid;
        const float w = set.weights[static_cast<size_t>(i)];
        xx += w * d.x * d.x; xy += w * d.x * d.y; xz += w * d.x * d.z;
        yy += w * d.y * d.y; yz += w * d.y * d.z; zz += w * d.z * d.z;
    }
    const Vec3 row0{xx, xy, xz}, row1{xy, yy, yz}, row2{xz, yz, zz};

    // Power iteration from the longest row.
    Vec3 v = row0;
    if (dot(row1, row1) > dot(v, v)) v = row1;
    if (dot(row2, row2) > dot(v, v)) v = row2;
    for (int it = 0; it < 8; ++it) {
        const Vec3 next = row0 * v.x + row1 * v.y + row2 * v.z;
        const float m = std::max({std::fabs(next.x), std::fabs(next.y), std::fabs(next.z)});
        if (m < 1e-12f) return {1.0f, 1.0f, 1.0f};
        v = next * (1.0f / m);
    }
    return v;
}

struct Candidate {
    float error = std::numeric_limits<float>::max();
    Vec3 start, end;
    std::array<uint8_t, 16> indices{};
    bool three_colour = false;
};

float weighted_distance(Vec3 a, Vec3 b, Vec3 metric_sq) {
    const Vec3 d = a - b;
    return dot(d * d, metric_sq);
}

Candidate range_fit(const ColourSet& set, Vec3 metric_sq, bool three) {
    Candidate c;
    c.three_colour = three;
    Vec3 start, end;
    if (set.count > 0) {
        const Vec3 axis = principal_component(set);
        start = end = set.points[0];
        float lo = dot(start, axis), hi = lo;
        for (int i = 1; i < set.count; ++i) {
            const Vec3 p = set.points[static_cast<size_t>(i)];
            const float v = dot(p, axis);
            if (v < lo) { start = p; lo = v; }
            else if (v > hi) { end = p; hi = v; }
        }
    }
    start = clamp_to_grid(start);
    end = clamp_to_grid(end);

    std::array<Vec3, 4> codes;
    int ncodes;
    codes[0] = start;
    codes[1] = end;
    if (three) {
        codes[2] = (start + end) * 0.5f;
        ncodes = 3;
    } else {
        codes[2] = start * (2.0f / 3.0f) + end * (1.0f / 3.0f);
        codes[3] = start * (1.0f / 3.0f) + end * (2.0f / 3.0f);
        ncodes = 4;
    }

    std::array<uint8_t, 16> closest{};
    float error = 0.0f;
    for (int i = 0; i < set.count; ++i) {
        float best = std::numeric_limits<float>::max();
        uint8_t idx = 0;
        for (int j = 0; j < ncodes; ++j) {
            const float d = weighted_distance(set.points[static_cast<size_t>(i)],
                                              codes[static_cast<size_t>(j)], metric_sq);
            if (d < best) { best = d; idx = static_cast<uint8_t>(j); }
        }
        closest[static_cast<size_t>(i)] = idx;
        error += best * set.weights[static_cast<size_t>(i)];
    }

    c.error = error;
    c.start = start;
    c.end = end;
    c.indices = set.remap_indices(closest);
    return c;
}

// Least-squares endpoints for one partition. Returns false when the system is
// singular (every point in a single cluster).
bool solve_endpoints(Vec3 alphax, float alpha2, Vec3 betax, float beta2, float alphabeta,
                     Vec3 metric_sq, Vec3& a, Vec3& b, float& error) {
    const float denom = alpha2 * beta2 - alphabeta * alphabeta;
    if (denom <= 1e-9f) return false;
    const float factor = 1.0f / denom;
    a = clamp_to_grid((alphax * beta2 - betax * alphabeta) * factor);
    b = clamp_to_grid((betax * alpha2 - alphax * alphabeta) * factor);

    // Residual minus the constant sum of w*x^2, enough to rank partitions.
    const Vec3 e = a * a * alpha2 + b * b * beta2 +
                   (a * b * alphabeta - a * alphax - b * betax) * 2.0f;
    error = dot(e, metric_sq);
    return true;
}

Candidate cluster_fit(const ColourSet& set, Vec3 metric_sq, bool three, int max_iterations) {
    Candidate best;
    best.three_colour = three;
    const int n = set.count;

    std::vector<std::array<uint8_t, 16>> tried;
    Vec3 axis = principal_component(set);

    for (int iteration = 0; iteration < max_iterations; ++iteration) {
        std::array<float, 16> dps{};
        std::array<uint8_t, 16> order{};
        for (int i = 0; i < n; ++i) {
            dps[static_cast<size_t>(i)] = dot(set.points[static_cast<size_t>(i)], axis);
            order[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
        }
        std::stable_sort(order.begin(), order.begin() + n,
                         [&](uint8_t l, uint8_t r) { return dps[l] < dps[r]; });
        bool repeated = std::any_of(tried.begin(), tried.end(), [&](const auto& o) {
            return std::equal(o.begin(), o.begin() + n, order.begin());
        });
        if (repeated) break;
        tried.push_back(order);

        std::array<Vec3, 16> wp{};
        std::array<float, 16> w{};
        Vec3 xsum;
        float wsum = 0.0f;
        for (int i = 0; i < n; ++i) {
            const size_t src = order[static_cast<size_t>(i)];
            w[static_cast<size_t>(i)] = set.weights[src];
            wp[static_cast<size_t>(i)] = set.points[src] * set.weights[src];
            xsum += wp[static_cast<size_t>(i)];
            wsum += w[static_cast<size_t>(i)];
        }

        float iter_error = best.error;
        int bi = -1, bj = -1, bk = -1;
        Vec3 bstart, bend;

        Vec3 part0;
        float w0 = 0.0f;
        for (int i = 0; i < n; ++i) {
            Vec3 part1;
            float w1 = 0.0f;
            for (int j = i;;) {
                if (three) {
                    const Vec3 part2 = xsum - part1 - part0;
                    const float w2 = wsum - w1 - w0;
                    Vec3 a, b;
                    float err;
                    if (solve_endpoints(part0 + part1 * 0.5f, w0 + w1 * 0.25f,
                                        part2 + part1 * 0.5f, w2 + w1 * 0.25f,
                                        w1 * 0.25f, metric_sq, a, b, err) &&
                        err < iter_error) {
                        iter_error = err;
                        bi = i; bj = j;
                        bstart = a; bend = b;
                    }
                } else {
                    Vec3 part2;
                    float w2 = 0.0f;
                    for (int k = j;;) {
                        const Vec3 part3 = xsum - part2 - part1 - part0;
                        const float w3 = wsum - w2 - w1 - w0;
                        Vec3 a, b;
                        float err;
                        if (solve_endpoints(part0 + part1 * (2.0f / 3.0f) + part2 * (1.0f / 3.0f),
                                            w0 + w1 * (4.0f / 9.0f) + w2 * (1.0f / 9.0f),
                                            part3 + part2 * (2.0f / 3.0f) + part1 * (1.0f / 3.0f),
                                            w3 + w2 * (4.0f / 9.0f) + w1 * (1.0f / 9.0f),
                                            (w1 + w2) * (2.0f / 9.0f), metric_sq, a, b, err) &&
                            err < iter_error) {
                            iter_error = err;
                            bi = i; bj = j; bk = k;
                            bstart = a; bend = b;
                        }
                        if (k == n) break;
                        part2 += wp[static_cast<size_t>(k)];
                        w2 += w[static_cast<size_t>(k)];
                        ++k;
                    }
                }
                if (j == n) break;
                part1 += wp[static_cast<size_t>(j)];
                w1 += w[static_cast<size_t>(j)];
                ++j;
            }
            part0 += wp[static_cast<size_t>(i)];
            w0 += w[static_cast<size_t>(i)];
        }

        if (bi < 0) break; // no improvement in this iteration

        std::array<uint8_t, 16> unordered{};
        for (int m = 0; m < n; ++m) {
            uint8_t idx;
            if (m < bi) idx = 0;
            else if (m < bj) idx = 2;
            else if (three) idx = 1;
            else if (m < bk) idx = 3;
            else idx = 1;
            unordered[order[static_cast<size_t>(m)]] = idx;
        }
        best.error = iter_error;
        best.start = bstart;
        best.end = bend;
        best.indices = set.remap_indices(unordered);

        axis = bend - bstart;
    }
    return best;
}

// --- Single colour fit ---

struct SingleEntry {
    uint8_t e0 = 0, e1 = 0, error = 255;
};
using SingleTable = std::array<SingleEntry, 256>;

int expand_bits(int e, int bits) {
    return bits == 5 ? (e << 3) | (e >> 2) : (e << 2) | (e >> 4);
}

// Best endpoint pair per 8-bit value when every texel uses palette index 2.
const SingleTable& single_table(int bits, bool three) {
    static const std::array<SingleTable, 4> tables = [] {
        std::array<SingleTable, 4> t{};
        for (int ti = 0; ti < 4; ++ti) {
            const int b = (ti & 2) ? 6 : 5;
            const bool th = (ti & 1) != 0;
            const int max = (1 << b) - 1;
            for (int v = 0; v < 256; ++v) {
                SingleEntry& best = t[static_cast<size_t>(ti)][static_cast<size_t>(v)];
                for (int e0 = 0; e0 <= max && best.error > 0; ++e0) {
                    const int x0 = expand_bits(e0, b);
                    for (int e1 = 0; e1 <= max; ++e1) {
                        const int x1 = expand_bits(e1, b);
                        const int interp = th ? (x0 + x1) / 2 : (2 * x0 + x1) / 3;
                        const int err = std::abs(interp - v);
                        if (err < best.error) {
                            best = {static_cast<uint8_t>(e0), static_cast<uint8_t>(e1),
                                    static_cast<uint8_t>(err)};
                            if (err == 0) break;
                        }
                    }
                }
            }
        }
        return t;
    }();
    return tables[static_cast<size_t>((bits == 6 ? 2 : 0) + (three ? 1 : 0))];
}

Candidate single_colour_fit(const ColourSet& set, Vec3 metric_sq, bool three) {
    const Vec3 p = set.points[0];
    const int r = static_cast<int>(std::lround(p.x * 255.0f));
    const int g = static_cast<int>(std::lround(p.y * 255.0f));
    const int b = static_cast<int>(std::lround(p.z * 255.0f));
    const SingleEntry& er = single_table(5, three)[static_cast<size_t>(r)];
    const SingleEntry& eg = single_table(6, three)[static_cast<size_t>(g)];
    const SingleEntry& eb = single_table(5, three)[static_cast<size_t>(b)];

    Candidate c;
    c.three_colour = three;
    c.start = {er.e0 / 31.0f, eg.e0 / 63.0f, eb.e0 / 31.0f};
    c.end = {er.e1 / 31.0f, eg.e1 / 63.0f, eb.e1 / 31.0f};
    const Vec3 err{static_cast<float>(er.error), static_cast<float>(eg.error),
                   static_cast<float>(eb.error)};
    c.error = dot(err * err, metric_sq);
    std::array<uint8_t, 16> idx{};
    idx[0] = 2;
    c.indices = set.remap_indices(idx);
    return c;
}

// --- Block writers ---

void write_colour_words(uint16_t a, uint16_t b, const std::array<uint8_t, 16>& indices, uint8_t* out) {
    uint32_t bits = 0;
    for (size_t i = 0; i < 16; ++i)
        bits |= static_cast<uint32_t>(indices[i] & 3) << (2 * i);
    std::memcpy(out, &a, 2);
    std::memcpy(out + 2, &b, 2);
    std::memcpy(out + 4, &bits, 4);
}

// Three-colour blocks need c0 <= c1.
void write_colour_block3(Vec3 start, Vec3 end, std::array<uint8_t, 16> indices, uint8_t* out) {
    uint16_t a = pack565(start), b = pack565(end);
    if (a > b) {
        std::swap(a, b);
        for (auto& i : indices) {
            if (i == 0) i = 1;
            else if (i == 1) i = 0;
        }
    }
    write_colour_words(a, b, indices, out);
}

// Four-colour blocks need c0 > c1; equal endpoints collapse to index 0.
void write_colour_block4(Vec3 start, Vec3 end, std::array<uint8_t, 16> indices, uint8_t* out) {
    uint16_t a = pack565(start), b = pack565(end);
    if (a < b) {
        std::swap(a, b);
        for (auto& i : indices) i ^= 1;
    } else if (a == b) {
        indices.fill(0);
    }
    write_colour_words(a, b, indices, out);
}

void compress_colour(const uint8_t* rgba, uint32_t mask, bool bc1, const Params& params, uint8_t* out) {
    const ColourSet set(rgba, mask, bc1, params.weigh_colour_by_alpha);
    const Vec3 metric{params.weights[0], params.weights[1], params.weights[2]};
    const Vec3 metric_sq = metric * metric;
    const int iterations = params.algorithm == Algorithm::IterativeClusterFit ? 8 : 1;

    Candidate best;
    bool have = false;
    auto run = [&](bool three) {
        Candidate c;
        if (set.count == 1) c = single_colour_fit(set, metric_sq, three);
        else if (set.count == 0 || params.algorithm == Algorithm::RangeFit) c = range_fit(set, metric_sq, three);
        else c = cluster_fit(set, metric_sq, three, iterations);
        if (!have || c.error < best.error) {
            best = c;
            have = true;
        }
    };

    if (bc1) {
        run(true);
        if (!set.transparent) run(false);
    } else {
        run(false);
    }

    if (best.three_colour) write_colour_block3(best.start, best.end, best.indices, out);
    else write_colour_block4(best.start, best.end, best.indices, out);
}

// --- Alpha encoding ---

void compress_alpha_bc2(const uint8_t* rgba, uint32_t mask, uint8_t* out) {
    std::memset(out, 0, 8);
    for (size_t i = 0; i < 16; i++) {
        uint32_t n = 0;
        if (mask & (1u << i)) n = (static_cast<uint32_t>(rgba[i * 4 + 3]) + 8) / 17;
        if (i % 2 == 0)
            out[i / 2] = static_cast<uint8_t>(n & 0xF);
        else
            out[i / 2] |= static_cast<uint8_t>((n & 0xF) << 4);
    }
}

void fix_range(int& lo, int& hi, int steps) {
    if (hi - lo < steps) hi = std::min(lo + steps, 255);
    if (hi - lo < steps) lo = std::max(0, hi - steps);
}

int fit_alpha_codes(const uint8_t* rgba, uint32_t mask, const std::array<uint8_t, 8>& codes,
                    std::array<uint8_t, 16>& indices) {
    int error = 0;
    for (size_t i = 0; i < 16; ++i) {
        if ((mask & (1u << i)) == 0) {
            indices[i] = 0;
            continue;
        }
        const int a = rgba[i * 4 + 3];
        int best = std::numeric_limits<int>::max();
        uint8_t idx = 0;
        for (size_t j = 0; j < 8; ++j) {
            const int d = (a - codes[j]) * (a - codes[j]);
            if (d < best) { best = d; idx = static_cast<uint8_t>(j); }
        }
        indices[i] = idx;
        error += best;
    }
    return error;
}

void write_alpha_block(uint8_t a0, uint8_t a1, const std::array<uint8_t, 16>& indices, uint8_t* out) {
    out[0] = a0;
    out[1] = a1;
    uint64_t bits = 0;
    for (size_t i = 0; i < 16; ++i)
        bits |= static_cast<uint64_t>(indices[i] & 7) << (3 * i);
    for (int i = 0; i < 6; ++i)
        out[2 + i] = static_cast<uint8_t>(bits >> (8 * i));
}

// Tries the six-interpolant (explicit 0/255) and eight-interpolant palettes
// and keeps the one with lower squared error.
void compress_alpha_bc3(const uint8_t* rgba, uint32_t mask, uint8_t* out) {
    int min5 = 255, max5 = 0, min7 = 255, max7 = 0;
    for (size_t i = 0; i < 16; ++i) {
        if ((mask & (1u << i)) == 0) continue;
        const int a = rgba[i * 4 + 3];
        min7 = std::min(min7, a);
        max7 = std::max(max7, a);
        if (a != 0 && a != 255) {
            min5 = std::min(min5, a);
            max5 = std::max(max5, a);
        }
    }
    if (min5 > max5) min5 = max5;
    if (min7 > max7) min7 = max7;
    fix_range(min5, max5, 5);
    fix_range(min7, max7, 7);

    // Palettes in decoder order: a0 <= a1 selects the six-interpolant mode.
    const auto codes5 = bc3_alpha_palette(static_cast<uint8_t>(min5), static_cast<uint8_t>(max5));
    const auto codes7 = bc3_alpha_palette(static_cast<uint8_t>(max7), static_cast<uint8_t>(min7));

    std::array<uint8_t, 16> idx5{}, idx7{};
    const int err5 = fit_alpha_codes(rgba, mask, codes5, idx5);
    const int err7 = fit_alpha_codes(rgba, mask, codes7, idx7);

    if (err5 <= err7)
        write_alpha_block(static_cast<uint8_t>(min5), static_cast<uint8_t>(max5), idx5, out);
    else
        write_alpha_block(static_cast<uint8_t>(max7), static_cast<uint8_t>(min7), idx7, out);
}

void check_rgba(std::span<const uint8_t> rgba, int width, int height) {
    if (width < 0 || height < 0 ||
        rgba.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 4)
        throw std::invalid_argument("bcn: buffer of " + std::to_string(rgba.size()) +
                                    " bytes does not match " + std::to_string(width) + "x" +
                                    std::to_string(height) + " RGBA");
}

} // namespace

void compress_block(Format fmt, const uint8_t* rgba, uint32_t mask, const Params& params, uint8_t* out) {
    switch (fmt) {
        case Format::BC1:
            compress_colour(rgba, mask, true, params, out);
            break;
        case Format::BC2:
            compress_alpha_bc2(rgba, mask, out);
            compress_colour(rgba, mask, false, params, out + 8);
            break;
        case Format::BC3:
            compress_alpha_bc3(rgba, mask, out);
            compress_colour(rgba, mask, false, params, out + 8);
            break;
    }
}

std::array<uint8_t, 64> decompress_block(Format fmt, const uint8_t* block) {
    std::array<uint8_t, 64> out{};
    switch (fmt) {
        case Format::BC1:
            decode_colour(block, true, out.data());
            break;
        case Format::BC2:
            decode_colour(block + 8, false, out.data());
            decode_bc2_alpha(block, out.data());
            break;
        case Format::BC3:
            decode_colour(block + 8, false, out.data());
            decode_bc3_alpha(block, out.data());
            break;
    }
    return out;
}

std::vector<uint8_t> compress(Format fmt, std::span<const uint8_t> rgba, int width, int height,
                              const Params& params) {
    check_rgba(rgba, width, height);
    const size_t bb = block_bytes(fmt);
    const int bw = (width + 3) / 4;
    const int bh = (height + 3) / 4;
    std::vector<uint8_t> out(compressed_size(fmt, width, height));

    parallel::for_each_index(static_cast<size_t>(bh), [&](size_t by) {
        std::array<uint8_t, 64> block{};
        for (int bx = 0; bx < bw; ++bx) {
            uint32_t mask = 0;
            block.fill(0);
            for (int py = 0; py < 4; ++py) {
                for (int px = 0; px < 4; ++px) {
                    const int x = bx * 4 + px;
                    const int y = static_cast<int>(by) * 4 + py;
                    if (x >= width || y >= height) continue;
                    const size_t src = (static_cast<size_t>(y) * static_cast<size_t>(width) +
                                        static_cast<size_t>(x)) * 4;
                    std::memcpy(block.data() + (py * 4 + px) * 4, rgba.data() + src, 4);
                    mask |= 1u << (py * 4 + px);
                }
            }
            compress_block(fmt, block.data(), mask, params,
                           out.data() + (by * static_cast<size_t>(bw) + static_cast<size_t>(bx)) * bb);
        }
    });
    return out;
}

std::vector<uint8_t> decompress(Format fmt, std::span<const uint8_t> data, int width, int height) {
    if (width < 0 || height < 0)
        throw std::invalid_argument("bcn: invalid dimensions " + std::to_string(width) + "x" +
                                    std::to_string(height));
    const size_t need = compressed_size(fmt, width, height);
    if (data.size() < need)
        throw std::invalid_argument("bcn: need " + std::to_string(need) + " bytes for " +
                                    std::to_string(width) + "x" + std::to_string(height) +
                                    ", got " + std::to_string(data.size()));

    const size_t bb = block_bytes(fmt);
    const int bw = (width + 3) / 4;
    const int bh = (height + 3) / 4;
    std::vector<uint8_t> out(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);

    parallel::for_each_index(static_cast<size_t>(bh), [&](size_t by) {
        for (int bx = 0; bx < bw; ++bx) {
            const auto pixels = decompress_block(
                fmt, data.data() + (by * static_cast<size_t>(bw) + static_cast<size_t>(bx)) * bb);
            for (int py = 0; py < 4; ++py) {
                for (int px = 0; px < 4; ++px) {
                    const int x = bx * 4 + px;
                    const int y = static_cast<int>(by) * 4 + py;
                    if (x >= width || y >= height) continue;
                    const size_t dst = (static_cast<size_t>(y) * static_cast<size_t>(width) +
                                        static_cast<size_t>(x)) * 4;
                    std::memcpy(out.data() + dst, pixels.data() + (py * 4 + px) * 4, 4);
                }
            }
        }
    });
    return out;
}

} // namespace ktextools::bcn
