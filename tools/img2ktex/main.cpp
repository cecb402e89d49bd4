#include "ktextools/ktex.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "../common/cli_logger.h"
#include "../common/encode_config.h"

namespace fs = std::filesystem;
using namespace ktextools;

static void print_usage() {
    cli::print("Usage: img2ktex [flags] <input.png|jpg|bmp|tga>");
    cli::print("Encodes any image stb_image can read as a KTEX texture.");
    cli::print("");
    cli::print("Flags:");
    cli::print("  -o <path>            Output .tex path");
    cli::print_encode_flags();
    cli::print("  -v, -vv              Verbose / debug logging");
}

int main(int argc, char* argv[]) {
    std::string output;
    int verbosity = 0;
    cli::EncodeFlags flags;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; i++) {
            if (flags.consume(argc, argv, i)) continue;
            if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
                output = argv[++i];
            } else if (std::strcmp(argv[i], "-v") == 0) {
                verbosity = std::min(verbosity + 1, 2);
            } else if (std::strcmp(argv[i], "-vv") == 0) {
                verbosity = 2;
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage();
                return 0;
            } else {
                positional.push_back(argv[i]);
            }
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 2;
    }

    cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }

    ktex::EncodeOptions opts;
    try {
        opts = flags.finish();
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 2;
    }

    const std::string in_path = positional[0];
    std::string out_path = output;
    if (out_path.empty()) {
        fs::path p(in_path);
        out_path = (p.parent_path() / p.stem()).string() + ".tex";
    }
    if (fs::exists(out_path)) {
        LOGE("output already exists:", out_path);
        return 1;
    }

    int width = 0, height = 0, channels = 0;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixels(
        stbi_load(in_path.c_str(), &width, &height, &channels, STBI_rgb_alpha), &stbi_image_free);
    if (!pixels) {
        LOGE("loading", in_path + ":", stbi_failure_reason());
        return 1;
    }
    LOGI("Image:", in_path, std::to_string(width) + "x" + std::to_string(height), "channels:", channels);

    std::vector<uint8_t> bytes;
    try {
        bytes = ktex::encode_rgba(width, height,
                                  std::span<const uint8_t>(pixels.get(), pixel::rgba_size(width, height)),
                                  opts);
    } catch (const std::exception& e) {
        LOGE("encoding KTEX:", e.what());
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary);
    if (!out || !out.write(reinterpret_cast<const char*>(bytes.data()),
                           static_cast<std::streamsize>(bytes.size()))) {
        LOGE("writing output:", out_path);
        return 1;
    }

    cli::log_plain("Output:", out_path, "(" + std::string(ktex::to_string(opts.pixel_format)) + ", " +
                                            std::to_string(bytes.size()) + " bytes)");
    return 0;
}
