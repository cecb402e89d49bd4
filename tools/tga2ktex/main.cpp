#include "ktextools/ktex.h"
#include "ktextools/tga.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/encode_config.h"

namespace fs = std::filesystem;
using namespace ktextools;

static void print_usage() {
    cli::print("Usage: tga2ktex [flags] <input.tga>");
    cli::print("Encodes a TGA image as a KTEX texture.");
    cli::print("");
    cli::print("Flags:");
    cli::print("  -o <path>            Output .tex path");
    cli::print_encode_flags();
    cli::print("  -v, -vv              Verbose / debug logging");
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
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

    std::string in_path = positional[0];
    if (to_lower(fs::path(in_path).extension().string()) != ".tga") {
        LOGE("input must be .tga:", in_path);
        return 1;
    }
    std::string out_path = output;
    if (out_path.empty()) {
        fs::path p(in_path);
        out_path = (p.parent_path() / p.stem()).string() + ".tex";
    }
    if (fs::exists(out_path)) {
        LOGE("output already exists:", out_path);
        return 1;
    }

    std::ifstream in(in_path, std::ios::binary);
    if (!in) {
        LOGE("opening input:", in_path);
        return 1;
    }

    pixel::Image img;
    try {
        img = tga::decode(in);
    } catch (const std::exception& e) {
        LOGE("decoding TGA:", e.what());
        return 1;
    }
    LOGI("TGA:", in_path, std::to_string(img.width) + "x" + std::to_string(img.height));
    LOGD("Options:", ktex::to_string(opts.platform), ktex::to_string(opts.pixel_format),
         ktex::to_string(opts.texture_type), bcn::to_string(opts.params.algorithm),
         "mipmaps:", opts.generate_mipmaps ? "yes" : "no");

    std::vector<uint8_t> bytes;
    try {
        bytes = ktex::encode_rgba(img.width, img.height, img.pixels, opts);
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
