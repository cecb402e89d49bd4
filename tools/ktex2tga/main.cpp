#include "ktextools/ktex.h"
#include "ktextools/tga.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using namespace ktextools;

static void print_usage() {
    cli::print("Usage: ktex2tga [flags] <input.tex>");
    cli::print("Decodes one mipmap level of a KTEX texture to TGA.");
    cli::print("");
    cli::print("Flags:");
    cli::print("  -o <path>    Output TGA path");
    cli::print("  -level <n>   Mipmap level to decode (default 0)");
    cli::print("  -v, -vv      Verbose / debug logging");
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

int main(int argc, char* argv[]) {
    std::string output;
    size_t level = 0;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "-level") == 0 && i + 1 < argc) {
            try {
                level = std::stoul(argv[++i]);
            } catch (const std::exception&) {
                LOGE("invalid level:", argv[i]);
                return 2;
            }
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

    cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }

    std::string in_path = positional[0];
    std::string out_path = output;
    if (out_path.empty()) {
        fs::path p(in_path);
        out_path = (p.parent_path() / p.stem()).string() + ".tga";
    }
    if (to_lower(fs::path(out_path).extension().string()) != ".tga") {
        LOGE("output must use .tga extension:", out_path);
        return 1;
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
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    pixel::Image img;
    ktex::Container c;
    try {
        c = ktex::decode(std::move(data));
        LOGD("Header:", ktex::to_string(c.header.layout), ktex::to_string(c.header.platform),
             ktex::to_string(c.header.pixel_format), "mipmaps:", c.header.mipmap_count);
        img = ktex::decompress_level(c, level);
    } catch (const std::exception& e) {
        LOGE("decoding", in_path + ":", e.what());
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary);
    if (!out) {
        LOGE("creating output:", out_path);
        return 1;
    }
    try {
        tga::encode(out, img);
    } catch (const std::exception& e) {
        LOGE("encoding TGA:", e.what());
        return 1;
    }

    cli::log_plain("Output:", out_path, "(" + std::string(ktex::to_string(c.header.pixel_format)) + " " +
                                            std::to_string(img.width) + "x" + std::to_string(img.height) + ")");
    return 0;
}
