#include "ktextools/ktex.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using namespace ktextools;

static void print_usage() {
    cli::print("Usage: ktex2img [flags] <input.tex>");
    cli::print("Converts a KTEX texture to PNG.");
    cli::print("Reads from file argument or stdin (use - or omit argument).");
    cli::print("");
    cli::print("Flags:");
    cli::print("  -o <path>    Output PNG path (use - for stdout)");
    cli::print("  -level <n>   Mipmap level to decode (default 0)");
    cli::print("  -v, -vv      Verbose / debug logging");
}

static void write_png_to_stream(std::ostream& out, const pixel::Image& img) {
    stbi_write_png_to_func(
        [](void* ctx, void* data, int size) {
            static_cast<std::ostream*>(ctx)->write(static_cast<const char*>(data), size);
        },
        &out, img.width, img.height, 4, img.pixels.data(), img.width * 4);
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

    bool from_stdin = positional.empty() || positional[0] == "-";
    std::string input_name = from_stdin ? "stdin" : positional[0];
    std::vector<uint8_t> data;
    if (from_stdin) {
        data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream f(input_name, std::ios::binary);
        if (!f) {
            LOGE("cannot open", input_name);
            return 1;
        }
        data.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    pixel::Image img;
    ktex::Container c;
    try {
        c = ktex::decode(std::move(data));
        img = ktex::decompress_level(c, level);
    } catch (const std::exception& e) {
        LOGE("decoding", input_name + ":", e.what());
        return 1;
    }

    LOGI("KTEX:", input_name, ktex::to_string(c.header.pixel_format),
         std::to_string(img.width) + "x" + std::to_string(img.height), "level", level);

    if (output == "-" || (from_stdin && output.empty())) {
        write_png_to_stream(std::cout, img);
    } else {
        std::string out_path = output;
        if (out_path.empty()) {
            fs::path p(input_name);
            out_path = (p.parent_path() / p.stem()).string() + ".png";
        }
        if (!stbi_write_png(out_path.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4)) {
            LOGE("writing", out_path);
            return 1;
        }
        cli::log_plain("Output:", out_path);
    }
    return 0;
}
