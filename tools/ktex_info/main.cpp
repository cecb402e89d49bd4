#include "ktextools/ktex.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

using json = nlohmann::ordered_json;
using namespace ktextools;

static std::string premultiply_name(ktex::Premultiply p) {
    switch (p) {
        case ktex::Premultiply::Yes: return "yes";
        case ktex::Premultiply::No: return "no";
        case ktex::Premultiply::Absent: break;
    }
    return "absent";
}

static json build_json(const ktex::Container& c) {
    const auto& h = c.header;
    json levels = json::array();
    for (const auto& m : c.mipmaps) {
        levels.push_back({
            {"width", m.width},
            {"height", m.height},
            {"pitch", m.pitch},
            {"dataSize", m.data_size},
        });
    }
    return json{
        {"layout", std::string(ktex::to_string(h.layout))},
        {"headerWord", ktex::encode_header(h)},
        {"platform", std::string(ktex::to_string(h.platform))},
        {"pixelFormat", std::string(ktex::to_string(h.pixel_format))},
        {"textureType", std::string(ktex::to_string(h.texture_type))},
        {"mipmapCount", h.mipmap_count},
        {"flag", h.flag},
        {"fill", h.fill},
        {"premultiplyAlpha", premultiply_name(h.premultiply)},
        {"trailingByte", c.trailing != ktex::Premultiply::Absent},
        {"fileSize", c.bytes.size()},
        {"mipmaps", levels},
    };
}

static void print_usage() {
    cli::print("Usage: ktex_info [flags] [input.tex]");
    cli::print("Parses a KTEX texture and prints its header and mipmap table as JSON.");
    cli::print("Reads from file argument or stdin (use - or omit argument).");
    cli::print("");
    cli::print("Flags:");
    cli::print("  --pretty   Pretty-print JSON output");
    cli::print("  -v, -vv    Verbose / debug logging");
}

int main(int argc, char* argv[]) {
    bool pretty = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
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
    std::string filename = from_stdin ? "stdin" : positional[0];
    std::vector<uint8_t> data;
    if (from_stdin) {
        LOGI("Reading KTEX from stdin");
        data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream f(filename, std::ios::binary);
        if (!f) {
            LOGE("cannot open", filename);
            return 1;
        }
        LOGI("Reading", filename);
        data.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
    LOGD("Input size (bytes):", data.size());

    ktex::Container c;
    try {
        c = ktex::decode(std::move(data));
    } catch (const ktex::Error& e) {
        LOGE("parsing", filename, "(" + std::string(ktex::to_string(e.kind())) + "):", e.what());
        return 1;
    }

    const json doc = build_json(c);
    if (pretty)
        std::cout << std::setw(2) << doc << '\n';
    else
        std::cout << doc << '\n';

    LOGI("KTEX:", filename, ktex::to_string(c.header.pixel_format), ktex::to_string(c.header.texture_type),
         "levels:", c.mipmaps.size());
    return 0;
}
