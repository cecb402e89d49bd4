#pragma once

#include "ktextools/bcn.h"
#include "ktextools/ktex.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ktextools::cli {

using json = nlohmann::ordered_json;

namespace detail {

inline std::string value_name(const json& v, const char* key) {
    if (!v.is_string())
        throw std::runtime_error(std::string("config: \"") + key + "\" must be a string");
    return v.get<std::string>();
}

inline bool value_bool(const json& v, const char* key) {
    if (!v.is_boolean())
        throw std::runtime_error(std::string("config: \"") + key + "\" must be a boolean");
    return v.get<bool>();
}

inline void set_platform(ktex::EncodeOptions& opts, const std::string& name) {
    auto p = ktex::parse_platform(name);
    if (!p) throw std::runtime_error("unknown platform: " + name);
    opts.platform = *p;
}

inline void set_pixel_format(ktex::EncodeOptions& opts, const std::string& name) {
    auto f = ktex::parse_pixel_format(name);
    if (!f) throw std::runtime_error("unknown pixel format: " + name);
    opts.pixel_format = *f;
}

inline void set_texture_type(ktex::EncodeOptions& opts, const std::string& name) {
    auto t = ktex::parse_texture_type(name);
    if (!t) throw std::runtime_error("unknown texture type: " + name);
    opts.texture_type = *t;
}

inline void set_algorithm(ktex::EncodeOptions& opts, const std::string& name) {
    auto a = bcn::parse_algorithm(name);
    if (!a) throw std::runtime_error("unknown compression algorithm: " + name);
    opts.params.algorithm = *a;
}

inline void set_weights(ktex::EncodeOptions& opts, const std::string& name) {
    if (name == "perceptual")
        opts.params.weights = bcn::k_weights_perceptual;
    else if (name == "uniform")
        opts.params.weights = bcn::k_weights_uniform;
    else
        throw std::runtime_error("unknown colour weights: " + name);
}

} // namespace detail

// apply_config overlays the fields present in a JSON object onto opts.
// Unknown keys are ignored.
inline void apply_config(const json& doc, ktex::EncodeOptions& opts) {
    if (!doc.is_object()) throw std::runtime_error("config: top level must be an object");
    if (doc.contains("platform"))
        detail::set_platform(opts, detail::value_name(doc["platform"], "platform"));
    if (doc.contains("pixelFormat"))
        detail::set_pixel_format(opts, detail::value_name(doc["pixelFormat"], "pixelFormat"));
    if (doc.contains("textureType"))
        detail::set_texture_type(opts, detail::value_name(doc["textureType"], "textureType"));
    if (doc.contains("premultiplyAlpha"))
        opts.premultiply = detail::value_bool(doc["premultiplyAlpha"], "premultiplyAlpha")
                               ? ktex::Premultiply::Yes
                               : ktex::Premultiply::No;
    if (doc.contains("generateMipmaps"))
        opts.generate_mipmaps = detail::value_bool(doc["generateMipmaps"], "generateMipmaps");
    if (doc.contains("compressionAlgorithm"))
        detail::set_algorithm(opts, detail::value_name(doc["compressionAlgorithm"], "compressionAlgorithm"));
    if (doc.contains("colourWeights"))
        detail::set_weights(opts, detail::value_name(doc["colourWeights"], "colourWeights"));
    if (doc.contains("weighColourByAlpha"))
        opts.params.weigh_colour_by_alpha =
            detail::value_bool(doc["weighColourByAlpha"], "weighColourByAlpha");
}

inline void load_config(const std::string& path, ktex::EncodeOptions& opts) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open config " + path);
    json doc;
    try {
        doc = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("config " + path + ": " + e.what());
    }
    apply_config(doc, opts);
}

inline void print_encode_flags() {
    print("  --config <file>      JSON file with encode options");
    print("  -platform <name>     default, pc, ps3, xbox360");
    print("  -format <name>       bc1, bc2, bc3, rgba, rgb (default bc3)");
    print("  -type <name>         1d, 2d, 3d, cube (default 2d)");
    print("  -premultiply <y|n>   Override alpha premultiplication");
    print("  -no-mipmaps          Store only the base level");
    print("  -algorithm <name>    range-fit, cluster-fit, iterative-cluster-fit");
    print("  -weights <name>      perceptual or uniform colour weights");
    print("  -weigh-alpha         Weigh colour error by alpha");
}

// EncodeFlags collects encode flags from argv. Config file values are applied
// first in finish(), then the flags on top of them.
class EncodeFlags {
public:
    // consume returns true if argv[i] (and possibly argv[i+1]) was an encode flag.
    bool consume(int argc, char* argv[], int& i) {
        const char* a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error(std::string("missing value for ") + a);
            return argv[++i];
        };
        if (std::strcmp(a, "--config") == 0) {
            config_path_ = value();
        } else if (std::strcmp(a, "-platform") == 0) {
            overrides_["platform"] = value();
        } else if (std::strcmp(a, "-format") == 0) {
            overrides_["pixelFormat"] = value();
        } else if (std::strcmp(a, "-type") == 0) {
            overrides_["textureType"] = value();
        } else if (std::strcmp(a, "-premultiply") == 0) {
            const std::string v = value();
            if (v == "y" || v == "yes" || v == "true" || v == "1")
                overrides_["premultiplyAlpha"] = true;
            else if (v == "n" || v == "no" || v == "false" || v == "0")
                overrides_["premultiplyAlpha"] = false;
            else
                throw std::runtime_error("invalid -premultiply value: " + v);
        } else if (std::strcmp(a, "-no-mipmaps") == 0) {
            overrides_["generateMipmaps"] = false;
        } else if (std::strcmp(a, "-algorithm") == 0) {
            overrides_["compressionAlgorithm"] = value();
        } else if (std::strcmp(a, "-weights") == 0) {
            overrides_["colourWeights"] = value();
        } else if (std::strcmp(a, "-weigh-alpha") == 0) {
            overrides_["weighColourByAlpha"] = true;
        } else {
            return false;
        }
        return true;
    }

    [[nodiscard]] ktex::EncodeOptions finish() const {
        ktex::EncodeOptions opts;
        if (!config_path_.empty()) load_config(config_path_, opts);
        apply_config(overrides_, opts);
        return opts;
    }

private:
    std::string config_path_;
    json overrides_ = json::object();
};

} // namespace ktextools::cli
