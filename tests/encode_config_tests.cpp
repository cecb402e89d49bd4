#include <gtest/gtest.h>

#include "../tools/common/encode_config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ktextools;
using json = nlohmann::ordered_json;

namespace {

fs::path write_config(const std::string& name, const std::string& text) {
    const auto dir = fs::temp_directory_path() / "ktextools_encode_config_tests";
    std::error_code ec;
    fs::create_directories(dir, ec);
    const auto path = dir / name;
    std::ofstream f(path);
    f << text;
    return path;
}

// Feeds argv-style flags through EncodeFlags and returns the resulting options.
ktex::EncodeOptions parse_flags(std::vector<std::string> args) {
    std::vector<char*> argv;
    static char prog[] = "tga2ktex";
    argv.push_back(prog);
    for (auto& a : args) argv.push_back(a.data());
    cli::EncodeFlags flags;
    const int argc = static_cast<int>(argv.size());
    for (int i = 1; i < argc; i++) {
        if (!flags.consume(argc, argv.data(), i))
            throw std::runtime_error("unexpected argument " + std::string(argv[static_cast<size_t>(i)]));
    }
    return flags.finish();
}

} // namespace

TEST(EncodeConfig, DefaultsWithoutConfig) {
    auto opts = parse_flags({});
    EXPECT_EQ(opts.platform, ktex::Platform::Default);
    EXPECT_EQ(opts.pixel_format, ktex::PixelFormat::BC3);
    EXPECT_EQ(opts.texture_type, ktex::TextureType::TwoD);
    EXPECT_EQ(opts.premultiply, ktex::Premultiply::Absent);
    EXPECT_TRUE(opts.generate_mipmaps);
    EXPECT_EQ(opts.params.algorithm, bcn::Algorithm::ClusterFit);
    EXPECT_FALSE(opts.params.weigh_colour_by_alpha);
}

TEST(EncodeConfig, MapsEveryField) {
    const json doc = {
        {"platform", "pc"},
        {"pixelFormat", "dxt1"},
        {"textureType", "cube"},
        {"premultiplyAlpha", false},
        {"generateMipmaps", false},
        {"compressionAlgorithm", "iterative-cluster-fit"},
        {"colourWeights", "uniform"},
        {"weighColourByAlpha", true},
        {"comment", "ignored"},
    };
    ktex::EncodeOptions opts;
    cli::apply_config(doc, opts);
    EXPECT_EQ(opts.platform, ktex::Platform::PC);
    EXPECT_EQ(opts.pixel_format, ktex::PixelFormat::BC1);
    EXPECT_EQ(opts.texture_type, ktex::TextureType::CubeMapped);
    EXPECT_EQ(opts.premultiply, ktex::Premultiply::No);
    EXPECT_FALSE(opts.generate_mipmaps);
    EXPECT_EQ(opts.params.algorithm, bcn::Algorithm::IterativeClusterFit);
    EXPECT_EQ(opts.params.weights, bcn::k_weights_uniform);
    EXPECT_TRUE(opts.params.weigh_colour_by_alpha);
}

TEST(EncodeConfig, RejectsWrongTypesAndNames) {
    ktex::EncodeOptions opts;
    EXPECT_THROW(cli::apply_config(json{{"generateMipmaps", "yes"}}, opts), std::runtime_error);
    EXPECT_THROW(cli::apply_config(json{{"premultiplyAlpha", 1}}, opts), std::runtime_error);
    EXPECT_THROW(cli::apply_config(json{{"pixelFormat", 3}}, opts), std::runtime_error);
    EXPECT_THROW(cli::apply_config(json{{"pixelFormat", "bc7"}}, opts), std::runtime_error);
    EXPECT_THROW(cli::apply_config(json{{"compressionAlgorithm", "fast"}}, opts), std::runtime_error);
    EXPECT_THROW(cli::apply_config(json::array({1, 2}), opts), std::runtime_error);
}

TEST(EncodeConfig, FlagsOverrideFileValues) {
    const auto path = write_config("override.json", R"({
        "platform": "ps3",
        "pixelFormat": "bc2",
        "generateMipmaps": false,
        "compressionAlgorithm": "range-fit"
    })");

    auto from_file = parse_flags({"--config", path.string()});
    EXPECT_EQ(from_file.platform, ktex::Platform::PS3);
    EXPECT_EQ(from_file.pixel_format, ktex::PixelFormat::BC2);
    EXPECT_FALSE(from_file.generate_mipmaps);
    EXPECT_EQ(from_file.params.algorithm, bcn::Algorithm::RangeFit);

    // Flag order relative to --config does not matter.
    auto overridden = parse_flags({"-format", "rgba", "--config", path.string(), "-premultiply", "y"});
    EXPECT_EQ(overridden.platform, ktex::Platform::PS3);
    EXPECT_EQ(overridden.pixel_format, ktex::PixelFormat::RGBA);
    EXPECT_EQ(overridden.premultiply, ktex::Premultiply::Yes);
    EXPECT_FALSE(overridden.generate_mipmaps);
}

TEST(EncodeConfig, BadConfigFileIsReported) {
    EXPECT_THROW(parse_flags({"--config", "/nonexistent/ktex.json"}), std::runtime_error);
    const auto path = write_config("broken.json", "{ \"platform\": ");
    EXPECT_THROW(parse_flags({"--config", path.string()}), std::runtime_error);
    EXPECT_THROW(parse_flags({"-premultiply", "maybe"}), std::runtime_error);
    EXPECT_THROW(parse_flags({"-format"}), std::runtime_error);
}
