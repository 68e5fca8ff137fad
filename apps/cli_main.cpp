#include "astro_compute/compute/dispatcher.hpp"
#include "astro_compute/config/configuration.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/types.hpp"
#include "astro_compute/core/utils.hpp"
#include "astro_compute/image/stats.hpp"
#include "astro_compute/registration/alignment.hpp"
#include "astro_compute/registration/correlation.hpp"
#include "astro_compute/tonemap/stf.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using astro_compute::Matrix2Df;
using astro_compute::PackedImage;
using astro_compute::Roi;
using astro_compute::StfParams;
using astro_compute::compute::ComputeDispatcher;
using astro_compute::config::Config;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static Config load_config(const std::string& path) {
    Config cfg = path.empty() ? Config{} : Config::load(path);
    cfg.validate();
    return cfg;
}

static int parse_int(const std::string& value, const char* name) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw astro_compute::ValidationError(std::string(name) + " expects an integer, got '" +
                                             value + "'");
    }
}

static float parse_float(const std::string& value, const char* name) {
    try {
        size_t used = 0;
        float v = std::stof(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw astro_compute::ValidationError(std::string(name) + " expects a number, got '" +
                                             value + "'");
    }
}

static Roi parse_roi(const std::string& text) {
    std::vector<std::string> parts = astro_compute::core::split(text, ',');
    if (parts.size() != 4) {
        throw astro_compute::ValidationError("--roi expects x,y,w,h, got '" + text + "'");
    }
    Roi roi;
    roi.x = static_cast<uint32_t>(parse_int(astro_compute::core::trim(parts[0]), "--roi x"));
    roi.y = static_cast<uint32_t>(parse_int(astro_compute::core::trim(parts[1]), "--roi y"));
    roi.w = static_cast<uint32_t>(parse_int(astro_compute::core::trim(parts[2]), "--roi w"));
    roi.h = static_cast<uint32_t>(parse_int(astro_compute::core::trim(parts[3]), "--roi h"));
    return roi;
}

static json dispatcher_json(const ComputeDispatcher& dispatcher) {
    json j;
    j["backend"] = dispatcher.backend_name();
    j["device"] = dispatcher.device_description();
    j["fallback"] = dispatcher.using_fallback();
    if (dispatcher.using_fallback()) {
        j["fallback_reason"] = dispatcher.fallback_reason();
    }
    return j;
}

// ============================================================================
// probe [--config <path>]
// ============================================================================
int cmd_probe(const std::string& config_path) {
    Config cfg = load_config(config_path);
    ComputeDispatcher dispatcher(cfg, &std::cerr);

    json result = dispatcher_json(dispatcher);
    result["session_id"] = dispatcher.session_id();
    result["requested"] = cfg.compute.backend;
    result["opencl_compiled"] = astro_compute::compute::opencl_compiled();
    print_json(result);
    return 0;
}

int cmd_get_schema() {
    std::cout << astro_compute::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        Config cfg = Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const astro_compute::AstroComputeError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// tonemap --input <f32> --width W --height H --output <png>
//         [--auto | --shadow S --midtone M --highlight H] [--config <path>]
// ============================================================================
struct ToneMapArgs {
    std::string input;
    std::string output;
    int width = 0;
    int height = 0;
    bool auto_stretch = false;
    StfParams stf;
};

int cmd_tonemap(const ToneMapArgs& args, const std::string& config_path) {
    Config cfg = load_config(config_path);
    Matrix2Df pixels = astro_compute::core::read_raw_f32(args.input, args.width, args.height);

    const astro_compute::image::ImageStats stats =
        astro_compute::image::compute_image_stats(pixels);
    float data_min = 0.0f;
    float data_max = 1.0f;
    if (stats.valid_count > 0) {
        data_min = static_cast<float>(stats.min);
        data_max = static_cast<float>(stats.max);
    } else {
        std::cerr << "[TONEMAP] No valid pixels, using data range [0, 1]" << std::endl;
    }

    StfParams stf = args.stf;
    if (args.auto_stretch) {
        astro_compute::tonemap::AutoStfConfig auto_cfg;
        auto_cfg.target_background = cfg.stf.target_background;
        auto_cfg.shadow_k = cfg.stf.shadow_k;
        stf = astro_compute::tonemap::auto_stf(stats, auto_cfg);
    }

    ComputeDispatcher dispatcher(cfg, &std::cerr);
    PackedImage packed = dispatcher.tone_map(pixels, data_min, data_max, stf);

    cv::Mat gray(args.height, args.width, CV_8UC1);
    for (size_t i = 0; i < packed.size(); ++i) {
        gray.data[i] = static_cast<uint8_t>(packed[i] & 0xFFu);
    }
    if (!cv::imwrite(args.output, gray)) {
        throw astro_compute::IOError("Cannot write image: " + args.output);
    }

    json result = dispatcher_json(dispatcher);
    result["output"] = args.output;
    result["data_min"] = data_min;
    result["data_max"] = data_max;
    result["stf"] = {{"shadow", stf.shadow}, {"midtone", stf.midtone},
                     {"highlight", stf.highlight}};
    print_json(result);
    return 0;
}

// ============================================================================
// offset --reference <f32> --target <f32> --width W --height H
//        [--max-shift N] [--roi x,y,w,h] [--pyramid] [--config <path>]
// ============================================================================
struct OffsetArgs {
    std::string reference;
    std::string target;
    int width = 0;
    int height = 0;
    std::optional<int> max_shift; // unset = correlation.max_shift from config
    std::string roi;
    bool pyramid = false;
};

int cmd_offset(const OffsetArgs& args, const std::string& config_path) {
    Config cfg = load_config(config_path);
    Matrix2Df ref = astro_compute::core::read_raw_f32(args.reference, args.width, args.height);
    Matrix2Df tgt = astro_compute::core::read_raw_f32(args.target, args.width, args.height);
    const int max_shift = args.max_shift.value_or(cfg.correlation.max_shift);

    ComputeDispatcher dispatcher(cfg, &std::cerr);
    astro_compute::OffsetMatch match;
    json result;
    if (args.pyramid) {
        match = astro_compute::registration::find_offset_pyramid(dispatcher, ref, tgt,
                                                                 cfg.correlation);
        result["mode"] = "pyramid";
    } else {
        const Roi roi = args.roi.empty()
            ? astro_compute::registration::centered_roi(static_cast<uint32_t>(args.width),
                                                        static_cast<uint32_t>(args.height))
            : parse_roi(args.roi);
        match = dispatcher.find_offset(ref, tgt, roi, max_shift);
        result["mode"] = "direct";
        result["roi"] = {roi.x, roi.y, roi.w, roi.h};
        result["max_shift"] = max_shift;
    }

    result["dx"] = match.dx;
    result["dy"] = match.dy;
    result["score"] = match.score.wire_value();
    result["status"] = astro_compute::score_status_to_string(match.score.status);
    result["has_match"] = match.has_match();
    result["compute"] = dispatcher_json(dispatcher);
    print_json(result);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: astro_compute_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  probe [--config C]              Select a compute backend and report it\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config --path P [--strict-exit-codes]  Validate config\n"
              << "  tonemap --input F --width W --height H --output PNG\n"
              << "          [--auto | --shadow S --midtone M --highlight H] [--config C]\n"
              << "                                  Stretch raw float32 samples to 8-bit\n"
              << "  offset --reference A --target B --width W --height H\n"
              << "         [--max-shift N] [--roi x,y,w,h] [--pyramid] [--config C]\n"
              << "                                  Integer offset of B relative to A\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto require_arg = [&](const char* name) -> std::string {
        std::string value = get_arg(name);
        if (value.empty()) {
            throw astro_compute::ValidationError(command + " requires " + name);
        }
        return value;
    };

    try {
        if (command == "probe") {
            return cmd_probe(get_arg("--config"));
        }

        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            if (path.empty()) {
                std::cerr << "validate-config requires --path\n";
                return 1;
            }
            return cmd_validate_config(path, has_flag("--strict-exit-codes"));
        }

        if (command == "tonemap") {
            ToneMapArgs args;
            args.input = require_arg("--input");
            args.output = require_arg("--output");
            args.width = parse_int(require_arg("--width"), "--width");
            args.height = parse_int(require_arg("--height"), "--height");
            args.auto_stretch = has_flag("--auto");
            if (!get_arg("--shadow").empty())
                args.stf.shadow = parse_float(get_arg("--shadow"), "--shadow");
            if (!get_arg("--midtone").empty())
                args.stf.midtone = parse_float(get_arg("--midtone"), "--midtone");
            if (!get_arg("--highlight").empty())
                args.stf.highlight = parse_float(get_arg("--highlight"), "--highlight");
            return cmd_tonemap(args, get_arg("--config"));
        }

        if (command == "offset") {
            OffsetArgs args;
            args.reference = require_arg("--reference");
            args.target = require_arg("--target");
            args.width = parse_int(require_arg("--width"), "--width");
            args.height = parse_int(require_arg("--height"), "--height");
            if (!get_arg("--max-shift").empty())
                args.max_shift = parse_int(get_arg("--max-shift"), "--max-shift");
            args.roi = get_arg("--roi");
            args.pyramid = has_flag("--pyramid");
            return cmd_offset(args, get_arg("--config"));
        }
    } catch (const astro_compute::AstroComputeError& e) {
        print_json(json{{"ok", false}, {"error", e.what()}});
        return 1;
    } catch (const cv::Exception& e) {
        print_json(json{{"ok", false}, {"error", e.what()}});
        return 1;
    }

    print_usage();
    return 1;
}
