/// @file blend_main.cpp
/// @brief CLI entry point for compositing a synthetic fragment scene.
///
/// Usage:
///   blend [-c <config.json>] [--mode <hard|sigmoid_alpha|softmax>]
///         [--sigma <F>] [--gamma <F>] [--background <r,g,b>]
///         [--znear <F>] [--zfar <F>] [--aggregation <log_sum|product>]
///         [-W <N>] [-H <N>] [-k <N>] [--batch <N>]
///         [-o <stats.json>] [--save-image <image.pt>] [--verbose]

#include "blending/blending.hpp"
#include "blending/composite_stats.hpp"
#include "data/synthetic_scene.hpp"
#include "utils/blend_config.hpp"

#include <spdlog/spdlog.h>
#include <torch/torch.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout
        << "Differentiable Fragment Compositor\n"
        << "\n"
        << "Usage: " << program << " [options]\n"
        << "\n"
        << "Blending:\n"
        << "  -c, --config <path>       JSON blend config (flags below override it)\n"
        << "  --mode <name>             hard, sigmoid_alpha or softmax (default: softmax)\n"
        << "  --sigma <F>               Edge sharpness (default: 1e-4)\n"
        << "  --gamma <F>               Depth sharpness (default: 1e-4)\n"
        << "  --background <r,g,b>      Background color in [0, 1] (default: 1,1,1)\n"
        << "  --znear <F>               Near clipping plane (default: 1)\n"
        << "  --zfar <F>                Far clipping plane (default: 100)\n"
        << "  --aggregation <name>      Alpha formulation: log_sum or product (default: log_sum)\n"
        << "\n"
        << "Scene:\n"
        << "  -W, --width <N>           Image width (default: 64)\n"
        << "  -H, --height <N>          Image height (default: 64)\n"
        << "  -k, --faces-per-pixel <N> Candidate faces per pixel (default: 4)\n"
        << "  --batch <N>               Copies of the scene in the batch (default: 1)\n"
        << "  --blur <F>                Blur radius in pixels (default: 1)\n"
        << "\n"
        << "Output:\n"
        << "  -o, --output <path>       Stats JSON file (default: blend_stats.json)\n"
        << "  --save-image <path>       Serialize the RGBA tensor with torch::save\n"
        << "  --cuda                    Composite on the GPU when available\n"
        << "  -v, --verbose             Debug logging\n"
        << "  -h, --help                Show this help message\n";
}

/// @brief Simple arg parser. Returns true if arg matches short or long form.
bool arg_matches(const char* arg, const char* short_form, const char* long_form) {
    return (short_form && std::strcmp(arg, short_form) == 0) ||
           (long_form && std::strcmp(arg, long_form) == 0);
}

/// @brief Parse "r,g,b" into three floats.
bool parse_rgb(const char* text, std::array<float, 3>& out) {
    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (std::sscanf(text, "%f,%f,%f", &r, &g, &b) != 3) {
        return false;
    }
    out = {r, g, b};
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_path;
    std::filesystem::path output_path = "blend_stats.json";
    std::filesystem::path image_path;
    dblend::DiskSceneSettings scene_settings;
    int batch = 1;
    bool use_cuda = false;

    // Flag overrides, applied after the config file is read.
    const char* mode_name = nullptr;
    const char* aggregation_name = nullptr;
    const char* sigma = nullptr;
    const char* gamma = nullptr;
    const char* znear = nullptr;
    const char* zfar = nullptr;
    const char* background = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (arg_matches(argv[i], "-h", "--help")) {
            print_usage(argv[0]);
            return 0;
        }
        if (arg_matches(argv[i], "-c", "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--mode") && i + 1 < argc) {
            mode_name = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--sigma") && i + 1 < argc) {
            sigma = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--gamma") && i + 1 < argc) {
            gamma = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--background") && i + 1 < argc) {
            background = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--znear") && i + 1 < argc) {
            znear = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--zfar") && i + 1 < argc) {
            zfar = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--aggregation") && i + 1 < argc) {
            aggregation_name = argv[++i];
        } else if (arg_matches(argv[i], "-W", "--width") && i + 1 < argc) {
            scene_settings.width = std::atoi(argv[++i]);
        } else if (arg_matches(argv[i], "-H", "--height") && i + 1 < argc) {
            scene_settings.height = std::atoi(argv[++i]);
        } else if (arg_matches(argv[i], "-k", "--faces-per-pixel") && i + 1 < argc) {
            scene_settings.faces_per_pixel = std::atoi(argv[++i]);
        } else if (arg_matches(argv[i], nullptr, "--batch") && i + 1 < argc) {
            batch = std::atoi(argv[++i]);
        } else if (arg_matches(argv[i], nullptr, "--blur") && i + 1 < argc) {
            scene_settings.blur_radius_px = static_cast<float>(std::atof(argv[++i]));
        } else if (arg_matches(argv[i], "-o", "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--save-image") && i + 1 < argc) {
            image_path = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--cuda")) {
            use_cuda = true;
        } else if (arg_matches(argv[i], "-v", "--verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::error("Unknown argument: {}", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (scene_settings.width <= 0 || scene_settings.height <= 0) {
        spdlog::error("Image size must be positive");
        return 1;
    }
    if (scene_settings.faces_per_pixel <= 0) {
        spdlog::error("Faces per pixel must be positive");
        return 1;
    }
    if (batch <= 0) {
        spdlog::error("Batch size must be positive");
        return 1;
    }

    try {
        dblend::BlendConfig config;
        if (!config_path.empty()) {
            spdlog::info("Loading config: {}", config_path.string());
            config = dblend::load_blend_config(config_path);
        }

        if (mode_name) config.mode = dblend::blend_mode_from_string(mode_name);
        if (aggregation_name) {
            config.aggregation = dblend::alpha_aggregation_from_string(aggregation_name);
        }
        if (sigma) config.params.sigma = static_cast<float>(std::atof(sigma));
        if (gamma) config.params.gamma = static_cast<float>(std::atof(gamma));
        if (znear) config.params.znear = static_cast<float>(std::atof(znear));
        if (zfar)  config.params.zfar  = static_cast<float>(std::atof(zfar));
        if (background && !parse_rgb(background, config.params.background_color)) {
            spdlog::error("Background must be given as r,g,b, got '{}'", background);
            return 1;
        }
        config.params.validate();

        torch::Device device = torch::kCPU;
        if (use_cuda) {
            if (torch::cuda::is_available()) {
                device = torch::kCUDA;
            } else {
                spdlog::warn("CUDA requested but not available; compositing on CPU");
            }
        }

        // Build the scene.
        auto disks = dblend::default_disks(scene_settings.width, scene_settings.height);
        auto single = dblend::make_disk_scene(disks, scene_settings);
        auto scene = dblend::stack_scenes(std::vector<dblend::SyntheticScene>(
            static_cast<size_t>(batch), single));
        scene.fragments.to_device(device);
        scene.colors = scene.colors.to(device);

        spdlog::info("Compositing {} x {}x{} (K={}) with mode '{}' on {}",
                     batch, scene_settings.width, scene_settings.height,
                     scene_settings.faces_per_pixel, dblend::to_string(config.mode),
                     device.is_cuda() ? "CUDA" : "CPU");

        auto t_start = std::chrono::steady_clock::now();
        torch::Tensor image;
        {
            torch::NoGradGuard no_grad;
            image = dblend::blend(config.mode, scene.colors, scene.fragments,
                                  config.params, config.aggregation);
        }
        auto elapsed = std::chrono::steady_clock::now() - t_start;

        auto stats = dblend::compute_composite_stats(image);
        stats.mode = dblend::to_string(config.mode);
        stats.blend_time_seconds = std::chrono::duration<float>(elapsed).count();

        // Print summary table.
        std::cout << "\n";
        std::cout << "=== Composite Results ===\n";
        std::cout << "  Mode:        " << stats.mode << "\n";
        std::cout << "  Images:      " << stats.num_images << " x "
                  << stats.width << "x" << stats.height << "\n";
        std::cout << "  Mean alpha:  " << stats.mean_alpha << "\n";
        std::cout << "  Coverage:    " << stats.coverage << "\n";
        std::cout << "  Mean RGB:    " << stats.mean_rgb[0] << ", "
                  << stats.mean_rgb[1] << ", " << stats.mean_rgb[2] << "\n";
        std::cout << "  Blend time:  " << stats.blend_time_seconds << " s\n";
        std::cout << "\n";

        stats.save_json(output_path);

        if (!image_path.empty()) {
            torch::save(image.cpu(), image_path.string());
            spdlog::info("Saved RGBA tensor to {}", image_path.string());
        }

    } catch (const std::exception& e) {
        spdlog::error("Compositing failed: {}", e.what());
        return 1;
    }

    return 0;
}
