/// @file composite_stats.cpp
/// @brief Composite statistics and their JSON form.

#include "blending/composite_stats.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace dblend {

CompositeStats compute_composite_stats(const torch::Tensor& image) {
    TORCH_CHECK(image.dim() == 4 && image.size(3) == 4,
                "composite stats: expected [N, H, W, 4] image, got ", image.sizes());
    TORCH_CHECK(image.is_floating_point(),
                "composite stats: image must be floating point, got ", image.dtype());

    torch::NoGradGuard no_grad;
    auto img = image.detach().to(torch::kCPU, torch::kFloat32);

    CompositeStats stats;
    stats.num_images = static_cast<int>(img.size(0));
    stats.height = static_cast<int>(img.size(1));
    stats.width = static_cast<int>(img.size(2));

    if (img.numel() == 0) {
        return stats;
    }

    auto alpha = img.select(3, 3);
    stats.mean_alpha = alpha.mean().item<float>();
    stats.coverage = alpha.gt(0.5).to(torch::kFloat32).mean().item<float>();

    auto rgb_mean = img.slice(3, 0, 3).reshape({-1, 3}).mean(/*dim=*/0);
    auto rgb_a = rgb_mean.accessor<float, 1>();
    for (int c = 0; c < 3; ++c) {
        stats.mean_rgb[c] = rgb_a[c];
    }

    stats.min_value = img.min().item<float>();
    stats.max_value = img.max().item<float>();
    return stats;
}

std::string CompositeStats::to_json() const {
    nlohmann::json j;
    j["mode"] = mode;
    j["num_images"] = num_images;
    j["height"] = height;
    j["width"] = width;
    j["mean_alpha"] = mean_alpha;
    j["coverage"] = coverage;
    j["mean_rgb"] = {mean_rgb[0], mean_rgb[1], mean_rgb[2]};
    j["min_value"] = min_value;
    j["max_value"] = max_value;
    j["blend_time_seconds"] = blend_time_seconds;
    return j.dump(2);
}

void CompositeStats::save_json(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    ofs << to_json() << "\n";
    spdlog::info("Saved composite stats to {}", path.string());
}

} // namespace dblend
