#pragma once

/// @file composite_stats.hpp
/// @brief Summary statistics of a composited RGBA batch.

#include <torch/torch.h>

#include <filesystem>
#include <string>

namespace dblend {

/// @brief Aggregate figures for an [N, H, W, 4] compositor output.
struct CompositeStats {
    std::string mode;
    int num_images = 0;
    int height = 0;
    int width = 0;
    float mean_alpha = 0.0f;
    float coverage = 0.0f;             ///< Fraction of pixels with alpha > 0.5
    float mean_rgb[3] = {0.0f, 0.0f, 0.0f};
    float min_value = 0.0f;            ///< Smallest channel value in the batch
    float max_value = 0.0f;            ///< Largest channel value in the batch
    float blend_time_seconds = 0.0f;

    /// @brief Serialize to JSON string (pretty-printed).
    std::string to_json() const;

    /// @brief Write JSON to file.
    /// @throws std::runtime_error if the file cannot be opened.
    void save_json(const std::filesystem::path& path) const;
};

/// @brief Compute statistics of an RGBA image batch.
///
/// @param image Compositor output [N, H, W, 4], floating, any device.
/// @return CompositeStats with mode and timing left at their defaults.
CompositeStats compute_composite_stats(const torch::Tensor& image);

} // namespace dblend
