#pragma once

/// @file blend_config.hpp
/// @brief JSON-backed configuration for a compositing run.
///
/// Example:
/// ```json
/// {
///   "mode": "softmax",
///   "sigma": 1e-4,
///   "gamma": 1e-4,
///   "background_color": [1.0, 1.0, 1.0],
///   "znear": 1.0,
///   "zfar": 100.0,
///   "alpha_aggregation": "log_sum"
/// }
/// ```
/// Every key is optional; missing keys keep the defaults below.

#include "blending/blending.hpp"
#include "core/blend_params.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace dblend {

/// @brief Everything a caller chooses before compositing.
struct BlendConfig {
    BlendMode mode = BlendMode::kSoftmax;
    BlendParams params;
    AlphaAggregation aggregation = AlphaAggregation::kLogSum;

    /// @brief Serialize to JSON string (pretty-printed). The per-batch
    ///        background tensor is not serialized.
    std::string to_json() const;

    /// @brief Write JSON to file.
    /// @throws std::runtime_error if the file cannot be opened.
    void save_json(const std::filesystem::path& path) const;
};

/// @brief Build a config from a parsed JSON object.
/// @throws std::runtime_error on unknown mode/aggregation names, a malformed
///         background_color, or a value of the wrong type.
BlendConfig blend_config_from_json(const nlohmann::json& j);

/// @brief Load and parse a JSON config file.
/// @throws std::runtime_error if the file is missing or not valid JSON.
BlendConfig load_blend_config(const std::filesystem::path& path);

} // namespace dblend
