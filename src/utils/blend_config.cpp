/// @file blend_config.cpp
/// @brief BlendConfig JSON parsing and serialization.

#include "utils/blend_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace dblend {
namespace {

/// @brief Read an optional float key, leaving `out` untouched if absent.
void read_float(const nlohmann::json& j, const char* key, float& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a number");
    }
    out = it->get<float>();
}

} // namespace

BlendConfig blend_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Blend config must be a JSON object");
    }

    BlendConfig config;

    if (auto it = j.find("mode"); it != j.end()) {
        if (!it->is_string()) {
            throw std::runtime_error("Config key 'mode' must be a string");
        }
        config.mode = blend_mode_from_string(it->get<std::string>());
    }
    if (auto it = j.find("alpha_aggregation"); it != j.end()) {
        if (!it->is_string()) {
            throw std::runtime_error("Config key 'alpha_aggregation' must be a string");
        }
        config.aggregation = alpha_aggregation_from_string(it->get<std::string>());
    }

    read_float(j, "sigma", config.params.sigma);
    read_float(j, "gamma", config.params.gamma);
    read_float(j, "znear", config.params.znear);
    read_float(j, "zfar", config.params.zfar);

    if (auto it = j.find("background_color"); it != j.end()) {
        if (!it->is_array() || it->size() != 3) {
            throw std::runtime_error("Config key 'background_color' must be an [r, g, b] array");
        }
        for (size_t c = 0; c < 3; ++c) {
            if (!(*it)[c].is_number()) {
                throw std::runtime_error("Config key 'background_color' must hold numbers");
            }
            config.params.background_color[c] = (*it)[c].get<float>();
        }
    }

    for (const auto& item : j.items()) {
        const auto& key = item.key();
        if (key != "mode" && key != "alpha_aggregation" && key != "sigma" &&
            key != "gamma" && key != "znear" && key != "zfar" &&
            key != "background_color") {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }

    return config;
}

BlendConfig load_blend_config(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() +
                                 ": " + e.what());
    }

    auto config = blend_config_from_json(j);
    spdlog::debug("Loaded blend config {} (mode={}, sigma={}, gamma={})",
                  path.string(), to_string(config.mode),
                  config.params.sigma, config.params.gamma);
    return config;
}

std::string BlendConfig::to_json() const {
    nlohmann::json j;
    j["mode"] = to_string(mode);
    j["alpha_aggregation"] = to_string(aggregation);
    j["sigma"] = params.sigma;
    j["gamma"] = params.gamma;
    j["znear"] = params.znear;
    j["zfar"] = params.zfar;
    j["background_color"] = {params.background_color[0],
                             params.background_color[1],
                             params.background_color[2]};
    return j.dump(2);
}

void BlendConfig::save_json(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    ofs << to_json() << "\n";
    spdlog::info("Saved blend config to {}", path.string());
}

} // namespace dblend
