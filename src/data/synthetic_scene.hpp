#pragma once

/// @file synthetic_scene.hpp
/// @brief Analytic fragment generator for flat-shaded 2D disks.
///
/// Produces the same per-pixel top-K data a mesh rasterizer would hand to
/// the compositors, for scenes simple enough to reason about in tests and
/// demos: every primitive is a disk at constant depth with a constant color,
/// and its signed distance at a pixel is |p - c| - r.

#include "core/fragments.hpp"

#include <Eigen/Core>
#include <torch/torch.h>

#include <cstdint>
#include <vector>

namespace dblend {

/// @brief One flat disk in pixel coordinates.
struct Disk {
    Eigen::Vector2f center = Eigen::Vector2f::Zero();  // pixel units, (x, y)
    float radius = 1.0f;                               // pixels
    float depth = 10.0f;                               // view-space z
    Eigen::Vector3f color = Eigen::Vector3f::Ones();   // RGB in [0, 1]
};

/// @brief Fragments plus the per-slot colors that go with them.
struct SyntheticScene {
    Fragments fragments;  // [N, H, W, K]
    torch::Tensor colors; // [N, H, W, K, 3], float32
};

/// @brief Settings for make_disk_scene().
struct DiskSceneSettings {
    int width = 64;
    int height = 64;
    int faces_per_pixel = 4;

    /// A disk is kept at a pixel while its signed distance is below this
    /// many pixels, so soft edges see faces slightly outside their
    /// silhouette. Distances are stored in normalised device units
    /// (pixels * 2 / min(width, height)), matching what the compositors'
    /// default sigma expects.
    float blur_radius_px = 1.0f;
};

/// @brief Rasterize a list of disks into top-K fragments, nearest first.
///
/// Padding slots get pix_to_face = -1, dists = -1 and zbuf = -1.
///
/// @param disks    Primitives; the face index is the position in this list.
/// @param settings Image size, K and blur radius.
/// @return Single-image scene (N = 1) on CPU.
/// @throws std::invalid_argument on non-positive sizes.
SyntheticScene make_disk_scene(const std::vector<Disk>& disks,
                               const DiskSceneSettings& settings);

/// @brief A fixed scene of three overlapping disks at different depths.
std::vector<Disk> default_disks(int width, int height);

/// @brief Concatenate scenes along the batch axis.
/// @throws c10::Error if H, W or K differ.
SyntheticScene stack_scenes(const std::vector<SyntheticScene>& scenes);

} // namespace dblend
