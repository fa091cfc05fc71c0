#pragma once

/// @file blend_params.hpp
/// @brief Parameters shared by the sigmoid and softmax compositors.

#include <torch/torch.h>

#include <array>
#include <cstdint>

namespace dblend {

/// @brief Blend settings for the soft compositors.
///
/// sigma sets the width of the distance -> coverage sigmoid (smaller means
/// harder silhouette edges). gamma sets the sharpness of the depth -> weight
/// exponential (smaller means the nearest face dominates more strongly).
///
/// The background is either a single RGB triple broadcast across the whole
/// batch (background_color), or a per-batch tensor (background, [N, 3]),
/// which takes precedence when defined. A [3] tensor is also accepted.
struct BlendParams {
    float sigma = 1e-4f;
    float gamma = 1e-4f;
    std::array<float, 3> background_color = {1.0f, 1.0f, 1.0f};

    /// Optional background override, [3] or [N, 3]. Undefined by default.
    torch::Tensor background;

    /// Clipping planes used to normalise depth into [0, 1] before the
    /// softmax weighting.
    float znear = 1.0f;
    float zfar  = 100.0f;

    /// @brief Throw c10::Error if sigma/gamma are not positive or the
    ///        clipping planes are inverted.
    void validate() const;

    /// @brief Resolve the background to a tensor broadcastable against an
    ///        [N, H, W, 3] image, i.e. shaped [1, 1, 1, 3] or [N, 1, 1, 3].
    ///
    /// @param batch_size N of the image being composited.
    /// @param options    dtype/device of the image.
    /// @throws c10::Error if a per-batch background does not have N rows.
    torch::Tensor resolve_background(int64_t batch_size,
                                     const torch::TensorOptions& options) const;
};

} // namespace dblend
