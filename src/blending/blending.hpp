#pragma once

/// @file blending.hpp
/// @brief Public API for compositing the top-K faces of each pixel into an
///        RGBA image.
///
/// Three interchangeable strategies share one input contract:
///   - hard_rgb_blend:      nearest face color, alpha fixed at 1.
///   - sigmoid_alpha_blend: nearest face color, soft silhouette alpha.
///   - softmax_rgb_blend:   probability- and depth-weighted color plus
///                          background, soft silhouette alpha.
///
/// All of them are pure libtorch expressions, so the result is
/// differentiable w.r.t. colors, dists and zbuf through autograd, on
/// whatever device the inputs live on. Every result is [N, H, W, 4] (RGBA)
/// with rows flipped relative to the fragments (row 0 = top of the image).

#include "blending/visibility.hpp"
#include "core/blend_params.hpp"
#include "core/fragments.hpp"

#include <torch/torch.h>

#include <string>

namespace dblend {

/// @brief Selects a compositing strategy.
enum class BlendMode {
    kHard,
    kSigmoidAlpha,
    kSoftmax,
};

/// @brief Parse "hard" / "sigmoid_alpha" / "softmax".
/// @throws std::runtime_error on an unknown name.
BlendMode blend_mode_from_string(const std::string& name);

/// @brief Inverse of blend_mode_from_string().
const char* to_string(BlendMode mode);

/// @brief Flip an image along its row axis (dim 1).
///
/// Fragments are produced bottom-up; images are consumed top-down. Applying
/// the flip twice restores the input.
torch::Tensor flip_rows(const torch::Tensor& image);

/// @brief Naive compositing: RGB of the nearest slot (k = 0), alpha = 1.
///
/// Alpha is 1 even on pixels with no face at all, and slot 0 is used
/// whether or not it is padding. Not differentiable w.r.t. geometry.
///
/// @param colors    Per-slot colors [N, H, W, K, 3], floating.
/// @param fragments Rasterizer output; only pix_to_face is read (for shape).
/// @return RGBA image [N, H, W, 4], rows flipped.
torch::Tensor hard_rgb_blend(const torch::Tensor& colors, const Fragments& fragments);

/// @brief Silhouette compositing: RGB of the nearest slot, alpha from the
///        distance-based coverage probability of all K slots.
///
/// @param colors      Per-slot colors [N, H, W, K, 3], floating.
/// @param fragments   Rasterizer output; pix_to_face and dists are read.
/// @param params      Only sigma is used.
/// @param aggregation Alpha formulation.
/// @return RGBA image [N, H, W, 4] clamped to [0, 1], rows flipped.
torch::Tensor sigmoid_alpha_blend(const torch::Tensor& colors,
                                  const Fragments& fragments,
                                  const BlendParams& params,
                                  AlphaAggregation aggregation = AlphaAggregation::kLogSum);

/// @brief Normalised per-slot weights of the softmax compositor.
///
/// weights.sum(-1) + background_weight == 1 for every pixel, up to
/// floating-point error.
struct SoftmaxWeights {
    torch::Tensor weights;            ///< Per-slot weights [N, H, W, K]
    torch::Tensor background_weight;  ///< Background weight [N, H, W, 1]
    torch::Tensor alpha;              ///< Silhouette alpha [N, H, W], not clamped
};

/// @brief Compute the softmax compositor's weights without touching colors.
///
///   prob_k    = sigmoid(-d_k / sigma) * valid_k
///   z_inv_k   = (zfar - z_k) / (zfar - znear) * valid_k
///   w_k       = prob_k * exp((z_inv_k - max_j z_inv_j) / gamma)
///   delta     = exp(1e-10 / gamma) * 1e-10
///   weights_k = w_k / (sum_j w_j + delta)
///   bg_weight = delta / (sum_j w_j + delta)
///
/// Subtracting the per-pixel maximum keeps every exponent <= 0 without
/// changing the normalised ratios. delta stands in for the background as
/// an infinitely distant extra face.
///
/// @param fragments   Rasterizer output; all three tensors are read.
/// @param params      sigma, gamma, znear and zfar are used.
/// @param aggregation Alpha formulation.
SoftmaxWeights softmax_blend_weights(const Fragments& fragments,
                                     const BlendParams& params,
                                     AlphaAggregation aggregation = AlphaAggregation::kLogSum);

/// @brief Soft compositing of color and depth order (Liu et al., ICCV 2019).
///
/// RGB is the convex combination of the K slot colors and the background
/// given by softmax_blend_weights(); alpha is the silhouette alpha. A pixel
/// with no valid slot gets exactly the background color and alpha 0.
///
/// @param colors      Per-slot colors [N, H, W, K, 3], floating.
/// @param fragments   Rasterizer output; all three tensors are read.
/// @param params      All fields are used; see BlendParams for background
///                    broadcasting.
/// @param aggregation Alpha formulation.
/// @return RGBA image [N, H, W, 4] clamped to [0, 1], rows flipped.
torch::Tensor softmax_rgb_blend(const torch::Tensor& colors,
                                const Fragments& fragments,
                                const BlendParams& params,
                                AlphaAggregation aggregation = AlphaAggregation::kLogSum);

/// @brief Dispatch to the compositor selected by mode.
torch::Tensor blend(BlendMode mode,
                    const torch::Tensor& colors,
                    const Fragments& fragments,
                    const BlendParams& params,
                    AlphaAggregation aggregation = AlphaAggregation::kLogSum);

} // namespace dblend
