#pragma once

/// @file visibility.hpp
/// @brief Distance-based coverage probability and its aggregation to alpha.
///
/// Follows the silhouette model of Liu et al., "Soft Rasterizer: A
/// Differentiable Renderer for Image-based 3D Reasoning" (ICCV 2019):
///   prob_k = sigmoid(-d_k / sigma) * valid_k
///   alpha  = 1 - prod_k (1 - prob_k)
///
/// The probabilistic OR saturates to 1 as soon as a single face fully covers
/// the pixel and stays differentiable everywhere.

#include "core/fragments.hpp"

#include <torch/torch.h>

#include <string>

namespace dblend {

/// @brief How the K per-slot probabilities are folded into one alpha.
enum class AlphaAggregation {
    kLogSum,   ///< 1 - exp(sum(log(1 - p))). Preferred for large K.
    kProduct,  ///< 1 - prod(1 - p).
};

/// @brief Parse "log_sum" / "product".
/// @throws std::runtime_error on an unknown name.
AlphaAggregation alpha_aggregation_from_string(const std::string& name);

/// @brief Inverse of alpha_aggregation_from_string().
const char* to_string(AlphaAggregation aggregation);

/// @brief Per-slot coverage probability.
///
/// The distance is negative inside a face, so it is negated before the
/// sigmoid. Padding slots (pix_to_face < 0) are multiplied by zero.
///
/// @param fragments Rasterizer output (pix_to_face and dists are read).
/// @param sigma     Sigmoid width, > 0.
/// @return Probability map [N, H, W, K], same dtype as dists.
torch::Tensor coverage_probability(const Fragments& fragments, float sigma);

/// @brief Fold per-slot probabilities into a per-pixel alpha.
///
/// @param prob        Probability map [..., K].
/// @param aggregation Formulation to use; both agree to float tolerance.
/// @return Alpha [...] (K reduced). Not clamped.
torch::Tensor aggregate_alpha(const torch::Tensor& prob,
                              AlphaAggregation aggregation = AlphaAggregation::kLogSum);

/// @brief coverage_probability() followed by aggregate_alpha().
///
/// A pixel whose slots are all padding gets alpha 0.
///
/// @return Alpha [N, H, W].
torch::Tensor silhouette_alpha(const Fragments& fragments, float sigma,
                               AlphaAggregation aggregation = AlphaAggregation::kLogSum);

} // namespace dblend
