/// @file blending.cpp
/// @brief Compositors for the top-K faces per pixel.
///
/// Every stage is a libtorch op with a well-defined derivative (sigmoid,
/// exp, log, arithmetic, max/sum reductions). Padding slots are removed by
/// multiplying with the validity mask, never by branching, so gradients
/// reach dists, zbuf and colors through autograd.

#include "blending/blending.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <tuple>

namespace dblend {
namespace {

/// @brief Nearest-slot color [N, H, W, 3].
torch::Tensor nearest_color(const torch::Tensor& colors) {
    return colors.select(/*dim=*/3, /*index=*/0);
}

/// @brief Stack RGB [N, H, W, 3] and alpha [N, H, W] into RGBA.
torch::Tensor pack_rgba(const torch::Tensor& rgb, const torch::Tensor& alpha) {
    return torch::cat({rgb, alpha.unsqueeze(-1).to(rgb.scalar_type())}, /*dim=*/-1);
}

/// @brief Clamp every channel to [0, 1] and flip the row axis.
torch::Tensor finalize(const torch::Tensor& rgba) {
    return flip_rows(torch::clamp(rgba, /*min=*/0.0, /*max=*/1.0));
}

void log_call(const char* name, const Fragments& fragments) {
    spdlog::debug("{}: N={} H={} W={} K={}", name,
                  fragments.batch_size(), fragments.height(),
                  fragments.width(), fragments.faces_per_pixel());
}

} // namespace

// ---------------------------------------------------------------------------
// Mode names
// ---------------------------------------------------------------------------

BlendMode blend_mode_from_string(const std::string& name) {
    if (name == "hard")          return BlendMode::kHard;
    if (name == "sigmoid_alpha") return BlendMode::kSigmoidAlpha;
    if (name == "softmax")       return BlendMode::kSoftmax;
    throw std::runtime_error("Unknown blend mode: '" + name +
                             "' (use 'hard', 'sigmoid_alpha' or 'softmax')");
}

const char* to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::kHard:         return "hard";
        case BlendMode::kSigmoidAlpha: return "sigmoid_alpha";
        case BlendMode::kSoftmax:      return "softmax";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// flip_rows
// ---------------------------------------------------------------------------

torch::Tensor flip_rows(const torch::Tensor& image) {
    TORCH_CHECK(image.dim() >= 2,
                "flip_rows needs at least 2 dims [N, H, ...], got ", image.dim());
    return torch::flip(image, {1});
}

// ---------------------------------------------------------------------------
// hard_rgb_blend
// ---------------------------------------------------------------------------

torch::Tensor hard_rgb_blend(const torch::Tensor& colors, const Fragments& fragments) {
    check_blend_inputs(colors, fragments, /*need_dists=*/false, /*need_zbuf=*/false);
    log_call("hard_rgb_blend", fragments);

    auto rgb = nearest_color(colors);
    auto alpha = torch::ones({fragments.batch_size(), fragments.height(), fragments.width()},
                             colors.options());
    return flip_rows(pack_rgba(rgb, alpha));
}

// ---------------------------------------------------------------------------
// sigmoid_alpha_blend
// ---------------------------------------------------------------------------

torch::Tensor sigmoid_alpha_blend(const torch::Tensor& colors,
                                  const Fragments& fragments,
                                  const BlendParams& params,
                                  AlphaAggregation aggregation) {
    check_blend_inputs(colors, fragments, /*need_dists=*/true, /*need_zbuf=*/false);
    TORCH_CHECK(params.sigma > 0.0f, "BlendParams.sigma must be positive, got ", params.sigma);
    log_call("sigmoid_alpha_blend", fragments);

    auto alpha = silhouette_alpha(fragments, params.sigma, aggregation);

    // Hard assignment for RGB, soft silhouette for alpha.
    return finalize(pack_rgba(nearest_color(colors), alpha));
}

// ---------------------------------------------------------------------------
// softmax_rgb_blend
// ---------------------------------------------------------------------------

SoftmaxWeights softmax_blend_weights(const Fragments& fragments,
                                     const BlendParams& params,
                                     AlphaAggregation aggregation) {
    check_fragments(fragments, /*need_dists=*/true, /*need_zbuf=*/true);
    params.validate();

    const auto dtype = fragments.dists.scalar_type();
    auto mask = fragments.valid_mask(dtype);

    // Stage 1: distance-based probability per slot, and its OR as alpha.
    auto prob_map = coverage_probability(fragments, params.sigma);
    auto alpha = aggregate_alpha(prob_map, aggregation);

    // Stage 2: normalised inverse depth, 1 at znear and 0 at zfar.
    const double znear = params.znear;
    const double zfar = params.zfar;
    auto z_inv = (zfar - fragments.zbuf.to(dtype)) / (zfar - znear) * mask;

    // Shift by the per-pixel maximum so the largest exponent is 0.
    auto z_inv_max = std::get<0>(z_inv.max(/*dim=*/-1, /*keepdim=*/true));
    auto weights_num = prob_map * torch::exp((z_inv - z_inv_max) / static_cast<double>(params.gamma));

    // Background mass: an infinitely distant face with a vanishing weight.
    const double delta = std::exp(1e-10 / static_cast<double>(params.gamma)) * 1e-10;

    // Stage 3: normalise over K plus the background.
    auto denom = weights_num.sum(/*dim=*/-1, /*keepdim=*/true) + delta;

    SoftmaxWeights out;
    out.weights = weights_num / denom;
    out.background_weight = delta / denom;
    out.alpha = alpha;
    return out;
}

torch::Tensor softmax_rgb_blend(const torch::Tensor& colors,
                                const Fragments& fragments,
                                const BlendParams& params,
                                AlphaAggregation aggregation) {
    check_blend_inputs(colors, fragments, /*need_dists=*/true, /*need_zbuf=*/true);
    log_call("softmax_rgb_blend", fragments);

    auto w = softmax_blend_weights(fragments, params, aggregation);
    auto weights = w.weights.to(colors.scalar_type());
    auto background_weight = w.background_weight.to(colors.scalar_type());

    auto background = params.resolve_background(fragments.batch_size(), colors.options());

    // [N, H, W, K, 1] * [N, H, W, K, 3] summed over K -> [N, H, W, 3]
    auto weighted_colors = (weights.unsqueeze(-1) * colors).sum(/*dim=*/-2);
    auto weighted_background = background_weight * background;

    return finalize(pack_rgba(weighted_colors + weighted_background, w.alpha));
}

// ---------------------------------------------------------------------------
// blend
// ---------------------------------------------------------------------------

torch::Tensor blend(BlendMode mode,
                    const torch::Tensor& colors,
                    const Fragments& fragments,
                    const BlendParams& params,
                    AlphaAggregation aggregation) {
    switch (mode) {
        case BlendMode::kHard:
            return hard_rgb_blend(colors, fragments);
        case BlendMode::kSigmoidAlpha:
            return sigmoid_alpha_blend(colors, fragments, params, aggregation);
        case BlendMode::kSoftmax:
            return softmax_rgb_blend(colors, fragments, params, aggregation);
    }
    throw std::runtime_error("Unhandled blend mode");
}

} // namespace dblend
