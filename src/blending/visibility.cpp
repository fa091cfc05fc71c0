/// @file visibility.cpp
/// @brief Coverage probability and alpha aggregation.

#include "blending/visibility.hpp"

#include <stdexcept>

namespace dblend {

namespace {

// Floor for 1 - p in the log-sum form. Below float32 resolution around 1,
// so the forward alpha is unchanged.
constexpr double kMinMissProbability = 1e-10;

} // namespace

AlphaAggregation alpha_aggregation_from_string(const std::string& name) {
    if (name == "log_sum") return AlphaAggregation::kLogSum;
    if (name == "product") return AlphaAggregation::kProduct;
    throw std::runtime_error("Unknown alpha aggregation: '" + name +
                             "' (use 'log_sum' or 'product')");
}

const char* to_string(AlphaAggregation aggregation) {
    switch (aggregation) {
        case AlphaAggregation::kLogSum:  return "log_sum";
        case AlphaAggregation::kProduct: return "product";
    }
    return "unknown";
}

torch::Tensor coverage_probability(const Fragments& fragments, float sigma) {
    TORCH_CHECK(sigma > 0.0f, "sigma must be positive, got ", sigma);
    TORCH_CHECK(fragments.pix_to_face.defined() && fragments.dists.defined(),
                "coverage_probability needs pix_to_face and dists");
    TORCH_CHECK(fragments.dists.sizes() == fragments.pix_to_face.sizes(),
                "dists must match pix_to_face shape ", fragments.pix_to_face.sizes(),
                ", got ", fragments.dists.sizes());

    auto mask = fragments.valid_mask(fragments.dists.scalar_type());
    return torch::sigmoid(-fragments.dists / sigma) * mask;
}

torch::Tensor aggregate_alpha(const torch::Tensor& prob, AlphaAggregation aggregation) {
    TORCH_CHECK(prob.dim() >= 1 && prob.size(-1) >= 1,
                "aggregate_alpha needs a non-empty last (K) dimension");

    // Complement of "no slot covers the pixel".
    auto miss = 1.0 - prob;
    switch (aggregation) {
        case AlphaAggregation::kProduct:
            return 1.0 - miss.prod(/*dim=*/-1);
        case AlphaAggregation::kLogSum:
            break;
    }
    // a*b = exp(log(a) + log(b)); the backward of a K-long product is
    // expensive for large K, a sum is not. A fully covering slot has
    // miss == 0, so the log input is floored to keep its gradient finite.
    return 1.0 - torch::exp(torch::log(miss.clamp_min(kMinMissProbability)).sum(/*dim=*/-1));
}

torch::Tensor silhouette_alpha(const Fragments& fragments, float sigma,
                               AlphaAggregation aggregation) {
    return aggregate_alpha(coverage_probability(fragments, sigma), aggregation);
}

} // namespace dblend
