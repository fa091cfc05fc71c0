/// @file fragments.cpp
/// @brief Input validation shared by all compositors.

#include "core/fragments.hpp"

namespace dblend {
namespace {

/// @brief Validate one floating per-slot tensor against pix_to_face.
void check_slot_tensor(const torch::Tensor& t, const torch::Tensor& pix_to_face,
                       const char* name) {
    TORCH_CHECK(t.defined(), "fragments.", name, " must be defined");
    TORCH_CHECK(t.is_floating_point(),
                "fragments.", name, " must be floating point, got ", t.dtype());
    TORCH_CHECK(t.sizes() == pix_to_face.sizes(),
                "fragments.", name, " must match pix_to_face shape ",
                pix_to_face.sizes(), ", got ", t.sizes());
    TORCH_CHECK(t.device() == pix_to_face.device(),
                "fragments.", name, " must be on the same device as pix_to_face");
}

} // namespace

void check_fragments(const Fragments& fragments, bool need_dists, bool need_zbuf) {
    const auto& p2f = fragments.pix_to_face;
    TORCH_CHECK(p2f.defined(), "fragments.pix_to_face must be defined");
    TORCH_CHECK(p2f.dim() == 4,
                "fragments.pix_to_face must be 4-dimensional [N, H, W, K], got ",
                p2f.dim(), " dims");
    TORCH_CHECK(!p2f.is_floating_point() && !p2f.is_complex() &&
                    p2f.scalar_type() != torch::kBool &&
                    p2f.scalar_type() != torch::kByte,
                "fragments.pix_to_face must be a signed integer tensor, got ",
                p2f.dtype());
    TORCH_CHECK(p2f.size(3) >= 1,
                "fragments must have at least one face per pixel (K >= 1)");

    if (need_dists) {
        check_slot_tensor(fragments.dists, p2f, "dists");
    }
    if (need_zbuf) {
        check_slot_tensor(fragments.zbuf, p2f, "zbuf");
    }
}

void check_blend_inputs(const torch::Tensor& colors,
                        const Fragments& fragments,
                        bool need_dists,
                        bool need_zbuf) {
    check_fragments(fragments, need_dists, need_zbuf);

    const auto& p2f = fragments.pix_to_face;
    TORCH_CHECK(colors.defined(), "colors must be defined");
    TORCH_CHECK(colors.dim() == 5,
                "colors must be 5-dimensional [N, H, W, K, 3], got ",
                colors.dim(), " dims");
    TORCH_CHECK(colors.size(4) == 3,
                "colors must have 3 channels, got ", colors.size(4));
    TORCH_CHECK(colors.is_floating_point(),
                "colors must be floating point, got ", colors.dtype());
    TORCH_CHECK(colors.sizes().slice(0, 4) == p2f.sizes(),
                "colors [N, H, W, K] must match pix_to_face shape ",
                p2f.sizes(), ", got ", colors.sizes());
    TORCH_CHECK(colors.device() == p2f.device(),
                "colors and fragments must be on the same device");
}

} // namespace dblend
