/// @file blend_params.cpp
/// @brief BlendParams validation and background broadcasting.

#include "core/blend_params.hpp"

namespace dblend {

void BlendParams::validate() const {
    TORCH_CHECK(sigma > 0.0f, "BlendParams.sigma must be positive, got ", sigma);
    TORCH_CHECK(gamma > 0.0f, "BlendParams.gamma must be positive, got ", gamma);
    TORCH_CHECK(zfar > znear,
                "BlendParams.zfar must be greater than znear, got znear=", znear,
                " zfar=", zfar);
}

torch::Tensor BlendParams::resolve_background(int64_t batch_size,
                                              const torch::TensorOptions& options) const {
    torch::Tensor bg;
    if (background.defined()) {
        TORCH_CHECK(background.size(-1) == 3,
                    "BlendParams.background must have 3 channels, got ",
                    background.size(-1));
        if (background.dim() == 1) {
            bg = background.reshape({1, 3});
        } else {
            TORCH_CHECK(background.dim() == 2 && background.size(0) == batch_size,
                        "BlendParams.background must be [3] or [N, 3] with N=",
                        batch_size, ", got ", background.sizes());
            bg = background;
        }
        bg = bg.to(options);
    } else {
        bg = torch::tensor({background_color[0], background_color[1], background_color[2]},
                           torch::TensorOptions().dtype(torch::kFloat32))
                 .reshape({1, 3})
                 .to(options);
    }

    // [B, 3] -> [B, 1, 1, 3] so it lines up with [N, H, W, 3] colors.
    return bg.reshape({bg.size(0), 1, 1, 3});
}

} // namespace dblend
