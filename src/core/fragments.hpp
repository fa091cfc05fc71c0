#pragma once

/// @file fragments.hpp
/// @brief Rasterizer fragment tensors and the input checks shared by the
///        compositors.

#include <torch/torch.h>

#include <cstdint>

namespace dblend {

/// @brief Per-pixel output of an external rasterizer, consumed by the
///        compositors.
///
/// Each pixel carries up to K candidate faces, nearest first. All three
/// tensors share the shape [N, H, W, K]:
///   - pix_to_face: signed integer face index; negative entries are padding
///                  slots with no face behind them.
///   - dists:       signed 2D distance from the pixel centre to the face
///                  edge (negative = inside the face).
///   - zbuf:        interpolated view-space depth of the face at the pixel.
///
/// Padding slots may hold arbitrary dists/zbuf values. Every consumer masks
/// them out through valid_mask() before they reach a probability or weight.
struct Fragments {
    torch::Tensor pix_to_face;  // [N, H, W, K], int64 face index, < 0 = padding
    torch::Tensor dists;        // [N, H, W, K], signed 2D distance
    torch::Tensor zbuf;         // [N, H, W, K], view-space depth

    int64_t batch_size() const { return pix_to_face.defined() ? pix_to_face.size(0) : 0; }
    int64_t height() const { return pix_to_face.defined() ? pix_to_face.size(1) : 0; }
    int64_t width() const { return pix_to_face.defined() ? pix_to_face.size(2) : 0; }
    int64_t faces_per_pixel() const { return pix_to_face.defined() ? pix_to_face.size(3) : 0; }

    /// @brief Validity flag per slot as a floating 0/1 tensor [N, H, W, K].
    ///
    /// Returned as a number rather than a bool so that masking is a
    /// multiplication and never interrupts the autograd graph.
    torch::Tensor valid_mask(torch::ScalarType dtype) const {
        return pix_to_face.ge(0).to(dtype);
    }

    /// @brief Move all defined tensors to the specified device.
    void to_device(torch::Device device) {
        if (pix_to_face.defined()) pix_to_face = pix_to_face.to(device);
        if (dists.defined())       dists       = dists.to(device);
        if (zbuf.defined())        zbuf        = zbuf.to(device);
    }

    /// @brief Check that the defined tensors agree on shape and device.
    ///
    /// dists and zbuf are optional here because the hard compositor only
    /// needs pix_to_face; the compositors check what they actually read.
    bool is_valid() const {
        if (!pix_to_face.defined() || pix_to_face.dim() != 4) return false;
        if (pix_to_face.size(3) < 1) return false;
        if (dists.defined() && (dists.sizes() != pix_to_face.sizes() ||
                                dists.device() != pix_to_face.device())) return false;
        if (zbuf.defined() && (zbuf.sizes() != pix_to_face.sizes() ||
                               zbuf.device() != pix_to_face.device())) return false;
        return true;
    }
};

/// @brief Validate the fragment tensors an operation reads.
///
/// pix_to_face must be a signed integer [N, H, W, K] tensor with K >= 1.
/// dists and zbuf are only checked (floating dtype, same shape and device
/// as pix_to_face) when the caller asks for them.
///
/// @throws c10::Error on any mismatch.
void check_fragments(const Fragments& fragments, bool need_dists, bool need_zbuf);

/// @brief check_fragments() plus a check of colors against them.
///
/// colors must be floating [N, H, W, K, 3] on the device of pix_to_face.
///
/// @param colors     Per-slot RGB colors [N, H, W, K, 3], floating.
/// @param fragments  Rasterizer output.
/// @param need_dists Whether the caller reads fragments.dists.
/// @param need_zbuf  Whether the caller reads fragments.zbuf.
/// @throws c10::Error on any mismatch.
void check_blend_inputs(const torch::Tensor& colors,
                        const Fragments& fragments,
                        bool need_dists,
                        bool need_zbuf);

} // namespace dblend
