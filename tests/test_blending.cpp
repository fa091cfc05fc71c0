/// @file test_blending.cpp
/// @brief Tests for the three compositors.
///
/// Tests cover:
///   - Output shape, [0, 1] range and row flip for every mode
///   - Pixels with no valid slot (hard: alpha 1, sigmoid: alpha 0,
///     softmax: exact background and alpha 0)
///   - Softmax weights summing to 1 with the background
///   - Single dominant face, equal-depth tie, background-only scenarios
///   - Broadcast vs per-batch background
///   - Input validation

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "blending/blending.hpp"
#include "core/blend_params.hpp"
#include "core/fragments.hpp"

#include <stdexcept>

namespace dblend {
namespace {

torch::Device test_device() {
    return torch::cuda::is_available() ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
}

torch::TensorOptions float_opts() {
    return torch::TensorOptions().dtype(torch::kFloat32).device(test_device());
}

/// @brief Build fragments on the test device from CPU tensors.
Fragments make_fragments(const torch::Tensor& pix_to_face,
                         const torch::Tensor& dists,
                         const torch::Tensor& zbuf) {
    Fragments f;
    f.pix_to_face = pix_to_face;
    f.dists = dists;
    f.zbuf = zbuf;
    f.to_device(test_device());
    return f;
}

/// @brief Random fragments with roughly a quarter of the slots padded.
Fragments make_random_fragments(int64_t n, int64_t h, int64_t w, int64_t k) {
    auto p2f = torch::randint(-1, 3, {n, h, w, k}, torch::kInt64);
    auto dists = torch::randn({n, h, w, k}) * 2e-4f;
    auto zbuf = torch::rand({n, h, w, k}) * 20.0f + 2.0f;
    return make_fragments(p2f, dists, zbuf);
}

/// @brief A [1, 1, 1, K] pixel from per-slot values.
Fragments make_pixel(std::vector<int64_t> faces, std::vector<float> dists, std::vector<float> depths) {
    const int64_t k = static_cast<int64_t>(faces.size());
    return make_fragments(torch::tensor(faces, torch::kInt64).reshape({1, 1, 1, k}),
                          torch::tensor(dists).reshape({1, 1, 1, k}),
                          torch::tensor(depths).reshape({1, 1, 1, k}));
}

/// @brief Per-slot colors [1, 1, 1, K, 3] from a flat RGB list.
torch::Tensor make_pixel_colors(std::vector<float> rgb) {
    const int64_t k = static_cast<int64_t>(rgb.size() / 3);
    return torch::tensor(rgb).reshape({1, 1, 1, k, 3}).to(test_device());
}

/// @brief Read RGBA of pixel (0, 0) of image 0.
std::vector<float> pixel_rgba(const torch::Tensor& image) {
    auto px = image.cpu()[0][0][0];
    return {px[0].item<float>(), px[1].item<float>(), px[2].item<float>(), px[3].item<float>()};
}

// ===========================================================================
// flip_rows
// ===========================================================================

TEST(BlendingTest, FlipRowsIsInvolution) {
    auto x = torch::arange(2 * 5 * 3 * 4, float_opts()).reshape({2, 5, 3, 4});
    auto once = flip_rows(x);

    EXPECT_FALSE(torch::equal(once, x));
    EXPECT_TRUE(torch::equal(once.select(1, 0), x.select(1, 4)));
    EXPECT_TRUE(torch::equal(flip_rows(once), x));
}

// ===========================================================================
// hard_rgb_blend
// ===========================================================================

TEST(BlendingTest, HardBlendPicksNearestSlotAndFlips) {
    const int64_t h = 3, w = 2, k = 2;
    // Slot 0 color encodes the row index; slot 1 is noise that must be ignored.
    auto colors = torch::rand({1, h, w, k, 3});
    for (int64_t y = 0; y < h; ++y) {
        colors.select(1, y).select(2, 0).fill_(0.1f * static_cast<float>(y + 1));
    }
    auto frags = make_random_fragments(1, h, w, k);

    auto image = hard_rgb_blend(colors.to(test_device()), frags).cpu();

    ASSERT_EQ(image.sizes(), (std::vector<int64_t>{1, h, w, 4}));
    // Output row 0 is fragment row h-1.
    EXPECT_NEAR(image[0][0][0][0].item<float>(), 0.3f, 1e-6f);
    EXPECT_NEAR(image[0][h - 1][0][0].item<float>(), 0.1f, 1e-6f);
    EXPECT_FLOAT_EQ(image.select(3, 3).min().item<float>(), 1.0f);
}

TEST(BlendingTest, HardBlendAlphaOneWithoutFaces) {
    auto frags = make_pixel({-1, -1}, {-1.0f, -1.0f}, {-1.0f, -1.0f});
    auto colors = make_pixel_colors({0.3f, 0.6f, 0.9f, 0.0f, 0.0f, 0.0f});

    auto rgba = pixel_rgba(hard_rgb_blend(colors, frags));

    EXPECT_NEAR(rgba[0], 0.3f, 1e-6f);
    EXPECT_NEAR(rgba[1], 0.6f, 1e-6f);
    EXPECT_NEAR(rgba[2], 0.9f, 1e-6f);
    EXPECT_FLOAT_EQ(rgba[3], 1.0f);
}

// ===========================================================================
// sigmoid_alpha_blend
// ===========================================================================

TEST(BlendingTest, SigmoidBlendKeepsNearestColor) {
    auto frags = make_pixel({4, 7}, {-1e-3f, 1e-3f}, {3.0f, 4.0f});
    auto colors = make_pixel_colors({0.2f, 0.4f, 0.6f, 0.9f, 0.9f, 0.9f});

    BlendParams params;
    auto rgba = pixel_rgba(sigmoid_alpha_blend(colors, frags, params));

    EXPECT_NEAR(rgba[0], 0.2f, 1e-6f);
    EXPECT_NEAR(rgba[1], 0.4f, 1e-6f);
    EXPECT_NEAR(rgba[2], 0.6f, 1e-6f);
    EXPECT_NEAR(rgba[3], 1.0f, 1e-3f);
}

TEST(BlendingTest, SigmoidBlendZeroAlphaWithoutFaces) {
    auto frags = make_pixel({-1, -1, -1}, {-1.0f, -1.0f, -1.0f}, {-1.0f, -1.0f, -1.0f});
    auto colors = make_pixel_colors({0.5f, 0.5f, 0.5f, 0.1f, 0.1f, 0.1f, 0.2f, 0.2f, 0.2f});

    BlendParams params;
    auto rgba = pixel_rgba(sigmoid_alpha_blend(colors, frags, params));
    EXPECT_FLOAT_EQ(rgba[3], 0.0f);
}

TEST(BlendingTest, SigmoidBlendClampsColors) {
    auto frags = make_pixel({0}, {-1e-3f}, {5.0f});
    auto colors = make_pixel_colors({1.5f, -0.25f, 0.5f});

    BlendParams params;
    auto rgba = pixel_rgba(sigmoid_alpha_blend(colors, frags, params));

    EXPECT_FLOAT_EQ(rgba[0], 1.0f);
    EXPECT_FLOAT_EQ(rgba[1], 0.0f);
    EXPECT_NEAR(rgba[2], 0.5f, 1e-6f);
}

// ===========================================================================
// softmax_rgb_blend: scenarios
// ===========================================================================

TEST(BlendingTest, SoftmaxSingleDominantFace) {
    BlendParams params;
    auto frags = make_pixel({0}, {-10.0f * params.sigma}, {10.0f});
    auto colors = make_pixel_colors({0.2f, 0.4f, 0.6f});

    auto rgba = pixel_rgba(softmax_rgb_blend(colors, frags, params));

    EXPECT_NEAR(rgba[0], 0.2f, 1e-2f);
    EXPECT_NEAR(rgba[1], 0.4f, 1e-2f);
    EXPECT_NEAR(rgba[2], 0.6f, 1e-2f);
    EXPECT_NEAR(rgba[3], 1.0f, 1e-3f);
}

TEST(BlendingTest, SoftmaxEqualDepthTie) {
    BlendParams params;
    const float d = -10.0f * params.sigma;
    auto frags = make_pixel({0, 1}, {d, d}, {7.0f, 7.0f});
    auto colors = make_pixel_colors({1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f});

    auto rgba = pixel_rgba(softmax_rgb_blend(colors, frags, params));

    EXPECT_NEAR(rgba[0], 0.5f, 1e-3f);
    EXPECT_NEAR(rgba[1], 0.5f, 1e-3f);
    EXPECT_NEAR(rgba[2], 0.0f, 1e-3f);
}

TEST(BlendingTest, SoftmaxBackgroundOnly) {
    BlendParams params;
    params.background_color = {0.1f, 0.2f, 0.3f};
    auto frags = make_pixel({-1, -1}, {-1.0f, -1.0f}, {-1.0f, -1.0f});
    auto colors = make_pixel_colors({0.9f, 0.9f, 0.9f, 0.8f, 0.8f, 0.8f});

    auto rgba = pixel_rgba(softmax_rgb_blend(colors, frags, params));

    EXPECT_NEAR(rgba[0], 0.1f, 1e-6f);
    EXPECT_NEAR(rgba[1], 0.2f, 1e-6f);
    EXPECT_NEAR(rgba[2], 0.3f, 1e-6f);
    EXPECT_FLOAT_EQ(rgba[3], 0.0f);
}

TEST(BlendingTest, SoftmaxNearerFaceDominates) {
    // Both faces cover the pixel; the nearer one wins with a sharp gamma.
    BlendParams params;
    const float d = -10.0f * params.sigma;
    auto frags = make_pixel({0, 1}, {d, d}, {2.0f, 6.0f});
    auto colors = make_pixel_colors({0.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f});

    auto rgba = pixel_rgba(softmax_rgb_blend(colors, frags, params));

    EXPECT_NEAR(rgba[2], 1.0f, 1e-3f);
    EXPECT_NEAR(rgba[0], 0.0f, 1e-3f);
}

TEST(BlendingTest, SoftmaxPaddingIgnoresGarbage) {
    // The padding slot has an "inside" distance and a nearer depth; it must
    // not pull the color toward its (red) slot color.
    BlendParams params;
    auto frags = make_pixel({3, -1}, {-10.0f * params.sigma, -1.0f}, {20.0f, 1.5f});
    auto colors = make_pixel_colors({0.0f, 1.0f, 0.0f, 1.0f, 0.0f, 0.0f});

    auto rgba = pixel_rgba(softmax_rgb_blend(colors, frags, params));

    EXPECT_NEAR(rgba[0], 0.0f, 1e-3f);
    EXPECT_NEAR(rgba[1], 1.0f, 1e-2f);
}

// ===========================================================================
// softmax_rgb_blend: invariants
// ===========================================================================

TEST(BlendingTest, SoftmaxWeightsConvexCombination) {
    torch::manual_seed(17);
    auto frags = make_random_fragments(2, 12, 10, 5);

    for (float gamma : {1e-4f, 1e-2f, 1.0f}) {
        BlendParams params;
        params.gamma = gamma;
        auto w = softmax_blend_weights(frags, params);

        ASSERT_EQ(w.weights.sizes(), frags.pix_to_face.sizes());
        ASSERT_EQ(w.background_weight.size(-1), 1);

        auto total = w.weights.sum(-1) + w.background_weight.squeeze(-1);
        EXPECT_LT((total - 1.0f).abs().max().item<float>(), 1e-5f) << "gamma=" << gamma;
        EXPECT_GE(w.weights.min().item<float>(), 0.0f);
        EXPECT_GE(w.background_weight.min().item<float>(), 0.0f);
    }
}

TEST(BlendingTest, SoftmaxPaddingSlotsGetZeroWeight) {
    torch::manual_seed(23);
    auto frags = make_random_fragments(1, 8, 8, 4);
    BlendParams params;
    params.gamma = 0.5f;

    auto w = softmax_blend_weights(frags, params);
    auto padded = frags.pix_to_face.lt(0);

    EXPECT_FLOAT_EQ(w.weights.masked_select(padded).abs().sum().item<float>(), 0.0f);
}

TEST(BlendingTest, OutputRangeAllModes) {
    torch::manual_seed(5);
    auto frags = make_random_fragments(2, 9, 7, 3);
    auto colors = (torch::rand({2, 9, 7, 3, 3}) * 2.0f - 0.5f).to(test_device());

    BlendParams params;
    params.background_color = {1.5f, -0.5f, 0.5f};
    for (auto mode : {BlendMode::kHard, BlendMode::kSigmoidAlpha, BlendMode::kSoftmax}) {
        auto image = blend(mode, colors, frags, params);
        ASSERT_EQ(image.sizes(), (std::vector<int64_t>{2, 9, 7, 4})) << to_string(mode);
        if (mode == BlendMode::kHard) continue;  // hard mode does not clamp
        EXPECT_GE(image.min().item<float>(), 0.0f) << to_string(mode);
        EXPECT_LE(image.max().item<float>(), 1.0f) << to_string(mode);
    }
}

TEST(BlendingTest, ZnearZfarDefaultsMatchFixedPlanes) {
    torch::manual_seed(29);
    auto frags = make_random_fragments(1, 6, 6, 3);
    auto colors = torch::rand({1, 6, 6, 3, 3}).to(test_device());

    BlendParams defaults;
    BlendParams explicit_planes;
    explicit_planes.znear = 1.0f;
    explicit_planes.zfar = 100.0f;

    EXPECT_TRUE(torch::equal(softmax_rgb_blend(colors, frags, defaults),
                             softmax_rgb_blend(colors, frags, explicit_planes)));
}

// ===========================================================================
// Background broadcasting
// ===========================================================================

TEST(BlendingTest, BackgroundTensorMatchesColorArray) {
    auto frags = make_fragments(torch::full({1, 2, 2, 1}, -1, torch::kInt64),
                                torch::zeros({1, 2, 2, 1}),
                                torch::zeros({1, 2, 2, 1}));
    auto colors = torch::rand({1, 2, 2, 1, 3}).to(test_device());

    BlendParams from_array;
    from_array.background_color = {0.25f, 0.5f, 0.75f};
    BlendParams from_tensor;
    from_tensor.background = torch::tensor({0.25f, 0.5f, 0.75f});

    EXPECT_TRUE(torch::allclose(softmax_rgb_blend(colors, frags, from_array),
                                softmax_rgb_blend(colors, frags, from_tensor)));
}

TEST(BlendingTest, PerBatchBackground) {
    auto frags = make_fragments(torch::full({2, 3, 3, 2}, -1, torch::kInt64),
                                torch::zeros({2, 3, 3, 2}),
                                torch::zeros({2, 3, 3, 2}));
    auto colors = torch::rand({2, 3, 3, 2, 3}).to(test_device());

    BlendParams params;
    params.background = torch::tensor({{0.1f, 0.2f, 0.3f}, {0.4f, 0.5f, 0.6f}});

    auto image = softmax_rgb_blend(colors, frags, params).cpu();
    auto first = image[0][1][2];
    auto second = image[1][0][0];

    EXPECT_NEAR(first[0].item<float>(), 0.1f, 1e-6f);
    EXPECT_NEAR(first[2].item<float>(), 0.3f, 1e-6f);
    EXPECT_NEAR(second[0].item<float>(), 0.4f, 1e-6f);
    EXPECT_NEAR(second[2].item<float>(), 0.6f, 1e-6f);

    // Wrong number of rows for the batch.
    params.background = torch::rand({3, 3});
    EXPECT_THROW(softmax_rgb_blend(colors, frags, params), c10::Error);
}

// ===========================================================================
// Dispatch and names
// ===========================================================================

TEST(BlendingTest, DispatchMatchesDirectCalls) {
    torch::manual_seed(31);
    auto frags = make_random_fragments(1, 5, 5, 2);
    auto colors = torch::rand({1, 5, 5, 2, 3}).to(test_device());
    BlendParams params;

    EXPECT_TRUE(torch::equal(blend(BlendMode::kHard, colors, frags, params),
                             hard_rgb_blend(colors, frags)));
    EXPECT_TRUE(torch::equal(blend(BlendMode::kSigmoidAlpha, colors, frags, params),
                             sigmoid_alpha_blend(colors, frags, params)));
    EXPECT_TRUE(torch::equal(blend(BlendMode::kSoftmax, colors, frags, params),
                             softmax_rgb_blend(colors, frags, params)));
}

TEST(BlendingTest, ModeNames) {
    for (auto mode : {BlendMode::kHard, BlendMode::kSigmoidAlpha, BlendMode::kSoftmax}) {
        EXPECT_EQ(blend_mode_from_string(to_string(mode)), mode);
    }
    EXPECT_THROW(blend_mode_from_string("phong"), std::runtime_error);
}

// ===========================================================================
// Input validation
// ===========================================================================

TEST(BlendingTest, InputValidation) {
    auto frags = make_random_fragments(1, 4, 4, 2);
    auto colors = torch::rand({1, 4, 4, 2, 3}).to(test_device());
    BlendParams params;

    // Colors with the wrong K.
    auto wrong_k = torch::rand({1, 4, 4, 3, 3}).to(test_device());
    EXPECT_THROW(softmax_rgb_blend(wrong_k, frags, params), c10::Error);

    // Colors with 4 channels.
    auto wrong_channels = torch::rand({1, 4, 4, 2, 4}).to(test_device());
    EXPECT_THROW(hard_rgb_blend(wrong_channels, frags), c10::Error);

    // Floating pix_to_face.
    Fragments float_index = frags;
    float_index.pix_to_face = frags.pix_to_face.to(torch::kFloat32);
    EXPECT_THROW(hard_rgb_blend(colors, float_index), c10::Error);

    // Missing zbuf for softmax, but sigmoid does not need it.
    Fragments no_zbuf = frags;
    no_zbuf.zbuf = torch::Tensor();
    EXPECT_THROW(softmax_rgb_blend(colors, no_zbuf, params), c10::Error);
    EXPECT_NO_THROW(sigmoid_alpha_blend(colors, no_zbuf, params));

    // Mismatched dists shape.
    Fragments bad_dists = frags;
    bad_dists.dists = torch::zeros({1, 4, 4, 3}, float_opts());
    EXPECT_THROW(sigmoid_alpha_blend(colors, bad_dists, params), c10::Error);

    // Bad parameters.
    BlendParams bad = params;
    bad.gamma = 0.0f;
    EXPECT_THROW(softmax_rgb_blend(colors, frags, bad), c10::Error);
    bad = params;
    bad.zfar = 0.5f;
    EXPECT_THROW(softmax_rgb_blend(colors, frags, bad), c10::Error);
    bad = params;
    bad.sigma = -1.0f;
    EXPECT_THROW(sigmoid_alpha_blend(colors, frags, bad), c10::Error);
}

} // namespace
} // namespace dblend
