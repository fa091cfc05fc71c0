/// @file synthetic_scene.cpp
/// @brief CPU disk rasterizer for compositor fixtures.

#include "data/synthetic_scene.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace dblend {
namespace {

struct Candidate {
    int64_t face = -1;
    float dist = 0.0f;   // NDC units
    float depth = 0.0f;
};

} // namespace

SyntheticScene make_disk_scene(const std::vector<Disk>& disks,
                               const DiskSceneSettings& settings) {
    if (settings.width <= 0 || settings.height <= 0 || settings.faces_per_pixel <= 0) {
        throw std::invalid_argument("Disk scene needs positive width, height and faces_per_pixel");
    }

    const int w = settings.width;
    const int h = settings.height;
    const int k = settings.faces_per_pixel;
    const float px_to_ndc = 2.0f / static_cast<float>(std::min(w, h));

    auto opts_f = torch::TensorOptions().dtype(torch::kFloat32);
    auto opts_l = torch::TensorOptions().dtype(torch::kInt64);

    auto pix_to_face = torch::full({1, h, w, k}, -1, opts_l);
    auto dists = torch::full({1, h, w, k}, -1.0f, opts_f);
    auto zbuf = torch::full({1, h, w, k}, -1.0f, opts_f);
    auto colors = torch::zeros({1, h, w, k, 3}, opts_f);

    auto p2f_a = pix_to_face.accessor<int64_t, 4>();
    auto dists_a = dists.accessor<float, 4>();
    auto zbuf_a = zbuf.accessor<float, 4>();
    auto colors_a = colors.accessor<float, 5>();

    std::vector<Candidate> candidates;
    candidates.reserve(disks.size());
    int64_t filled_slots = 0;

    // Rows follow rasterizer order: row index = y, growing upwards.
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const Eigen::Vector2f p(static_cast<float>(x) + 0.5f,
                                    static_cast<float>(y) + 0.5f);

            candidates.clear();
            for (size_t i = 0; i < disks.size(); ++i) {
                const auto& d = disks[i];
                const float signed_px = (p - d.center).norm() - d.radius;
                if (signed_px < settings.blur_radius_px) {
                    candidates.push_back({static_cast<int64_t>(i), signed_px * px_to_ndc, d.depth});
                }
            }

            // Nearest first; ties keep the lower face index in front.
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const Candidate& a, const Candidate& b) {
                                 return a.depth < b.depth;
                             });

            const int n = std::min(k, static_cast<int>(candidates.size()));
            for (int s = 0; s < n; ++s) {
                const auto& c = candidates[s];
                const auto& color = disks[static_cast<size_t>(c.face)].color;
                p2f_a[0][y][x][s] = c.face;
                dists_a[0][y][x][s] = c.dist;
                zbuf_a[0][y][x][s] = c.depth;
                colors_a[0][y][x][s][0] = color.x();
                colors_a[0][y][x][s][1] = color.y();
                colors_a[0][y][x][s][2] = color.z();
            }
            filled_slots += n;
        }
    }

    spdlog::debug("Disk scene: {} disks, {}x{}, K={}, {} filled slots",
                  disks.size(), w, h, k, filled_slots);

    SyntheticScene scene;
    scene.fragments.pix_to_face = pix_to_face;
    scene.fragments.dists = dists;
    scene.fragments.zbuf = zbuf;
    scene.colors = colors;
    return scene;
}

std::vector<Disk> default_disks(int width, int height) {
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    const float r = 0.25f * std::min(w, h);

    std::vector<Disk> disks(3);
    disks[0].center = Eigen::Vector2f(0.40f * w, 0.45f * h);
    disks[0].radius = r;
    disks[0].depth = 5.0f;
    disks[0].color = Eigen::Vector3f(0.9f, 0.2f, 0.2f);

    disks[1].center = Eigen::Vector2f(0.60f * w, 0.45f * h);
    disks[1].radius = r;
    disks[1].depth = 8.0f;
    disks[1].color = Eigen::Vector3f(0.2f, 0.8f, 0.3f);

    disks[2].center = Eigen::Vector2f(0.50f * w, 0.65f * h);
    disks[2].radius = r;
    disks[2].depth = 12.0f;
    disks[2].color = Eigen::Vector3f(0.2f, 0.3f, 0.9f);
    return disks;
}

SyntheticScene stack_scenes(const std::vector<SyntheticScene>& scenes) {
    TORCH_CHECK(!scenes.empty(), "stack_scenes needs at least one scene");

    std::vector<torch::Tensor> p2f, dists, zbuf, colors;
    for (const auto& s : scenes) {
        TORCH_CHECK(s.fragments.pix_to_face.sizes().slice(1) ==
                        scenes.front().fragments.pix_to_face.sizes().slice(1),
                    "stack_scenes: H, W and K must match across scenes");
        p2f.push_back(s.fragments.pix_to_face);
        dists.push_back(s.fragments.dists);
        zbuf.push_back(s.fragments.zbuf);
        colors.push_back(s.colors);
    }

    SyntheticScene out;
    out.fragments.pix_to_face = torch::cat(p2f, 0);
    out.fragments.dists = torch::cat(dists, 0);
    out.fragments.zbuf = torch::cat(zbuf, 0);
    out.colors = torch::cat(colors, 0);
    return out;
}

} // namespace dblend
