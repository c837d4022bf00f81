/* SPDX-FileCopyrightText: 2025 NeuralPseudoScan Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "models/voxel_radiance_field.hpp"
#include "core/logger.hpp"
#include "rendering/point_extraction.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <random>

namespace nps::models {

    namespace {
        constexpr float LAST_SAMPLE_DISTANCE = 1e10f;
        constexpr float PDF_EPS = 1e-5f;
        constexpr float MEDIAN_DEPTH_THRESHOLD = 0.5f;

        struct GridView {
            const float* density = nullptr;
            const float* color = nullptr;
            glm::ivec3 resolution{0};
            glm::vec3 bbox_min{0.0f};
            glm::vec3 bbox_max{0.0f};
            const rendering::ParamArray* warp_offsets = nullptr;
            const rendering::ParamArray* appearance_gains = nullptr;
        };

        struct FieldSample {
            float sigma = 0.0f;
            glm::vec3 rgb{0.0f};
        };

        struct RayContext {
            glm::vec3 origin;
            glm::vec3 direction;
            glm::vec3 offset{0.0f};
            glm::vec3 gain{1.0f};
        };

        size_t vertex_index(const GridView& grid, const int x, const int y, const int z) {
            return (static_cast<size_t>(x) * static_cast<size_t>(grid.resolution.y) + static_cast<size_t>(y)) *
                       static_cast<size_t>(grid.resolution.z) +
                   static_cast<size_t>(z);
        }

        glm::vec3 table_row(const rendering::ParamArray& table, const uint32_t row) {
            const size_t i = static_cast<size_t>(row) * 3;
            return {table.data[i], table.data[i + 1], table.data[i + 2]};
        }

        FieldSample query_field(const GridView& grid, const glm::vec3& p) {
            const glm::vec3 extent = grid.bbox_max - grid.bbox_min;
            const glm::vec3 cells = glm::vec3(grid.resolution - 1);
            const glm::vec3 u = (p - grid.bbox_min) / extent * cells;

            if (u.x < 0.0f || u.y < 0.0f || u.z < 0.0f || u.x > cells.x || u.y > cells.y || u.z > cells.z) {
                return {};
            }

            const glm::ivec3 i0 = glm::clamp(glm::ivec3(glm::floor(u)), glm::ivec3(0), grid.resolution - 2);
            const glm::vec3 f = u - glm::vec3(i0);

            FieldSample sample;
            for (int corner = 0; corner < 8; ++corner) {
                const int dx = corner & 1;
                const int dy = (corner >> 1) & 1;
                const int dz = (corner >> 2) & 1;
                const float w = (dx ? f.x : 1.0f - f.x) *
                                (dy ? f.y : 1.0f - f.y) *
                                (dz ? f.z : 1.0f - f.z);
                if (w == 0.0f) {
                    continue;
                }
                const size_t v = vertex_index(grid, i0.x + dx, i0.y + dy, i0.z + dz);
                sample.sigma += w * grid.density[v];
                sample.rgb += w * glm::vec3(grid.color[3 * v], grid.color[3 * v + 1], grid.color[3 * v + 2]);
            }

            sample.sigma = std::max(sample.sigma, 0.0f);
            return sample;
        }

        // Alpha-composites one ray over sorted depths on a black background.
        void composite_ray(const GridView& grid,
                           const RayContext& ray,
                           const std::vector<float>& t_vals,
                           rendering::RenderOutput& out,
                           std::vector<float>& weights) {
            const size_t n = t_vals.size();
            const float dir_norm = glm::length(ray.direction);

            weights.assign(n, 0.0f);
            glm::vec3 rgb(0.0f);
            float acc = 0.0f;
            float depth = 0.0f;
            float transmittance = 1.0f;

            for (size_t i = 0; i < n; ++i) {
                const glm::vec3 point = ray.origin + t_vals[i] * ray.direction;
                const FieldSample field = query_field(grid, point + ray.offset);

                const float dist = (i + 1 < n ? t_vals[i + 1] - t_vals[i] : LAST_SAMPLE_DISTANCE) * dir_norm;
                const float alpha = 1.0f - std::exp(-field.sigma * dist);
                const float w = alpha * transmittance;
                transmittance *= 1.0f - alpha;

                weights[i] = w;
                rgb += w * glm::clamp(field.rgb * ray.gain, 0.0f, 1.0f);
                acc += w;
                depth += w * t_vals[i];

                out.points.push_back(point);
                out.weights.push_back(w);
            }

            const int median = rendering::first_opaque_sample(weights, MEDIAN_DEPTH_THRESHOLD);

            out.rgb.push_back(rgb);
            out.acc.push_back(acc);
            out.depth.push_back(depth);
            out.median_depth.push_back(median >= 0 ? t_vals[static_cast<size_t>(median)] : 0.0f);
        }

        std::vector<float> linspace(const float start, const float stop, const int num) {
            std::vector<float> values(static_cast<size_t>(num));
            for (int i = 0; i < num; ++i) {
                const float t = num > 1 ? static_cast<float>(i) / static_cast<float>(num - 1) : 0.0f;
                values[static_cast<size_t>(i)] = start * (1.0f - t) + stop * t;
            }
            return values;
        }

        // Uniform draw inside each interval between midpoints
        void stratify(std::vector<float>& t_vals, std::mt19937_64& gen) {
            const size_t n = t_vals.size();
            if (n < 2) {
                return;
            }
            std::uniform_real_distribution<float> dist(0.0f, 1.0f);
            std::vector<float> jittered(n);
            for (size_t i = 0; i < n; ++i) {
                const float lower = i > 0 ? 0.5f * (t_vals[i - 1] + t_vals[i]) : t_vals[0];
                const float upper = i + 1 < n ? 0.5f * (t_vals[i] + t_vals[i + 1]) : t_vals[n - 1];
                jittered[i] = lower + (upper - lower) * dist(gen);
            }
            t_vals = std::move(jittered);
        }

        bool is_row_table(const rendering::ParamArray& table) {
            return table.shape.size() == 2 && table.shape[1] == 3 && table.is_consistent();
        }

        GridView make_view(const rendering::ModelState& state) {
            const auto* density = state.find(PARAM_DENSITY);
            const auto* color = state.find(PARAM_COLOR);
            const auto* bbox = state.find(PARAM_BBOX);

            GridView grid;
            grid.density = density->data.data();
            grid.color = color->data.data();
            grid.resolution = glm::ivec3(static_cast<int>(density->shape[0]),
                                         static_cast<int>(density->shape[1]),
                                         static_cast<int>(density->shape[2]));
            grid.bbox_min = glm::vec3(bbox->data[0], bbox->data[1], bbox->data[2]);
            grid.bbox_max = glm::vec3(bbox->data[3], bbox->data[4], bbox->data[5]);
            grid.warp_offsets = state.find(PARAM_WARP_OFFSETS);
            grid.appearance_gains = state.find(PARAM_APPEARANCE_GAINS);
            return grid;
        }
    } // namespace

    core::Result<void> validate_voxel_state(const rendering::ModelState& state) {
        using core::ErrorCode;

        if (!state.model_type.empty() && state.model_type != VOXEL_RADIANCE_FIELD) {
            return core::make_error(ErrorCode::CORRUPTED_DATA,
                                    std::format("State belongs to model '{}', not '{}'", state.model_type, VOXEL_RADIANCE_FIELD));
        }

        const auto* density = state.find(PARAM_DENSITY);
        const auto* color = state.find(PARAM_COLOR);
        const auto* bbox = state.find(PARAM_BBOX);
        if (!density || !color || !bbox) {
            return core::make_error(ErrorCode::CORRUPTED_DATA,
                                    std::format("Voxel field state needs '{}', '{}' and '{}'", PARAM_DENSITY, PARAM_COLOR, PARAM_BBOX));
        }

        if (density->shape.size() != 3 || !density->is_consistent() ||
            std::ranges::any_of(density->shape, [](const int64_t d) { return d < 2; })) {
            return core::make_error(ErrorCode::CORRUPTED_DATA, "Density grid must be [X,Y,Z] with every side >= 2");
        }
        if (color->shape.size() != 4 || color->shape[3] != 3 || !color->is_consistent() ||
            !std::equal(density->shape.begin(), density->shape.end(), color->shape.begin())) {
            return core::make_error(ErrorCode::CORRUPTED_DATA, "Color grid must be [X,Y,Z,3] matching the density grid");
        }
        if (bbox->shape != std::vector<int64_t>{2, 3} || !bbox->is_consistent()) {
            return core::make_error(ErrorCode::CORRUPTED_DATA, "Bounding box must be [2,3]");
        }
        for (int axis = 0; axis < 3; ++axis) {
            if (!(bbox->data[3 + axis] > bbox->data[axis])) {
                return core::make_error(ErrorCode::CORRUPTED_DATA,
                                        std::format("Bounding box is empty along axis {}", axis));
            }
        }

        for (const char* name : {PARAM_WARP_OFFSETS, PARAM_APPEARANCE_GAINS}) {
            if (const auto* table = state.find(name); table && !is_row_table(*table)) {
                return core::make_error(ErrorCode::CORRUPTED_DATA, std::format("'{}' must be [K,3]", name));
            }
        }
        return {};
    }

    VoxelRadianceField::VoxelRadianceField(const VoxelFieldOptions& options)
        : options_(options) {}

    core::Result<rendering::ModelOutput> VoxelRadianceField::render(const rendering::ModelState& params,
                                                                    const rendering::RayBatch& rays,
                                                                    const float warp_alpha,
                                                                    const core::RngKey coarse_key,
                                                                    const core::RngKey fine_key) const {
        if (auto valid = validate_voxel_state(params); !valid) {
            return std::unexpected(valid.error());
        }
        if (!rays.is_consistent()) {
            return core::make_error(core::ErrorCode::INVALID_ARGUMENT, "Ray shard arrays have mismatched lengths");
        }
        if (options_.num_coarse_samples < 1 || options_.num_fine_samples < 0 ||
            (options_.num_fine_samples > 0 && options_.num_coarse_samples < 3)) {
            return core::make_error(core::ErrorCode::INVALID_CONFIG,
                                    std::format("Unsupported sample counts: coarse={}, fine={}",
                                                options_.num_coarse_samples, options_.num_fine_samples));
        }

        const GridView grid = make_view(params);
        const bool has_fine = options_.num_fine_samples > 0;
        const size_t num_rays = rays.size();

        auto coarse_gen = core::make_generator(coarse_key);
        auto fine_gen = core::make_generator(fine_key);
        std::uniform_real_distribution<float> uniform(0.0f, 1.0f);

        const std::vector<float> base_t = linspace(options_.near, options_.far, options_.num_coarse_samples);

        rendering::ModelOutput output;
        output.coarse.num_samples = options_.num_coarse_samples;
        output.coarse.reserve(num_rays, options_.num_coarse_samples);
        if (has_fine) {
            output.fine.emplace();
            output.fine->num_samples = options_.num_coarse_samples + options_.num_fine_samples;
            output.fine->reserve(num_rays, output.fine->num_samples);
        }

        std::vector<float> coarse_weights;
        std::vector<float> fine_weights;
        std::vector<float> bins;
        std::vector<float> u(has_fine && options_.randomized ? static_cast<size_t>(options_.num_fine_samples) : 0);

        for (size_t r = 0; r < num_rays; ++r) {
            RayContext ray{rays.origins[r], rays.directions[r]};
            if (grid.warp_offsets && rays.warp[r] < static_cast<uint64_t>(grid.warp_offsets->shape[0])) {
                ray.offset = warp_alpha * table_row(*grid.warp_offsets, rays.warp[r]);
            }
            if (grid.appearance_gains && rays.appearance[r] < static_cast<uint64_t>(grid.appearance_gains->shape[0])) {
                ray.gain = table_row(*grid.appearance_gains, rays.appearance[r]);
            }

            std::vector<float> t_coarse = base_t;
            if (options_.randomized) {
                stratify(t_coarse, coarse_gen);
            }
            composite_ray(grid, ray, t_coarse, output.coarse, coarse_weights);

            if (!has_fine) {
                continue;
            }

            bins.resize(t_coarse.size() - 1);
            for (size_t i = 0; i + 1 < t_coarse.size(); ++i) {
                bins[i] = 0.5f * (t_coarse[i] + t_coarse[i + 1]);
            }
            for (auto& value : u) {
                value = uniform(fine_gen);
            }

            const std::span<const float> inner(coarse_weights.data() + 1, coarse_weights.size() - 2);
            std::vector<float> t_fine = sample_piecewise_constant_pdf(bins, inner, options_.num_fine_samples, u);
            t_fine.insert(t_fine.end(), t_coarse.begin(), t_coarse.end());
            std::ranges::sort(t_fine);

            composite_ray(grid, ray, t_fine, *output.fine, fine_weights);
        }

        output.coarse.height = rays.height;
        output.coarse.width = rays.width;
        if (output.fine) {
            output.fine->height = rays.height;
            output.fine->width = rays.width;
        }
        return output;
    }

    rendering::ModelState make_voxel_state(const VoxelGridSpec& spec,
                                           const std::function<float(const glm::vec3&)>& density,
                                           const std::function<glm::vec3(const glm::vec3&)>& color) {
        const glm::ivec3 res = glm::max(spec.resolution, glm::ivec3(2));
        const size_t num_vertices = static_cast<size_t>(res.x) * static_cast<size_t>(res.y) * static_cast<size_t>(res.z);

        rendering::ParamArray density_grid{{res.x, res.y, res.z}, {}};
        rendering::ParamArray color_grid{{res.x, res.y, res.z, 3}, {}};
        density_grid.data.reserve(num_vertices);
        color_grid.data.reserve(num_vertices * 3);

        const glm::vec3 step = (spec.bbox_max - spec.bbox_min) / glm::vec3(res - 1);
        for (int x = 0; x < res.x; ++x) {
            for (int y = 0; y < res.y; ++y) {
                for (int z = 0; z < res.z; ++z) {
                    const glm::vec3 p = spec.bbox_min + step * glm::vec3(x, y, z);
                    density_grid.data.push_back(density(p));
                    const glm::vec3 c = color(p);
                    color_grid.data.insert(color_grid.data.end(), {c.r, c.g, c.b});
                }
            }
        }

        rendering::ModelState state;
        state.model_type = VOXEL_RADIANCE_FIELD;
        state.params.emplace(PARAM_DENSITY, std::move(density_grid));
        state.params.emplace(PARAM_COLOR, std::move(color_grid));
        state.params.emplace(PARAM_BBOX, rendering::ParamArray{{2, 3},
                                                               {spec.bbox_min.x, spec.bbox_min.y, spec.bbox_min.z,
                                                                spec.bbox_max.x, spec.bbox_max.y, spec.bbox_max.z}});
        return state;
    }

    std::vector<float> sample_piecewise_constant_pdf(const std::span<const float> bins,
                                                     const std::span<const float> weights,
                                                     const int num_samples,
                                                     const std::span<const float> u) {
        if (num_samples <= 0 || bins.size() < 2 || weights.size() + 1 != bins.size()) {
            return {};
        }

        // Pad so that an all-zero ray still has a valid pdf
        std::vector<float> w(weights.begin(), weights.end());
        float weight_sum = 0.0f;
        for (const float value : w) {
            weight_sum += value;
        }
        const float padding = std::max(0.0f, PDF_EPS - weight_sum);
        for (auto& value : w) {
            value += padding / static_cast<float>(w.size());
        }
        weight_sum += padding;

        const size_t nb = bins.size();
        std::vector<float> cdf(nb, 0.0f);
        for (size_t i = 1; i + 1 < nb; ++i) {
            cdf[i] = std::min(1.0f, cdf[i - 1] + w[i - 1] / weight_sum);
        }
        cdf[nb - 1] = 1.0f;

        std::vector<float> samples;
        samples.reserve(static_cast<size_t>(num_samples));

        for (int j = 0; j < num_samples; ++j) {
            float uj;
            if (u.empty()) {
                uj = num_samples > 1 ? static_cast<float>(j) / static_cast<float>(num_samples - 1) : 0.0f;
            } else {
                uj = u[static_cast<size_t>(j) % u.size()];
            }

            const size_t k = static_cast<size_t>(std::upper_bound(cdf.begin(), cdf.end(), uj) - cdf.begin());
            const size_t lo = k > 0 ? k - 1 : 0;
            const size_t hi = k < nb ? k : nb - 1;

            const float denom = cdf[hi] - cdf[lo];
            float t = denom > 0.0f ? (uj - cdf[lo]) / denom : 0.0f;
            if (!std::isfinite(t)) {
                t = 0.0f;
            }
            t = std::clamp(t, 0.0f, 1.0f);
            samples.push_back(bins[lo] + t * (bins[hi] - bins[lo]));
        }
        return samples;
    }

} // namespace nps::models
