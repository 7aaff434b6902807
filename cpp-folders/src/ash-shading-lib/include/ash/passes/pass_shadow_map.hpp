#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: pass_shadow_map.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Үндсэн directional гэрлийн ortho camera-г тааруулж, сүүдэр
            тусгагч item-уудын хамгийн ойрын depth01-ийг ShadowDepthMap-д бичнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "ash/camera/light_camera.hpp"
#include "ash/frame/frame_params.hpp"
#include "ash/gfx/rt_shadow.hpp"
#include "ash/passes/pass_context.hpp"
#include "ash/passes/scene_data.hpp"
#include "ash/render/rasterizer.hpp"

namespace ash
{
    class PassShadowMap
    {
    public:
        struct Inputs
        {
            const ToonScene* scene = nullptr;
            const FrameParams* fp = nullptr;
            ShadowDepthMap* shadow = nullptr;
        };

        const LightCamera& last_light_camera() const { return light_cam_; }

        void execute(PassContext& ctx, const Inputs& in)
        {
            ctx.shadow.reset();
            if (!in.scene || !in.fp || !in.shadow) return;
            if (!in.fp->shadow.enable || !in.fp->shading.shadows) return;

            const LightDescriptor* sun = in.scene->lights.primary();
            if (!sun || sun->kind != LightKind::Directional) return;

            ShadowDepthMap& shadow = *in.shadow;
            const int res = (int)std::clamp<uint32_t>(in.fp->shadow.resolution, 1u, kMaxTargetDimension);
            if (shadow.w != res || shadow.h != res) shadow.resize(res, res);
            if (!shadow.valid()) return;
            shadow.clear(1.0f);

            const AABB casters = shadow_caster_bounds(*in.scene);
            if (in.fp->shadow.film_size > 0.0f)
            {
                light_cam_ = build_dir_light_camera_film(
                    sun->dir_to_light_ws,
                    casters.center(),
                    in.fp->shadow.film_size,
                    in.fp->shadow.near_plane,
                    in.fp->shadow.far_plane);
            }
            else
            {
                light_cam_ = build_dir_light_camera_aabb(
                    sun->dir_to_light_ws,
                    casters,
                    in.fp->shadow.fit_margin,
                    (uint32_t)res);
            }

            // Depth-only: гурвалжин бүрээс зөвхөн хамгийн ойрын z01 үлдээнэ.
            for (const DrawItem& item : in.scene->items)
            {
                if (!item.visible || !item.casts_shadow || !item.mesh || item.mesh->empty()) continue;
                rasterize_item_depth(*item.mesh, light_cam_.viewproj * item.model, shadow);
            }

            ctx.shadow.map = &shadow;
            ctx.shadow.light_viewproj = light_cam_.viewproj;
            ctx.shadow.valid = true;
        }

    private:
        // Cull хийхгүй. Frustum-аар clip хийсэн гурвалжин бүрийн хамгийн ойрын z01.
        static void rasterize_item_depth(const MeshData& mesh, const glm::mat4& mvp, ShadowDepthMap& shadow)
        {
            std::vector<VertexOut> projected(mesh.positions.size());
            for (size_t i = 0; i < mesh.positions.size(); ++i)
            {
                projected[i].clip = mvp * glm::vec4(mesh.positions[i], 1.0f);
            }

            const size_t tri_count = mesh.triangle_count();
            for (size_t ti = 0; ti < tri_count; ++ti)
            {
                uint32_t idx[3];
                for (int k = 0; k < 3; ++k)
                {
                    idx[k] = mesh.indices.empty() ? (uint32_t)(ti * 3 + k) : mesh.indices[ti * 3 + k];
                }
                if (idx[0] >= projected.size() || idx[1] >= projected.size() || idx[2] >= projected.size()) continue;

                const detail::ClipPolygon poly = detail::clip_triangle(projected[idx[0]], projected[idx[1]], projected[idx[2]]);
                for (size_t k = 1; k + 1 < poly.size(); ++k)
                {
                    detail::ScreenTriangle tri{};
                    if (!detail::setup_screen_triangle(poly[0], poly[k], poly[k + 1], shadow.w, shadow.h, tri)) continue;

                    for (int y = tri.y0; y <= tri.y1; ++y)
                    {
                        for (int x = tri.x0; x <= tri.x1; ++x)
                        {
                            const glm::vec3 bc = barycentric_2d(
                                glm::vec2((float)x + 0.5f, (float)y + 0.5f), tri.screen[0], tri.screen[1], tri.screen[2]);
                            if (glm::any(glm::lessThan(bc, glm::vec3(0.0f)))) continue;

                            const float z01 = std::clamp(
                                glm::dot(bc, glm::vec3(tri.ndc_z[0], tri.ndc_z[1], tri.ndc_z[2])) * 0.5f + 0.5f, 0.0f, 1.0f);
                            float& stored = shadow.at(x, y);
                            stored = std::min(stored, z01);
                        }
                    }
                }
            }
        }

        LightCamera light_cam_{};
    };
}
