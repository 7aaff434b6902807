#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Mesh-ийг vertex программаар хувиргаж, clip хийж, гурвалжин бүрийг
            perspective-correct interpolation-той rasterize хийн fragment
            программыг дуудна. Мөрүүдийг job system-ээр зэрэг боловсруулна.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "ash/gfx/rt_types.hpp"
#include "ash/job/parallel_for.hpp"
#include "ash/resources/mesh.hpp"
#include "ash/shader/program.hpp"

namespace ash
{
    enum class RasterizerCullMode
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    struct RasterizerConfig
    {
        RasterizerCullMode cull_mode = RasterizerCullMode::Back;
        // LH convention дээр гадагш эргэлттэй mesh дэлгэц дээр CW харагдана.
        bool front_face_ccw = false;
        bool depth_test = true;
        bool depth_write = true;
        IJobSystem* job_system = nullptr;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 64 * 64;
    };

    struct RasterizerTarget
    {
        RT_ColorHDR* hdr = nullptr;
        RT_DepthBuffer* depth = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_culled = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t fragments_shaded = 0;
    };

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 ab = b - a;
        const glm::vec2 ac = c - a;
        const glm::vec2 ap = p - a;
        const float area = ab.x * ac.y - ac.x * ab.y;
        if (std::abs(area) < 1e-8f) return glm::vec3(-1.0f);
        const float beta = (ap.x * ac.y - ac.x * ap.y) / area;
        const float gamma = (ab.x * ap.y - ap.x * ab.y) / area;
        return glm::vec3(1.0f - beta - gamma, beta, gamma);
    }

    namespace detail
    {
        using ClipPolygon = std::vector<VertexOut>;

        inline VertexOut mix_varyings(const VertexOut& a, const VertexOut& b, float t)
        {
            VertexOut o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.world_pos = glm::mix(a.world_pos, b.world_pos, t);
            o.normal_ws = glm::mix(a.normal_ws, b.normal_ws, t);
            o.shadow_coord = glm::mix(a.shadow_coord, b.shadow_coord, t);
            o.uv = glm::mix(a.uv, b.uv, t);
            return o;
        }

        // dot(plane, clip) >= 0 бол тухайн хавтгайн дотор тал.
        inline const std::array<glm::vec4, 6>& frustum_planes()
        {
            static const std::array<glm::vec4, 6> planes = {{
                { 1.0f,  0.0f,  0.0f, 1.0f},
                {-1.0f,  0.0f,  0.0f, 1.0f},
                { 0.0f,  1.0f,  0.0f, 1.0f},
                { 0.0f, -1.0f,  0.0f, 1.0f},
                { 0.0f,  0.0f,  1.0f, 1.0f},
                { 0.0f,  0.0f, -1.0f, 1.0f},
            }};
            return planes;
        }

        inline bool inside_all_planes(const VertexOut& v)
        {
            if (!(v.clip.w > 0.0f)) return false;
            for (const glm::vec4& pl : frustum_planes())
            {
                if (glm::dot(pl, v.clip) < 0.0f) return false;
            }
            return true;
        }

        // Sutherland-Hodgman, нэг хавтгай.
        inline ClipPolygon clip_against(const ClipPolygon& poly, const glm::vec4& plane)
        {
            ClipPolygon out{};
            out.reserve(poly.size() + 2);
            const size_t n = poly.size();
            for (size_t i = 0; i < n; ++i)
            {
                const VertexOut& a = poly[i];
                const VertexOut& b = poly[(i + 1) % n];
                const float da = glm::dot(plane, a.clip);
                const float db = glm::dot(plane, b.clip);
                if ((da >= 0.0f) != (db >= 0.0f) && std::abs(da - db) > 1e-8f)
                {
                    out.push_back(mix_varyings(a, b, da / (da - db)));
                }
                if (db >= 0.0f) out.push_back(b);
            }
            return out;
        }

        inline ClipPolygon clip_triangle(const VertexOut& a, const VertexOut& b, const VertexOut& c)
        {
            ClipPolygon poly = {a, b, c};
            if (inside_all_planes(a) && inside_all_planes(b) && inside_all_planes(c)) return poly;
            for (const glm::vec4& pl : frustum_planes())
            {
                if (poly.size() < 3) break;
                poly = clip_against(poly, pl);
            }
            return poly;
        }

        // Дэлгэцэнд буусан гурвалжин: пикселийн байрлал, NDC z, 1/w.
        struct ScreenTriangle
        {
            std::array<const VertexOut*, 3> v{};
            std::array<glm::vec2, 3> screen{};
            std::array<float, 3> ndc_z{};
            std::array<float, 3> inv_w{};
            float signed_area2 = 0.0f;
            int x0 = 0, x1 = -1, y0 = 0, y1 = -1;
        };

        inline bool setup_screen_triangle(
            const VertexOut& a, const VertexOut& b, const VertexOut& c, int W, int H, ScreenTriangle& tri)
        {
            tri.v = {&a, &b, &c};
            for (int i = 0; i < 3; ++i)
            {
                const glm::vec4& clip = tri.v[i]->clip;
                tri.inv_w[i] = 1.0f / clip.w;
                const glm::vec3 ndc = glm::vec3(clip) * tri.inv_w[i];
                if (!std::isfinite(ndc.x) || !std::isfinite(ndc.y) || !std::isfinite(ndc.z)) return false;
                tri.screen[i] = glm::vec2((ndc.x * 0.5f + 0.5f) * (float)(W - 1), (ndc.y * 0.5f + 0.5f) * (float)(H - 1));
                tri.ndc_z[i] = ndc.z;
            }
            const glm::vec2 e01 = tri.screen[1] - tri.screen[0];
            const glm::vec2 e02 = tri.screen[2] - tri.screen[0];
            tri.signed_area2 = e01.x * e02.y - e01.y * e02.x;
            if (std::abs(tri.signed_area2) < 1e-10f) return false;

            const glm::vec2 lo = glm::min(tri.screen[0], glm::min(tri.screen[1], tri.screen[2]));
            const glm::vec2 hi = glm::max(tri.screen[0], glm::max(tri.screen[1], tri.screen[2]));
            tri.x0 = std::max(0, (int)std::floor(lo.x));
            tri.x1 = std::min(W - 1, (int)std::ceil(hi.x));
            tri.y0 = std::max(0, (int)std::floor(lo.y));
            tri.y1 = std::min(H - 1, (int)std::ceil(hi.y));
            return tri.x0 <= tri.x1 && tri.y0 <= tri.y1;
        }

        inline bool is_culled(const ScreenTriangle& tri, const RasterizerConfig& config)
        {
            const bool front = (tri.signed_area2 > 0.0f) == config.front_face_ccw;
            switch (config.cull_mode)
            {
                case RasterizerCullMode::Back: return !front;
                case RasterizerCullMode::Front: return front;
                default: return false;
            }
        }

        // [y_begin, y_end) мөрүүдийг shade хийгээд бичигдсэн fragment-ийн тоог буцаана.
        inline uint64_t shade_rows(
            const ScreenTriangle& tri,
            int y_begin,
            int y_end,
            const ShaderProgram& program,
            const ShaderUniforms& uniforms,
            RasterizerTarget target,
            const RasterizerConfig& config)
        {
            const VertexOut& a = *tri.v[0];
            const VertexOut& b = *tri.v[1];
            const VertexOut& c = *tri.v[2];
            uint64_t written = 0;

            for (int y = y_begin; y < y_end; ++y)
            {
                for (int x = tri.x0; x <= tri.x1; ++x)
                {
                    const glm::vec3 bc = barycentric_2d(
                        glm::vec2((float)x + 0.5f, (float)y + 0.5f), tri.screen[0], tri.screen[1], tri.screen[2]);
                    if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                    // NDC z нь дэлгэц дээр шугаман, бусад varying 1/w-ээр жинлэгдэнэ.
                    const float depth01 = std::clamp(
                        (bc.x * tri.ndc_z[0] + bc.y * tri.ndc_z[1] + bc.z * tri.ndc_z[2]) * 0.5f + 0.5f, 0.0f, 1.0f);
                    float* depth_px = target.depth ? &target.depth->depth.at(x, y) : nullptr;
                    if (depth_px && config.depth_test && depth01 >= *depth_px) continue;

                    const glm::vec3 pw = bc * glm::vec3(tri.inv_w[0], tri.inv_w[1], tri.inv_w[2]);
                    const float pw_sum = pw.x + pw.y + pw.z;
                    if (pw_sum <= 1e-10f) continue;
                    const glm::vec3 k = pw / pw_sum;

                    FragmentIn frag{};
                    frag.world_pos = k.x * a.world_pos + k.y * b.world_pos + k.z * c.world_pos;
                    frag.normal_ws = k.x * a.normal_ws + k.y * b.normal_ws + k.z * c.normal_ws;
                    frag.shadow_coord = k.x * a.shadow_coord + k.y * b.shadow_coord + k.z * c.shadow_coord;
                    frag.has_shadow_coord = true;
                    frag.uv = k.x * a.uv + k.y * b.uv + k.z * c.uv;
                    frag.depth01 = depth01;
                    frag.px = x;
                    frag.py = y;

                    const FragmentOut out = program.fs(frag, uniforms);
                    if (out.discard) continue;
                    if (depth_px && config.depth_write) *depth_px = depth01;
                    target.hdr->color.at(x, y) = out.color;
                    ++written;
                }
            }
            return written;
        }
    }

    inline RasterizerStats rasterize_mesh(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        RasterizerTarget target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target.hdr || !program.valid() || mesh.empty()) return stats;
        const int W = target.hdr->w;
        const int H = target.hdr->h;
        if (W <= 0 || H <= 0) return stats;
        if (target.depth && (target.depth->w != W || target.depth->h != H)) return stats;

        // Vertex stage: орой бүрт нэг удаа.
        std::vector<VertexOut> varyings(mesh.positions.size());
        for (size_t i = 0; i < mesh.positions.size(); ++i)
        {
            ShaderVertex in{};
            in.position = mesh.positions[i];
            if (i < mesh.normals.size()) in.normal = mesh.normals[i];
            if (i < mesh.uvs.size()) in.uv = mesh.uvs[i];
            varyings[i] = program.vs(in, uniforms);
        }

        const size_t tri_count = mesh.triangle_count();
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats.tri_input++;
            uint32_t idx[3];
            for (int k = 0; k < 3; ++k)
            {
                idx[k] = mesh.indices.empty() ? (uint32_t)(ti * 3 + k) : mesh.indices[ti * 3 + k];
            }
            if (idx[0] >= varyings.size() || idx[1] >= varyings.size() || idx[2] >= varyings.size()) continue;

            const detail::ClipPolygon poly = detail::clip_triangle(varyings[idx[0]], varyings[idx[1]], varyings[idx[2]]);
            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                detail::ScreenTriangle tri{};
                if (!detail::setup_screen_triangle(poly[0], poly[k], poly[k + 1], W, H, tri)) continue;
                if (detail::is_culled(tri, config))
                {
                    stats.tri_culled++;
                    continue;
                }
                stats.tri_raster++;

                const int rows = tri.y1 - tri.y0 + 1;
                const int pixels = rows * (tri.x1 - tri.x0 + 1);
                const int min_rows = std::max(1, config.parallel_min_rows);
                if (config.job_system && rows >= min_rows && pixels >= std::max(1, config.parallel_min_pixels))
                {
                    // Мөр бүрийг нэг л ажил бичнэ, тоолуурыг мөрөөр нь хадгална.
                    std::vector<uint64_t> per_row((size_t)rows, 0u);
                    parallel_for_1d(config.job_system, tri.y0, tri.y1 + 1, min_rows, [&](int yb, int ye)
                    {
                        for (int y = yb; y < ye; ++y)
                        {
                            per_row[(size_t)(y - tri.y0)] = detail::shade_rows(tri, y, y + 1, program, uniforms, target, config);
                        }
                    });
                    for (uint64_t n : per_row) stats.fragments_shaded += n;
                }
                else
                {
                    stats.fragments_shaded += detail::shade_rows(tri, tri.y0, tri.y1 + 1, program, uniforms, target, config);
                }
            }
        }
        return stats;
    }
}
