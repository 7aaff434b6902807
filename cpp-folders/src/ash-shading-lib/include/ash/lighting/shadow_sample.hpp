#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: shadow_sample.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Гэрлийн орон зайн координатаас shadow map-ийг 1 tap, PCF 2x2
            эсвэл PCF 3x3 аргаар уншиж [0,1] харагдах байдлыг буцаана.
*/

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "ash/gfx/rt_shadow.hpp"

namespace ash {

enum class ShadowFilter : uint32_t {
    Hard = 0,
    PCF2x2 = 1,
    PCF3x3 = 2
};

enum class ShadowBiasMode : uint32_t {
    Constant = 0,
    SlopeScaled = 1
};

struct ShadowParams {
    glm::mat4 light_viewproj{1.0f};

    ShadowFilter   filter    = ShadowFilter::PCF3x3;
    ShadowBiasMode bias_mode = ShadowBiasMode::SlopeScaled;

    // Bias (constant + optional slope-scale)
    float bias_const = 0.0015f;
    float bias_slope = 0.0015f;

    float pcf_step = 1.0f;  // in texels
    float strength = 1.0f;  // 0 = no shadow, 1 = full
};

inline const char* shadow_filter_name(ShadowFilter f) {
    switch (f) {
        case ShadowFilter::Hard: return "hard";
        case ShadowFilter::PCF2x2: return "pcf2x2";
        case ShadowFilter::PCF3x3: return "pcf3x3";
    }
    return "unknown";
}

inline const char* shadow_bias_mode_name(ShadowBiasMode m) {
    switch (m) {
        case ShadowBiasMode::Constant: return "constant";
        case ShadowBiasMode::SlopeScaled: return "slope";
    }
    return "unknown";
}

inline int shadow_filter_tap_count(ShadowFilter f) {
    switch (f) {
        case ShadowFilter::Hard: return 1;
        case ShadowFilter::PCF2x2: return 4;
        case ShadowFilter::PCF3x3: return 9;
    }
    return 1;
}

// light clip-space (w хуваагдаагүй) -> (u,v,depth) in [0,1]
inline bool shadow_project_uvz(
    const glm::vec4& shadow_coord,
    float& out_u,
    float& out_v,
    float& out_z
){
    if (std::abs(shadow_coord.w) < 1e-8f) return false;

    const glm::vec3 ndc = glm::vec3(shadow_coord) / shadow_coord.w;   // [-1,1] range
    out_u = ndc.x * 0.5f + 0.5f;
    out_v = ndc.y * 0.5f + 0.5f;
    out_z = ndc.z * 0.5f + 0.5f;                                      // map [-1,1] -> [0,1]
    return true;
}

// world position -> (u,v,depth). Projective хувилбар, дээрхтэй ижил үр дүн өгнө.
inline bool shadow_project_uvz(
    const glm::mat4& light_vp,
    const glm::vec3& pos_ws,
    float& out_u,
    float& out_v,
    float& out_z
){
    return shadow_project_uvz(light_vp * glm::vec4(pos_ws, 1.0f), out_u, out_v, out_z);
}

inline float shadow_bias(
    ShadowBiasMode mode,
    float ndotl,
    float bias_const,
    float bias_slope
){
    if (mode == ShadowBiasMode::Constant) return bias_const;
    // ndotl бага (grazing) үед илүү bias өгч acne-г дарна
    const float slope = (1.0f - std::clamp(ndotl, 0.0f, 1.0f));
    return bias_const + bias_slope * slope;
}

inline float shadow_compare(const ShadowDepthMap& sm, int x, int y, float z_test) {
    return (z_test <= sm.fetch_clamped(x, y)) ? 1.0f : 0.0f;
}

// returns visibility in [0..1] (1 = lit, 0 = fully shadowed)
inline float shadow_visibility(
    const ShadowDepthMap& sm,
    const ShadowParams& sp,
    const glm::vec4& shadow_coord,
    float ndotl
){
    if (!sm.valid()) return 1.0f;

    float u, v, z;
    if (!shadow_project_uvz(shadow_coord, u, v, z)) return 1.0f;
    if (!std::isfinite(u) || !std::isfinite(v) || !std::isfinite(z)) return 1.0f;

    // Гэрлийн frustum-аас гарсан fragment бүрэн гэрэлтэй.
    if (z > 1.0f) return 1.0f;
    if (u < 0.0f || u > 1.0f || v < 0.0f || v > 1.0f) return 1.0f;

    const float bias   = shadow_bias(sp.bias_mode, ndotl, sp.bias_const, sp.bias_slope);
    const float z_test = z - bias;

    const float fx   = u * (float)(sm.w - 1);
    const float fy   = v * (float)(sm.h - 1);
    const int   step = std::max(1, (int)std::round(sp.pcf_step));

    float lit = 0.0f;
    int count = 0;
    switch (sp.filter) {
        case ShadowFilter::Hard: {
            lit = shadow_compare(sm, (int)std::round(fx), (int)std::round(fy), z_test);
            count = 1;
            break;
        }
        case ShadowFilter::PCF2x2: {
            const int x0 = (int)std::floor(fx);
            const int y0 = (int)std::floor(fy);
            for (int oy = 0; oy <= 1; ++oy) {
                for (int ox = 0; ox <= 1; ++ox) {
                    lit += shadow_compare(sm, x0 + ox * step, y0 + oy * step, z_test);
                    count++;
                }
            }
            break;
        }
        case ShadowFilter::PCF3x3: {
            const int cx = (int)std::round(fx);
            const int cy = (int)std::round(fy);
            for (int oy = -1; oy <= 1; ++oy) {
                for (int ox = -1; ox <= 1; ++ox) {
                    lit += shadow_compare(sm, cx + ox * step, cy + oy * step, z_test);
                    count++;
                }
            }
            break;
        }
    }

    const float vis = (count > 0) ? lit / (float)count : 1.0f;
    return glm::mix(1.0f, vis, std::clamp(sp.strength, 0.0f, 1.0f));
}

inline float shadow_visibility_ws(
    const ShadowDepthMap& sm,
    const ShadowParams& sp,
    const glm::vec3& pos_ws,
    float ndotl
){
    return shadow_visibility(sm, sp, sp.light_viewproj * glm::vec4(pos_ws, 1.0f), ndotl);
}

} // namespace ash
