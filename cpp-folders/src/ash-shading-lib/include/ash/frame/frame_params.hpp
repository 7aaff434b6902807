#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: frame_params.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Кадр болон шэйдингийн стратеги сонголтын тохиргоо. Утга бүр
            анхдагчтай бөгөөд env_config.hpp орчны хувьсагчаар дарж бичнэ.
*/


#include <cstdint>

#include "ash/lighting/shadow_sample.hpp"

namespace ash
{
    enum class NormalTransformMode : uint32_t
    {
        // Жигд бус scale-д зөв. Model сингуляр бол upper 3x3 руу буцна.
        InverseTranspose = 0,
        // Host-оос өгсөн normal matrix.
        NormalMatrix = 1,
        // Зөвхөн жигд scale-тэй geometry-д зөв ойролцоолол.
        ModelUpper3x3 = 2
    };

    enum class DebugViewMode : uint32_t
    {
        None = 0,
        ShadowVisibility = 1,
        Normal = 2,
        Depth = 3,
        Diffuse = 4
    };

    struct ShadingParams
    {
        bool shadows = true;
        ShadowFilter shadow_filter = ShadowFilter::PCF3x3;
        ShadowBiasMode shadow_bias_mode = ShadowBiasMode::SlopeScaled;
        float shadow_bias_const = 0.0015f;
        float shadow_bias_slope = 0.0015f;
        float shadow_pcf_step = 1.0f;
        float shadow_strength = 1.0f;

        // false бол бүх материалын rim-ийг сүүдрээр масклахгүй.
        bool rim_mask_by_shadow = true;
        bool clamp_output = false;
        // Гэрэл холбогдоогүй үед цэнхэр өнгө гаргана.
        bool debug_missing_light = true;

        NormalTransformMode normal_mode = NormalTransformMode::InverseTranspose;
        DebugViewMode debug_view = DebugViewMode::None;
    };

    struct ShadowPassParams
    {
        bool enable = true;
        uint32_t resolution = 1024;
        // 0 бол scene AABB-д тааруулна, эс бөгөөс ortho film хэмжээ.
        float film_size = 0.0f;
        float near_plane = 1.0f;
        float far_plane = 200.0f;
        float fit_margin = 2.0f;
    };

    struct OutlinePassParams
    {
        bool enable = true;
        float width_scale = 1.0f;
    };

    struct TonemapParams
    {
        float exposure = 1.0f;
        float gamma = 2.2f;
    };

    // Render target болон shadow map-ийн нэг талын дээд хэмжээ.
    constexpr uint32_t kMaxTargetDimension = 16384u;

    struct FrameParams
    {
        int w = 640;
        int h = 360;

        ShadingParams shading{};
        ShadowPassParams shadow{};
        OutlinePassParams outline{};
        TonemapParams tonemap{};
    };

    inline ShadowParams make_shadow_params(const ShadingParams& sp, const glm::mat4& light_viewproj)
    {
        ShadowParams out{};
        out.light_viewproj = light_viewproj;
        out.filter = sp.shadow_filter;
        out.bias_mode = sp.shadow_bias_mode;
        out.bias_const = sp.shadow_bias_const;
        out.bias_slope = sp.shadow_bias_slope;
        out.pcf_step = sp.shadow_pcf_step;
        out.strength = sp.shadow_strength;
        return out;
    }

    inline const char* debug_view_mode_name(DebugViewMode m)
    {
        switch (m)
        {
            case DebugViewMode::None: return "none";
            case DebugViewMode::ShadowVisibility: return "shadow";
            case DebugViewMode::Normal: return "normal";
            case DebugViewMode::Depth: return "depth";
            case DebugViewMode::Diffuse: return "diffuse";
        }
        return "unknown";
    }
}
