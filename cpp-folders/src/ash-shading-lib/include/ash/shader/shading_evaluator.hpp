#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: shading_evaluator.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Fragment бүрийн эцсийн өнгийг тооцоолно: diffuse загвар, сүүдрийн
            sampler, compositor-ийг материал болон кадрын тохиргоогоор холбоно.
            Төлөвгүй, fragment бүр бие даан тооцогдоно.
*/


#include <algorithm>

#include <glm/glm.hpp>

#include "ash/lighting/diffuse_model.hpp"
#include "ash/lighting/light_types.hpp"
#include "ash/lighting/rim_light.hpp"
#include "ash/lighting/shadow_sample.hpp"
#include "ash/resources/texture.hpp"
#include "ash/shader/compositor.hpp"
#include "ash/shader/types.hpp"

namespace ash
{
    // Нэг fragment-ийн гэрлийн завсрын үр дүн. Debug view болон тестэд ил гаргана.
    struct FragmentLighting
    {
        bool has_light = false;
        glm::vec4 albedo{1.0f};
        glm::vec3 N{0.0f, 1.0f, 0.0f};
        glm::vec3 V{0.0f, 0.0f, 1.0f};
        glm::vec3 ambient{0.0f};
        glm::vec3 direct{0.0f};
        float primary_diffuse = 0.0f;
        float primary_visibility = 1.0f;
    };

    inline const ToonMaterial& default_toon_material()
    {
        static const ToonMaterial mat{};
        return mat;
    }

    inline glm::vec4 eval_albedo(const ToonMaterial& mat, const glm::vec2& uv)
    {
        const glm::vec4 tex = sample_texture2d_bilinear_repeat(mat.albedo_tex, uv);
        const glm::vec3 base = resolve_color(glm::vec3(mat.base_color), kFallbackBaseColor);
        return glm::vec4(base * glm::vec3(tex), mat.base_color.a * tex.a);
    }

    inline float eval_light_visibility(
        const FragmentIn& fin,
        const ShaderUniforms& u,
        const ToonMaterial& mat,
        const LightDescriptor& light,
        float ndotl)
    {
        if (!u.shading.shadows || !mat.receive_shadows || !light.shadow_map) return 1.0f;
        // Shadow map нь зөвхөн directional гэрлийн ortho camera-аар зурагдана.
        if (light.kind != LightKind::Directional) return 1.0f;

        const ShadowParams sp = make_shadow_params(u.shading, light.light_viewproj);
        // Rasterizer-ийн interpolate хийсэн координатыг зөвхөн ижил гэрлийн матрицтай үед ашиглана.
        const bool reuse = fin.has_shadow_coord && (light.light_viewproj == u.transforms.light_viewproj);
        const glm::vec4 coord = reuse ? fin.shadow_coord : light.light_viewproj * glm::vec4(fin.world_pos, 1.0f);
        return shadow_visibility(*light.shadow_map, sp, coord, ndotl);
    }

    inline FragmentLighting eval_fragment_lighting(const FragmentIn& fin, const ShaderUniforms& u)
    {
        const ToonMaterial& mat = u.material ? *u.material : default_toon_material();

        FragmentLighting fl{};
        fl.albedo = eval_albedo(mat, fin.uv);
        fl.N = safe_normalize(fin.normal_ws);
        const glm::vec3 to_cam = u.camera_pos - fin.world_pos;
        fl.V = (glm::length(to_cam) > 1e-8f) ? glm::normalize(to_cam) : fl.N;
        fl.has_light = !u.lights.empty();

        for (size_t i = 0; i < u.lights.size(); ++i)
        {
            const LightDescriptor& light = u.lights.lights[i];
            const glm::vec3 L = light_dir_to(light, fin.world_pos);
            const float ndotl = glm::dot(fl.N, L);
            const float diffuse = eval_diffuse(mat.diffuse, ndotl);
            const float vis = eval_light_visibility(fin, u, mat, light, ndotl);
            const glm::vec3 radiance =
                resolve_color(light.color, kFallbackLightColor) * light.intensity * light_attenuation(light, fin.world_pos);

            fl.direct += diffuse * radiance * vis;
            fl.ambient += light.ambient;
            if (i == 0)
            {
                fl.primary_diffuse = diffuse;
                fl.primary_visibility = vis;
            }
        }
        return fl;
    }

    inline ColorF evaluate_toon_fragment(const FragmentIn& fin, const ShaderUniforms& u)
    {
        const ToonMaterial& mat = u.material ? *u.material : default_toon_material();
        const FragmentLighting fl = eval_fragment_lighting(fin, u);

        if (!fl.has_light)
        {
            if (u.shading.debug_missing_light) return missing_light_color(fl.albedo.a);
            CompositeInputs unlit{};
            unlit.albedo = fl.albedo;
            unlit.direct = glm::vec3(1.0f);
            return composite_color(unlit, u.shading.clamp_output);
        }

        RimParams rp = mat.rim;
        rp.mask_by_shadow = rp.mask_by_shadow && u.shading.rim_mask_by_shadow;

        CompositeInputs in{};
        in.albedo = fl.albedo;
        in.ambient = fl.ambient;
        in.shadow_tint = mat.shadow_tint;
        in.direct = fl.direct;
        in.rim = rim_term(rp, fl.N, fl.V, fl.primary_visibility);
        return composite_color(in, u.shading.clamp_output);
    }

    inline ColorF evaluate_debug_fragment(const FragmentIn& fin, const ShaderUniforms& u, DebugViewMode mode)
    {
        if (mode == DebugViewMode::Normal)
        {
            const glm::vec3 n = safe_normalize(fin.normal_ws) * 0.5f + glm::vec3(0.5f);
            return ColorF{n.r, n.g, n.b, 1.0f};
        }
        if (mode == DebugViewMode::Depth)
        {
            const float d = std::clamp(fin.depth01, 0.0f, 1.0f);
            return ColorF{d, d, d, 1.0f};
        }

        const FragmentLighting fl = eval_fragment_lighting(fin, u);
        if (!fl.has_light) return missing_light_color(1.0f);
        const float s = (mode == DebugViewMode::ShadowVisibility) ? fl.primary_visibility : fl.primary_diffuse;
        return ColorF{s, s, s, 1.0f};
    }
}
