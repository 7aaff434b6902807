#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <set>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "ash/core/env_config.hpp"
#include "ash/core/log.hpp"
#include "ash/frame/frame_params.hpp"
#include "ash/lighting/diffuse_model.hpp"
#include "ash/lighting/light_types.hpp"
#include "ash/lighting/rim_light.hpp"
#include "ash/lighting/shadow_sample.hpp"
#include "ash/resources/material.hpp"
#include "ash/shader/builtin_shaders.hpp"
#include "ash/shader/compositor.hpp"
#include "ash/shader/shading_evaluator.hpp"
#include "ash/shader/vertex_transform.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_rgb(const ash::ColorF& c, float r, float g, float b, float eps = 1e-4f)
    {
        return approx_eq(c.r, r, eps) && approx_eq(c.g, g, eps) && approx_eq(c.b, b, eps);
    }

    bool approx_vec3(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    // Зүүн хоёр багана 0 (бүрэн хаалттай), бусад нь 1.
    ash::ShadowDepthMap make_stepped_shadow_map()
    {
        ash::ShadowDepthMap sm(5, 5);
        for (int y = 0; y < sm.h; ++y)
        {
            for (int x = 0; x < sm.w; ++x)
            {
                sm.at(x, y) = (x < 2) ? 0.0f : 1.0f;
            }
        }
        return sm;
    }

    ash::ShadowParams make_unbiased_params(ash::ShadowFilter filter)
    {
        ash::ShadowParams sp{};
        sp.filter = filter;
        sp.bias_mode = ash::ShadowBiasMode::Constant;
        sp.bias_const = 0.0f;
        sp.bias_slope = 0.0f;
        sp.pcf_step = 1.0f;
        sp.strength = 1.0f;
        return sp;
    }

    // N=(0,0,1), L=(0,0,1), ambient 0.1, цагаан гэрэл ба материал.
    ash::ShaderUniforms make_facing_light_uniforms(const ash::ToonMaterial* mat)
    {
        ash::ShaderUniforms u{};
        u.material = mat;
        u.camera_pos = glm::vec3(0.0f, 0.0f, 5.0f);
        u.lights.add(ash::make_directional_light(
            glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(1.0f), glm::vec3(0.1f), 1.0f));
        return u;
    }

    ash::FragmentIn make_facing_fragment()
    {
        ash::FragmentIn fin{};
        fin.world_pos = glm::vec3(0.0f, 0.0f, 0.5f);
        fin.normal_ws = glm::vec3(0.0f, 0.0f, 1.0f);
        return fin;
    }

    bool test_half_lambert_bounded()
    {
        for (int i = 0; i <= 64; ++i)
        {
            const float theta = glm::pi<float>() * (float)i / 64.0f;
            for (int j = 0; j <= 64; ++j)
            {
                const float phi = glm::two_pi<float>() * (float)j / 64.0f;
                const glm::vec3 N(std::sin(theta) * std::cos(phi), std::cos(theta), std::sin(theta) * std::sin(phi));
                const glm::vec3 L = glm::normalize(glm::vec3(0.3f, -0.8f, 0.5f));
                const float hl = ash::half_lambert(N, L);
                if (hl < 0.0f || hl > 1.0f) return false;
                const float hl2 = ash::half_lambert(N, L, true);
                if (hl2 < 0.0f || hl2 > 1.0f) return false;
            }
        }
        if (!approx_eq(ash::half_lambert(1.0f), 1.0f)) return false;
        if (!approx_eq(ash::half_lambert(0.0f), 0.5f)) return false;
        if (!approx_eq(ash::half_lambert(-1.0f), 0.0f)) return false;
        // Нэгж биш оролт ч мужаас гарахгүй.
        if (!approx_eq(ash::half_lambert(3.0f), 1.0f)) return false;
        return true;
    }

    bool test_toon_bands_levels_and_monotonic()
    {
        for (int k = 1; k <= 6; ++k)
        {
            std::set<int> levels{};
            float prev = -1.0f;
            for (int i = 0; i <= 4000; ++i)
            {
                const float x = (float)i / 4000.0f;
                const float q = ash::toon_bands(x, k, 0.0f);
                if (q + 1e-6f < prev) return false;
                prev = q;
                levels.insert((int)std::lround(q * 1000.0f));
            }
            // 0, 1/k, ... (k-1)/k болон x=1 дээрх 1.0.
            if ((int)levels.size() != k + 1) return false;
        }

        // Floor нь доод түвшнийг дээш өргөнө.
        if (!approx_eq(ash::toon_bands(0.1f, 3, 0.2f), 0.2f)) return false;
        if (!approx_eq(ash::toon_bands(0.9f, 3, 0.2f), 2.0f / 3.0f)) return false;
        return true;
    }

    bool test_band_count_sanitized()
    {
        if (ash::sanitize_band_count(0) != ash::kDefaultToonBands) return false;
        if (ash::sanitize_band_count(-4) != ash::kDefaultToonBands) return false;
        if (ash::sanitize_band_count(5) != 5) return false;
        if (!approx_eq(ash::toon_bands(0.5f, 0), 1.0f / 3.0f)) return false;
        if (!approx_eq(ash::toon_bands(0.5f, -2), 1.0f / 3.0f)) return false;
        return true;
    }

    bool test_toon_threshold_and_steps()
    {
        if (!approx_eq(ash::toon_threshold(0.0f, 0.5f, 0.05f), 0.0f)) return false;
        if (!approx_eq(ash::toon_threshold(1.0f, 0.5f, 0.05f), 1.0f)) return false;
        if (!approx_eq(ash::toon_threshold(0.5f, 0.5f, 0.05f), 0.5f)) return false;
        if (!approx_eq(ash::toon_threshold(0.0f, 0.5f, 0.05f, 0.25f), 0.25f)) return false;

        const ash::ToonStepTable t = ash::make_default_cel_step_table();
        if (!approx_eq(ash::toon_steps(1.0f, t), 1.0f)) return false;
        if (!approx_eq(ash::toon_steps(0.7f, t), 0.8f)) return false;
        if (!approx_eq(ash::toon_steps(0.3f, t), 0.5f)) return false;
        if (!approx_eq(ash::toon_steps(0.1f, t), 0.3f)) return false;
        if (!approx_eq(ash::toon_steps(-0.8f, t), 0.3f)) return false;

        ash::DiffuseParams p{};
        p.model = ash::DiffuseModel::ToonSteps;
        if (!approx_eq(ash::eval_diffuse(p, 0.96f), 1.0f)) return false;
        p.model = ash::DiffuseModel::ToonBands;
        p.band_count = 3;
        // N.L = 0 -> half-Lambert 0.5 -> floor(1.5)/3
        if (!approx_eq(ash::eval_diffuse(p, 0.0f), 1.0f / 3.0f)) return false;
        return true;
    }

    bool test_shadow_frustum_exit_is_lit()
    {
        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        const ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::PCF3x3);

        // z01 = 1.25 > 1
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 1.5f, 1.0f), 1.0f), 1.0f)) return false;
        // u, v мужаас гадна
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(1.5f, 0.0f, 0.0f, 1.0f), 1.0f), 1.0f)) return false;
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, -1.2f, 0.0f, 1.0f), 1.0f), 1.0f)) return false;
        // w ~ 0
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.0f, 0.0f), 1.0f), 1.0f)) return false;
        // Дотор нь бол бүрэн сүүдэртэй.
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f), 0.0f)) return false;
        return true;
    }

    bool test_pcf_equals_tap_average()
    {
        const ash::ShadowDepthMap sm = make_stepped_shadow_map();
        const float z01 = 0.5f;

        // 3x3: u=0.5 -> fx=2, x = 1,2,3
        {
            const ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::PCF3x3);
            float sum = 0.0f;
            for (int oy = -1; oy <= 1; ++oy)
            {
                for (int ox = -1; ox <= 1; ++ox)
                {
                    sum += ash::shadow_compare(sm, 2 + ox, 2 + oy, z01);
                }
            }
            const float vis = ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f);
            if (!approx_eq(vis, sum / 9.0f)) return false;
            if (!approx_eq(vis, 2.0f / 3.0f)) return false;
        }

        // 2x2: u=0.375 -> fx=1.5, x = 1,2
        {
            const ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::PCF2x2);
            float sum = 0.0f;
            for (int oy = 0; oy <= 1; ++oy)
            {
                for (int ox = 0; ox <= 1; ++ox)
                {
                    sum += ash::shadow_compare(sm, 1 + ox, 2 + oy, z01);
                }
            }
            const float vis = ash::shadow_visibility(sm, sp, glm::vec4(-0.25f, 0.0f, 0.0f, 1.0f), 1.0f);
            if (!approx_eq(vis, sum / 4.0f)) return false;
            if (!approx_eq(vis, 0.5f)) return false;
        }

        // Hard: нэг texel.
        {
            const ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::Hard);
            if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f), 1.0f)) return false;
            if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(-0.5f, 0.0f, 0.0f, 1.0f), 1.0f), 0.0f)) return false;
        }

        if (ash::shadow_filter_tap_count(ash::ShadowFilter::Hard) != 1) return false;
        if (ash::shadow_filter_tap_count(ash::ShadowFilter::PCF2x2) != 4) return false;
        if (ash::shadow_filter_tap_count(ash::ShadowFilter::PCF3x3) != 9) return false;
        return true;
    }

    bool test_shadow_bias_and_strength()
    {
        if (!approx_eq(ash::shadow_bias(ash::ShadowBiasMode::Constant, 0.0f, 0.001f, 0.002f), 0.001f)) return false;
        if (!approx_eq(ash::shadow_bias(ash::ShadowBiasMode::SlopeScaled, 0.0f, 0.001f, 0.002f), 0.003f)) return false;
        if (!approx_eq(ash::shadow_bias(ash::ShadowBiasMode::SlopeScaled, 1.0f, 0.001f, 0.002f), 0.001f)) return false;

        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::PCF3x3);
        sp.strength = 0.5f;
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f), 0.5f)) return false;

        // Bias нь ижил гүнтэй гадаргыг гэрэлтэй болгоно.
        sm.clear(0.5f);
        sp.strength = 1.0f;
        sp.bias_const = 0.01f;
        if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, 0.01f, 1.0f), 1.0f), 1.0f)) return false;
        return true;
    }

    bool test_rim_term()
    {
        const glm::vec3 N(0.0f, 0.0f, 1.0f);
        ash::RimParams rp{};
        rp.mask_by_shadow = false;

        if (!approx_vec3(ash::rim_term(rp, N, N, 1.0f), glm::vec3(0.0f))) return false;
        const glm::vec3 side(1.0f, 0.0f, 0.0f);
        if (!approx_vec3(ash::rim_term(rp, N, side, 1.0f), glm::vec3(rp.strength))) return false;

        float prev = -1.0f;
        for (int i = 0; i <= 90; ++i)
        {
            const float a = glm::radians((float)i);
            const glm::vec3 V(std::sin(a), 0.0f, std::cos(a));
            const float f = ash::rim_factor(N, V, rp.edge0, rp.edge1);
            if (f + 1e-6f < prev) return false;
            prev = f;
        }

        rp.mask_by_shadow = true;
        if (!approx_vec3(ash::rim_term(rp, N, side, 0.0f), glm::vec3(0.0f))) return false;
        rp.enable = false;
        if (!approx_vec3(ash::rim_term(rp, N, side, 1.0f), glm::vec3(0.0f))) return false;
        return true;
    }

    bool test_zero_color_fallback()
    {
        const ash::ColorF c = ash::composite_single_light(
            glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), 1.0f, 1.0f, glm::vec3(0.1f), glm::vec3(0.0f), glm::vec3(0.0f));
        if (!approx_rgb(c, 1.1f, 1.1f, 1.1f)) return false;

        ash::ToonMaterial mat = ash::make_half_lambert_material("black", glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        u.lights.lights[0].color = glm::vec3(0.0f);
        const ash::ColorF e = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(e, 1.1f, 1.1f, 1.1f)) return false;

        // Ambient тэгийг шууд хүлээн авна.
        const ash::ColorF z = ash::composite_single_light(
            glm::vec4(1.0f), 0.0f, 1.0f, glm::vec3(0.0f), glm::vec3(1.0f), glm::vec3(0.0f));
        if (!approx_rgb(z, 0.0f, 0.0f, 0.0f)) return false;
        return true;
    }

    bool test_scenario_lit_facing_light()
    {
        const ash::ColorF c = ash::composite_single_light(
            glm::vec4(1.0f), ash::half_lambert(1.0f), 1.0f, glm::vec3(0.1f), glm::vec3(1.0f), glm::vec3(0.0f));
        if (!approx_rgb(c, 1.1f, 1.1f, 1.1f)) return false;
        const ash::ColorF clamped = ash::composite_single_light(
            glm::vec4(1.0f), 1.0f, 1.0f, glm::vec3(0.1f), glm::vec3(1.0f), glm::vec3(0.0f), true);
        if (!approx_rgb(clamped, 1.0f, 1.0f, 1.0f)) return false;

        const ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        const ash::ColorF e = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(e, 1.1f, 1.1f, 1.1f)) return false;
        if (!approx_eq(e.a, 1.0f)) return false;

        u.shading.clamp_output = true;
        const ash::ColorF ec = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(ec, 1.0f, 1.0f, 1.0f)) return false;
        return true;
    }

    bool test_scenario_fully_shadowed()
    {
        const ash::ColorF c = ash::composite_single_light(
            glm::vec4(1.0f), 1.0f, 0.0f, glm::vec3(0.1f), glm::vec3(1.0f), glm::vec3(0.0f));
        if (!approx_rgb(c, 0.1f, 0.1f, 0.1f)) return false;

        // Identity гэрлийн матриц: fragment z01 = 0.75, map бүхэлдээ 0.
        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        const ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        u.lights.lights[0].shadow_map = &sm;
        u.lights.lights[0].light_viewproj = glm::mat4(1.0f);
        const ash::ColorF e = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(e, 0.1f, 0.1f, 0.1f)) return false;

        u.shading.shadows = false;
        const ash::ColorF lit = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(lit, 1.1f, 1.1f, 1.1f)) return false;
        return true;
    }

    bool test_scenario_three_band()
    {
        if (!approx_eq(ash::toon_bands(0.5f, 3), 1.0f / 3.0f)) return false;
        if (!approx_eq(ash::toon_bands(0.5f, 3, 0.4f), 0.4f)) return false;

        ash::ToonMaterial mat = ash::make_toon_band_material("band", glm::vec4(1.0f), 3);
        mat.rim.enable = false;
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        // N.L = 0 -> half-Lambert 0.5 -> 1/3; ambient 0.1
        u.lights.lights[0].dir_to_light_ws = glm::vec3(1.0f, 0.0f, 0.0f);
        const ash::ColorF e = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        const float expected = 0.1f + 1.0f / 3.0f;
        if (!approx_rgb(e, expected, expected, expected)) return false;
        return true;
    }

    bool test_albedo_texture_modulation()
    {
        ash::Texture2DData tex(2, 2, ash::Color{255, 255, 255, 255});
        tex.at(1, 0) = ash::Color{0, 0, 0, 255};
        ash::ToonMaterial mat = ash::make_half_lambert_material("tex", glm::vec4(0.5f, 0.5f, 0.5f, 1.0f));
        mat.albedo_tex = &tex;

        const glm::vec4 a = ash::eval_albedo(mat, glm::vec2(0.0f, 0.0f));
        if (!approx_eq(a.r, 0.5f) || !approx_eq(a.a, 1.0f)) return false;
        const glm::vec4 b = ash::eval_albedo(mat, glm::vec2(0.5f, 0.0f));
        if (!approx_eq(b.r, 0.25f)) return false;
        // Repeat wrap: u=1.0 нь u=0.0-тэй адил.
        const glm::vec4 c = ash::eval_albedo(mat, glm::vec2(1.0f, 0.0f));
        if (!approx_eq(c.r, a.r)) return false;

        mat.albedo_tex = nullptr;
        if (!approx_eq(ash::eval_albedo(mat, glm::vec2(0.3f)).g, 0.5f)) return false;
        return true;
    }

    bool test_vertex_transform()
    {
        const glm::mat4 model = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
        const glm::mat4 light_vp = glm::scale(glm::mat4(1.0f), glm::vec3(0.5f));
        const ash::TransformSet t = ash::make_transform_set(model, glm::mat4(1.0f), glm::mat4(1.0f), light_vp);

        ash::ShaderVertex v{};
        v.position = glm::vec3(0.0f);
        v.normal = glm::vec3(0.0f, 2.0f, 0.0f);
        v.uv = glm::vec2(0.25f, 0.75f);
        const ash::VertexOut o = ash::transform_vertex(v, t);
        if (!approx_vec3(glm::vec3(o.clip), glm::vec3(1.0f, 2.0f, 3.0f))) return false;
        if (!approx_eq(o.clip.w, 1.0f)) return false;
        if (!approx_vec3(o.world_pos, glm::vec3(1.0f, 2.0f, 3.0f))) return false;
        if (!approx_vec3(o.normal_ws, glm::vec3(0.0f, 1.0f, 0.0f))) return false;
        if (!approx_vec3(glm::vec3(o.shadow_coord), glm::vec3(0.5f, 1.0f, 1.5f))) return false;
        if (!approx_eq(o.uv.x, 0.25f) || !approx_eq(o.uv.y, 0.75f)) return false;

        // Жигд бус scale: inverse-transpose нь гадаргад перпендикуляр хэвээр.
        const glm::mat4 squash = glm::scale(glm::mat4(1.0f), glm::vec3(2.0f, 1.0f, 1.0f));
        const ash::TransformSet ts = ash::make_transform_set(squash, glm::mat4(1.0f), glm::mat4(1.0f));
        ash::ShaderVertex d{};
        d.normal = glm::normalize(glm::vec3(1.0f, 1.0f, 0.0f));
        const glm::vec3 n_it = ash::transform_vertex(d, ts, ash::NormalTransformMode::InverseTranspose).normal_ws;
        const glm::vec3 n_m3 = ash::transform_vertex(d, ts, ash::NormalTransformMode::ModelUpper3x3).normal_ws;
        if (!approx_vec3(n_it, glm::normalize(glm::vec3(0.5f, 1.0f, 0.0f)))) return false;
        if (!approx_vec3(n_m3, glm::normalize(glm::vec3(2.0f, 1.0f, 0.0f)))) return false;
        const glm::vec3 n_nm = ash::transform_vertex(d, ts, ash::NormalTransformMode::NormalMatrix).normal_ws;
        if (!approx_vec3(n_nm, n_it)) return false;
        return true;
    }

    bool test_outline_inflation()
    {
        ash::ShaderVertex v{};
        v.position = glm::vec3(1.0f, 0.0f, 0.0f);
        v.normal = glm::vec3(3.0f, 0.0f, 0.0f);
        const ash::ShaderVertex inflated = ash::inflate_along_normal(v, 0.03f);
        if (!approx_vec3(inflated.position, glm::vec3(1.03f, 0.0f, 0.0f))) return false;

        ash::ToonMaterial mat = ash::make_toon_band_material("hull", glm::vec4(1.0f), 3);
        mat.outline_width = 0.1f;
        mat.outline_color = glm::vec4(0.2f, 0.1f, 0.0f, 1.0f);
        ash::ShaderUniforms u{};
        u.material = &mat;
        u.outline_width_scale = 2.0f;
        const ash::ShaderProgram p = ash::make_outline_program();
        if (!p.valid()) return false;
        const ash::VertexOut o = p.vs(v, u);
        if (!approx_vec3(o.world_pos, glm::vec3(1.2f, 0.0f, 0.0f))) return false;
        const ash::FragmentOut f = p.fs(ash::fragment_from_vertex(o), u);
        if (!approx_rgb(f.color, 0.2f, 0.1f, 0.0f)) return false;
        return true;
    }

    bool test_missing_light_debug_color()
    {
        const ash::ToonMaterial mat = ash::make_half_lambert_material("red", glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
        ash::ShaderUniforms u{};
        u.material = &mat;
        const ash::ColorF c = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(c, 0.0f, 0.0f, 1.0f)) return false;

        u.shading.debug_missing_light = false;
        const ash::ColorF unlit = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(unlit, 1.0f, 0.0f, 0.0f)) return false;

        // Material байхгүй үед анхдагч цагаан материал.
        u.material = nullptr;
        u.lights.add(ash::make_directional_light(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(1.0f), glm::vec3(0.0f)));
        const ash::ColorF dflt = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!(dflt.r > 0.9f && approx_eq(dflt.r, dflt.b))) return false;
        return true;
    }

    bool test_multi_light_accumulation()
    {
        const ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        u.lights.add(ash::make_directional_light(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(1.0f), glm::vec3(0.1f)));
        const ash::ColorF two = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(two, 2.2f, 2.2f, 2.2f)) return false;

        const ash::LightDescriptor pl = ash::make_point_light(
            glm::vec3(0.0f, 0.0f, 2.0f), glm::vec3(1.0f), glm::vec3(1.0f, 0.0f, 0.25f), 1.0f);
        if (!approx_eq(ash::light_attenuation(pl, glm::vec3(0.0f)), 0.5f)) return false;
        if (!approx_vec3(ash::light_dir_to(pl, glm::vec3(0.0f)), glm::vec3(0.0f, 0.0f, 1.0f))) return false;
        // Ойрхон үед 1-ээс хэтрэхгүй.
        const ash::LightDescriptor near_pl = ash::make_point_light(
            glm::vec3(0.0f), glm::vec3(1.0f), glm::vec3(0.5f, 0.0f, 0.0f), 1.0f);
        if (!approx_eq(ash::light_attenuation(near_pl, glm::vec3(0.0f)), 1.0f)) return false;
        return true;
    }

    bool test_pcf_step_spacing()
    {
        const ash::ShadowDepthMap sm = make_stepped_shadow_map();
        ash::ShadowParams sp = make_unbiased_params(ash::ShadowFilter::PCF2x2);

        // 2x2: u=0.125 -> fx=0.5. step 1 нь x=0,1 (хоёулаа хаалттай), step 2 нь x=0,2.
        const glm::vec4 left(-0.75f, 0.0f, 0.0f, 1.0f);
        if (!approx_eq(ash::shadow_visibility(sm, sp, left, 1.0f), 0.0f)) return false;
        sp.pcf_step = 2.0f;
        if (!approx_eq(ash::shadow_visibility(sm, sp, left, 1.0f), 0.5f)) return false;

        // 3x3: u=0.75 -> cx=3. step 1 нь x=2..4, step 2 нь x=1,3,5 (5 нь 4 руу clamp).
        sp.filter = ash::ShadowFilter::PCF3x3;
        const glm::vec4 right(0.5f, 0.0f, 0.0f, 1.0f);
        sp.pcf_step = 1.0f;
        if (!approx_eq(ash::shadow_visibility(sm, sp, right, 1.0f), 1.0f)) return false;
        sp.pcf_step = 2.0f;
        if (!approx_eq(ash::shadow_visibility(sm, sp, right, 1.0f), 2.0f / 3.0f)) return false;

        // Кадрын тохиргооноос дамжина.
        ash::ShadingParams shading{};
        shading.shadow_pcf_step = 2.0f;
        if (!approx_eq(ash::make_shadow_params(shading, glm::mat4(1.0f)).pcf_step, 2.0f)) return false;
        return true;
    }

    bool test_non_finite_coordinates()
    {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float inf = std::numeric_limits<float>::infinity();

        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        for (ash::ShadowFilter f : {ash::ShadowFilter::Hard, ash::ShadowFilter::PCF2x2, ash::ShadowFilter::PCF3x3})
        {
            const ash::ShadowParams sp = make_unbiased_params(f);
            if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(nan, 0.0f, 0.0f, 1.0f), 1.0f), 1.0f)) return false;
            if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, 0.0f, nan, 1.0f), 1.0f), 1.0f)) return false;
            if (!approx_eq(ash::shadow_visibility(sm, sp, glm::vec4(0.0f, -inf, 0.0f, 1.0f), 1.0f), 1.0f)) return false;
        }

        ash::Texture2DData tex(2, 2, ash::Color{0, 0, 0, 255});
        ash::ToonMaterial mat = ash::make_half_lambert_material("tex", glm::vec4(0.5f, 0.5f, 0.5f, 1.0f));
        mat.albedo_tex = &tex;
        const glm::vec4 a = ash::eval_albedo(mat, glm::vec2(nan, 0.0f));
        if (!approx_eq(a.r, 0.5f) || !approx_eq(a.a, 1.0f)) return false;
        const glm::vec4 b = ash::eval_albedo(mat, glm::vec2(0.0f, inf));
        if (!approx_eq(b.g, 0.5f)) return false;
        return true;
    }

    bool test_rim_mask_frame_toggle()
    {
        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        mat.rim.enable = true;
        mat.rim.mask_by_shadow = true;
        mat.rim.strength = 0.4f;
        mat.rim.color = glm::vec3(1.0f);

        // Камер хажуугаас: N.V = 0 тул rim бүтэн. Fragment бүрэн сүүдэртэй.
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        u.camera_pos = glm::vec3(5.0f, 0.0f, 0.5f);
        u.lights.lights[0].shadow_map = &sm;
        u.lights.lights[0].light_viewproj = glm::mat4(1.0f);

        const ash::ColorF masked = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(masked, 0.1f, 0.1f, 0.1f)) return false;

        u.shading.rim_mask_by_shadow = false;
        const ash::ColorF frame_off = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(frame_off, 0.5f, 0.5f, 0.5f)) return false;

        u.shading.rim_mask_by_shadow = true;
        mat.rim.mask_by_shadow = false;
        const ash::ColorF material_off = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(material_off, 0.5f, 0.5f, 0.5f)) return false;
        return true;
    }

    bool test_debug_view_fragments()
    {
        const ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        ash::ShaderUniforms u = make_facing_light_uniforms(&mat);
        ash::FragmentIn fin = make_facing_fragment();
        fin.depth01 = 0.3f;

        const ash::ColorF n = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::Normal);
        if (!approx_rgb(n, 0.5f, 0.5f, 1.0f)) return false;
        const ash::ColorF d = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::Depth);
        if (!approx_rgb(d, 0.3f, 0.3f, 0.3f)) return false;
        const ash::ColorF diff = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::Diffuse);
        if (!approx_rgb(diff, 1.0f, 1.0f, 1.0f)) return false;
        const ash::ColorF lit = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::ShadowVisibility);
        if (!approx_rgb(lit, 1.0f, 1.0f, 1.0f)) return false;

        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        u.lights.lights[0].shadow_map = &sm;
        u.lights.lights[0].light_viewproj = glm::mat4(1.0f);
        const ash::ColorF dark = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::ShadowVisibility);
        if (!approx_rgb(dark, 0.0f, 0.0f, 0.0f)) return false;

        u.lights.lights.clear();
        const ash::ColorF missing = ash::evaluate_debug_fragment(fin, u, ash::DebugViewMode::Diffuse);
        if (!approx_rgb(missing, 0.0f, 0.0f, 1.0f)) return false;

        ash::ShadingParams shading{};
        if (ash::make_main_program(shading).name != "toon") return false;
        shading.debug_view = ash::DebugViewMode::Depth;
        const ash::ShaderProgram p = ash::make_main_program(shading);
        if (p.name != "debug_depth" || !p.valid()) return false;
        if (!approx_rgb(p.fs(fin, u).color, 0.3f, 0.3f, 0.3f)) return false;

        if (ash::parse_debug_view_name("Normal").value != ash::DebugViewMode::Normal) return false;
        if (ash::parse_debug_view_name("shadow").value != ash::DebugViewMode::ShadowVisibility) return false;
        if (ash::parse_debug_view_name("xray").ok) return false;
        return true;
    }

    bool test_point_light_range_and_shadow()
    {
        const ash::LightDescriptor pl = ash::make_point_light(
            glm::vec3(0.0f, 0.0f, 2.0f), glm::vec3(1.0f), glm::vec3(1.0f, 0.0f, 0.0f), 1.0f, 3.0f);
        if (!approx_eq(ash::light_attenuation(pl, glm::vec3(0.0f)), 1.0f)) return false;
        if (!approx_eq(ash::light_attenuation(pl, glm::vec3(0.0f, 0.0f, -2.0f)), 0.0f)) return false;
        ash::LightDescriptor unbounded = pl;
        unbounded.range = 0.0f;
        if (!approx_eq(ash::light_attenuation(unbounded, glm::vec3(0.0f, 0.0f, -2.0f)), 1.0f)) return false;

        // Shadow map холбогдсон ч point гэрэл сүүдэрлэгдэхгүй.
        ash::ShadowDepthMap sm(4, 4);
        sm.clear(0.0f);
        const ash::ToonMaterial mat = ash::make_half_lambert_material("white", glm::vec4(1.0f));
        ash::ShaderUniforms u{};
        u.material = &mat;
        u.camera_pos = glm::vec3(0.0f, 0.0f, 5.0f);
        ash::LightDescriptor shadowed_pl = pl;
        shadowed_pl.shadow_map = &sm;
        shadowed_pl.light_viewproj = glm::mat4(1.0f);
        u.lights.add(shadowed_pl);
        const ash::ColorF c = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(c, 1.0f, 1.0f, 1.0f)) return false;

        // Range-ээс гадна зөвхөн ambient (0) үлдэнэ.
        u.lights.lights[0].range = 1.0f;
        const ash::ColorF out_of_range = ash::evaluate_toon_fragment(make_facing_fragment(), u);
        if (!approx_rgb(out_of_range, 0.0f, 0.0f, 0.0f)) return false;
        return true;
    }

    bool test_env_config_parsing()
    {
        if (!ash::parse_env_bool("ON").value) return false;
        if (ash::parse_env_bool("no").value) return false;
        if (ash::parse_env_bool("maybe").ok) return false;
        if (ash::parse_env_u32("512").value != 512u) return false;
        if (ash::parse_env_u32("12x").ok) return false;
        if (ash::parse_env_u32("0", 1u).ok) return false;
        if (!approx_eq(ash::parse_env_f32("1.5").value, 1.5f)) return false;
        if (ash::parse_env_f32("abc").ok) return false;
        if (ash::parse_shadow_filter_name("PCF2x2").value != ash::ShadowFilter::PCF2x2) return false;
        if (ash::parse_shadow_filter_name("gauss").ok) return false;
        if (ash::parse_shadow_bias_mode_name("constant").value != ash::ShadowBiasMode::Constant) return false;

        const std::map<std::string, std::string> vars = {
            {"ASH_WIDTH", "320"},
            {"ASH_SHADOW_FILTER", "hard"},
            {"ASH_SHADOW_BIAS", "bogus"},
            {"ASH_CLAMP_OUTPUT", "true"},
            {"ASH_SHADOW_MAP_SIZE", "4"},
            {"ASH_CAPTURE", "out.ppm"},
        };
        const ash::EnvGetter env = [&vars](const char* name) -> const char* {
            const auto it = vars.find(name);
            return (it == vars.end()) ? nullptr : it->second.c_str();
        };

        // Буруу утгын анхааруулгыг тестийн гаралтаас нууна.
        ash::set_log_level(ash::LogLevel::Error);
        const ash::FrameParams base{};
        const ash::FrameParams fp = ash::load_frame_params_from_env(base, env);
        ash::set_log_level(ash::LogLevel::Info);
        if (fp.w != 320 || fp.h != base.h) return false;
        if (fp.shading.shadow_filter != ash::ShadowFilter::Hard) return false;
        // Буруу утга анхныхаа утгыг хадгална.
        if (fp.shading.shadow_bias_mode != base.shading.shadow_bias_mode) return false;
        if (fp.shadow.resolution != base.shadow.resolution) return false;
        if (!fp.shading.clamp_output) return false;
        if (ash::load_capture_path_from_env("x.ppm", env) != "out.ppm") return false;

        // Хэмжээ int-д багтахгүй эсвэл хэт том бол анхны утга хэвээр.
        if (!ash::parse_env_u32("16384", 1u, ash::kMaxTargetDimension).ok) return false;
        if (ash::parse_env_u32("16385", 1u, ash::kMaxTargetDimension).ok) return false;
        if (ash::parse_env_u32("3000000000", 1u, ash::kMaxTargetDimension).ok) return false;
        if (ash::parse_env_u32("99999999999999999999999").ok) return false;

        const std::map<std::string, std::string> huge = {
            {"ASH_WIDTH", "3000000000"},
            {"ASH_HEIGHT", "100000"},
            {"ASH_SHADOW_MAP_SIZE", "100000"},
        };
        const ash::EnvGetter huge_env = [&huge](const char* name) -> const char* {
            const auto it = huge.find(name);
            return (it == huge.end()) ? nullptr : it->second.c_str();
        };
        ash::set_log_level(ash::LogLevel::Error);
        const ash::FrameParams kept = ash::load_frame_params_from_env(base, huge_env);
        ash::set_log_level(ash::LogLevel::Info);
        if (kept.w != base.w || kept.h != base.h) return false;
        if (kept.shadow.resolution != base.shadow.resolution) return false;
        return true;
    }
}

int main()
{
    const bool ok_hl = test_half_lambert_bounded();
    const bool ok_bands = test_toon_bands_levels_and_monotonic();
    const bool ok_band_count = test_band_count_sanitized();
    const bool ok_steps = test_toon_threshold_and_steps();
    const bool ok_frustum = test_shadow_frustum_exit_is_lit();
    const bool ok_pcf = test_pcf_equals_tap_average();
    const bool ok_bias = test_shadow_bias_and_strength();
    const bool ok_rim = test_rim_term();
    const bool ok_fallback = test_zero_color_fallback();
    const bool ok_lit = test_scenario_lit_facing_light();
    const bool ok_shadowed = test_scenario_fully_shadowed();
    const bool ok_band3 = test_scenario_three_band();
    const bool ok_albedo = test_albedo_texture_modulation();
    const bool ok_vertex = test_vertex_transform();
    const bool ok_outline = test_outline_inflation();
    const bool ok_missing = test_missing_light_debug_color();
    const bool ok_multi = test_multi_light_accumulation();
    const bool ok_env = test_env_config_parsing();
    const bool ok_pcf_step = test_pcf_step_spacing();
    const bool ok_non_finite = test_non_finite_coordinates();
    const bool ok_rim_toggle = test_rim_mask_frame_toggle();
    const bool ok_debug = test_debug_view_fragments();
    const bool ok_point = test_point_light_range_and_shadow();

    if (!ok_hl) std::fprintf(stderr, "[ash-tests] half-Lambert bounds failed\n");
    if (!ok_bands) std::fprintf(stderr, "[ash-tests] toon band levels/monotonicity failed\n");
    if (!ok_band_count) std::fprintf(stderr, "[ash-tests] band count sanitizing failed\n");
    if (!ok_steps) std::fprintf(stderr, "[ash-tests] toon threshold/step table failed\n");
    if (!ok_frustum) std::fprintf(stderr, "[ash-tests] shadow frustum-exit rule failed\n");
    if (!ok_pcf) std::fprintf(stderr, "[ash-tests] PCF tap average failed\n");
    if (!ok_bias) std::fprintf(stderr, "[ash-tests] shadow bias/strength failed\n");
    if (!ok_rim) std::fprintf(stderr, "[ash-tests] rim term failed\n");
    if (!ok_fallback) std::fprintf(stderr, "[ash-tests] zero-color fallback failed\n");
    if (!ok_lit) std::fprintf(stderr, "[ash-tests] lit facing-light scenario failed\n");
    if (!ok_shadowed) std::fprintf(stderr, "[ash-tests] fully shadowed scenario failed\n");
    if (!ok_band3) std::fprintf(stderr, "[ash-tests] three-band scenario failed\n");
    if (!ok_albedo) std::fprintf(stderr, "[ash-tests] albedo texture modulation failed\n");
    if (!ok_vertex) std::fprintf(stderr, "[ash-tests] vertex transform failed\n");
    if (!ok_outline) std::fprintf(stderr, "[ash-tests] outline inflation failed\n");
    if (!ok_missing) std::fprintf(stderr, "[ash-tests] missing-light debug color failed\n");
    if (!ok_multi) std::fprintf(stderr, "[ash-tests] multi-light accumulation failed\n");
    if (!ok_env) std::fprintf(stderr, "[ash-tests] env config parsing failed\n");
    if (!ok_pcf_step) std::fprintf(stderr, "[ash-tests] PCF tap spacing failed\n");
    if (!ok_non_finite) std::fprintf(stderr, "[ash-tests] non-finite shadow/texture coordinates failed\n");
    if (!ok_rim_toggle) std::fprintf(stderr, "[ash-tests] frame rim shadow-mask toggle failed\n");
    if (!ok_debug) std::fprintf(stderr, "[ash-tests] debug view fragments failed\n");
    if (!ok_point) std::fprintf(stderr, "[ash-tests] point light range/shadow failed\n");

    if (!(ok_hl && ok_bands && ok_band_count && ok_steps && ok_frustum && ok_pcf && ok_bias && ok_rim &&
          ok_fallback && ok_lit && ok_shadowed && ok_band3 && ok_albedo && ok_vertex && ok_outline && ok_missing &&
          ok_multi && ok_env && ok_pcf_step && ok_non_finite && ok_rim_toggle && ok_debug && ok_point)) return 1;
    std::fprintf(stderr, "[ash-tests] shading core: all tests passed\n");
    return 0;
}
