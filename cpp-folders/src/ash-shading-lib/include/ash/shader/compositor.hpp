#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: compositor.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Суурь өнгө, diffuse, сүүдэр, ambient, rim-ийг нэгтгэж эцсийн
            өнгийг гаргана. Тэг өнгийг fallback өнгөөр орлуулна.
*/


#include <algorithm>

#include <glm/glm.hpp>

#include "ash/gfx/rt_types.hpp"

namespace ash
{
    // Урт нь үүнээс бага өнгийг "тохируулаагүй" гэж үзнэ.
    constexpr float kColorEpsilon = 1e-4f;

    inline const glm::vec3 kFallbackBaseColor{1.0f, 1.0f, 1.0f};
    inline const glm::vec3 kFallbackLightColor{1.0f, 1.0f, 1.0f};
    inline const glm::vec3 kFallbackShadowTint{1.0f, 1.0f, 1.0f};
    // Гэрэл холбогдоогүйг илтгэх debug өнгө.
    inline const glm::vec3 kDebugNoLightColor{0.0f, 0.0f, 1.0f};

    inline bool color_is_unset(const glm::vec3& c)
    {
        return glm::length(c) < kColorEpsilon;
    }

    inline glm::vec3 resolve_color(const glm::vec3& c, const glm::vec3& fallback)
    {
        return color_is_unset(c) ? fallback : c;
    }

    struct CompositeInputs
    {
        glm::vec4 albedo{1.0f};          // base color * texture, alpha included
        glm::vec3 ambient{0.0f};
        glm::vec3 shadow_tint{1.0f};
        glm::vec3 direct{0.0f};          // sum(diffuse * light_color * visibility)
        glm::vec3 rim{0.0f};
    };

    inline ColorF composite_color(const CompositeInputs& in, bool clamp_output)
    {
        const glm::vec3 base = glm::vec3(in.albedo);
        const glm::vec3 tint = resolve_color(in.shadow_tint, kFallbackShadowTint);
        glm::vec3 c = base * (in.ambient * tint + in.direct) + in.rim;
        if (clamp_output) c = glm::clamp(c, glm::vec3(0.0f), glm::vec3(1.0f));
        return ColorF{c.r, c.g, c.b, in.albedo.a};
    }

    // Нэг гэрлийн стандарт дараалал:
    // base * (ambient + diffuse * light_color * visibility) + rim
    inline ColorF composite_single_light(
        const glm::vec4& base_color,
        float diffuse,
        float shadow_vis,
        const glm::vec3& ambient,
        const glm::vec3& light_color,
        const glm::vec3& rim,
        bool clamp_output = false)
    {
        CompositeInputs in{};
        in.albedo = glm::vec4(resolve_color(glm::vec3(base_color), kFallbackBaseColor), base_color.a);
        in.ambient = ambient;
        in.direct = diffuse * resolve_color(light_color, kFallbackLightColor) * std::clamp(shadow_vis, 0.0f, 1.0f);
        in.rim = rim;
        return composite_color(in, clamp_output);
    }

    inline ColorF missing_light_color(float alpha)
    {
        return ColorF{kDebugNoLightColor.r, kDebugNoLightColor.g, kDebugNoLightColor.b, alpha};
    }
}
