#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: rim_light.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Fresnel маягийн rim гэрэл. Харах чиглэл ба нормалийн хоорондох
            өнцөг томрох тусам ирмэгийг тодруулна.
*/

#include <algorithm>

#include <glm/glm.hpp>

namespace ash
{
    struct RimParams
    {
        bool enable = true;
        float edge0 = 0.6f;
        float edge1 = 1.0f;
        float strength = 0.4f;
        glm::vec3 color{1.0f, 1.0f, 1.0f};
        // Бүрэн сүүдэртэй хэсэгт rim гаргахгүй.
        bool mask_by_shadow = true;
    };

    inline float rim_factor(const glm::vec3& N, const glm::vec3& V, float edge0, float edge1)
    {
        const float rim = 1.0f - std::max(glm::dot(N, V), 0.0f);
        if (edge1 <= edge0) return (rim >= edge1) ? 1.0f : 0.0f;
        return glm::smoothstep(edge0, edge1, rim);
    }

    inline glm::vec3 rim_term(const RimParams& rp, const glm::vec3& N, const glm::vec3& V, float shadow_vis)
    {
        if (!rp.enable) return glm::vec3(0.0f);
        const float f = rim_factor(N, V, rp.edge0, rp.edge1) * rp.strength;
        const float mask = rp.mask_by_shadow ? std::clamp(shadow_vis, 0.0f, 1.0f) : 1.0f;
        return rp.color * (f * mask);
    }
}
