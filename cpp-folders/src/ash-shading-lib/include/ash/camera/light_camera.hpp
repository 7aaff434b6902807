#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: light_camera.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Directional гэрлийн ortho camera. Scene AABB-д тааруулах болон
            film хэмжээ + near/far-аар тогтоох хоёр хувилбар.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "ash/camera/convention.hpp"
#include "ash/geometry/aabb.hpp"

namespace ash
{
    struct LightCamera
    {
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::mat4 viewproj{1.0f};
        glm::vec3 pos_ws{0.0f};
        // Гэрлийн цацрагийн чиглэл (гэрлээс scene рүү).
        glm::vec3 dir_ws{0.0f, -1.0f, 0.0f};
    };

    namespace detail
    {
        // Ortho цонхны төвийг texel алхамд буулгаж, camera хөдлөхөд сүүдрийн ирмэг гулсахгүй.
        inline glm::vec4 snap_ortho_window(const glm::vec2& lo, const glm::vec2& hi, uint32_t resolution)
        {
            const glm::vec2 span = glm::max(hi - lo, glm::vec2(1e-5f));
            glm::vec2 center = 0.5f * (lo + hi);
            if (resolution > 0u)
            {
                const glm::vec2 texel = span / (float)resolution;
                center = glm::floor(center / texel + 0.5f) * texel;
            }
            const glm::vec2 half = 0.5f * span;
            return glm::vec4(center - half, center + half);
        }
    }

    inline LightCamera build_dir_light_camera_aabb(
        const glm::vec3& dir_to_light_ws,
        const AABB& scene_aabb_ws,
        float extra_margin = 2.0f,
        uint32_t shadow_map_resolution = 1024u
    )
    {
        LightCamera lc{};
        lc.dir_ws = -glm::normalize(dir_to_light_ws);

        const glm::vec3 focus = scene_aabb_ws.center();
        const float back_off = 2.0f * (glm::length(scene_aabb_ws.extent()) + extra_margin);
        lc.pos_ws = focus - lc.dir_ws * back_off;
        lc.view = look_at_lh(lc.pos_ws, focus, stable_up_for(lc.dir_ws));

        // Гэрлийн орон зай дахь хайрцаг: x,y нь ortho цонх, z нь near/far.
        const AABB ls = transform_aabb(scene_aabb_ws, lc.view);
        const glm::vec3 margin(extra_margin);
        const glm::vec3 lo = ls.minv - margin;
        const glm::vec3 hi = ls.maxv + margin;

        const glm::vec4 win = detail::snap_ortho_window(glm::vec2(lo), glm::vec2(hi), shadow_map_resolution);
        lc.proj = ortho_lh_no(win.x, win.z, win.y, win.w, std::max(0.01f, lo.z), hi.z);
        lc.viewproj = lc.proj * lc.view;
        return lc;
    }

    // Тогтмол film хэмжээтэй нарны camera. focus_ws-ийг төвд авч, гэрэл рүү
    // far-ийн хагас зайд байрлуулна.
    inline LightCamera build_dir_light_camera_film(
        const glm::vec3& dir_to_light_ws,
        const glm::vec3& focus_ws,
        float film_size,
        float near_plane,
        float far_plane
    )
    {
        LightCamera lc{};
        lc.dir_ws = -glm::normalize(dir_to_light_ws);

        const float zn = std::max(1e-3f, near_plane);
        const float zf = std::max(zn + 1e-3f, far_plane);
        const float half = 0.5f * std::max(film_size, 1e-3f);

        lc.pos_ws = focus_ws - lc.dir_ws * (0.5f * (zn + zf));
        lc.view = look_at_lh(lc.pos_ws, focus_ws, stable_up_for(lc.dir_ws));
        lc.proj = ortho_lh_no(-half, half, -half, half, zn, zf);
        lc.viewproj = lc.proj * lc.view;
        return lc;
    }
}
