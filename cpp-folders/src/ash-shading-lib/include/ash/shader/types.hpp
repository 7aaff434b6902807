#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment программуудын оролт гаралт болон host-оос
            холбогдох uniform-уудын төрөл.
*/


#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "ash/frame/frame_params.hpp"
#include "ash/gfx/rt_types.hpp"
#include "ash/lighting/light_types.hpp"
#include "ash/resources/material.hpp"

namespace ash
{
    struct TransformSet
    {
        glm::mat4 model{1.0f};
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::mat4 mvp{1.0f};
        glm::mat3 normal{1.0f};
        glm::mat4 light_viewproj{1.0f};
    };

    // Vertex record (object space).
    struct ShaderVertex
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
    };

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};

        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        // light_viewproj * world_pos, w-д хуваагүй.
        glm::vec4 shadow_coord{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec2 uv{0.0f};
    };

    struct FragmentIn
    {
        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec4 shadow_coord{0.0f, 0.0f, 0.0f, 1.0f};
        bool has_shadow_coord = false;
        glm::vec2 uv{0.0f};
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    struct ShaderUniforms
    {
        TransformSet transforms{};
        glm::vec3 camera_pos{0.0f};

        LightSet lights{};
        const ToonMaterial* material = nullptr;

        ShadingParams shading{};
        // Outline pass-д material.outline_width-ийг үржүүлнэ.
        float outline_width_scale = 1.0f;
    };

    inline glm::vec3 safe_normalize(const glm::vec3& v, const glm::vec3& fallback = glm::vec3(0.0f, 1.0f, 0.0f))
    {
        const float len = glm::length(v);
        return (len > 1e-8f) ? v / len : fallback;
    }

    inline glm::mat3 inverse_transpose_3x3(const glm::mat4& m)
    {
        glm::mat3 n = glm::mat3(m);
        const float det = glm::determinant(n);
        if (std::abs(det) > 1e-8f) n = glm::transpose(glm::inverse(n));
        return n;
    }

    inline TransformSet make_transform_set(
        const glm::mat4& model,
        const glm::mat4& view,
        const glm::mat4& proj,
        const glm::mat4& light_viewproj = glm::mat4(1.0f))
    {
        TransformSet t{};
        t.model = model;
        t.view = view;
        t.proj = proj;
        t.mvp = proj * view * model;
        t.normal = inverse_transpose_3x3(model);
        t.light_viewproj = light_viewproj;
        return t;
    }

    inline FragmentIn fragment_from_vertex(const VertexOut& v)
    {
        FragmentIn f{};
        f.world_pos = v.world_pos;
        f.normal_ws = v.normal_ws;
        f.shadow_coord = v.shadow_coord;
        f.has_shadow_coord = true;
        f.uv = v.uv;
        return f;
    }
}
