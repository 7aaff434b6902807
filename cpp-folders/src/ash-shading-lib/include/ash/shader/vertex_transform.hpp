#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: vertex_transform.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Object-space оройг clip, world, гэрлийн орон зай руу хувиргаж
            fragment-ийн оролтыг бэлтгэнэ. Outline hull-ийг нормалийн дагуу
            томруулах хувилбар.
*/


#include <cmath>

#include <glm/glm.hpp>

#include "ash/shader/types.hpp"

namespace ash
{
    inline glm::mat3 select_normal_matrix(const TransformSet& t, NormalTransformMode mode)
    {
        switch (mode)
        {
            case NormalTransformMode::InverseTranspose:
                return inverse_transpose_3x3(t.model);
            case NormalTransformMode::NormalMatrix:
                return t.normal;
            case NormalTransformMode::ModelUpper3x3:
                // Жигд scale-тэй үед л зөв, бусад үед нормаль хазайна.
                return glm::mat3(t.model);
        }
        return inverse_transpose_3x3(t.model);
    }

    inline VertexOut transform_vertex(
        const ShaderVertex& vin,
        const TransformSet& t,
        NormalTransformMode normal_mode = NormalTransformMode::InverseTranspose)
    {
        VertexOut o{};
        const glm::vec4 local = glm::vec4(vin.position, 1.0f);
        const glm::vec4 wp4 = t.model * local;

        o.clip = t.mvp * local;
        o.world_pos = glm::vec3(wp4);
        o.normal_ws = safe_normalize(select_normal_matrix(t, normal_mode) * vin.normal);
        // Shading-д ашиглах яг тэр world байрлалаас гэрлийн координат гаргана.
        o.shadow_coord = t.light_viewproj * glm::vec4(o.world_pos, 1.0f);
        o.uv = vin.uv;
        return o;
    }

    inline ShaderVertex inflate_along_normal(const ShaderVertex& vin, float width)
    {
        ShaderVertex o = vin;
        o.position = vin.position + safe_normalize(vin.normal, glm::vec3(0.0f)) * width;
        return o;
    }

    // Host энэ hull-ийг front-face cull хийж үндсэн pass-аас өмнө зурна.
    inline VertexOut transform_outline_vertex(
        const ShaderVertex& vin,
        const TransformSet& t,
        float width,
        NormalTransformMode normal_mode = NormalTransformMode::InverseTranspose)
    {
        return transform_vertex(inflate_along_normal(vin, width), t, normal_mode);
    }
}
