#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: primitives.hpp
    МОДУЛЬ: geometry
    ЗОРИЛГО: Demo болон тестэд хэрэглэх хавтгай, бөмбөлөг, хайрцаг mesh үүсгэгч.
            Гурвалжин бүр гадагш нормальтай (CCW) эргэлттэй.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "ash/geometry/aabb.hpp"
#include "ash/resources/mesh.hpp"

namespace ash
{
    struct PlaneDesc
    {
        float width = 10.0f;
        float depth = 10.0f;
        int segments_x = 1;
        int segments_z = 1;
    };

    struct SphereDesc
    {
        float radius = 1.0f;
        int slices = 32;
        int stacks = 16;
    };

    struct BoxDesc
    {
        glm::vec3 size{1.0f};
    };

    namespace detail
    {
        inline uint32_t push_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv)
        {
            const uint32_t idx = (uint32_t)m.positions.size();
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            return idx;
        }

        // Нүүрний нормаль оройн нормальтай эсрэг бол сүүлийн хоёрыг солино.
        inline void push_outward_triangle(MeshData& m, uint32_t i0, uint32_t i1, uint32_t i2)
        {
            const glm::vec3 e1 = m.positions[i1] - m.positions[i0];
            const glm::vec3 e2 = m.positions[i2] - m.positions[i0];
            const glm::vec3 vertex_n = m.normals[i0] + m.normals[i1] + m.normals[i2];
            const bool flip = glm::dot(glm::cross(e1, e2), vertex_n) < 0.0f;
            m.indices.insert(m.indices.end(), {i0, flip ? i2 : i1, flip ? i1 : i2});
        }

        // origin + s*span_u + t*span_v, s,t in [0,1]. Нэг нормальтай хавтгай хэсэг.
        inline void push_quad_grid(
            MeshData& m,
            const glm::vec3& origin,
            const glm::vec3& span_u,
            const glm::vec3& span_v,
            const glm::vec3& normal,
            int cells_u,
            int cells_v)
        {
            const int nu = std::max(1, cells_u);
            const int nv = std::max(1, cells_v);
            const uint32_t first = (uint32_t)m.positions.size();
            const uint32_t row = (uint32_t)nu + 1u;

            for (int j = 0; j <= nv; ++j)
            {
                for (int i = 0; i <= nu; ++i)
                {
                    const glm::vec2 st((float)i / (float)nu, (float)j / (float)nv);
                    push_vertex(m, origin + st.x * span_u + st.y * span_v, normal, st);
                }
            }
            for (uint32_t j = 0; j < (uint32_t)nv; ++j)
            {
                for (uint32_t i = 0; i < (uint32_t)nu; ++i)
                {
                    const uint32_t a = first + j * row + i;
                    const uint32_t c = a + row;
                    push_outward_triangle(m, a, a + 1, c + 1);
                    push_outward_triangle(m, a, c + 1, c);
                }
            }
        }
    }

    // XZ хавтгай, төв нь эх цэг, нормаль +Y.
    inline MeshData make_plane(const PlaneDesc& d)
    {
        MeshData m{};
        m.name = "plane";
        detail::push_quad_grid(
            m,
            glm::vec3(-0.5f * d.width, 0.0f, -0.5f * d.depth),
            glm::vec3(d.width, 0.0f, 0.0f),
            glm::vec3(0.0f, 0.0f, d.depth),
            glm::vec3(0.0f, 1.0f, 0.0f),
            d.segments_x,
            d.segments_z);
        return m;
    }

    // UV бөмбөлөг. Туйл бүр нэг оройтой тул туйлын орчим fan гурвалжнууд.
    inline MeshData make_sphere(const SphereDesc& d)
    {
        MeshData m{};
        m.name = "sphere";
        const int slices = std::max(3, d.slices);
        const int stacks = std::max(2, d.stacks);
        const float r = std::max(d.radius, 1e-4f);

        const uint32_t north = detail::push_vertex(m, glm::vec3(0.0f, r, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec2(0.5f, 0.0f));

        // Дотоод цагиргууд: stack 1 .. stacks-1, seam дээр давхар орой.
        const uint32_t ring_len = (uint32_t)slices + 1u;
        const uint32_t first_ring = (uint32_t)m.positions.size();
        for (int s = 1; s < stacks; ++s)
        {
            const float polar = glm::pi<float>() * (float)s / (float)stacks;
            const float y = std::cos(polar);
            const float ring_r = std::sin(polar);
            for (int k = 0; k <= slices; ++k)
            {
                const float azimuth = glm::two_pi<float>() * (float)k / (float)slices;
                const glm::vec3 n(ring_r * std::cos(azimuth), y, ring_r * std::sin(azimuth));
                detail::push_vertex(m, n * r, n, glm::vec2((float)k / (float)slices, (float)s / (float)stacks));
            }
        }

        const uint32_t south = detail::push_vertex(m, glm::vec3(0.0f, -r, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f), glm::vec2(0.5f, 1.0f));

        const uint32_t ring_count = (uint32_t)stacks - 1u;
        for (uint32_t k = 0; k < (uint32_t)slices; ++k)
        {
            detail::push_outward_triangle(m, north, first_ring + k, first_ring + k + 1);
        }
        for (uint32_t s = 0; s + 1 < ring_count; ++s)
        {
            const uint32_t top = first_ring + s * ring_len;
            const uint32_t bottom = top + ring_len;
            for (uint32_t k = 0; k < (uint32_t)slices; ++k)
            {
                detail::push_outward_triangle(m, top + k, bottom + k, top + k + 1);
                detail::push_outward_triangle(m, top + k + 1, bottom + k, bottom + k + 1);
            }
        }
        const uint32_t last_ring = first_ring + (ring_count - 1u) * ring_len;
        for (uint32_t k = 0; k < (uint32_t)slices; ++k)
        {
            detail::push_outward_triangle(m, south, last_ring + k + 1, last_ring + k);
        }
        return m;
    }

    // Тал бүр тусдаа 4 оройтой тул нормаль нь хурц ирмэгтэй.
    inline MeshData make_box(const BoxDesc& d)
    {
        struct Face
        {
            glm::vec3 n;
            glm::vec3 u;
            glm::vec3 v;
        };
        static const std::array<Face, 6> faces = {{
            {{ 1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f, 0.0f}},
            {{-1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f, 0.0f}},
            {{ 0.0f, 1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}},
            {{ 0.0f,-1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}},
            {{ 0.0f, 0.0f, 1.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}},
            {{ 0.0f, 0.0f,-1.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}},
        }};

        MeshData m{};
        m.name = "box";
        const glm::vec3 half = 0.5f * d.size;
        for (const Face& f : faces)
        {
            const glm::vec3 span_u = f.u * d.size;
            const glm::vec3 span_v = f.v * d.size;
            const glm::vec3 origin = f.n * half - 0.5f * span_u - 0.5f * span_v;
            detail::push_quad_grid(m, origin, span_u, span_v, f.n, 1, 1);
        }
        return m;
    }

    inline AABB mesh_local_aabb(const MeshData& m)
    {
        AABB b{};
        for (const glm::vec3& p : m.positions) b.expand(p);
        return b;
    }
}
