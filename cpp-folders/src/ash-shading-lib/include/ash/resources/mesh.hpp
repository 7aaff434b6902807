#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Vertex transformer-т орох object-space орой (position, normal, uv)
            болон индексийн өгөгдөл.
*/


#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace ash
{
    struct MeshData
    {
        std::string name{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec2> uvs{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty();
        }

        size_t triangle_count() const
        {
            return indices.empty() ? (positions.size() / 3) : (indices.size() / 3);
        }
    };
}
