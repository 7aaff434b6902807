#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: aabb.hpp
    МОДУЛЬ: geometry
    ЗОРИЛГО: Тэнхлэгтэй зэрэгцээ хязгаарын хайрцаг. Shadow camera-г сүүдэр
            тусгагчдад тааруулахад ашиглана.
*/

#include <glm/glm.hpp>

namespace ash {

struct AABB {
    glm::vec3 minv{  1e30f };
    glm::vec3 maxv{ -1e30f };

    inline bool valid() const {
        return minv.x <= maxv.x && minv.y <= maxv.y && minv.z <= maxv.z;
    }

    inline void expand(const glm::vec3& p) {
        minv = glm::min(minv, p);
        maxv = glm::max(maxv, p);
    }

    inline void expand(const AABB& b) {
        if (!b.valid()) return;
        expand(b.minv);
        expand(b.maxv);
    }

    inline glm::vec3 center() const { return 0.5f * (minv + maxv); }
    inline glm::vec3 extent() const { return 0.5f * (maxv - minv); }
};

// Local AABB-ийн 8 оройг model-оор хувиргаж world AABB гаргана.
inline AABB transform_aabb(const AABB& local, const glm::mat4& model) {
    AABB out{};
    if (!local.valid()) return out;
    const glm::vec3 mn = local.minv;
    const glm::vec3 mx = local.maxv;
    const glm::vec3 corners[8] = {
        {mn.x, mn.y, mn.z}, {mx.x, mn.y, mn.z}, {mn.x, mx.y, mn.z}, {mx.x, mx.y, mn.z},
        {mn.x, mn.y, mx.z}, {mx.x, mn.y, mx.z}, {mn.x, mx.y, mx.z}, {mx.x, mx.y, mx.z},
    };
    for (const glm::vec3& c : corners) {
        out.expand(glm::vec3(model * glm::vec4(c, 1.0f)));
    }
    return out;
}

} // namespace ash
