#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: light_types.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Host engine-ээс ирэх гэрлийн тодорхойлолт (чиглэл/байрлал, өнгө,
            ambient, сулрал, shadow map) болон гэрлүүдийн дараалсан багц.
*/

#include <algorithm>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "ash/gfx/rt_shadow.hpp"

namespace ash
{
    enum class LightKind : uint32_t
    {
        Directional = 0,
        Point = 1
    };

    struct LightDescriptor
    {
        LightKind kind = LightKind::Directional;

        // Directional: fragment-ээс гэрэл рүү заасан нэгж вектор.
        glm::vec3 dir_to_light_ws{0.0f, 1.0f, 0.0f};
        // Point: world-space байрлал.
        glm::vec3 pos_ws{0.0f};

        glm::vec3 color{1.0f, 1.0f, 1.0f};
        float intensity = 1.0f;
        glm::vec3 ambient{0.1f, 0.1f, 0.1f};

        // (constant, linear, quadratic). Directional гэрэлд хэрэглэгдэхгүй.
        glm::vec3 attenuation{1.0f, 0.0f, 0.0f};
        // Point: энэ зайнаас цааш гэрэлгүй. 0 бол хязгааргүй.
        float range = 0.0f;

        const ShadowDepthMap* shadow_map = nullptr;
        glm::mat4 light_viewproj{1.0f};
    };

    struct LightSet
    {
        std::vector<LightDescriptor> lights{};

        bool empty() const { return lights.empty(); }
        size_t size() const { return lights.size(); }

        const LightDescriptor* primary() const
        {
            return lights.empty() ? nullptr : &lights.front();
        }

        void add(const LightDescriptor& l) { lights.push_back(l); }
    };

    inline LightDescriptor make_directional_light(
        const glm::vec3& dir_to_light_ws,
        const glm::vec3& color,
        const glm::vec3& ambient,
        float intensity = 1.0f)
    {
        LightDescriptor l{};
        l.kind = LightKind::Directional;
        const float len = glm::length(dir_to_light_ws);
        l.dir_to_light_ws = (len > 1e-8f) ? dir_to_light_ws / len : glm::vec3(0.0f, 1.0f, 0.0f);
        l.color = color;
        l.ambient = ambient;
        l.intensity = intensity;
        return l;
    }

    inline LightDescriptor make_point_light(
        const glm::vec3& pos_ws,
        const glm::vec3& color,
        const glm::vec3& attenuation,
        float intensity = 1.0f,
        float range = 10.0f)
    {
        LightDescriptor l{};
        l.kind = LightKind::Point;
        l.range = std::max(range, 0.0f);
        l.pos_ws = pos_ws;
        l.color = color;
        l.attenuation = attenuation;
        l.intensity = intensity;
        l.ambient = glm::vec3(0.0f);
        return l;
    }

    inline glm::vec3 light_dir_to(const LightDescriptor& l, const glm::vec3& pos_ws)
    {
        if (l.kind == LightKind::Directional) return l.dir_to_light_ws;
        const glm::vec3 d = l.pos_ws - pos_ws;
        const float len = glm::length(d);
        return (len > 1e-8f) ? d / len : glm::vec3(0.0f, 1.0f, 0.0f);
    }

    inline float light_attenuation(const LightDescriptor& l, const glm::vec3& pos_ws)
    {
        if (l.kind == LightKind::Directional) return 1.0f;
        const float d = glm::length(l.pos_ws - pos_ws);
        if (l.range > 0.0f && d > l.range) return 0.0f;
        const float denom = l.attenuation.x + l.attenuation.y * d + l.attenuation.z * d * d;
        return (denom > 1e-6f) ? std::min(1.0f / denom, 1.0f) : 1.0f;
    }
}
