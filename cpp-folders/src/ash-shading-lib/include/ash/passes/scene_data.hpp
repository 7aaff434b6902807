#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: scene_data.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Pass-уудын уншдаг scene: draw item, гэрлийн багц, камер.
            Mesh, material-ийг host эзэмшинэ; энд зөвхөн заагч хадгална.
*/


#include <algorithm>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "ash/camera/convention.hpp"
#include "ash/geometry/aabb.hpp"
#include "ash/geometry/primitives.hpp"
#include "ash/lighting/light_types.hpp"
#include "ash/resources/material.hpp"
#include "ash/resources/mesh.hpp"

namespace ash
{
    struct DrawItem
    {
        std::string name{};
        const MeshData* mesh = nullptr;
        glm::mat4 model{1.0f};
        const ToonMaterial* material = nullptr;
        bool casts_shadow = true;
        bool visible = true;
    };

    struct SceneCamera
    {
        glm::vec3 pos_ws{0.0f, 3.0f, -8.0f};
        glm::vec3 target_ws{0.0f, 0.5f, 0.0f};
        float fov_y_deg = 55.0f;
        float znear = 0.1f;
        float zfar = 200.0f;

        glm::mat4 view() const
        {
            const glm::vec3 dir = target_ws - pos_ws;
            return look_at_lh(pos_ws, target_ws, stable_up_for(safe_dir(dir)));
        }

        glm::mat4 proj(float aspect) const
        {
            return perspective_lh_no(glm::radians(fov_y_deg), std::max(aspect, 1e-4f), znear, zfar);
        }

    private:
        static glm::vec3 safe_dir(const glm::vec3& d)
        {
            const float len = glm::length(d);
            return (len > 1e-8f) ? d / len : glm::vec3(0.0f, 0.0f, 1.0f);
        }
    };

    struct ToonScene
    {
        std::vector<DrawItem> items{};
        // lights[0] нь shadow map хүлээн авах үндсэн гэрэл.
        LightSet lights{};
        SceneCamera camera{};
        glm::vec3 clear_color{0.05f, 0.06f, 0.08f};
    };

    inline AABB shadow_caster_bounds(const ToonScene& scene)
    {
        AABB box{};
        for (const DrawItem& item : scene.items)
        {
            if (!item.visible || !item.casts_shadow || !item.mesh || item.mesh->empty()) continue;
            box.expand(transform_aabb(mesh_local_aabb(*item.mesh), item.model));
        }
        if (!box.valid())
        {
            box.expand(glm::vec3(-1.0f));
            box.expand(glm::vec3(1.0f));
        }
        return box;
    }
}
