#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: pass_context.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Нэг кадрын pass-ууд хооронд дамжих runtime төлөв: job system,
            shadow pass-ийн гаралт, rasterizer статистик.
*/


#include <cstdint>

#include <glm/glm.hpp>

#include "ash/gfx/rt_shadow.hpp"
#include "ash/job/job_system.hpp"
#include "ash/render/rasterizer.hpp"

namespace ash
{
    struct ShadowRuntime
    {
        const ShadowDepthMap* map = nullptr;
        glm::mat4 light_viewproj{1.0f};
        bool valid = false;

        void reset()
        {
            map = nullptr;
            light_viewproj = glm::mat4(1.0f);
            valid = false;
        }
    };

    struct PassContext
    {
        IJobSystem* job_system = nullptr;

        ShadowRuntime shadow{};
        RasterizerStats outline_stats{};
        RasterizerStats main_stats{};
    };
}
