/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: ash_shading_lib.cpp
    МОДУЛЬ: ash-shading-lib
    ЗОРИЛГО: Compiled library target anchor translation unit. Header бүрийг
            нэг удаа compile хийж include дарааллын алдааг эрт илрүүлнэ.
*/

#include "ash/core/env_config.hpp"
#include "ash/gfx/ppm_writer.hpp"
#include "ash/job/job_system.hpp"
#include "ash/passes/pass_resolve.hpp"
#include "ash/passes/pass_shadow_map.hpp"
#include "ash/passes/pass_toon_forward.hpp"

namespace ash
{
    int ash_shading_compiled_target_anchor()
    {
        return 0;
    }
}
