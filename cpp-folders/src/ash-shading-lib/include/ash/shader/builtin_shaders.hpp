#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Toon, outline болон debug view программууд.
*/


#include <glm/glm.hpp>

#include "ash/shader/program.hpp"
#include "ash/shader/shading_evaluator.hpp"
#include "ash/shader/vertex_transform.hpp"

namespace ash
{
    inline ShaderProgram make_toon_program()
    {
        ShaderProgram p{};
        p.name = "toon";
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            return transform_vertex(vin, u.transforms, u.shading.normal_mode);
        };
        p.fs = [](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            o.color = evaluate_toon_fragment(fin, u);
            return o;
        };
        return p;
    }

    // Inverted hull: нормалийн дагуу томруулсан geometry-г нэг өнгөөр будна.
    inline ShaderProgram make_outline_program()
    {
        ShaderProgram p{};
        p.name = "outline";
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            const float width = u.material ? u.material->outline_width * u.outline_width_scale : 0.0f;
            return transform_outline_vertex(vin, u.transforms, width, u.shading.normal_mode);
        };
        p.fs = [](const FragmentIn&, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            const glm::vec4 c = u.material ? u.material->outline_color : glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
            o.color = ColorF{c.r, c.g, c.b, c.a};
            return o;
        };
        return p;
    }

    inline ShaderProgram make_debug_view_program(DebugViewMode mode)
    {
        ShaderProgram p = make_toon_program();
        p.name = std::string("debug_") + debug_view_mode_name(mode);
        p.fs = [mode](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            o.color = evaluate_debug_fragment(fin, u, mode);
            return o;
        };
        return p;
    }

    inline ShaderProgram make_main_program(const ShadingParams& sp)
    {
        if (sp.debug_view != DebugViewMode::None) return make_debug_view_program(sp.debug_view);
        return make_toon_program();
    }
}
