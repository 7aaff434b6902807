#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Rasterizer-ийн дуудах vertex/fragment функцийн хос.
*/


#include <functional>
#include <string>

#include "ash/shader/types.hpp"

namespace ash
{
    using VertexShaderFn = std::function<VertexOut(const ShaderVertex&, const ShaderUniforms&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const ShaderUniforms&)>;

    struct ShaderProgram
    {
        std::string name{};
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const
        {
            return (bool)vs && (bool)fs;
        }
    };
}
