#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: ppm_writer.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: LDR target-ийг binary PPM (P6) болгож бичнэ. Canvas-ийн y дээш
            чиглэлтэй тул мөрүүдийг доош нь эргүүлж бичнэ.
*/


#include <cstddef>
#include <fstream>
#include <string>

#include "ash/core/result.hpp"
#include "ash/gfx/rt_types.hpp"

namespace ash
{
    // Амжилттай бол бичсэн пикселийн тоог буцаана.
    inline Result<size_t> write_ldr_to_ppm(const std::string& path, const RT_ColorLDR& ldr)
    {
        if (ldr.w <= 0 || ldr.h <= 0) return Result<size_t>::failure("empty LDR target");
        if (path.empty()) return Result<size_t>::failure("empty capture path");

        std::ofstream out(path, std::ios::binary);
        if (!out) return Result<size_t>::failure("cannot open '" + path + "' for writing");

        out << "P6\n" << ldr.w << " " << ldr.h << "\n255\n";
        for (int y_screen = 0; y_screen < ldr.h; ++y_screen)
        {
            const int y_canvas = ldr.h - 1 - y_screen;
            for (int x = 0; x < ldr.w; ++x)
            {
                const Color c = ldr.color.at(x, y_canvas);
                const char rgb[3] = {(char)c.r, (char)c.g, (char)c.b};
                out.write(rgb, 3);
            }
        }
        if (!out.good()) return Result<size_t>::failure("write to '" + path + "' failed");
        return Result<size_t>::success((size_t)ldr.w * (size_t)ldr.h);
    }
}
