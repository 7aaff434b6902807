#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Toon pass-ийн HDR өнгө, resolve-ийн LDR өнгө, гүний буфер.
            Бүгд мөр дараалсан (row-major) нэг массив дээр хадгалагдана.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ash
{
    struct Color
    {
        uint8_t r, g, b, a;
    };

    struct ColorF
    {
        float r, g, b, a;
    };

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int width, int height, const TPixel& fill_value)
        {
            resize(width, height, fill_value);
        }

        void resize(int width, int height, const TPixel& fill_value)
        {
            w = std::max(width, 0);
            h = std::max(height, 0);
            data.assign(pixel_count(), fill_value);
        }

        void clear(const TPixel& fill_value) { std::fill(data.begin(), data.end(), fill_value); }

        size_t pixel_count() const { return (size_t)w * (size_t)h; }
        size_t index_of(int x, int y) const { return (size_t)y * (size_t)w + (size_t)x; }

        TPixel& at(int x, int y) { return data[index_of(x, y)]; }
        const TPixel& at(int x, int y) const { return data[index_of(x, y)]; }
    };

    // Compositor clamp хийхгүй үед 1.0-ээс их утгыг хэвээр хадгална.
    struct RT_ColorHDR
    {
        static constexpr ColorF kDefaultClear{0.0f, 0.0f, 0.0f, 1.0f};

        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int width, int height, ColorF fill_value = kDefaultClear)
            : w(width), h(height), color(width, height, fill_value)
        {}

        void clear(ColorF c = kDefaultClear) { color.clear(c); }
    };

    struct RT_ColorLDR
    {
        static constexpr Color kDefaultClear{0, 0, 0, 255};

        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int width, int height, Color fill_value = kDefaultClear)
            : w(width), h(height), color(width, height, fill_value)
        {}

        void clear(Color c = kDefaultClear) { color.clear(c); }
    };

    // depth01 = ndc.z * 0.5 + 0.5, 1.0 нь far plane.
    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int width, int height) : w(width), h(height), depth(width, height, 1.0f) {}

        void clear(float far_value = 1.0f) { depth.clear(far_value); }
    };
}
