#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Материалын albedo текстур болон түүнийг bilinear/repeat горимоор
            уншиж linear өнгө рүү хөрвүүлэх функц.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "ash/gfx/rt_types.hpp"

namespace ash
{
    // sRGB8 texel-үүд. Мөр 0 нь v = 0.
    struct Texture2DData
    {
        PixelBuffer2D<Color> pixels{};

        Texture2DData() = default;
        Texture2DData(int width, int height, Color fill_value = {0, 0, 0, 255})
            : pixels(width, height, fill_value)
        {}

        int width() const { return pixels.w; }
        int height() const { return pixels.h; }
        bool valid() const { return pixels.w > 0 && pixels.h > 0 && pixels.data.size() == pixels.pixel_count(); }

        Color& at(int x, int y) { return pixels.at(x, y); }
        const Color& at(int x, int y) const { return pixels.at(x, y); }
    };

    inline float srgb8_channel_to_linear(uint8_t v)
    {
        return std::pow((float)v * (1.0f / 255.0f), 2.2f);
    }

    inline glm::vec4 srgb8_to_linear_rgba(const Color& c)
    {
        return glm::vec4(
            srgb8_channel_to_linear(c.r),
            srgb8_channel_to_linear(c.g),
            srgb8_channel_to_linear(c.b),
            (float)c.a * (1.0f / 255.0f));
    }

    // Текстургүй эсвэл uv нь NaN/inf үед (1,1,1,1) буцааж base color-ийг өөрчлөхгүй үлдээнэ.
    inline glm::vec4 sample_texture2d_bilinear_repeat(const Texture2DData* tex, const glm::vec2& uv)
    {
        if (!tex || !tex->valid()) return glm::vec4(1.0f);
        if (!std::isfinite(uv.x) || !std::isfinite(uv.y)) return glm::vec4(1.0f);

        const glm::vec2 wrapped = uv - glm::floor(uv);
        const glm::vec2 max_texel((float)(tex->width() - 1), (float)(tex->height() - 1));
        const glm::vec2 texel = wrapped * max_texel;
        const glm::ivec2 lo = glm::ivec2(glm::floor(texel));
        const glm::ivec2 hi = glm::min(lo + 1, glm::ivec2(tex->width() - 1, tex->height() - 1));
        const glm::vec2 frac = texel - glm::vec2(lo);

        const glm::vec4 top = glm::mix(
            srgb8_to_linear_rgba(tex->at(lo.x, lo.y)), srgb8_to_linear_rgba(tex->at(hi.x, lo.y)), frac.x);
        const glm::vec4 bottom = glm::mix(
            srgb8_to_linear_rgba(tex->at(lo.x, hi.y)), srgb8_to_linear_rgba(tex->at(hi.x, hi.y)), frac.x);
        return glm::mix(top, bottom, frac.y);
    }
}
