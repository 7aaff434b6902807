#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: rt_shadow.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Гэрлийн орон зайн гүний зураг (shadow map). Shadow pass бичиж,
            toon pass зөвхөн уншина.
*/

#include <algorithm>
#include <cstdint>
#include <vector>

namespace ash {

struct ShadowDepthMap {
    int w = 0;
    int h = 0;
    std::vector<float> depth;

    ShadowDepthMap() = default;
    ShadowDepthMap(int W, int H) { resize(W, H); }

    inline void resize(int W, int H) {
        w = std::max(0, W);
        h = std::max(0, H);
        depth.assign((size_t)w * (size_t)h, 1.0f);
    }

    inline void clear(float v = 1.0f) {
        std::fill(depth.begin(), depth.end(), v);
    }

    inline bool valid() const {
        return w > 0 && h > 0 && depth.size() == (size_t)w * (size_t)h;
    }

    inline float& at(int x, int y) { return depth[(size_t)y * (size_t)w + (size_t)x]; }
    inline const float& at(int x, int y) const { return depth[(size_t)y * (size_t)w + (size_t)x]; }

    // Ирмэгээс гарсан texel-ийг хамгийн ойрын ирмэг рүү clamp хийнэ.
    inline float fetch_clamped(int x, int y) const {
        x = std::clamp(x, 0, w - 1);
        y = std::clamp(y, 0, h - 1);
        return at(x, y);
    }
};

} // namespace ash
