#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: pass_resolve.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Toon pass-ийн HDR гаралтыг exposure, gamma хэрэглэж [0,1]-д
            saturate хийн 8 битийн LDR target руу буулгана.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include "ash/frame/frame_params.hpp"
#include "ash/gfx/rt_types.hpp"
#include "ash/job/parallel_for.hpp"
#include "ash/passes/pass_context.hpp"

namespace ash
{
    inline uint8_t resolve_channel(float v, float exposure, float inv_gamma)
    {
        float c = std::clamp(v * exposure, 0.0f, 1.0f);
        c = std::pow(c, inv_gamma);
        return (uint8_t)std::clamp((int)std::lround(c * 255.0f), 0, 255);
    }

    class PassResolve
    {
    public:
        struct Inputs
        {
            const FrameParams* fp = nullptr;
            const RT_ColorHDR* hdr = nullptr;
            RT_ColorLDR* ldr = nullptr;
        };

        void execute(PassContext& ctx, const Inputs& in)
        {
            if (!in.fp || !in.hdr || !in.ldr) return;
            if (in.hdr->w <= 0 || in.hdr->h <= 0 || in.ldr->w <= 0 || in.ldr->h <= 0) return;

            const int w = std::min(in.hdr->w, in.ldr->w);
            const int h = std::min(in.hdr->h, in.ldr->h);
            const float exposure = std::max(0.0001f, in.fp->tonemap.exposure);
            const float inv_gamma = 1.0f / std::max(0.001f, in.fp->tonemap.gamma);

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        const ColorF s = in.hdr->color.at(x, y);
                        in.ldr->color.at(x, y) = Color{
                            resolve_channel(s.r, exposure, inv_gamma),
                            resolve_channel(s.g, exposure, inv_gamma),
                            resolve_channel(s.b, exposure, inv_gamma),
                            255
                        };
                    }
                }
            });
        }
    };
}
