#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: diffuse_model.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Diffuse эрчмийн загварууд: half-Lambert, toon threshold,
            N-band квантчлал болон шаталсан cel хүснэгт. Материал бүр аль
            загварыг ашиглахаа өөрөө сонгоно.
*/

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

namespace ash
{
    enum class DiffuseModel : uint32_t
    {
        HalfLambert = 0,
        ToonThreshold = 1,
        ToonBands = 2,
        ToonSteps = 3
    };

    constexpr int kDefaultToonBands = 3;
    constexpr int kMaxToonSteps = 8;

    struct ToonStep
    {
        float threshold = 0.0f; // N.L энэ утгаас их бол intensity хэрэглэнэ
        float intensity = 1.0f;
    };

    // Өндөр threshold-оос эхлэн эрэмбэлсэн хүснэгт. Аль ч шатанд таараагүй бол fallback.
    struct ToonStepTable
    {
        std::array<ToonStep, kMaxToonSteps> steps{};
        int count = 0;
        float fallback = 0.3f;
    };

    inline const char* diffuse_model_name(DiffuseModel m)
    {
        switch (m)
        {
            case DiffuseModel::HalfLambert: return "half_lambert";
            case DiffuseModel::ToonThreshold: return "toon_threshold";
            case DiffuseModel::ToonBands: return "toon_bands";
            case DiffuseModel::ToonSteps: return "toon_steps";
        }
        return "unknown";
    }

    // Прототипийн cel shader-ийн шатлал: 0.95 / 0.5 / 0.2, доод түвшин 0.3.
    inline ToonStepTable make_default_cel_step_table()
    {
        ToonStepTable t{};
        t.steps[0] = ToonStep{0.95f, 1.0f};
        t.steps[1] = ToonStep{0.5f, 0.8f};
        t.steps[2] = ToonStep{0.2f, 0.5f};
        t.count = 3;
        t.fallback = 0.3f;
        return t;
    }

    struct DiffuseParams
    {
        DiffuseModel model = DiffuseModel::HalfLambert;
        bool half_lambert_squared = false;
        int band_count = kDefaultToonBands;
        float band_floor = 0.0f;
        float threshold = 0.5f;
        float smoothness = 0.05f;
        ToonStepTable step_table = make_default_cel_step_table();
    };

    inline int sanitize_band_count(int band_count)
    {
        return (band_count <= 0) ? kDefaultToonBands : band_count;
    }

    inline float half_lambert(float ndotl, bool squared = false)
    {
        // [-1,1] -> [0,1]. Оролт нэгж вектор биш үед ч мужаас гаргахгүй.
        const float hl = std::clamp(ndotl * 0.5f + 0.5f, 0.0f, 1.0f);
        return squared ? hl * hl : hl;
    }

    inline float half_lambert(const glm::vec3& N, const glm::vec3& L, bool squared = false)
    {
        return half_lambert(glm::dot(N, L), squared);
    }

    inline float toon_threshold(float intensity, float threshold, float smoothness, float band_floor = 0.0f)
    {
        const float s = std::max(smoothness, 1e-4f);
        const float e = glm::smoothstep(threshold - s, threshold + s, intensity);
        return glm::mix(std::clamp(band_floor, 0.0f, 1.0f), 1.0f, e);
    }

    inline float toon_bands(float intensity, int band_count, float band_floor = 0.0f)
    {
        const float k = (float)sanitize_band_count(band_count);
        const float x = std::clamp(intensity, 0.0f, 1.0f);
        const float banded = std::floor(x * k) / k;
        return std::max(banded, std::clamp(band_floor, 0.0f, 1.0f));
    }

    inline float toon_steps(float ndotl, const ToonStepTable& table)
    {
        const float x = std::max(ndotl, 0.0f);
        const int n = std::clamp(table.count, 0, kMaxToonSteps);
        for (int i = 0; i < n; ++i)
        {
            if (x > table.steps[(size_t)i].threshold) return table.steps[(size_t)i].intensity;
        }
        return table.fallback;
    }

    inline float eval_diffuse(const DiffuseParams& p, float ndotl)
    {
        switch (p.model)
        {
            case DiffuseModel::HalfLambert:
                return half_lambert(ndotl, p.half_lambert_squared);
            case DiffuseModel::ToonThreshold:
                return toon_threshold(half_lambert(ndotl, p.half_lambert_squared), p.threshold, p.smoothness, p.band_floor);
            case DiffuseModel::ToonBands:
                return toon_bands(half_lambert(ndotl, p.half_lambert_squared), p.band_count, p.band_floor);
            case DiffuseModel::ToonSteps:
                // Cel хүснэгт remap хийгээгүй max(N.L,0) дээр ажилладаг.
                return toon_steps(ndotl, p.step_table);
        }
        return half_lambert(ndotl);
    }
}
