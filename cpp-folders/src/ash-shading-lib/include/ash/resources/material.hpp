#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: material.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Toon материалын параметрүүд: суурь өнгө, текстур, diffuse загвар,
            сүүдрийн өнгө, outline болон rim тохиргоо.
*/


#include <string>

#include <glm/glm.hpp>

#include "ash/lighting/diffuse_model.hpp"
#include "ash/lighting/rim_light.hpp"
#include "ash/resources/texture.hpp"

namespace ash
{
    struct ToonMaterial
    {
        std::string name{};

        glm::vec4 base_color{1.0f, 1.0f, 1.0f, 1.0f};
        const Texture2DData* albedo_tex = nullptr;

        DiffuseParams diffuse{};

        // Ambient хэсгийг үржүүлэх өнгө. (0,0,0) бол (1,1,1) гэж үзнэ.
        glm::vec3 shadow_tint{1.0f, 1.0f, 1.0f};
        bool receive_shadows = true;

        bool outline = false;
        float outline_width = 0.03f;
        glm::vec4 outline_color{0.0f, 0.0f, 0.0f, 1.0f};

        RimParams rim{};
    };

    // Газрын гадаргад: зөөлөн half-Lambert, rim-гүй.
    inline ToonMaterial make_half_lambert_material(const std::string& name, const glm::vec4& base_color)
    {
        ToonMaterial m{};
        m.name = name;
        m.base_color = base_color;
        m.diffuse.model = DiffuseModel::HalfLambert;
        m.rim.enable = false;
        return m;
    }

    // Дүрд: N-band квантчлал, outline, rim.
    inline ToonMaterial make_toon_band_material(const std::string& name, const glm::vec4& base_color, int band_count, float band_floor = 0.0f)
    {
        ToonMaterial m{};
        m.name = name;
        m.base_color = base_color;
        m.diffuse.model = DiffuseModel::ToonBands;
        m.diffuse.band_count = sanitize_band_count(band_count);
        m.diffuse.band_floor = band_floor;
        m.outline = true;
        return m;
    }

    inline ToonMaterial make_cel_step_material(const std::string& name, const glm::vec4& base_color)
    {
        ToonMaterial m{};
        m.name = name;
        m.base_color = base_color;
        m.diffuse.model = DiffuseModel::ToonSteps;
        m.diffuse.step_table = make_default_cel_step_table();
        m.outline = true;
        return m;
    }
}
