#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: env_config.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: ASH_* орчны хувьсагчаас FrameParams-ийн утгуудыг дарж унших.
            Буруу утга өгвөл анхааруулга бичээд анхны утгыг хадгална.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <limits>
#include <string>

#include "ash/core/log.hpp"
#include "ash/core/result.hpp"
#include "ash/frame/frame_params.hpp"
#include "ash/lighting/shadow_sample.hpp"

namespace ash
{
    // Тестэд орчны хувьсагчийг орлуулах боломжтой уншигч.
    using EnvGetter = std::function<const char*(const char*)>;

    inline const char* system_env(const char* name)
    {
        return std::getenv(name);
    }

    inline bool env_value_set(const char* value)
    {
        return value && *value != '\0';
    }

    inline std::string to_lower_copy(const char* value)
    {
        std::string v(value ? value : "");
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return v;
    }

    inline Result<bool> parse_env_bool(const char* value)
    {
        if (!env_value_set(value)) return Result<bool>::failure("empty value");
        const std::string v = to_lower_copy(value);
        if (v == "1" || v == "true" || v == "on" || v == "yes") return Result<bool>::success(true);
        if (v == "0" || v == "false" || v == "off" || v == "no") return Result<bool>::success(false);
        return Result<bool>::failure("expected a boolean, got '" + std::string(value) + "'");
    }

    inline Result<uint32_t> parse_env_u32(
        const char* value,
        uint32_t min_value = 1u,
        uint32_t max_value = std::numeric_limits<uint32_t>::max())
    {
        if (!env_value_set(value)) return Result<uint32_t>::failure("empty value");
        char* end = nullptr;
        const long long parsed = std::strtoll(value, &end, 10);
        if (end == value || *end != '\0') return Result<uint32_t>::failure("expected an integer, got '" + std::string(value) + "'");
        if (parsed < (long long)min_value) return Result<uint32_t>::failure("value " + std::string(value) + " is below " + std::to_string(min_value));
        if (parsed > (long long)max_value) return Result<uint32_t>::failure("value " + std::string(value) + " is above " + std::to_string(max_value));
        return Result<uint32_t>::success(static_cast<uint32_t>(parsed));
    }

    inline Result<float> parse_env_f32(const char* value, float min_value = 0.0f)
    {
        if (!env_value_set(value)) return Result<float>::failure("empty value");
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || *end != '\0' || !std::isfinite(parsed)) return Result<float>::failure("expected a number, got '" + std::string(value) + "'");
        if (parsed < (double)min_value) return Result<float>::failure("value " + std::string(value) + " is below " + std::to_string(min_value));
        return Result<float>::success(static_cast<float>(parsed));
    }

    inline Result<ShadowFilter> parse_shadow_filter_name(const char* value)
    {
        const std::string v = to_lower_copy(value);
        if (v == "hard") return Result<ShadowFilter>::success(ShadowFilter::Hard);
        if (v == "pcf2x2" || v == "2x2") return Result<ShadowFilter>::success(ShadowFilter::PCF2x2);
        if (v == "pcf3x3" || v == "3x3" || v == "pcf") return Result<ShadowFilter>::success(ShadowFilter::PCF3x3);
        return Result<ShadowFilter>::failure("unknown shadow filter '" + v + "' (hard|pcf2x2|pcf3x3)");
    }

    inline Result<ShadowBiasMode> parse_shadow_bias_mode_name(const char* value)
    {
        const std::string v = to_lower_copy(value);
        if (v == "constant" || v == "const") return Result<ShadowBiasMode>::success(ShadowBiasMode::Constant);
        if (v == "slope" || v == "slope_scaled") return Result<ShadowBiasMode>::success(ShadowBiasMode::SlopeScaled);
        return Result<ShadowBiasMode>::failure("unknown shadow bias mode '" + v + "' (constant|slope)");
    }

    inline Result<DebugViewMode> parse_debug_view_name(const char* value)
    {
        const std::string v = to_lower_copy(value);
        if (v == "none") return Result<DebugViewMode>::success(DebugViewMode::None);
        if (v == "shadow") return Result<DebugViewMode>::success(DebugViewMode::ShadowVisibility);
        if (v == "normal") return Result<DebugViewMode>::success(DebugViewMode::Normal);
        if (v == "depth") return Result<DebugViewMode>::success(DebugViewMode::Depth);
        if (v == "diffuse") return Result<DebugViewMode>::success(DebugViewMode::Diffuse);
        return Result<DebugViewMode>::failure("unknown debug view '" + v + "' (none|shadow|normal|depth|diffuse)");
    }

    // Хувьсагч тохируулагдсан ба зөв утгатай үед л dst-ийг дарна.
    template<typename T, typename Parser>
    inline bool apply_env_override(const EnvGetter& env, const char* name, Parser&& parse, T& dst)
    {
        const char* value = env(name);
        if (!env_value_set(value)) return false;
        const auto r = parse(value);
        if (!r.ok)
        {
            log_warn(std::string(name) + ": " + r.error + ", keeping default");
            return false;
        }
        dst = static_cast<T>(r.value);
        return true;
    }

    inline FrameParams load_frame_params_from_env(FrameParams fp, const EnvGetter& env = system_env)
    {
        auto target_size = [](const char* v) { return parse_env_u32(v, 1u, kMaxTargetDimension); };
        auto shadow_size = [](const char* v) { return parse_env_u32(v, 16u, kMaxTargetDimension); };
        auto f32_pos = [](const char* v) { return parse_env_f32(v, 1e-4f); };

        apply_env_override(env, "ASH_WIDTH", target_size, fp.w);
        apply_env_override(env, "ASH_HEIGHT", target_size, fp.h);
        apply_env_override(env, "ASH_SHADOWS", parse_env_bool, fp.shading.shadows);
        apply_env_override(env, "ASH_SHADOW_FILTER", parse_shadow_filter_name, fp.shading.shadow_filter);
        apply_env_override(env, "ASH_SHADOW_BIAS", parse_shadow_bias_mode_name, fp.shading.shadow_bias_mode);
        apply_env_override(env, "ASH_SHADOW_MAP_SIZE", shadow_size, fp.shadow.resolution);
        apply_env_override(env, "ASH_RIM_SHADOW_MASK", parse_env_bool, fp.shading.rim_mask_by_shadow);
        apply_env_override(env, "ASH_CLAMP_OUTPUT", parse_env_bool, fp.shading.clamp_output);
        apply_env_override(env, "ASH_OUTLINE", parse_env_bool, fp.outline.enable);
        apply_env_override(env, "ASH_DEBUG_VIEW", parse_debug_view_name, fp.shading.debug_view);
        apply_env_override(env, "ASH_EXPOSURE", f32_pos, fp.tonemap.exposure);
        apply_env_override(env, "ASH_GAMMA", f32_pos, fp.tonemap.gamma);
        fp.shadow.enable = fp.shading.shadows;
        return fp;
    }

    inline std::string load_capture_path_from_env(const std::string& fallback, const EnvGetter& env = system_env)
    {
        const char* value = env("ASH_CAPTURE");
        return env_value_set(value) ? std::string(value) : fallback;
    }
}
