/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: hello_toon_shading.cpp
    МОДУЛЬ: hello-toon-shading
    ЗОРИЛГО: Хавтгай дээрх бөмбөлөг, хайрцгийг outline, PCF сүүдэртэй toon
            shading-ээр нэг кадр зурж PPM файл болгон хадгална.
*/

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <ash/core/env_config.hpp>
#include <ash/core/log.hpp>
#include <ash/frame/frame_params.hpp>
#include <ash/geometry/primitives.hpp>
#include <ash/gfx/ppm_writer.hpp>
#include <ash/gfx/rt_shadow.hpp>
#include <ash/gfx/rt_types.hpp>
#include <ash/job/job_system.hpp>
#include <ash/lighting/diffuse_model.hpp>
#include <ash/lighting/light_types.hpp>
#include <ash/passes/pass_context.hpp>
#include <ash/passes/pass_resolve.hpp>
#include <ash/passes/pass_shadow_map.hpp>
#include <ash/passes/pass_toon_forward.hpp>
#include <ash/passes/scene_data.hpp>
#include <ash/resources/material.hpp>

namespace
{
    constexpr const char* kDefaultCapturePath = "toon_shading.ppm";

    ash::FrameParams make_default_frame_params()
    {
        ash::FrameParams fp{};
        fp.w = 960;
        fp.h = 540;
        fp.shadow.resolution = 1024;
        fp.shadow.fit_margin = 1.0f;
        fp.shading.shadow_filter = ash::ShadowFilter::PCF3x3;
        return fp;
    }

    const char* on_off(bool v)
    {
        return v ? "on" : "off";
    }
}

int main(int argc, char* argv[])
{
    const ash::FrameParams fp = ash::load_frame_params_from_env(make_default_frame_params());
    std::string capture_path = ash::load_capture_path_from_env(kDefaultCapturePath);
    if (argc > 1 && argv[1] && *argv[1] != '\0') capture_path = argv[1];

    ash::log_info(
        "hello-toon-shading " + std::to_string(fp.w) + "x" + std::to_string(fp.h) +
        " shadows=" + on_off(fp.shading.shadows) +
        " filter=" + ash::shadow_filter_name(fp.shading.shadow_filter) +
        " bias=" + ash::shadow_bias_mode_name(fp.shading.shadow_bias_mode) +
        " outline=" + on_off(fp.outline.enable) +
        " view=" + ash::debug_view_mode_name(fp.shading.debug_view));

    // Mesh, material-ууд scene-ээс урт насална.
    const ash::MeshData floor_mesh = ash::make_plane(ash::PlaneDesc{14.0f, 14.0f, 8, 8});
    const ash::MeshData orb_mesh = ash::make_sphere(ash::SphereDesc{1.0f, 40, 20});
    const ash::MeshData crate_mesh = ash::make_box(ash::BoxDesc{glm::vec3(1.4f)});

    const ash::ToonMaterial floor_mat = ash::make_half_lambert_material("floor", glm::vec4(0.55f, 0.62f, 0.48f, 1.0f));
    ash::ToonMaterial orb_mat = ash::make_toon_band_material("orb", glm::vec4(0.95f, 0.45f, 0.30f, 1.0f), 3, 0.15f);
    orb_mat.shadow_tint = glm::vec3(0.70f, 0.75f, 1.0f);
    const ash::ToonMaterial crate_mat = ash::make_cel_step_material("crate", glm::vec4(0.35f, 0.55f, 0.90f, 1.0f));

    ash::ToonScene scene{};
    scene.camera.pos_ws = glm::vec3(-2.5f, 4.0f, -7.5f);
    scene.camera.target_ws = glm::vec3(0.3f, 0.6f, 0.0f);

    ash::DrawItem floor{};
    floor.name = "floor";
    floor.mesh = &floor_mesh;
    floor.material = &floor_mat;
    scene.items.push_back(floor);

    ash::DrawItem orb{};
    orb.name = "orb";
    orb.mesh = &orb_mesh;
    orb.material = &orb_mat;
    orb.model = glm::translate(glm::mat4(1.0f), glm::vec3(-1.0f, 1.0f, 0.0f));
    scene.items.push_back(orb);

    ash::DrawItem crate{};
    crate.name = "crate";
    crate.mesh = &crate_mesh;
    crate.material = &crate_mat;
    crate.model =
        glm::translate(glm::mat4(1.0f), glm::vec3(1.8f, 0.7f, 0.8f)) *
        glm::rotate(glm::mat4(1.0f), glm::radians(30.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    scene.items.push_back(crate);

    // Нар: үндсэн гэрэл, сүүдэр хүлээн авна.
    scene.lights.add(ash::make_directional_light(
        glm::vec3(-0.4f, 1.0f, -0.5f),
        glm::vec3(1.0f, 0.95f, 0.8f),
        glm::vec3(0.3f, 0.3f, 0.4f) * 0.4f,
        1.0f));
    // Ар талын сул цэгэн гэрэл.
    scene.lights.add(ash::make_point_light(
        glm::vec3(3.0f, 2.5f, 3.0f),
        glm::vec3(0.4f, 0.5f, 1.0f),
        glm::vec3(1.0f, 0.2f, 0.05f),
        0.6f));

    for (const ash::DrawItem& item : scene.items)
    {
        ash::log_info("item " + item.name + " diffuse=" + ash::diffuse_model_name(item.material->diffuse.model));
    }

    ash::ThreadPoolJobSystem jobs{ash::ThreadPoolJobSystem::default_worker_count()};
    ash::PassContext ctx{};
    ctx.job_system = &jobs;

    ash::ShadowDepthMap shadow_map{};
    ash::RT_ColorHDR hdr{fp.w, fp.h};
    ash::RT_DepthBuffer depth{fp.w, fp.h};
    ash::RT_ColorLDR ldr{fp.w, fp.h};

    ash::PassShadowMap shadow_pass{};
    ash::PassToonForward toon_pass{};
    ash::PassResolve resolve_pass{};

    const auto t0 = std::chrono::steady_clock::now();
    shadow_pass.execute(ctx, ash::PassShadowMap::Inputs{&scene, &fp, &shadow_map});
    toon_pass.execute(ctx, ash::PassToonForward::Inputs{&scene, &fp, &hdr, &depth});
    resolve_pass.execute(ctx, ash::PassResolve::Inputs{&fp, &hdr, &ldr});
    const auto t1 = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    char summary[256];
    std::snprintf(
        summary,
        sizeof(summary),
        "frame %.2f ms, shadow=%s, outline tris=%llu, main tris=%llu, fragments=%llu",
        ms,
        ctx.shadow.valid ? "valid" : "none",
        (unsigned long long)ctx.outline_stats.tri_raster,
        (unsigned long long)ctx.main_stats.tri_raster,
        (unsigned long long)(ctx.outline_stats.fragments_shaded + ctx.main_stats.fragments_shaded));
    ash::log_info(summary);

    const ash::Result<size_t> written = ash::write_ldr_to_ppm(capture_path, ldr);
    if (!written.ok)
    {
        ash::log_error("capture failed: " + written.error);
        return 2;
    }
    ash::log_info("wrote " + capture_path + " (" + std::to_string(written.value) + " pixels)");
    return 0;
}
