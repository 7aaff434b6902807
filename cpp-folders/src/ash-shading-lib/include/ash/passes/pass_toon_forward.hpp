#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: pass_toon_forward.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Item бүрийг эхлээд inverted hull outline-аар (front-face culling),
            дараа нь toon shading-ээр (back-face culling) HDR target руу зурна.
*/


#include <glm/glm.hpp>

#include "ash/frame/frame_params.hpp"
#include "ash/gfx/rt_types.hpp"
#include "ash/passes/pass_context.hpp"
#include "ash/passes/scene_data.hpp"
#include "ash/render/rasterizer.hpp"
#include "ash/shader/builtin_shaders.hpp"

namespace ash
{
    class PassToonForward
    {
    public:
        struct Inputs
        {
            const ToonScene* scene = nullptr;
            const FrameParams* fp = nullptr;
            RT_ColorHDR* hdr = nullptr;
            RT_DepthBuffer* depth = nullptr;
        };

        void execute(PassContext& ctx, const Inputs& in)
        {
            ctx.outline_stats = RasterizerStats{};
            ctx.main_stats = RasterizerStats{};
            if (!in.scene || !in.fp || !in.hdr || !in.depth) return;
            if (in.hdr->w <= 0 || in.hdr->h <= 0) return;
            if (in.depth->w != in.hdr->w || in.depth->h != in.hdr->h) return;

            const glm::vec3 cc = in.scene->clear_color;
            in.hdr->clear(ColorF{cc.r, cc.g, cc.b, 1.0f});
            in.depth->clear(1.0f);

            // Program-уудыг frame-ийн тохиргоо өөрчлөгдөх үед л дахин үүсгэнэ.
            if (!outline_program_.valid()) outline_program_ = make_outline_program();
            if (!main_program_.valid() || main_view_ != in.fp->shading.debug_view)
            {
                main_program_ = make_main_program(in.fp->shading);
                main_view_ = in.fp->shading.debug_view;
            }

            const float aspect = (float)in.hdr->w / (float)in.hdr->h;
            const glm::mat4 view = in.scene->camera.view();
            const glm::mat4 proj = in.scene->camera.proj(aspect);
            const glm::mat4 light_vp = ctx.shadow.valid ? ctx.shadow.light_viewproj : glm::mat4(1.0f);

            ShaderUniforms base{};
            base.camera_pos = in.scene->camera.pos_ws;
            base.lights = in.scene->lights;
            base.shading = in.fp->shading;
            base.outline_width_scale = in.fp->outline.width_scale;
            bind_shadow(ctx, base.lights);

            RasterizerTarget target{in.hdr, in.depth};

            RasterizerConfig outline_cfg{};
            outline_cfg.cull_mode = RasterizerCullMode::Front;
            outline_cfg.job_system = ctx.job_system;

            RasterizerConfig main_cfg{};
            main_cfg.cull_mode = RasterizerCullMode::Back;
            main_cfg.job_system = ctx.job_system;

            const bool outlines = in.fp->outline.enable && in.fp->shading.debug_view == DebugViewMode::None;
            for (const DrawItem& item : in.scene->items)
            {
                if (!item.visible || !item.mesh || item.mesh->empty()) continue;

                ShaderUniforms u = base;
                u.transforms = make_transform_set(item.model, view, proj, light_vp);
                u.material = item.material;

                if (outlines && item.material && item.material->outline && item.material->outline_width > 0.0f)
                {
                    accumulate(ctx.outline_stats, rasterize_mesh(*item.mesh, outline_program_, u, target, outline_cfg));
                }
                accumulate(ctx.main_stats, rasterize_mesh(*item.mesh, main_program_, u, target, main_cfg));
            }
        }

    private:
        // Shadow pass-ийн гаралтыг үндсэн (эхний) directional гэрэлд холбоно.
        static void bind_shadow(const PassContext& ctx, LightSet& lights)
        {
            if (!ctx.shadow.valid || lights.empty()) return;
            LightDescriptor& primary = lights.lights.front();
            if (primary.kind != LightKind::Directional) return;
            primary.shadow_map = ctx.shadow.map;
            primary.light_viewproj = ctx.shadow.light_viewproj;
        }

        static void accumulate(RasterizerStats& dst, const RasterizerStats& src)
        {
            dst.tri_input += src.tri_input;
            dst.tri_culled += src.tri_culled;
            dst.tri_after_clip += src.tri_after_clip;
            dst.tri_raster += src.tri_raster;
            dst.fragments_shaded += src.fragments_shaded;
        }

        ShaderProgram outline_program_{};
        ShaderProgram main_program_{};
        DebugViewMode main_view_ = DebugViewMode::None;
    };
}
