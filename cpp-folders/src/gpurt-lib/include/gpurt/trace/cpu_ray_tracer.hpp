#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: cpu_ray_tracer.hpp
    МОДУЛЬ: trace
    ЗОРИЛГО: raytrace.comp-ийн CPU хувилбар. Software backend, headless capture
            болон тестүүдэд ашиглана. Зургийг 8x8 tile-аар job system дээр тараана.
*/


#include <atomic>
#include <chrono>
#include <cstdint>

#include <glm/glm.hpp>

#include "gpurt/core/context.hpp"
#include "gpurt/gfx/image.hpp"
#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/job/job_system.hpp"
#include "gpurt/job/parallel_for.hpp"
#include "gpurt/scene/scene.hpp"
#include "gpurt/trace/shading.hpp"

namespace gpurt
{
    class CpuRayTracer
    {
    public:
        explicit CpuRayTracer(IJobSystem* jobs = nullptr)
            : jobs_(jobs)
        {}

        void set_job_system(IJobSystem* jobs) { jobs_ = jobs; }

        // Камерын зургийн хэмжээгээр out-г дахин хэмжээлж, бүх пикселийг бичнэ.
        void render(const Scene& scene, ShadeMode mode, RT_ColorLDR& out, TraceStats* stats = nullptr)
        {
            const auto t0 = std::chrono::steady_clock::now();
            const ImageExtent image = scene.camera.image();
            out.ensure_size((int)image.width, (int)image.height);

            std::atomic<uint64_t> shadow_rays{0};
            parallel_for_tiles_2d(
                jobs_,
                (int)image.width,
                (int)image.height,
                (int)k_trace_group_size_x,
                (int)k_trace_group_size_y,
                [&](int x0, int y0, int x1, int y1) {
                    ShadeCounters local{};
                    for (int y = y0; y < y1; ++y)
                    {
                        for (int x = x0; x < x1; ++x)
                        {
                            const Ray ray = scene.camera.primary_ray((uint32_t)x, (uint32_t)y);
                            const glm::vec3 c = trace_ray_color(scene, ray, mode, &local);
                            out.color.at(x, y) = Color{
                                encode_display_channel(c.r),
                                encode_display_channel(c.g),
                                encode_display_channel(c.b),
                                255};
                        }
                    }
                    shadow_rays.fetch_add(local.shadow_rays, std::memory_order_relaxed);
                });

            if (stats)
            {
                const uint64_t primary = (uint64_t)image.width * (uint64_t)image.height;
                const DispatchGroups groups = trace_dispatch_groups(image.width, image.height);
                stats->primary_rays = primary;
                stats->shadow_rays = shadow_rays.load(std::memory_order_relaxed);
                stats->sphere_tests = (primary + stats->shadow_rays) * (uint64_t)scene.spheres().size();
                stats->dispatch_groups_x = groups.x;
                stats->dispatch_groups_y = groups.y;
                stats->ms_trace = std::chrono::duration<float, std::milli>(std::chrono::steady_clock::now() - t0).count();
            }
        }

        // Нэг пикселийн өнгө. Тест болон debug-д.
        Color trace_pixel(const Scene& scene, ShadeMode mode, uint32_t x, uint32_t y) const
        {
            const glm::vec3 c = trace_ray_color(scene, scene.camera.primary_ray(x, y), mode);
            return Color{encode_display_channel(c.r), encode_display_channel(c.g), encode_display_channel(c.b), 255};
        }

    private:
        IJobSystem* jobs_ = nullptr;
    };
}
