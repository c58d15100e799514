#pragma once

/*
    GPURT RENDERER SAN

    FILE: shading.hpp
    MODULE: trace
    PURPOSE: Per-ray shading shared by the CPU tracer. Kept line-for-line in step
             with shaders/raytrace.comp so both paths produce the same image.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "gpurt/scene/scene.hpp"

namespace gpurt
{
    enum class ShadeMode : uint32_t
    {
        Lit = 0,
        Normals = 1,
        Depth = 2
    };

    inline constexpr uint32_t k_shade_mode_count = 3;

    inline const char* shade_mode_name(ShadeMode m)
    {
        switch (m)
        {
            case ShadeMode::Lit: return "lit";
            case ShadeMode::Normals: return "normals";
            case ShadeMode::Depth: return "depth";
        }
        return "unknown";
    }

    inline ShadeMode next_shade_mode(ShadeMode m)
    {
        return (ShadeMode)(((uint32_t)m + 1u) % k_shade_mode_count);
    }

    inline constexpr float k_trace_t_min = 1e-3f;
    inline constexpr float k_trace_t_max = 1e30f;
    inline constexpr float k_shadow_bias = 1e-3f;
    inline constexpr float k_display_gamma = 2.2f;

    struct ShadeCounters
    {
        uint64_t shadow_rays = 0;
    };

    // Linear radiance for a primary ray.
    inline glm::vec3 trace_ray_color(const Scene& scene, const Ray& ray, ShadeMode mode, ShadeCounters* counters = nullptr)
    {
        const auto hit = scene.closest_hit(ray, k_trace_t_min, k_trace_t_max);
        if (!hit)
        {
            if (mode == ShadeMode::Depth) return glm::vec3(0.0f);
            return scene.sky.color(ray.direction);
        }

        switch (mode)
        {
            case ShadeMode::Normals:
                return 0.5f * (hit->normal + glm::vec3(1.0f));
            case ShadeMode::Depth:
            {
                const float dist = hit->t * std::sqrt(glm::dot(ray.direction, ray.direction));
                return glm::vec3(1.0f / (1.0f + dist));
            }
            case ShadeMode::Lit:
                break;
        }

        const glm::vec3 albedo = scene.material_for(hit->material).albedo;
        const Vec3 l = scene.sun.to_light();
        const float n_dot_l = std::max(0.0f, glm::dot(hit->normal, l));
        float direct = 0.0f;
        if (n_dot_l > 0.0f)
        {
            if (counters) ++counters->shadow_rays;
            const Ray shadow{hit->point + hit->normal * k_shadow_bias, l};
            if (!scene.any_hit(shadow, k_trace_t_min, k_trace_t_max))
            {
                direct = scene.sun.intensity * n_dot_l;
            }
        }
        return albedo * (scene.sun.ambient + direct);
    }

    inline uint8_t encode_display_channel(float linear)
    {
        const float c = std::pow(std::clamp(linear, 0.0f, 1.0f), 1.0f / k_display_gamma);
        return (uint8_t)std::lround(c * 255.0f);
    }
}
