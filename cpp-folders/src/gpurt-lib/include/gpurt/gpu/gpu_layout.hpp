#pragma once

/*
    GPURT RENDERER SAN

    FILE: gpu_layout.hpp
    MODULE: gpu
    PURPOSE: Host side of the compute ray tracer's data contract. Struct layouts
             mirror the blocks declared in shaders/raytrace.comp (std140 uniform,
             std430 storage, push constants) and are pinned with static_asserts.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "gpurt/camera/camera.hpp"
#include "gpurt/scene/scene.hpp"
#include "gpurt/trace/shading.hpp"

namespace gpurt
{
    inline constexpr uint32_t k_trace_group_size_x = 8u;
    inline constexpr uint32_t k_trace_group_size_y = 8u;

    inline constexpr uint32_t k_trace_set_index = 0u;
    inline constexpr uint32_t k_trace_binding_output = 0u;
    inline constexpr uint32_t k_trace_binding_frame = 1u;
    inline constexpr uint32_t k_trace_binding_spheres = 2u;

    inline constexpr uint32_t k_present_set_index = 0u;
    inline constexpr uint32_t k_present_binding_texture = 0u;
    inline constexpr uint32_t k_present_vertex_count = 6u;

    struct alignas(16) FrameUniformGPU
    {
        // xyz: camera origin, w: focal length
        glm::vec4 origin{0.0f};
        // xyz: center of pixel (0, 0)
        glm::vec4 pixel00{0.0f};
        glm::vec4 pixel_du{0.0f};
        glm::vec4 pixel_dv{0.0f};
        // x: width, y: height, z: sphere count, w: frame index
        glm::uvec4 image{0u};
        // xyz: direction to light, w: intensity
        glm::vec4 sun{0.0f};
        // rgb: horizon, a: ambient
        glm::vec4 sky_horizon{0.0f};
        glm::vec4 sky_zenith{0.0f};
    };
    static_assert(sizeof(FrameUniformGPU) == 128, "FrameUniformGPU must match the std140 block in raytrace.comp");
    static_assert(offsetof(FrameUniformGPU, image) == 64, "FrameUniformGPU::image offset mismatch");
    static_assert(offsetof(FrameUniformGPU, sky_zenith) == 112, "FrameUniformGPU::sky_zenith offset mismatch");

    struct alignas(16) SphereGPU
    {
        // xyz: center, w: radius
        glm::vec4 center_radius{0.0f};
        // rgb: albedo
        glm::vec4 albedo{0.0f};
    };
    static_assert(sizeof(SphereGPU) == 32, "SphereGPU must be 32 bytes (std430)");

    struct RayTracePushConstants
    {
        uint32_t shade_mode = 0;
        uint32_t flags = 0;
        uint32_t pad0 = 0;
        uint32_t pad1 = 0;
    };
    static_assert(sizeof(RayTracePushConstants) == 16, "RayTracePushConstants must stay 16 bytes");

    struct DispatchGroups
    {
        uint32_t x = 0;
        uint32_t y = 0;
    };

    inline DispatchGroups trace_dispatch_groups(uint32_t width, uint32_t height)
    {
        DispatchGroups g{};
        g.x = (width + k_trace_group_size_x - 1u) / k_trace_group_size_x;
        g.y = (height + k_trace_group_size_y - 1u) / k_trace_group_size_y;
        return g;
    }

    inline FrameUniformGPU pack_frame_uniform(const Camera& camera, const Scene& scene, uint64_t frame_index)
    {
        const Viewport& vp = camera.viewport();
        const ImageExtent image = camera.image();
        const size_t sphere_count = std::min(scene.spheres().size(), k_max_scene_spheres);

        FrameUniformGPU out{};
        out.origin = glm::vec4(camera.origin(), vp.focal_length);
        out.pixel00 = glm::vec4(camera.pixel00(), 0.0f);
        out.pixel_du = glm::vec4(vp.du, 0.0f);
        out.pixel_dv = glm::vec4(vp.dv, 0.0f);
        out.image = glm::uvec4(image.width, image.height, (uint32_t)sphere_count, (uint32_t)(frame_index & 0xffffffffu));
        out.sun = glm::vec4(scene.sun.to_light(), scene.sun.intensity);
        out.sky_horizon = glm::vec4(scene.sky.horizon, scene.sun.ambient);
        out.sky_zenith = glm::vec4(scene.sky.zenith, 0.0f);
        return out;
    }

    inline SphereGPU pack_sphere(const Sphere& s, const Material& m)
    {
        SphereGPU out{};
        out.center_radius = glm::vec4(s.center, s.radius);
        out.albedo = glm::vec4(m.albedo, 1.0f);
        return out;
    }

    // Material indices are resolved on the host; the GPU only sees albedo.
    inline size_t pack_spheres(const Scene& scene, std::vector<SphereGPU>& out)
    {
        const std::vector<Sphere>& spheres = scene.spheres();
        const size_t count = std::min(spheres.size(), k_max_scene_spheres);
        out.resize(count);
        for (size_t i = 0; i < count; ++i)
        {
            out[i] = pack_sphere(spheres[i], scene.material_for(spheres[i].material));
        }
        return count;
    }

    inline RayTracePushConstants make_ray_trace_push_constants(ShadeMode mode)
    {
        RayTracePushConstants out{};
        out.shade_mode = (uint32_t)mode;
        return out;
    }

    // Smallest power of two >= n. Buffers grow in these steps so a slowly
    // growing scene does not reallocate every frame.
    inline size_t grow_capacity_pow2(size_t n, size_t minimum = 16)
    {
        size_t cap = std::max<size_t>(1, minimum);
        while (cap < n) cap <<= 1;
        return cap;
    }
}
