#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

#include <glm/glm.hpp>

#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/scene/scene_presets.hpp"
#include "gpurt/trace/shading.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_eq(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    bool test_dispatch_groups()
    {
        const gpurt::DispatchGroups hd = gpurt::trace_dispatch_groups(1280, 720);
        if (hd.x != 160u || hd.y != 90u) return false;

        // Partial tiles still get a group; the shader discards out-of-range texels.
        const gpurt::DispatchGroups odd = gpurt::trace_dispatch_groups(9, 17);
        if (odd.x != 2u || odd.y != 3u) return false;

        const gpurt::DispatchGroups one = gpurt::trace_dispatch_groups(1, 1);
        if (one.x != 1u || one.y != 1u) return false;

        const gpurt::DispatchGroups none = gpurt::trace_dispatch_groups(0, 0);
        return none.x == 0u && none.y == 0u;
    }

    bool test_pack_frame_uniform()
    {
        gpurt::Scene scene = gpurt::make_default_scene(gpurt::ImageExtent{200, 100});
        const uint64_t frame_index = (1ull << 32) + 5ull;
        const gpurt::FrameUniformGPU u = gpurt::pack_frame_uniform(scene.camera, scene, frame_index);

        if (!approx_eq(glm::vec3(u.origin), glm::vec3(0.0f)) || !approx_eq(u.origin.w, 1.0f)) return false;
        if (!approx_eq(glm::vec3(u.pixel00), glm::vec3(-1.99f, 0.99f, -1.0f))) return false;
        if (!approx_eq(glm::vec3(u.pixel_du), glm::vec3(0.02f, 0.0f, 0.0f))) return false;
        if (!approx_eq(glm::vec3(u.pixel_dv), glm::vec3(0.0f, -0.02f, 0.0f))) return false;
        if (u.image != glm::uvec4(200u, 100u, 2u, 5u)) return false;

        const glm::vec3 l = glm::normalize(glm::vec3(-0.4f, 1.0f, 0.3f));
        if (!approx_eq(glm::vec3(u.sun), l) || !approx_eq(u.sun.w, 1.0f)) return false;
        if (!approx_eq(glm::vec3(u.sky_horizon), glm::vec3(1.0f)) || !approx_eq(u.sky_horizon.a, 0.15f)) return false;
        if (!approx_eq(glm::vec3(u.sky_zenith), glm::vec3(0.5f, 0.7f, 1.0f))) return false;

        // Resizing the camera is picked up on the next pack.
        if (!scene.camera.resize(400, 100)) return false;
        const gpurt::FrameUniformGPU r = gpurt::pack_frame_uniform(scene.camera, scene, 0);
        return r.image.x == 400u && approx_eq(r.pixel00.x, -3.99f);
    }

    bool test_pack_spheres()
    {
        gpurt::Scene scene = gpurt::make_default_scene(gpurt::ImageExtent{16, 16});
        scene.add_sphere(gpurt::Sphere{gpurt::Point3(1.0f, 2.0f, 3.0f), 0.25f, 9u});

        std::vector<gpurt::SphereGPU> packed{};
        if (gpurt::pack_spheres(scene, packed) != 3u || packed.size() != 3u) return false;

        if (packed[0].center_radius != glm::vec4(0.0f, 0.0f, -1.0f, 0.5f)) return false;
        if (!approx_eq(glm::vec3(packed[0].albedo), glm::vec3(0.7f, 0.3f, 0.3f)) || packed[0].albedo.w != 1.0f) return false;
        if (packed[1].center_radius != glm::vec4(0.0f, -100.5f, -1.0f, 100.0f)) return false;
        if (!approx_eq(glm::vec3(packed[2].albedo), glm::vec3(0.5f))) return false;

        // Shrinking the scene shrinks the packed array.
        scene.clear_geometry();
        return gpurt::pack_spheres(scene, packed) == 0u && packed.empty();
    }

    bool test_push_constants_and_modes()
    {
        const gpurt::RayTracePushConstants lit = gpurt::make_ray_trace_push_constants(gpurt::ShadeMode::Lit);
        const gpurt::RayTracePushConstants normals = gpurt::make_ray_trace_push_constants(gpurt::ShadeMode::Normals);
        const gpurt::RayTracePushConstants depth = gpurt::make_ray_trace_push_constants(gpurt::ShadeMode::Depth);
        if (lit.shade_mode != 0u || normals.shade_mode != 1u || depth.shade_mode != 2u) return false;
        if (lit.flags != 0u || lit.pad0 != 0u || lit.pad1 != 0u) return false;

        if (gpurt::next_shade_mode(gpurt::ShadeMode::Lit) != gpurt::ShadeMode::Normals) return false;
        if (gpurt::next_shade_mode(gpurt::ShadeMode::Normals) != gpurt::ShadeMode::Depth) return false;
        if (gpurt::next_shade_mode(gpurt::ShadeMode::Depth) != gpurt::ShadeMode::Lit) return false;
        return std::strcmp(gpurt::shade_mode_name(gpurt::ShadeMode::Depth), "depth") == 0;
    }

    bool test_grow_capacity()
    {
        if (gpurt::grow_capacity_pow2(0) != 16u) return false;
        if (gpurt::grow_capacity_pow2(16) != 16u) return false;
        if (gpurt::grow_capacity_pow2(17) != 32u) return false;
        if (gpurt::grow_capacity_pow2(1000) != 1024u) return false;
        if (gpurt::grow_capacity_pow2(5, 1) != 8u) return false;
        return gpurt::grow_capacity_pow2(3, 0) == 4u;
    }
}

int main()
{
    const bool ok_dispatch = test_dispatch_groups();
    const bool ok_uniform = test_pack_frame_uniform();
    const bool ok_spheres = test_pack_spheres();
    const bool ok_push = test_push_constants_and_modes();
    const bool ok_grow = test_grow_capacity();

    if (!ok_dispatch) std::fprintf(stderr, "[gpu-layout-tests] dispatch groups failed\n");
    if (!ok_uniform) std::fprintf(stderr, "[gpu-layout-tests] frame uniform packing failed\n");
    if (!ok_spheres) std::fprintf(stderr, "[gpu-layout-tests] sphere packing failed\n");
    if (!ok_push) std::fprintf(stderr, "[gpu-layout-tests] push constants/shade modes failed\n");
    if (!ok_grow) std::fprintf(stderr, "[gpu-layout-tests] capacity growth failed\n");

    if (!(ok_dispatch && ok_uniform && ok_spheres && ok_push && ok_grow)) return 1;
    std::fprintf(stderr, "[gpu-layout-tests] all tests passed\n");
    return 0;
}
