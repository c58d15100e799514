#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "gpurt/geometry/aabb.hpp"
#include "gpurt/geometry/sphere.hpp"
#include "gpurt/scene/scene.hpp"
#include "gpurt/scene/scene_presets.hpp"

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

    gpurt::Ray make_ray(const glm::vec3& o, const glm::vec3& d)
    {
        gpurt::Ray r{};
        r.origin = o;
        r.direction = d;
        return r;
    }

    bool test_sphere_intersection()
    {
        const gpurt::Sphere s{gpurt::Point3(0.0f, 0.0f, -1.0f), 0.5f, 3u};

        const auto hit = s.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 1e30f);
        if (!hit) return false;
        if (!approx_eq(hit->t, 0.5f)) return false;
        if (!approx_eq(hit->point, glm::vec3(0.0f, 0.0f, -0.5f))) return false;
        if (!approx_eq(hit->normal, glm::vec3(0.0f, 0.0f, 1.0f))) return false;
        if (!hit->front_face || hit->material != 3u) return false;

        // Starting at the center the far root is used and the normal flips.
        const auto inside = s.intersect(make_ray(s.center, glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 1e30f);
        if (!inside || inside->front_face) return false;
        if (!approx_eq(inside->t, 0.5f)) return false;
        if (!approx_eq(inside->normal, glm::vec3(0.0f, 0.0f, 1.0f))) return false;

        if (s.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)), 0.001f, 1e30f)) return false;
        if (s.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 0.4f)) return false;
        if (s.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f)), 0.001f, 1e30f)) return false;

        // Unnormalized directions scale t.
        const auto scaled = s.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -2.0f)), 0.001f, 1e30f);
        return scaled && approx_eq(scaled->t, 0.25f);
    }

    bool test_sphere_degenerate_and_bounds()
    {
        const gpurt::Sphere flat{gpurt::Point3(0.0f, 0.0f, -1.0f), 0.0f, 0u};
        if (!flat.degenerate()) return false;
        if (flat.intersect(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 1e30f)) return false;
        if (flat.bounds().valid()) return false;

        const gpurt::Sphere nan_center{gpurt::Point3(NAN, 0.0f, 0.0f), 1.0f, 0u};
        if (!nan_center.degenerate()) return false;

        const gpurt::Sphere s{gpurt::Point3(1.0f, 2.0f, 3.0f), 2.0f, 0u};
        const gpurt::AABB box = s.bounds();
        if (!box.valid()) return false;
        if (!approx_eq(box.minv, glm::vec3(-1.0f, 0.0f, 1.0f))) return false;
        if (!approx_eq(box.maxv, glm::vec3(3.0f, 4.0f, 5.0f))) return false;
        return approx_eq(box.center(), s.center) && approx_eq(box.extent(), glm::vec3(2.0f));
    }

    bool test_scene_generation_tracking()
    {
        gpurt::Scene scene{};
        const uint64_t g0 = scene.geometry_generation();

        const uint32_t mat = scene.add_material(gpurt::Material{});
        const uint32_t idx = scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f), 1.0f, mat});
        if (idx != 0u || scene.geometry_generation() != g0 + 2) return false;

        if (scene.set_sphere(5u, gpurt::Sphere{})) return false;
        if (scene.set_material(5u, gpurt::Material{})) return false;
        if (scene.geometry_generation() != g0 + 2) return false;

        if (!scene.set_sphere(0u, gpurt::Sphere{gpurt::Point3(1.0f), 2.0f, mat})) return false;
        if (!scene.set_material(0u, gpurt::Material{glm::vec3(1.0f)})) return false;
        if (scene.geometry_generation() != g0 + 4) return false;

        // Camera moves are not geometry edits.
        scene.camera.set_origin(gpurt::Point3(0.0f, 1.0f, 0.0f));
        if (scene.geometry_generation() != g0 + 4) return false;

        scene.clear_geometry();
        return scene.spheres().empty() && scene.materials().empty() && scene.geometry_generation() == g0 + 5;
    }

    bool test_scene_hit_queries()
    {
        gpurt::Scene scene = gpurt::make_default_scene(gpurt::ImageExtent{64, 64});

        const auto hit = scene.closest_hit(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 1e30f);
        if (!hit || !approx_eq(hit->t, 0.5f) || hit->material != 0u) return false;

        const auto ground = scene.closest_hit(make_ray(glm::vec3(0.0f), glm::vec3(0.0f, -1.0f, 0.0f)), 0.001f, 1e30f);
        if (!ground || !approx_eq(ground->t, 0.5f) || ground->material != 1u) return false;

        // A closer sphere in front wins regardless of insertion order.
        const uint32_t mat = scene.add_material(gpurt::Material{glm::vec3(0.1f)});
        scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f, 0.0f, 0.0f), 0.25f, mat});
        const auto closer = scene.closest_hit(make_ray(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.0f, 0.0f, -1.0f)), 0.001f, 1e30f);
        if (!closer || !approx_eq(closer->t, 0.75f) || closer->material != mat) return false;

        if (scene.any_hit(make_ray(glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)), 0.001f, 1e30f)) return false;
        if (!scene.any_hit(make_ray(glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)), 0.001f, 1e30f)) return false;
        return !scene.any_hit(make_ray(glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)), 0.001f, 0.5f);
    }

    bool test_scene_validation()
    {
        gpurt::Scene scene{};
        if (scene.validate().ok) return false;

        const uint32_t mat = scene.add_material(gpurt::Material{});
        scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f, 0.0f, -1.0f), 0.5f, mat});
        if (!scene.validate().ok) return false;

        scene.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f), -1.0f, mat});
        const gpurt::Status degenerate = scene.validate();
        if (degenerate.ok || degenerate.error.find("sphere 1") == std::string::npos) return false;

        if (!scene.set_sphere(1u, gpurt::Sphere{gpurt::Point3(0.0f), 1.0f, 7u})) return false;
        const gpurt::Status bad_material = scene.validate();
        if (bad_material.ok || bad_material.error.find("material 7") == std::string::npos) return false;

        gpurt::Scene big{};
        const uint32_t big_mat = big.add_material(gpurt::Material{});
        for (size_t i = 0; i < gpurt::k_max_scene_spheres; ++i)
        {
            big.add_sphere(gpurt::Sphere{gpurt::Point3((float)i, 0.0f, -5.0f), 0.25f, big_mat});
        }
        if (!big.validate().ok) return false;
        big.add_sphere(gpurt::Sphere{gpurt::Point3(0.0f, 0.0f, -5.0f), 0.25f, big_mat});
        return !big.validate().ok;
    }

    bool test_scene_presets()
    {
        const gpurt::ImageExtent image{320, 180};
        for (std::string_view name : gpurt::k_scene_preset_names)
        {
            const gpurt::Result<gpurt::Scene> r = gpurt::make_scene_preset(name, image);
            if (!r.ok || !r.value.validate().ok) return false;
            if (r.value.camera.image() != image) return false;
        }

        if (gpurt::make_single_sphere_scene(image).spheres().size() != 1) return false;
        if (gpurt::make_grid_scene(image).spheres().size() != 16) return false;

        const gpurt::Scene def = gpurt::make_default_scene(image);
        if (def.spheres().size() != 2) return false;
        if (!approx_eq(def.spheres()[0].center, glm::vec3(0.0f, 0.0f, -1.0f))) return false;
        if (!approx_eq(def.spheres()[1].radius, 100.0f)) return false;
        if (!approx_eq(def.material_for(0u).albedo, glm::vec3(0.7f, 0.3f, 0.3f))) return false;

        const gpurt::Result<gpurt::Scene> bad = gpurt::make_scene_preset("nope", image);
        return !bad.ok && bad.error.find("single|default|grid") != std::string::npos;
    }

    bool test_materials_and_sky()
    {
        const gpurt::Scene scene = gpurt::make_single_sphere_scene(gpurt::ImageExtent{8, 8});
        if (!approx_eq(scene.material_for(99u).albedo, glm::vec3(0.5f))) return false;

        const gpurt::Sky sky{};
        if (!approx_eq(sky.color(glm::vec3(0.0f, 1.0f, 0.0f)), sky.zenith)) return false;
        if (!approx_eq(sky.color(glm::vec3(0.0f, -3.0f, 0.0f)), sky.horizon)) return false;
        if (!approx_eq(sky.color(glm::vec3(1.0f, 0.0f, 0.0f)), glm::vec3(0.75f, 0.85f, 1.0f))) return false;

        gpurt::SunLight sun{};
        sun.direction = glm::vec3(0.0f);
        return approx_eq(sun.to_light(), glm::vec3(0.0f, 1.0f, 0.0f));
    }
}

int main()
{
    const bool ok_sphere = test_sphere_intersection();
    const bool ok_bounds = test_sphere_degenerate_and_bounds();
    const bool ok_gen = test_scene_generation_tracking();
    const bool ok_hits = test_scene_hit_queries();
    const bool ok_validate = test_scene_validation();
    const bool ok_presets = test_scene_presets();
    const bool ok_sky = test_materials_and_sky();

    if (!ok_sphere) std::fprintf(stderr, "[scene-tests] sphere intersection failed\n");
    if (!ok_bounds) std::fprintf(stderr, "[scene-tests] degenerate sphere/bounds failed\n");
    if (!ok_gen) std::fprintf(stderr, "[scene-tests] geometry generation failed\n");
    if (!ok_hits) std::fprintf(stderr, "[scene-tests] closest/any hit failed\n");
    if (!ok_validate) std::fprintf(stderr, "[scene-tests] validation failed\n");
    if (!ok_presets) std::fprintf(stderr, "[scene-tests] presets failed\n");
    if (!ok_sky) std::fprintf(stderr, "[scene-tests] materials/sky failed\n");

    if (!(ok_sphere && ok_bounds && ok_gen && ok_hits && ok_validate && ok_presets && ok_sky)) return 1;
    std::fprintf(stderr, "[scene-tests] all tests passed\n");
    return 0;
}
