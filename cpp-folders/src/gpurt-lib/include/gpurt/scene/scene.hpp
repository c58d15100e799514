#pragma once

/*
    GPURT RENDERER SAN

    FILE: scene.hpp
    MODULE: scene
    PURPOSE: Sphere scene with materials, sky gradient and sun light.
             Geometry edits go through Scene so that geometry_generation()
             tells GPU copies when they are stale.
*/


#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "gpurt/camera/camera.hpp"
#include "gpurt/core/result.hpp"
#include "gpurt/geometry/aabb.hpp"
#include "gpurt/geometry/sphere.hpp"
#include "gpurt/math/vec.hpp"

namespace gpurt
{
    // Storage buffer upper bound; also bounds the per-pixel loop in raytrace.comp.
    inline constexpr size_t k_max_scene_spheres = 4096;

    struct Material
    {
        glm::vec3 albedo{0.5f, 0.5f, 0.5f};
    };

    struct Sky
    {
        glm::vec3 horizon{1.0f, 1.0f, 1.0f};
        glm::vec3 zenith{0.5f, 0.7f, 1.0f};

        glm::vec3 color(const Vec3& dir) const
        {
            const Vec3 d = normalize_or(dir, -axis_k());
            const float t = 0.5f * (d.y + 1.0f);
            return (1.0f - t) * horizon + t * zenith;
        }
    };

    struct SunLight
    {
        // Points toward the light.
        Vec3 direction{-0.4f, 1.0f, 0.3f};
        float intensity = 1.0f;
        float ambient = 0.15f;

        Vec3 to_light() const
        {
            return normalize_or(direction, axis_j());
        }
    };

    class Scene
    {
    public:
        Camera camera{};
        Sky sky{};
        SunLight sun{};

        uint32_t add_material(const Material& m)
        {
            materials_.push_back(m);
            ++geometry_generation_;
            return (uint32_t)(materials_.size() - 1);
        }

        uint32_t add_sphere(const Sphere& s)
        {
            spheres_.push_back(s);
            ++geometry_generation_;
            return (uint32_t)(spheres_.size() - 1);
        }

        bool set_sphere(uint32_t index, const Sphere& s)
        {
            if (index >= spheres_.size()) return false;
            spheres_[index] = s;
            ++geometry_generation_;
            return true;
        }

        bool set_material(uint32_t index, const Material& m)
        {
            if (index >= materials_.size()) return false;
            materials_[index] = m;
            ++geometry_generation_;
            return true;
        }

        void clear_geometry()
        {
            spheres_.clear();
            materials_.clear();
            ++geometry_generation_;
        }

        const std::vector<Sphere>& spheres() const { return spheres_; }
        const std::vector<Material>& materials() const { return materials_; }
        uint64_t geometry_generation() const { return geometry_generation_; }

        // Out-of-range indices resolve to a neutral grey.
        Material material_for(uint32_t index) const
        {
            if (index < materials_.size()) return materials_[index];
            return Material{};
        }

        std::optional<Hit> closest_hit(const Ray& ray, float t_min, float t_max) const
        {
            std::optional<Hit> best{};
            float closest = t_max;
            for (const Sphere& s : spheres_)
            {
                if (auto h = s.intersect(ray, t_min, closest))
                {
                    closest = h->t;
                    best = h;
                }
            }
            return best;
        }

        bool any_hit(const Ray& ray, float t_min, float t_max) const
        {
            for (const Sphere& s : spheres_)
            {
                if (s.intersect(ray, t_min, t_max)) return true;
            }
            return false;
        }

        AABB bounds() const
        {
            AABB box{};
            for (const Sphere& s : spheres_) box.expand(s.bounds());
            return box;
        }

        Status validate() const
        {
            if (spheres_.empty())
            {
                return Status::failure("scene has no spheres");
            }
            if (spheres_.size() > k_max_scene_spheres)
            {
                return Status::failure(
                    "scene has " + std::to_string(spheres_.size()) +
                    " spheres, limit is " + std::to_string(k_max_scene_spheres));
            }
            for (size_t i = 0; i < spheres_.size(); ++i)
            {
                const Sphere& s = spheres_[i];
                if (s.degenerate())
                {
                    return Status::failure("sphere " + std::to_string(i) + " has a non-positive or non-finite radius/center");
                }
                if (s.material >= materials_.size())
                {
                    return Status::failure(
                        "sphere " + std::to_string(i) + " references material " +
                        std::to_string(s.material) + " but only " +
                        std::to_string(materials_.size()) + " exist");
                }
            }
            return status_ok();
        }

    private:
        std::vector<Sphere> spheres_{};
        std::vector<Material> materials_{};
        uint64_t geometry_generation_ = 0;
    };
}
