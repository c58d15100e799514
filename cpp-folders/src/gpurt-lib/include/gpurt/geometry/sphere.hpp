#pragma once

/*
    GPURT RENDERER SAN

    FILE: sphere.hpp
    MODULE: geometry
    PURPOSE: Sphere primitive, ray hit record and the Geometry concept every
             traceable primitive satisfies.
*/


#include <cmath>
#include <concepts>
#include <cstdint>
#include <optional>

#include <glm/glm.hpp>

#include "gpurt/geometry/aabb.hpp"
#include "gpurt/math/vec.hpp"

namespace gpurt
{
    struct Hit
    {
        float t = 0.0f;
        Point3 point{0.0f};
        // Always faces against the incoming ray.
        Vec3 normal{0.0f, 1.0f, 0.0f};
        bool front_face = true;
        uint32_t material = 0;
    };

    template<typename T>
    concept Geometry = requires(const T& g, const Ray& r, float t_min, float t_max)
    {
        { g.intersect(r, t_min, t_max) } -> std::same_as<std::optional<Hit>>;
        { g.bounds() } -> std::same_as<AABB>;
    };

    struct Sphere
    {
        Point3 center{0.0f};
        float radius = 0.0f;
        uint32_t material = 0;

        bool degenerate() const
        {
            return !(radius > 0.0f) || !std::isfinite(radius) || !is_finite(center);
        }

        // Half-b quadratic. Returns the nearest root inside (t_min, t_max).
        std::optional<Hit> intersect(const Ray& ray, float t_min, float t_max) const
        {
            if (degenerate()) return std::nullopt;

            const Vec3 oc = ray.origin - center;
            const float a = glm::dot(ray.direction, ray.direction);
            if (a <= 0.0f) return std::nullopt;
            const float half_b = glm::dot(oc, ray.direction);
            const float c = glm::dot(oc, oc) - radius * radius;
            const float disc = half_b * half_b - a * c;
            if (disc < 0.0f) return std::nullopt;

            const float sqrt_d = std::sqrt(disc);
            float root = (-half_b - sqrt_d) / a;
            if (root <= t_min || root >= t_max)
            {
                root = (-half_b + sqrt_d) / a;
                if (root <= t_min || root >= t_max) return std::nullopt;
            }

            Hit hit{};
            hit.t = root;
            hit.point = ray.at(root);
            const Vec3 outward = (hit.point - center) / radius;
            hit.front_face = glm::dot(ray.direction, outward) < 0.0f;
            hit.normal = hit.front_face ? outward : -outward;
            hit.material = material;
            return hit;
        }

        AABB bounds() const
        {
            AABB box{};
            if (degenerate()) return box;
            const Vec3 r{radius};
            box.expand(center - r);
            box.expand(center + r);
            return box;
        }
    };

    static_assert(Geometry<Sphere>, "Sphere must satisfy Geometry");
}
