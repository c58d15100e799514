#pragma once

/*
    GPURT RENDERER SAN

    FILE: vec.hpp
    MODULE: math
    PURPOSE: 3D vector/point aliases over glm, unit axes and the Ray type used by
             both the CPU tracer and the GPU data packing.
*/


#include <cmath>

#include <glm/glm.hpp>

namespace gpurt
{
    using Vec3 = glm::vec3;
    using Point3 = glm::vec3;

    inline Point3 origin() { return Point3{0.0f, 0.0f, 0.0f}; }
    inline Vec3 axis_i() { return Vec3{1.0f, 0.0f, 0.0f}; }
    inline Vec3 axis_j() { return Vec3{0.0f, 1.0f, 0.0f}; }
    inline Vec3 axis_k() { return Vec3{0.0f, 0.0f, 1.0f}; }

    inline float length_squared(const Vec3& v)
    {
        return glm::dot(v, v);
    }

    inline Vec3 normalize_or(const Vec3& v, const Vec3& fallback)
    {
        const float len2 = glm::dot(v, v);
        if (len2 <= 1e-10f) return fallback;
        return v * (1.0f / std::sqrt(len2));
    }

    inline bool is_finite(const Vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    struct Ray
    {
        Point3 origin{0.0f};
        Vec3 direction{0.0f, 0.0f, -1.0f};

        Point3 at(float t) const { return origin + t * direction; }
    };
}
