#pragma once

/*
    GPURT RENDERER SAN

    FILE: viewport.hpp
    MODULE: camera
    PURPOSE: Virtual image plane in front of the camera. Maps an image of
             width x height pixels onto a rectangle spanned by u (left to right)
             and v (top to bottom), focal_length units along the view direction.
*/


#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "gpurt/math/vec.hpp"

namespace gpurt
{
    struct ImageExtent
    {
        uint32_t width = 0;
        uint32_t height = 0;

        bool empty() const { return width == 0 || height == 0; }
        float aspect() const { return empty() ? 1.0f : (float)width / (float)height; }

        bool operator==(const ImageExtent&) const = default;
    };

    struct Viewport
    {
        float width = 0.0f;
        float height = 0.0f;
        float focal_length = 1.0f;
        Vec3 u{0.0f};
        Vec3 v{0.0f};
        Vec3 du{0.0f};
        Vec3 dv{0.0f};
    };

    // Orthonormal camera frame.
    struct CameraBasis
    {
        Vec3 forward{0.0f, 0.0f, -1.0f};
        Vec3 right{1.0f, 0.0f, 0.0f};
        Vec3 up{0.0f, 1.0f, 0.0f};
    };

    inline float viewport_height_from_vfov(float vfov_radians, float focal_length)
    {
        return 2.0f * focal_length * std::tan(0.5f * vfov_radians);
    }

    inline Viewport make_viewport(const CameraBasis& basis, ImageExtent image, float viewport_height, float focal_length)
    {
        Viewport vp{};
        vp.height = viewport_height;
        vp.width = viewport_height * image.aspect();
        vp.focal_length = focal_length;
        vp.u = basis.right * vp.width;
        // Image rows grow downward.
        vp.v = -basis.up * vp.height;
        if (!image.empty())
        {
            vp.du = vp.u / (float)image.width;
            vp.dv = vp.v / (float)image.height;
        }
        return vp;
    }

    inline Point3 viewport_upper_left(const Point3& eye, const CameraBasis& basis, const Viewport& vp)
    {
        return eye + basis.forward * vp.focal_length - 0.5f * vp.u - 0.5f * vp.v;
    }

    inline Point3 viewport_pixel00(const Point3& eye, const CameraBasis& basis, const Viewport& vp)
    {
        return viewport_upper_left(eye, basis, vp) + 0.5f * (vp.du + vp.dv);
    }
}
