#pragma once

/*
    GPURT RENDERER SAN

    FILE: camera.hpp
    MODULE: camera
    PURPOSE: Pinhole camera that owns its viewport. Any change of image size,
             origin or direction recomputes the viewport and bumps generation().
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>

#include <glm/glm.hpp>

#include "gpurt/camera/camera_math.hpp"
#include "gpurt/camera/viewport.hpp"
#include "gpurt/math/vec.hpp"

namespace gpurt
{
    struct CameraDesc
    {
        Point3 origin{0.0f, 0.0f, 0.0f};
        Vec3 direction{0.0f, 0.0f, -1.0f};
        Vec3 world_up{0.0f, 1.0f, 0.0f};
        float viewport_height = 2.0f;
        float focal_length = 1.0f;
        // When set, overrides viewport_height.
        std::optional<float> vfov_degrees{};
    };

    class Camera
    {
    public:
        Camera()
            : Camera(CameraDesc{}, ImageExtent{1, 1})
        {}

        Camera(const CameraDesc& desc, ImageExtent image)
            : origin_(desc.origin),
              direction_(normalize_or(desc.direction, -axis_k())),
              world_up_(normalize_or(desc.world_up, axis_j())),
              viewport_height_(desc.viewport_height > 0.0f ? desc.viewport_height : 2.0f),
              focal_length_(desc.focal_length > 0.0f ? desc.focal_length : 1.0f),
              vfov_degrees_(desc.vfov_degrees),
              image_(image.empty() ? ImageExtent{1, 1} : image)
        {
            recompute();
        }

        // Returns false and keeps the previous viewport for an empty image.
        bool resize(uint32_t width, uint32_t height)
        {
            if (width == 0 || height == 0) return false;
            const ImageExtent next{width, height};
            if (next == image_) return true;
            image_ = next;
            recompute();
            return true;
        }

        void set_origin(const Point3& p)
        {
            if (!is_finite(p) || p == origin_) return;
            origin_ = p;
            recompute();
        }

        bool set_direction(const Vec3& dir)
        {
            if (!is_finite(dir) || length_squared(dir) <= 1e-10f) return false;
            const Vec3 d = glm::normalize(dir);
            if (d == direction_) return true;
            direction_ = d;
            recompute();
            return true;
        }

        void look_at(const Point3& target)
        {
            (void)set_direction(target - origin_);
        }

        void set_yaw_pitch(float yaw, float pitch)
        {
            (void)set_direction(forward_from_yaw_pitch(yaw, std::clamp(pitch, -k_pitch_limit, k_pitch_limit)));
        }

        void set_vfov_degrees(std::optional<float> vfov)
        {
            vfov_degrees_ = vfov;
            recompute();
        }

        const Point3& origin() const { return origin_; }
        const Vec3& direction() const { return direction_; }
        const CameraBasis& basis() const { return basis_; }
        const Viewport& viewport() const { return viewport_; }
        ImageExtent image() const { return image_; }
        float aspect() const { return image_.aspect(); }
        float focal_length() const { return focal_length_; }
        const Point3& pixel00() const { return pixel00_; }
        uint64_t generation() const { return generation_; }

        Point3 upper_left() const
        {
            return viewport_upper_left(origin_, basis_, viewport_);
        }

        Point3 pixel_center(float i, float j) const
        {
            return pixel00_ + i * viewport_.du + j * viewport_.dv;
        }

        // Direction is left unnormalized, matching the compute shader.
        Ray primary_ray(uint32_t i, uint32_t j) const
        {
            Ray r{};
            r.origin = origin_;
            r.direction = pixel_center((float)i, (float)j) - origin_;
            return r;
        }

    private:
        void recompute()
        {
            basis_.forward = direction_;
            basis_.right = right_from_forward(direction_, world_up_);
            basis_.up = glm::cross(basis_.right, basis_.forward);

            float height = viewport_height_;
            if (vfov_degrees_ && *vfov_degrees_ > 0.0f && *vfov_degrees_ < 180.0f)
            {
                height = viewport_height_from_vfov(glm::radians(*vfov_degrees_), focal_length_);
            }
            viewport_ = make_viewport(basis_, image_, height, focal_length_);
            pixel00_ = viewport_pixel00(origin_, basis_, viewport_);
            ++generation_;
        }

        Point3 origin_{0.0f};
        Vec3 direction_{0.0f, 0.0f, -1.0f};
        Vec3 world_up_{0.0f, 1.0f, 0.0f};
        float viewport_height_ = 2.0f;
        float focal_length_ = 1.0f;
        std::optional<float> vfov_degrees_{};
        ImageExtent image_{1, 1};
        CameraBasis basis_{};
        Viewport viewport_{};
        Point3 pixel00_{0.0f};
        uint64_t generation_ = 0;
    };
}
