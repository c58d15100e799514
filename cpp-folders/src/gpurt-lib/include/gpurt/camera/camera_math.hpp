#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: camera_math.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Yaw/pitch болон чиглэлийн векторын хоорондох хөрвүүлэлт.
            Баруун гарын систем: yaw = -pi/2, pitch = 0 үед -Z рүү харна.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "gpurt/math/vec.hpp"

namespace gpurt
{
    // pi/2 - 0.01
    inline constexpr float k_pitch_limit = 1.5607963f;

    inline Vec3 forward_from_yaw_pitch(float yaw, float pitch)
    {
        Vec3 f{};
        f.x = std::cos(pitch) * std::cos(yaw);
        f.y = std::sin(pitch);
        f.z = std::cos(pitch) * std::sin(yaw);
        return glm::normalize(f);
    }

    // forward_from_yaw_pitch-ийн урвуу.
    inline void yaw_pitch_from_forward(const Vec3& fwd, float& out_yaw, float& out_pitch)
    {
        const Vec3 f = normalize_or(fwd, -axis_k());
        out_pitch = std::asin(std::clamp(f.y, -1.0f, 1.0f));
        out_yaw = std::atan2(f.z, f.x);
    }

    inline Vec3 right_from_forward(const Vec3& fwd, const Vec3& world_up = Vec3(0.0f, 1.0f, 0.0f))
    {
        // Дээш харсан үед cross тэг болох тул +X-ийг fallback болгоно.
        return normalize_or(glm::cross(fwd, world_up), axis_i());
    }
}
