#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: free_camera_controller.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: PlatformInputState-ээр Camera-г удирдах чөлөөт камер.
            WASD + QE + баруун товчтой mouse look + shift хурдасгалт.
*/

#include <algorithm>
#include <cmath>

#include "gpurt/camera/camera.hpp"
#include "gpurt/camera/camera_math.hpp"
#include "gpurt/platform/platform_input.hpp"

namespace gpurt
{
    struct FreeCameraController
    {
        float yaw = -1.5707963f;
        float pitch = 0.0f;

        float move_speed = 2.0f;
        float look_speed = 0.003f;

        // WSL2/Remote-д гарч болох mouse spike-ийг шүүх утгууд
        static constexpr float kMouseSpikeThreshold = 180.0f;
        static constexpr float kMouseDeltaClamp = 70.0f;

        // Камерын одоогийн чиглэлээс yaw/pitch-ийг авна.
        void sync_from(const Camera& camera)
        {
            yaw_pitch_from_forward(camera.direction(), yaw, pitch);
        }

        // Камер өөрчлөгдсөн бол true буцаана.
        bool update(Camera& camera, const PlatformInputState& input, float dt)
        {
            bool changed = false;
            if (input.right_mouse_down && (input.mouse_dx != 0.0f || input.mouse_dy != 0.0f))
            {
                float mdx = input.mouse_dx;
                float mdy = input.mouse_dy;
                if (std::abs(mdx) > kMouseSpikeThreshold || std::abs(mdy) > kMouseSpikeThreshold)
                {
                    mdx = 0.0f;
                    mdy = 0.0f;
                }
                mdx = std::clamp(mdx, -kMouseDeltaClamp, kMouseDeltaClamp);
                mdy = std::clamp(mdy, -kMouseDeltaClamp, kMouseDeltaClamp);

                // Баруун гарын систем: mouse баруун тийш явбал yaw өснө.
                yaw += mdx * look_speed;
                pitch -= mdy * look_speed;
                pitch = std::clamp(pitch, -k_pitch_limit, k_pitch_limit);
                camera.set_yaw_pitch(yaw, pitch);
                changed = true;
            }

            if (!input.moving() || dt <= 0.0f) return changed;

            const CameraBasis& b = camera.basis();
            const Vec3 world_up = axis_j();
            const float step = move_speed * (input.boost ? 3.0f : 1.0f) * dt;

            Vec3 delta{0.0f};
            if (input.forward)  delta += b.forward;
            if (input.backward) delta -= b.forward;
            if (input.right)    delta += b.right;
            if (input.left)     delta -= b.right;
            if (input.ascend)   delta += world_up;
            if (input.descend)  delta -= world_up;
            if (length_squared(delta) <= 1e-10f) return changed;

            camera.set_origin(camera.origin() + glm::normalize(delta) * step);
            return true;
        }
    };
}
