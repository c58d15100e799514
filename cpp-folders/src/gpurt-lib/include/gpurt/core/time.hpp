#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Фрэйм хоорондын хугацаа болон FPS тоолуур.
*/


#include <cstdint>

namespace gpurt
{
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;

        float begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0)
            {
                ticks_prev = ticks_now;
                return 0.0f;
            }
            const float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            return dt;
        }
    };

    // dt-үүдийг window_seconds хугацаанд хуримтлуулж дундаж FPS гаргана.
    struct FpsCounter
    {
        float window_seconds = 0.5f;
        float accum_seconds = 0.0f;
        uint32_t accum_frames = 0;
        float fps = 0.0f;
        float avg_ms = 0.0f;

        // Шинэ дундаж гарсан үед true буцаана.
        bool tick(float dt)
        {
            if (dt <= 0.0f) return false;
            accum_seconds += dt;
            ++accum_frames;
            if (accum_seconds < window_seconds) return false;
            fps = (float)accum_frames / accum_seconds;
            avg_ms = 1000.0f * accum_seconds / (float)accum_frames;
            accum_seconds = 0.0f;
            accum_frames = 0;
            return true;
        }
    };
}
