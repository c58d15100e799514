#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Нэг фрэймийн хугацаанд цуглуулсан оролт болон цонхны үйл явдлууд.
*/


namespace gpurt
{
    struct PlatformInputState
    {
        bool quit = false;
        bool cycle_shade_mode = false;
        bool reset_camera = false;
        bool request_capture = false;

        // Цонхны хэмжээ өөрчлөгдсөн бол resized=true, шинэ drawable хэмжээ.
        bool resized = false;
        int resize_width = 0;
        int resize_height = 0;
        bool minimized = false;

        bool forward = false;
        bool backward = false;
        bool left = false;
        bool right = false;
        bool ascend = false;
        bool descend = false;
        bool boost = false;

        bool right_mouse_down = false;
        bool right_mouse_up = false;
        float mouse_dx = 0.0f;
        float mouse_dy = 0.0f;

        bool moving() const
        {
            return forward || backward || left || right || ascend || descend;
        }
    };
}
