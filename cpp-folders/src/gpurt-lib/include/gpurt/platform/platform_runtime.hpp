#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Цонх, оролт болон CPU зургийг дэлгэцэнд гаргах platform интерфэйс.
*/


#include <cstdint>
#include <string>

#include "gpurt/platform/platform_input.hpp"

namespace gpurt
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
        bool resizable = true;
        // true үед SDL renderer үүсгэхгүй, swapchain-ийг Vulkan backend эзэмшинэ.
        bool vulkan = false;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_relative_mouse_mode(bool enabled) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void drawable_size(int& w, int& h) const = 0;
        virtual void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) = 0;
        virtual void present() = 0;
    };
}
