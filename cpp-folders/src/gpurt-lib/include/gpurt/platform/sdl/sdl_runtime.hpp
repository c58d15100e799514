#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 цонх ба оролт. Vulkan горимд зөвхөн цонх, software горимд
            streaming texture-ээр CPU зургийг гаргана.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>

#include "gpurt/core/log.hpp"
#include "gpurt/platform/platform_runtime.hpp"

namespace gpurt
{
    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        explicit SdlRuntime(const WindowDesc& desc)
            : vulkan_(desc.vulkan)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }
            sdl_up_ = true;

            const Uint32 window_flags = SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI |
                (desc.resizable ? SDL_WINDOW_RESIZABLE : 0u) |
                (desc.vulkan ? SDL_WINDOW_VULKAN : 0u);
            window_ = SDL_CreateWindow(desc.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                desc.width, desc.height, window_flags);
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            // Vulkan owns presentation; the SDL renderer only backs the CPU path.
            if (!vulkan_)
            {
                renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
                if (!renderer_)
                {
                    log_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                    return;
                }
            }
            valid_ = true;
        }

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_up_) SDL_Quit();
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        bool valid() const override { return valid_; }

        bool pump_input(PlatformInputState& input) override
        {
            input = PlatformInputState{};

            SDL_Event ev;
            while (SDL_PollEvent(&ev)) handle_event(ev, input);

            if (input.resized)
            {
                drawable_size(input.resize_width, input.resize_height);
                if (input.resize_width <= 0 || input.resize_height <= 0) minimized_ = true;
            }
            input.minimized = minimized_;

            // Button-up can be lost while the cursor is captured, so poll the real state.
            const bool rmb_down = (SDL_GetMouseState(nullptr, nullptr) & SDL_BUTTON(SDL_BUTTON_RIGHT)) != 0;
            if (rmb_down) look_held_ = true;
            else if (SDL_GetRelativeMouseMode() != SDL_TRUE) look_held_ = false;
            input.right_mouse_down = look_held_;

            const uint8_t* keys = SDL_GetKeyboardState(nullptr);
            input.forward = keys[SDL_SCANCODE_W] != 0;
            input.backward = keys[SDL_SCANCODE_S] != 0;
            input.left = keys[SDL_SCANCODE_A] != 0;
            input.right = keys[SDL_SCANCODE_D] != 0;
            input.descend = keys[SDL_SCANCODE_Q] != 0;
            input.ascend = keys[SDL_SCANCODE_E] != 0;
            input.boost = keys[SDL_SCANCODE_LSHIFT] != 0;
            return !input.quit;
        }

        void set_relative_mouse_mode(bool enabled) override
        {
            SDL_SetRelativeMouseMode(enabled ? SDL_TRUE : SDL_FALSE);
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        // Pixel size, which differs from window size on high-DPI displays.
        void drawable_size(int& w, int& h) const override
        {
            w = 0;
            h = 0;
            if (!window_) return;
            if (vulkan_) SDL_Vulkan_GetDrawableSize(window_, &w, &h);
            else if (renderer_) SDL_GetRendererOutputSize(renderer_, &w, &h);
            else SDL_GetWindowSize(window_, &w, &h);
        }

        SDL_Window* window() const { return window_; }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) override
        {
            if (!renderer_ || !src || width <= 0 || height <= 0) return;
            if (!fit_texture(width, height)) return;

            void* pixels = nullptr;
            int pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) return;
            const size_t row_bytes = (size_t)width * 4u;
            for (int row = 0; row < height; ++row)
            {
                std::memcpy(static_cast<uint8_t*>(pixels) + (size_t)row * pitch, src + (size_t)row * src_pitch_bytes, row_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present() override
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        void handle_event(const SDL_Event& ev, PlatformInputState& input)
        {
            switch (ev.type)
            {
                case SDL_QUIT:
                    input.quit = true;
                    break;
                case SDL_KEYDOWN:
                    if (ev.key.repeat == 0) handle_key(ev.key.keysym.sym, input);
                    break;
                case SDL_MOUSEMOTION:
                    input.mouse_dx += (float)ev.motion.xrel;
                    input.mouse_dy += (float)ev.motion.yrel;
                    break;
                case SDL_MOUSEBUTTONDOWN:
                    if (ev.button.button == SDL_BUTTON_RIGHT) look_held_ = true;
                    break;
                case SDL_MOUSEBUTTONUP:
                    if (ev.button.button == SDL_BUTTON_RIGHT)
                    {
                        look_held_ = false;
                        input.right_mouse_up = true;
                    }
                    break;
                case SDL_WINDOWEVENT:
                    handle_window_event(ev.window.event, input);
                    break;
                default:
                    break;
            }
        }

        static void handle_key(SDL_Keycode key, PlatformInputState& input)
        {
            if (key == SDLK_ESCAPE) input.quit = true;
            else if (key == SDLK_F1) input.cycle_shade_mode = true;
            else if (key == SDLK_r) input.reset_camera = true;
            else if (key == SDLK_F12) input.request_capture = true;
        }

        void handle_window_event(Uint8 what, PlatformInputState& input)
        {
            if (what == SDL_WINDOWEVENT_SIZE_CHANGED || what == SDL_WINDOWEVENT_RESIZED)
            {
                input.resized = true;
            }
            else if (what == SDL_WINDOWEVENT_MINIMIZED)
            {
                minimized_ = true;
            }
            else if (what == SDL_WINDOWEVENT_RESTORED || what == SDL_WINDOWEVENT_MAXIMIZED)
            {
                minimized_ = false;
                input.resized = true;
            }
            else if (what == SDL_WINDOWEVENT_FOCUS_LOST)
            {
                look_held_ = false;
            }
        }

        // Streaming texture sized to the traced image.
        bool fit_texture(int width, int height)
        {
            if (texture_ && width == texture_w_ && height == texture_h_) return true;
            if (texture_) SDL_DestroyTexture(texture_);
            texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, width, height);
            texture_w_ = texture_ ? width : 0;
            texture_h_ = texture_ ? height : 0;
            if (!texture_) log_error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
            return texture_ != nullptr;
        }

        bool valid_ = false;
        bool vulkan_ = false;
        bool sdl_up_ = false;
        bool minimized_ = false;
        bool look_held_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
        int texture_w_ = 0;
        int texture_h_ = 0;
    };
}
