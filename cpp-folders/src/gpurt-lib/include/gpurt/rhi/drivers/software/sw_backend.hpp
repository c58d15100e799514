#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: sw_backend.hpp
    МОДУЛЬ: rhi/drivers/software
    ЗОРИЛГО: CPU reference tracer-ийн backend.
            Фрэйм бүрийн хэмжээг хянаж, resize-ийн тоог тоолно.
*/


#include <cstdint>

#include "gpurt/rhi/core/backend.hpp"

namespace gpurt
{
    class SoftwareRenderBackend final : public IRenderBackend
    {
    public:
        RenderBackendType type() const override { return RenderBackendType::Software; }
        BackendCapabilities capabilities() const override
        {
            BackendCapabilities c{};
            c.queues.graphics_count = 1;
            c.queues.compute_count = 1;
            c.queues.present_count = 1;
            c.features.compute_shaders = true;
            c.features.storage_image_rgba8 = true;
            c.limits.max_frames_in_flight = 1;
            c.limits.max_compute_workgroup_invocations = UINT32_MAX;
            c.supports_present = true;
            c.supports_offscreen = true;
            return c;
        }

        void on_resize(Context& ctx, int w, int h) override
        {
            (void)ctx;
            if (w <= 0 || h <= 0) return;
            if (w == width_ && h == height_) return;
            width_ = w;
            height_ = h;
            ++resize_count_;
        }

        void begin_frame(Context& ctx, const RenderBackendFrameInfo& frame) override
        {
            on_resize(ctx, frame.width, frame.height);
            in_frame_ = true;
        }

        void end_frame(Context& ctx, const RenderBackendFrameInfo& frame) override
        {
            (void)ctx;
            (void)frame;
            in_frame_ = false;
            ++frames_completed_;
        }

        int width() const { return width_; }
        int height() const { return height_; }
        uint64_t resize_count() const { return resize_count_; }
        uint64_t frames_completed() const { return frames_completed_; }
        bool in_frame() const { return in_frame_; }

    private:
        int width_ = 0;
        int height_ = 0;
        uint64_t resize_count_ = 0;
        uint64_t frames_completed_ = 0;
        bool in_frame_ = false;
    };
}
