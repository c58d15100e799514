#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: context.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Job system, бүртгэгдсэн backend-ууд болон фрэймийн статистикийг
            нэг дор хадгалах ерөнхий контекст.
*/


#include <array>
#include <cstdint>

#include "gpurt/job/job_system.hpp"
#include "gpurt/rhi/core/backend.hpp"

namespace gpurt
{
    // Фрэйм бүрийн trace статистик. App гарчиг болон лог-д ашиглана.
    struct TraceStats
    {
        uint64_t primary_rays = 0;
        uint64_t shadow_rays = 0;
        uint64_t sphere_tests = 0;
        uint32_t dispatch_groups_x = 0;
        uint32_t dispatch_groups_y = 0;
        float ms_trace = 0.0f;
        float ms_frame = 0.0f;
    };

    // Surface/GPU алдааны тоолуур. Сэргэсэн алдааг ч бүртгэнэ.
    struct FrameStatusCounters
    {
        uint64_t ok = 0;
        uint64_t skipped = 0;
        uint64_t resized = 0;
        uint64_t errors = 0;

        void record(FrameStatus s)
        {
            if (s == FrameStatus::Ok) ++ok;
            else if (s == FrameStatus::Skipped) ++skipped;
            else if (frame_status_needs_resize(s)) ++resized;
            else ++errors;
        }
    };

    struct Context
    {
        IJobSystem* job_system = nullptr;
        uint64_t frame_index = 0;
        TraceStats stats{};
        FrameStatusCounters frame_status{};
        std::array<IRenderBackend*, k_render_backend_type_count> backends{nullptr, nullptr};
        RenderBackendType primary_backend = RenderBackendType::Software;

        // The first registered backend becomes primary until one is chosen.
        void register_backend(IRenderBackend* backend)
        {
            if (!backend) return;
            if (active_backend() == nullptr) primary_backend = backend->type();
            backends[(size_t)backend->type()] = backend;
        }

        void set_primary_backend(IRenderBackend* backend)
        {
            register_backend(backend);
            if (backend) primary_backend = backend->type();
        }

        void set_primary_backend(RenderBackendType type) { primary_backend = type; }

        IRenderBackend* backend(RenderBackendType type) const { return backends[(size_t)type]; }
        bool has_backend(RenderBackendType type) const { return backend(type) != nullptr; }

        // Falls back to any registered backend, Vulkan first.
        IRenderBackend* active_backend() const
        {
            for (RenderBackendType t : {primary_backend, RenderBackendType::Vulkan, RenderBackendType::Software})
            {
                if (IRenderBackend* b = backend(t)) return b;
            }
            return nullptr;
        }

        RenderBackendType active_backend_type() const
        {
            const IRenderBackend* b = active_backend();
            return b ? b->type() : RenderBackendType::Software;
        }

        const char* active_backend_name() const
        {
            const IRenderBackend* b = active_backend();
            return b ? b->name() : render_backend_type_name(RenderBackendType::Software);
        }
    };
}
