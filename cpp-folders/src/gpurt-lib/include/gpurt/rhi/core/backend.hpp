#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: backend.hpp
    МОДУЛЬ: rhi/core
    ЗОРИЛГО: Render backend-ийн ерөнхий интерфэйс.
            Vulkan нь compute ray trace хийнэ, software нь CPU reference tracer ажиллуулна.
*/


#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "gpurt/rhi/core/capabilities.hpp"

namespace gpurt
{
    struct Context;

    enum class RenderBackendType : uint8_t
    {
        Software = 0,
        Vulkan = 1
    };

    inline constexpr size_t k_render_backend_type_count = 2;

    inline const char* render_backend_type_name(RenderBackendType type)
    {
        switch (type)
        {
            case RenderBackendType::Software: return "software";
            case RenderBackendType::Vulkan: return "vulkan";
        }
        return "unknown";
    }

    inline std::string to_lower_ascii(std::string_view s)
    {
        std::string out{};
        out.reserve(s.size());
        for (const char c : s)
        {
            out.push_back((char)std::tolower((unsigned char)c));
        }
        return out;
    }

    inline std::optional<RenderBackendType> try_parse_render_backend_type(std::string_view text)
    {
        const std::string v = to_lower_ascii(text);
        if (v == "software" || v == "sw" || v == "cpu") return RenderBackendType::Software;
        if (v == "vulkan" || v == "vk") return RenderBackendType::Vulkan;
        return std::nullopt;
    }

    enum class PresentModePreference : uint8_t
    {
        Fifo = 0,
        Mailbox = 1
    };

    inline const char* present_mode_preference_name(PresentModePreference p)
    {
        return p == PresentModePreference::Mailbox ? "mailbox" : "fifo";
    }

    inline std::optional<PresentModePreference> try_parse_present_mode_preference(std::string_view text)
    {
        const std::string v = to_lower_ascii(text);
        if (v == "fifo" || v == "vsync") return PresentModePreference::Fifo;
        if (v == "mailbox") return PresentModePreference::Mailbox;
        return std::nullopt;
    }

    // Нэг фрэйм зурах оролдлогын үр дүн. App эдгээрт тус тусдаа хариу үйлдэл хийнэ.
    enum class FrameStatus : uint8_t
    {
        Ok = 0,
        Skipped,
        SurfaceOutOfDate,
        SurfaceLost,
        OutOfMemory,
        DeviceLost,
        Error
    };

    inline const char* frame_status_name(FrameStatus s)
    {
        switch (s)
        {
            case FrameStatus::Ok: return "ok";
            case FrameStatus::Skipped: return "skipped";
            case FrameStatus::SurfaceOutOfDate: return "surface-out-of-date";
            case FrameStatus::SurfaceLost: return "surface-lost";
            case FrameStatus::OutOfMemory: return "out-of-memory";
            case FrameStatus::DeviceLost: return "device-lost";
            case FrameStatus::Error: return "error";
        }
        return "unknown";
    }

    // Surface-ийг одоогийн хэмжээгээр дахин тохируулбал сэргэх статусууд.
    inline bool frame_status_needs_resize(FrameStatus s)
    {
        return s == FrameStatus::SurfaceOutOfDate || s == FrameStatus::SurfaceLost;
    }

    // Програмаас гарах шаардлагатай статусууд.
    inline bool frame_status_is_fatal(FrameStatus s)
    {
        return s == FrameStatus::OutOfMemory || s == FrameStatus::DeviceLost;
    }

    struct RenderBackendFrameInfo
    {
        uint64_t frame_index = 0;
        int width = 0;
        int height = 0;
    };

    class IRenderBackend
    {
    public:
        virtual ~IRenderBackend() = default;

        virtual RenderBackendType type() const = 0;
        virtual const char* name() const { return render_backend_type_name(type()); }
        virtual BackendCapabilities capabilities() const { return BackendCapabilities{}; }

        virtual void on_resize(Context& ctx, int w, int h) { (void)ctx; (void)w; (void)h; }
        virtual void begin_frame(Context& ctx, const RenderBackendFrameInfo& frame) = 0;
        virtual void end_frame(Context& ctx, const RenderBackendFrameInfo& frame) = 0;
    };
}
