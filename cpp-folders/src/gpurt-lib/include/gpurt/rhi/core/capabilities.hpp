#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: capabilities.hpp
    МОДУЛЬ: rhi/core
    ЗОРИЛГО: Backend-ийн queue/feature/limit мэдээллийг нэгэн жигд contract-оор илэрхийлнэ.
            Ray trace compute pass ажиллах боломжтой эсэхийг эндээс шалгана.
*/


#include <cstdint>

namespace gpurt
{
    struct BackendQueueCaps
    {
        uint32_t graphics_count = 0;
        uint32_t compute_count = 0;
        uint32_t present_count = 0;
    };

    struct BackendFeatureCaps
    {
        bool validation_layers = false;
        bool push_constants = false;
        bool compute_shaders = false;
        bool storage_image_rgba8 = false;
        bool async_compute = false;
    };

    struct BackendLimitCaps
    {
        uint32_t max_frames_in_flight = 2;
        uint32_t max_push_constant_bytes = 0;
        uint32_t max_compute_workgroup_count[3] = {0, 0, 0};
        uint32_t max_compute_workgroup_invocations = 0;
        uint32_t max_image_dimension_2d = 0;
        uint64_t max_storage_buffer_range = 0;
    };

    struct BackendCapabilities
    {
        BackendQueueCaps queues{};
        BackendFeatureCaps features{};
        BackendLimitCaps limits{};
        bool supports_present = false;
        bool supports_offscreen = true;
    };

    // 8x8 групп бүхий compute trace dispatch-ийг энэ backend хүлээж авах эсэх.
    inline bool capabilities_support_ray_trace(const BackendCapabilities& c, uint32_t group_invocations)
    {
        return c.queues.compute_count > 0 &&
            c.features.compute_shaders &&
            c.features.storage_image_rgba8 &&
            c.limits.max_compute_workgroup_invocations >= group_invocations;
    }
}
