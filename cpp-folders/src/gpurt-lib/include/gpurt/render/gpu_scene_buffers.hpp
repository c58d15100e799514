#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: gpu_scene_buffers.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Frame slot бүрийн uniform болон sphere storage buffer.
            Uniform фрэйм бүр бичигдэнэ, sphere buffer зөвхөн scene өөрчлөгдсөн үед.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <vulkan/vulkan.h>

#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_frame_ownership.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_memory_utils.hpp"
#include "gpurt/scene/scene.hpp"

namespace gpurt
{
    struct SceneUploadResult
    {
        bool ok = false;
        // Sphere buffer handle changed: descriptor sets of this slot must be rewritten.
        bool reallocated = false;
        bool spheres_uploaded = false;
        size_t sphere_count = 0;
    };

    template <size_t SlotCount>
    class GpuSceneBuffers
    {
    public:
        struct Slot
        {
            VkHostBuffer uniform{};
            VkHostBuffer spheres{};
            size_t sphere_capacity = 0;
        };

        GpuSceneBuffers() = default;
        ~GpuSceneBuffers() { destroy(); }

        GpuSceneBuffers(const GpuSceneBuffers&) = delete;
        GpuSceneBuffers& operator=(const GpuSceneBuffers&) = delete;

        bool create(VkDevice device, VkPhysicalDevice gpu, uint64_t max_storage_buffer_range)
        {
            destroy();
            device_ = device;
            gpu_ = gpu;
            max_storage_buffer_range_ = max_storage_buffer_range;
            for (uint32_t i = 0; i < (uint32_t)SlotCount; ++i)
            {
                Slot& s = slots_.at_slot(i);
                if (!vk_create_host_buffer(device_, gpu_, sizeof(FrameUniformGPU), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, s.uniform)) return false;
                if (!allocate_spheres(s, grow_capacity_pow2(0))) return false;
            }
            tracker_.invalidate_all();
            return true;
        }

        void destroy()
        {
            if (device_ == VK_NULL_HANDLE) return;
            slots_.for_each([&](uint32_t, Slot& s) {
                vk_destroy_host_buffer(device_, s.uniform);
                vk_destroy_host_buffer(device_, s.spheres);
                s.sphere_capacity = 0;
            });
            tracker_.invalidate_all();
            device_ = VK_NULL_HANDLE;
        }

        // The slot's previous submission must have completed (its fence waited).
        SceneUploadResult upload(uint32_t slot, const Scene& scene, uint64_t frame_index)
        {
            SceneUploadResult out{};
            if (!slots_.valid_slot(slot)) return out;
            Slot& s = slots_.at_slot(slot);

            const FrameUniformGPU frame = pack_frame_uniform(scene.camera, scene, frame_index);
            if (!vk_write_host_buffer(s.uniform, &frame, sizeof(frame))) return out;

            out.sphere_count = std::min(scene.spheres().size(), k_max_scene_spheres);
            if (!tracker_.stale(slot, scene.geometry_generation()))
            {
                out.ok = true;
                return out;
            }

            pack_spheres(scene, staging_);
            if (staging_.size() > s.sphere_capacity)
            {
                const size_t cap = grow_capacity_pow2(staging_.size());
                if (max_storage_buffer_range_ > 0 && cap * sizeof(SphereGPU) > max_storage_buffer_range_) return out;
                vk_destroy_host_buffer(device_, s.spheres);
                s.sphere_capacity = 0;
                if (!allocate_spheres(s, cap)) return out;
                out.reallocated = true;
            }
            if (!staging_.empty() &&
                !vk_write_host_buffer(s.spheres, staging_.data(), staging_.size() * sizeof(SphereGPU)))
            {
                return out;
            }
            tracker_.mark_uploaded(slot, scene.geometry_generation());
            out.spheres_uploaded = true;
            out.ok = true;
            return out;
        }

        const Slot& slot(uint32_t i) const { return slots_.at_slot(i); }

        VkDescriptorBufferInfo uniform_info(uint32_t i) const
        {
            const Slot& s = slots_.at_slot(i);
            return VkDescriptorBufferInfo{s.uniform.buffer, 0, sizeof(FrameUniformGPU)};
        }

        VkDescriptorBufferInfo spheres_info(uint32_t i) const
        {
            const Slot& s = slots_.at_slot(i);
            return VkDescriptorBufferInfo{s.spheres.buffer, 0, VK_WHOLE_SIZE};
        }

    private:
        bool allocate_spheres(Slot& s, size_t capacity)
        {
            if (!vk_create_host_buffer(
                    device_,
                    gpu_,
                    (VkDeviceSize)(capacity * sizeof(SphereGPU)),
                    VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                    s.spheres))
            {
                return false;
            }
            s.sphere_capacity = capacity;
            return true;
        }

        VkDevice device_ = VK_NULL_HANDLE;
        VkPhysicalDevice gpu_ = VK_NULL_HANDLE;
        uint64_t max_storage_buffer_range_ = 0;
        VkFrameRing<Slot, SlotCount> slots_{};
        VkSlotGenerationTracker<SlotCount> tracker_{};
        std::vector<SphereGPU> staging_{};
    };
}
