#pragma once

/*
    GPURT RENDERER SAN

    FILE: vk_ray_tracer.hpp
    MODULE: render
    PURPOSE: Per-frame orchestration on the Vulkan backend. Each frame uploads
             camera and scene data, dispatches the compute tracer into the
             storage target, then draws it to the swapchain image:

               begin_frame -> upload -> [GENERAL] dispatch -> [READ_ONLY]
               -> present pass -> end_frame

             Swapchain rebuilds recreate the storage target and resize the
             camera so the viewport always matches the window.
*/


#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <vulkan/vulkan.h>

#include "gpurt/core/context.hpp"
#include "gpurt/core/log.hpp"
#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/render/gpu_scene_buffers.hpp"
#include "gpurt/render/present_pass.hpp"
#include "gpurt/render/raytrace_pass.hpp"
#include "gpurt/render/storage_target.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_backend.hpp"
#include "gpurt/scene/scene.hpp"
#include "gpurt/trace/shading.hpp"

namespace gpurt
{
    struct RayTracerShaderPaths
    {
        std::string compute{};
        std::string vertex{};
        std::string fragment{};
    };

    class VulkanRayTracer
    {
    public:
        static constexpr size_t kSlots = VulkanRenderBackend::kMaxFramesInFlight;

        VulkanRayTracer(VulkanRenderBackend& vk, RayTracerShaderPaths shaders)
            : vk_(vk), shaders_(std::move(shaders))
        {}

        ~VulkanRayTracer()
        {
            (void)vk_.wait_idle();
        }

        VulkanRayTracer(const VulkanRayTracer&) = delete;
        VulkanRayTracer& operator=(const VulkanRayTracer&) = delete;

        // Throws std::runtime_error when a GPU resource cannot be created.
        void init()
        {
            if (!vk_.ready()) throw std::runtime_error("VulkanRayTracer: backend is not initialized");
            const BackendCapabilities caps = vk_.capabilities();
            if (!capabilities_support_ray_trace(caps, k_trace_group_size_x * k_trace_group_size_y))
            {
                throw std::runtime_error("VulkanRayTracer: device cannot run the compute tracer");
            }

            if (!scene_buffers_.create(vk_.device(), vk_.physical_device(), caps.limits.max_storage_buffer_range))
            {
                throw std::runtime_error("VulkanRayTracer: scene buffer allocation failed");
            }
            trace_pass_.create(vk_.device(), shaders_.compute);
            present_pass_.create(vk_.device(), vk_.render_pass(), shaders_.vertex, shaders_.fragment);
            if (storage_target_needs_rebuild(storage_.extent(), vk_.swapchain_extent(), true))
            {
                rebuild_for_swapchain();
            }
            else
            {
                log_info("vulkan: swapchain is empty, storage target deferred to the first visible frame");
            }
            log_info("vulkan: ray tracer ready (" + std::to_string(kSlots) + " frames in flight)");
        }

        FrameStatus render_frame(Context& ctx, Scene& scene, ShadeMode mode)
        {
            const auto t0 = std::chrono::steady_clock::now();

            RenderBackendFrameInfo frame{};
            frame.frame_index = ctx.frame_index;

            VulkanRenderBackend::FrameInfo fi{};
            const FrameStatus begin = vk_.begin_frame(ctx, frame, fi);
            if (begin != FrameStatus::Ok) return begin;

            const bool swapchain_changed = swapchain_generation_ != vk_.swapchain_generation() || !storage_.valid();
            if (storage_target_needs_rebuild(storage_.extent(), fi.extent, swapchain_changed))
            {
                // Other slots may still sample the old image.
                if (!vk_.wait_idle()) return FrameStatus::DeviceLost;
                rebuild_for_swapchain();
            }
            if (!scene.camera.resize(fi.extent.width, fi.extent.height))
            {
                throw std::runtime_error("VulkanRayTracer: swapchain extent is empty");
            }

            const uint32_t slot = fi.frame_slot;
            const SceneUploadResult upload = scene_buffers_.upload(slot, scene, ctx.frame_index);
            if (!upload.ok)
            {
                throw std::runtime_error("VulkanRayTracer: scene upload failed");
            }
            if (upload.reallocated || slot_storage_generation_[slot] != storage_.generation())
            {
                write_slot_descriptors(slot);
            }

            VkCommandBufferBeginInfo bi{};
            bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            if (vkBeginCommandBuffer(fi.cmd, &bi) != VK_SUCCESS)
            {
                throw std::runtime_error("vkBeginCommandBuffer failed");
            }

            storage_.record_begin_write(fi.cmd);
            const DispatchGroups groups = trace_pass_.record(fi.cmd, slot, storage_.extent(), make_ray_trace_push_constants(mode));
            storage_.record_end_write(fi.cmd);
            present_pass_.record(fi.cmd, slot, fi.render_pass, fi.framebuffer, fi.extent);

            if (vkEndCommandBuffer(fi.cmd) != VK_SUCCESS)
            {
                throw std::runtime_error("vkEndCommandBuffer failed");
            }

            const FrameStatus end = vk_.end_frame(fi);

            const uint64_t pixels = (uint64_t)fi.extent.width * (uint64_t)fi.extent.height;
            ctx.stats.primary_rays = pixels;
            ctx.stats.sphere_tests = pixels * (uint64_t)upload.sphere_count;
            ctx.stats.shadow_rays = 0;
            ctx.stats.dispatch_groups_x = groups.x;
            ctx.stats.dispatch_groups_y = groups.y;
            ctx.stats.ms_trace = std::chrono::duration<float, std::milli>(std::chrono::steady_clock::now() - t0).count();
            return end;
        }

        VkExtent2D target_extent() const { return storage_.extent(); }

    private:
        void rebuild_for_swapchain()
        {
            const VkExtent2D extent = vk_.swapchain_extent();
            if (!storage_.create(vk_.device(), vk_.physical_device(), extent))
            {
                throw std::runtime_error("VulkanRayTracer: storage image creation failed");
            }
            present_pass_.recreate_pipeline(vk_.render_pass());
            swapchain_generation_ = vk_.swapchain_generation();
            log_info("vulkan: storage target " + std::to_string(extent.width) + "x" + std::to_string(extent.height));
        }

        void write_slot_descriptors(uint32_t slot)
        {
            trace_pass_.write_descriptors(
                slot,
                storage_.view(),
                scene_buffers_.uniform_info(slot),
                scene_buffers_.spheres_info(slot));
            present_pass_.write_descriptor(slot, storage_.view(), storage_.sampler());
            slot_storage_generation_[slot] = storage_.generation();
        }

        VulkanRenderBackend& vk_;
        RayTracerShaderPaths shaders_{};
        StorageTarget storage_{};
        GpuSceneBuffers<kSlots> scene_buffers_{};
        RayTracePass<kSlots> trace_pass_{};
        PresentPass<kSlots> present_pass_{};
        uint64_t swapchain_generation_ = 0;
        std::array<uint64_t, kSlots> slot_storage_generation_{};
    };
}
