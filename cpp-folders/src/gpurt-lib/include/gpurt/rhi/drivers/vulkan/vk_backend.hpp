#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: vk_backend.hpp
    МОДУЛЬ: rhi/drivers/vulkan
    ЗОРИЛГО: Vulkan backend: instance, surface, device, present render pass болон
            2 frame slot-ийн синхрончлол. Swapchain-ийг vk_swapchain.hpp,
            төхөөрөмжийн сонголтыг vk_device.hpp гүйцэтгэнэ.
            Фрэйм бүрийн үр дүнг FrameStatus-аар app руу мэдээлнэ.
*/


#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>
#include <vulkan/vulkan.h>

#include "gpurt/core/log.hpp"
#include "gpurt/rhi/core/backend.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_device.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_swapchain.hpp"

namespace gpurt
{
    class VulkanRenderBackend final : public IRenderBackend
    {
    public:
        static constexpr uint32_t kMaxFramesInFlight = 2;

        struct InitDesc
        {
            SDL_Window* window = nullptr;
            int width = 0;
            int height = 0;
            bool enable_validation = false;
            PresentModePreference present_mode = PresentModePreference::Fifo;
            const char* app_name = "gpurt";
        };

        struct FrameInfo
        {
            VkCommandBuffer cmd = VK_NULL_HANDLE;
            VkFramebuffer framebuffer = VK_NULL_HANDLE;
            VkRenderPass render_pass = VK_NULL_HANDLE;
            VkExtent2D extent{};
            VkFormat format = VK_FORMAT_UNDEFINED;
            uint32_t image_index = 0;
            // Index into per-frame resources; its previous use has completed.
            uint32_t frame_slot = 0;
        };

        VulkanRenderBackend() = default;
        ~VulkanRenderBackend() override { shutdown(); }

        VulkanRenderBackend(const VulkanRenderBackend&) = delete;
        VulkanRenderBackend& operator=(const VulkanRenderBackend&) = delete;

        RenderBackendType type() const override { return RenderBackendType::Vulkan; }

        BackendCapabilities capabilities() const override
        {
            if (initialized_) return caps_;
            BackendCapabilities fallback{};
            fallback.features.push_constants = true;
            fallback.limits.max_frames_in_flight = kMaxFramesInFlight;
            fallback.limits.max_push_constant_bytes = 128;
            return fallback;
        }

        void begin_frame(Context&, const RenderBackendFrameInfo& frame) override
        {
            if (vk_drawable_differs(targets_.extent, frame.width, frame.height)) request_resize(frame.width, frame.height);
        }

        void end_frame(Context&, const RenderBackendFrameInfo&) override {}

        void on_resize(Context&, int w, int h) override { request_resize(w, h); }

        bool ready() const { return initialized_; }

        bool init_sdl(const InitDesc& desc)
        {
            shutdown();
            if (!desc.window) return false;
            window_ = desc.window;
            validation_requested_ = desc.enable_validation;
            present_pref_ = desc.present_mode;
            app_name_ = desc.app_name ? desc.app_name : "gpurt";
            request_resize(desc.width, desc.height);

            if (!bring_up())
            {
                shutdown();
                return false;
            }
            initialized_ = true;
            return true;
        }

        // Only records the request; the rebuild happens in the next begin_frame.
        void request_resize(int w, int h)
        {
            if (w > 0 && h > 0)
            {
                pending_w_ = w;
                pending_h_ = h;
            }
            rebuild_pending_ = true;
        }

        FrameStatus begin_frame(Context&, const RenderBackendFrameInfo&, FrameInfo& out)
        {
            if (!initialized_) return FrameStatus::Error;
            if (device_lost_) return FrameStatus::DeviceLost;

            if (surface_lost_)
            {
                const FrameStatus s = recreate_surface();
                if (s != FrameStatus::Ok) return s;
            }
            if (rebuild_pending_ || targets_.handle == VK_NULL_HANDLE)
            {
                const FrameStatus s = rebuild_swapchain();
                if (s != FrameStatus::Ok) return s;
            }

            const uint32_t slot_index = (uint32_t)(frame_counter_ % kMaxFramesInFlight);
            FrameSlot& slot = slots_[slot_index];

            VkResult r = vkWaitForFences(device_, 1, &slot.done, VK_TRUE, UINT64_MAX);
            if (r != VK_SUCCESS) return note_failure(r);

            uint32_t image = 0;
            r = vkAcquireNextImageKHR(device_, targets_.handle, UINT64_MAX, slot.image_ready, VK_NULL_HANDLE, &image);
            if (r == VK_SUBOPTIMAL_KHR)
            {
                // The image is ours and image_ready will signal: render it, rebuild next frame.
                rebuild_pending_ = true;
            }
            else if (r != VK_SUCCESS)
            {
                return note_failure(r);
            }

            // Another slot may still be rendering into this image.
            VkFence& owner = targets_.image_fences[image];
            if (owner != VK_NULL_HANDLE && owner != slot.done)
            {
                r = vkWaitForFences(device_, 1, &owner, VK_TRUE, UINT64_MAX);
                if (r != VK_SUCCESS) return note_failure(r);
            }
            owner = slot.done;

            r = vkResetFences(device_, 1, &slot.done);
            if (r != VK_SUCCESS) return note_failure(r);
            r = vkResetCommandBuffer(slot.cmd, 0);
            if (r != VK_SUCCESS) return note_failure(r);

            out.cmd = slot.cmd;
            out.framebuffer = targets_.framebuffers[image];
            out.render_pass = render_pass_;
            out.extent = targets_.extent;
            out.format = targets_.format;
            out.image_index = image;
            out.frame_slot = slot_index;
            return FrameStatus::Ok;
        }

        FrameStatus end_frame(const FrameInfo& info)
        {
            if (device_lost_) return FrameStatus::DeviceLost;
            if (info.image_index >= targets_.present_ready.size()) return FrameStatus::SurfaceOutOfDate;

            FrameSlot& slot = slots_[info.frame_slot % kMaxFramesInFlight];
            VkSemaphore present_ready = targets_.present_ready[info.image_index];
            const VkPipelineStageFlags wait_at = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

            VkSubmitInfo submit{};
            submit.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            submit.waitSemaphoreCount = 1;
            submit.pWaitSemaphores = &slot.image_ready;
            submit.pWaitDstStageMask = &wait_at;
            submit.commandBufferCount = 1;
            submit.pCommandBuffers = &info.cmd;
            submit.signalSemaphoreCount = 1;
            submit.pSignalSemaphores = &present_ready;
            const VkResult submitted = vkQueueSubmit(queue_, 1, &submit, slot.done);
            if (submitted != VK_SUCCESS) return note_failure(submitted);

            // The slot's fence is now pending, so advance regardless of present.
            ++frame_counter_;

            VkPresentInfoKHR present{};
            present.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
            present.waitSemaphoreCount = 1;
            present.pWaitSemaphores = &present_ready;
            present.swapchainCount = 1;
            present.pSwapchains = &targets_.handle;
            present.pImageIndices = &info.image_index;
            const VkResult presented = vkQueuePresentKHR(present_queue_, &present);
            if (presented == VK_SUBOPTIMAL_KHR)
            {
                rebuild_pending_ = true;
                return FrameStatus::Ok;
            }
            if (presented != VK_SUCCESS) return note_failure(presented);
            return FrameStatus::Ok;
        }

        bool wait_idle()
        {
            if (device_ == VK_NULL_HANDLE) return true;
            const VkResult r = vkDeviceWaitIdle(device_);
            if (r == VK_ERROR_DEVICE_LOST) device_lost_ = true;
            return r == VK_SUCCESS;
        }

        VkDevice device() const { return device_; }
        VkPhysicalDevice physical_device() const { return choice_.gpu; }
        VkRenderPass render_pass() const { return render_pass_; }
        VkExtent2D swapchain_extent() const { return targets_.extent; }
        uint64_t swapchain_generation() const { return swapchain_generation_; }

    private:
        struct FrameSlot
        {
            VkCommandBuffer cmd = VK_NULL_HANDLE;
            VkSemaphore image_ready = VK_NULL_HANDLE;
            VkFence done = VK_NULL_HANDLE;
        };

        static VKAPI_ATTR VkBool32 VKAPI_CALL on_validation_message(
            VkDebugUtilsMessageSeverityFlagBitsEXT,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* data,
            void*)
        {
            if (data && data->pMessage) std::fprintf(stderr, "[vulkan] %s\n", data->pMessage);
            return VK_FALSE;
        }

        static VkDebugUtilsMessengerCreateInfoEXT messenger_info()
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity =
                VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType =
                VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            info.pfnUserCallback = on_validation_message;
            return info;
        }

        FrameStatus note_status(FrameStatus s)
        {
            if (s == FrameStatus::SurfaceOutOfDate) rebuild_pending_ = true;
            else if (s == FrameStatus::SurfaceLost) surface_lost_ = true;
            else if (s == FrameStatus::DeviceLost) device_lost_ = true;
            return s;
        }

        FrameStatus note_failure(VkResult r) { return note_status(frame_status_from_vk_result(r)); }

        bool bring_up()
        {
            if (!create_instance())
            {
                log_error("vulkan: instance creation failed");
                return false;
            }
            if (!SDL_Vulkan_CreateSurface(window_, instance_, &surface_))
            {
                log_error(std::string("vulkan: SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());
                return false;
            }
            const std::optional<VkDeviceChoice> picked = vk_pick_device(instance_, surface_);
            if (!picked)
            {
                log_error("vulkan: no GPU with graphics+compute, present and RGBA8 storage images");
                return false;
            }
            choice_ = *picked;
            log_info(std::string("vulkan: using ") + choice_.props.deviceName);

            if (!create_device())
            {
                log_error("vulkan: device creation failed");
                return false;
            }
            if (!create_frame_slots())
            {
                log_error("vulkan: command buffer or sync object creation failed");
                return false;
            }

            // Built from the surface's preferred format so pipelines can be
            // created even while the window starts minimized.
            const VkSurfaceSupport support = vk_query_surface_support(choice_.gpu, surface_);
            render_pass_ = vk_create_present_render_pass(device_, vk_pick_surface_format(support.formats).format);
            if (render_pass_ == VK_NULL_HANDLE)
            {
                log_error("vulkan: render pass creation failed");
                return false;
            }
            render_pass_format_ = vk_pick_surface_format(support.formats).format;

            const FrameStatus first = rebuild_swapchain();
            if (first != FrameStatus::Ok && first != FrameStatus::Skipped)
            {
                log_error("vulkan: swapchain creation failed");
                return false;
            }

            caps_ = vk_describe_device(choice_, surface_, !layers_.empty(), kMaxFramesInFlight);
            return true;
        }

        bool create_instance()
        {
            unsigned int sdl_count = 0;
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &sdl_count, nullptr)) return false;
            std::vector<const char*> extensions(sdl_count);
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &sdl_count, extensions.data())) return false;

            const auto enable_extension = [&extensions](const char* name) {
                for (const char* have : extensions)
                {
                    if (std::strcmp(have, name) == 0) return true;
                }
                if (!vk_has_instance_extension(name)) return false;
                extensions.push_back(name);
                return true;
            };

            bool debug_utils = false;
            if (validation_requested_)
            {
                constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";
                if (vk_has_instance_layer(kValidationLayer)) layers_.push_back(kValidationLayer);
                else log_warn("vulkan: validation requested but VK_LAYER_KHRONOS_validation is not installed");
                debug_utils = enable_extension(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            }

            VkInstanceCreateFlags flags = 0;
            // Portability drivers (MoltenVK) stay hidden without this extension and flag.
            if (enable_extension("VK_KHR_portability_enumeration"))
            {
#ifdef VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR
                flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#else
                flags |= static_cast<VkInstanceCreateFlags>(0x00000001u);
#endif
            }

            VkApplicationInfo app{};
            app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
            app.pApplicationName = app_name_.c_str();
            app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
            app.pEngineName = "gpurt";
            app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
            app.apiVersion = VK_API_VERSION_1_1;

            const VkDebugUtilsMessengerCreateInfoEXT messenger = messenger_info();

            VkInstanceCreateInfo info{};
            info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
            info.flags = flags;
            info.pApplicationInfo = &app;
            info.enabledLayerCount = (uint32_t)layers_.size();
            info.ppEnabledLayerNames = layers_.empty() ? nullptr : layers_.data();
            info.enabledExtensionCount = (uint32_t)extensions.size();
            info.ppEnabledExtensionNames = extensions.empty() ? nullptr : extensions.data();
            // Also reports problems raised inside vkCreateInstance itself.
            if (debug_utils && !layers_.empty()) info.pNext = &messenger;

            if (vkCreateInstance(&info, nullptr, &instance_) != VK_SUCCESS) return false;

            if (debug_utils)
            {
                const auto create_messenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
                    vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
                if (!create_messenger || create_messenger(instance_, &messenger, nullptr, &messenger_) != VK_SUCCESS)
                {
                    messenger_ = VK_NULL_HANDLE;
                    log_warn("vulkan: debug messenger creation failed");
                }
            }
            return true;
        }

        bool create_device()
        {
            const uint32_t main_family = *choice_.queues.graphics_compute;
            const uint32_t present_family = *choice_.queues.present;
            const float priority = 1.0f;

            std::vector<VkDeviceQueueCreateInfo> queue_infos{};
            for (uint32_t family : {main_family, present_family})
            {
                if (!queue_infos.empty() && queue_infos.front().queueFamilyIndex == family) continue;
                VkDeviceQueueCreateInfo qi{};
                qi.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
                qi.queueFamilyIndex = family;
                qi.queueCount = 1;
                qi.pQueuePriorities = &priority;
                queue_infos.push_back(qi);
            }

            std::vector<const char*> extensions{VK_KHR_SWAPCHAIN_EXTENSION_NAME};
            if (vk_has_device_extension(choice_.gpu, "VK_KHR_portability_subset"))
            {
                extensions.push_back("VK_KHR_portability_subset");
            }

            VkDeviceCreateInfo info{};
            info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
            info.queueCreateInfoCount = (uint32_t)queue_infos.size();
            info.pQueueCreateInfos = queue_infos.data();
            info.enabledExtensionCount = (uint32_t)extensions.size();
            info.ppEnabledExtensionNames = extensions.data();
            if (vkCreateDevice(choice_.gpu, &info, nullptr, &device_) != VK_SUCCESS) return false;

            vkGetDeviceQueue(device_, main_family, 0, &queue_);
            vkGetDeviceQueue(device_, present_family, 0, &present_queue_);
            return true;
        }

        bool create_frame_slots()
        {
            VkCommandPoolCreateInfo pool_info{};
            pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            pool_info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
            pool_info.queueFamilyIndex = *choice_.queues.graphics_compute;
            if (vkCreateCommandPool(device_, &pool_info, nullptr, &cmd_pool_) != VK_SUCCESS) return false;

            std::array<VkCommandBuffer, kMaxFramesInFlight> cmds{};
            VkCommandBufferAllocateInfo alloc{};
            alloc.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            alloc.commandPool = cmd_pool_;
            alloc.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            alloc.commandBufferCount = kMaxFramesInFlight;
            if (vkAllocateCommandBuffers(device_, &alloc, cmds.data()) != VK_SUCCESS) return false;

            VkSemaphoreCreateInfo sem_info{};
            sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
            // Signaled so the first wait on each slot returns immediately.
            VkFenceCreateInfo fence_info{};
            fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

            for (uint32_t i = 0; i < kMaxFramesInFlight; ++i)
            {
                FrameSlot& slot = slots_[i];
                slot.cmd = cmds[i];
                if (vkCreateSemaphore(device_, &sem_info, nullptr, &slot.image_ready) != VK_SUCCESS) return false;
                if (vkCreateFence(device_, &fence_info, nullptr, &slot.done) != VK_SUCCESS) return false;
            }
            return true;
        }

        // The old swapchain is handed to the new one and retired afterwards.
        // The render pass is kept unless the surface format changed.
        FrameStatus rebuild_swapchain()
        {
            int w = 0;
            int h = 0;
            SDL_Vulkan_GetDrawableSize(window_, &w, &h);
            if (w <= 0 || h <= 0) return FrameStatus::Skipped;
            pending_w_ = w;
            pending_h_ = h;

            const VkResult idle = vkDeviceWaitIdle(device_);
            if (idle != VK_SUCCESS) return note_failure(idle);

            VkSwapchainRequest req{};
            req.surface = surface_;
            req.queues = choice_.queues;
            req.present_mode = present_pref_;
            req.drawable_width = pending_w_;
            req.drawable_height = pending_h_;
            req.previous = targets_.handle;

            VkSwapchainTargets next{};
            const FrameStatus built = vk_build_swapchain(choice_.gpu, device_, req, next);
            vk_destroy_swapchain_targets(device_, targets_);
            if (built != FrameStatus::Ok) return note_status(built);
            targets_ = std::move(next);

            if (present_pref_ == PresentModePreference::Mailbox && targets_.present_mode != VK_PRESENT_MODE_MAILBOX_KHR)
            {
                log_warn("vulkan: mailbox present mode unavailable, using fifo");
            }

            if (targets_.format != render_pass_format_)
            {
                if (render_pass_ != VK_NULL_HANDLE) vkDestroyRenderPass(device_, render_pass_, nullptr);
                render_pass_ = vk_create_present_render_pass(device_, targets_.format);
                if (render_pass_ == VK_NULL_HANDLE) return FrameStatus::Error;
            }
            render_pass_format_ = targets_.format;

            if (!vk_create_swapchain_framebuffers(device_, render_pass_, targets_)) return FrameStatus::Error;

            rebuild_pending_ = false;
            ++swapchain_generation_;
            log_info("vulkan: swapchain " + std::to_string(targets_.extent.width) + "x" +
                std::to_string(targets_.extent.height) + " (generation " + std::to_string(swapchain_generation_) + ")");
            return FrameStatus::Ok;
        }

        FrameStatus recreate_surface()
        {
            const VkResult idle = vkDeviceWaitIdle(device_);
            if (idle != VK_SUCCESS) return note_failure(idle);

            vk_destroy_swapchain_targets(device_, targets_);
            if (surface_ != VK_NULL_HANDLE) vkDestroySurfaceKHR(instance_, surface_, nullptr);
            surface_ = VK_NULL_HANDLE;

            if (!SDL_Vulkan_CreateSurface(window_, instance_, &surface_))
            {
                log_error(std::string("vulkan: surface re-creation failed: ") + SDL_GetError());
                return FrameStatus::SurfaceLost;
            }
            VkBool32 presentable = VK_FALSE;
            if (vkGetPhysicalDeviceSurfaceSupportKHR(choice_.gpu, *choice_.queues.present, surface_, &presentable) != VK_SUCCESS ||
                presentable != VK_TRUE)
            {
                log_error("vulkan: new surface is not presentable from the selected queue");
                return FrameStatus::Error;
            }
            surface_lost_ = false;
            rebuild_pending_ = true;
            log_warn("vulkan: surface re-created");
            return FrameStatus::Ok;
        }

        void shutdown()
        {
            if (device_ != VK_NULL_HANDLE)
            {
                (void)vkDeviceWaitIdle(device_);
                vk_destroy_swapchain_targets(device_, targets_);
                if (render_pass_ != VK_NULL_HANDLE) vkDestroyRenderPass(device_, render_pass_, nullptr);
                for (FrameSlot& slot : slots_)
                {
                    if (slot.image_ready != VK_NULL_HANDLE) vkDestroySemaphore(device_, slot.image_ready, nullptr);
                    if (slot.done != VK_NULL_HANDLE) vkDestroyFence(device_, slot.done, nullptr);
                }
                // Frees the slot command buffers with it.
                if (cmd_pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(device_, cmd_pool_, nullptr);
                vkDestroyDevice(device_, nullptr);
            }
            if (instance_ != VK_NULL_HANDLE)
            {
                if (surface_ != VK_NULL_HANDLE) vkDestroySurfaceKHR(instance_, surface_, nullptr);
                if (messenger_ != VK_NULL_HANDLE)
                {
                    const auto destroy_messenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
                        vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
                    if (destroy_messenger) destroy_messenger(instance_, messenger_, nullptr);
                }
                vkDestroyInstance(instance_, nullptr);
            }

            instance_ = VK_NULL_HANDLE;
            messenger_ = VK_NULL_HANDLE;
            surface_ = VK_NULL_HANDLE;
            choice_ = VkDeviceChoice{};
            device_ = VK_NULL_HANDLE;
            queue_ = VK_NULL_HANDLE;
            present_queue_ = VK_NULL_HANDLE;
            cmd_pool_ = VK_NULL_HANDLE;
            slots_ = {};
            targets_ = VkSwapchainTargets{};
            render_pass_ = VK_NULL_HANDLE;
            render_pass_format_ = VK_FORMAT_UNDEFINED;
            layers_.clear();
            caps_ = BackendCapabilities{};
            window_ = nullptr;
            pending_w_ = 0;
            pending_h_ = 0;
            initialized_ = false;
            rebuild_pending_ = false;
            surface_lost_ = false;
            device_lost_ = false;
            frame_counter_ = 0;
            swapchain_generation_ = 0;
        }

        SDL_Window* window_ = nullptr;
        std::string app_name_ = "gpurt";
        bool validation_requested_ = false;
        PresentModePreference present_pref_ = PresentModePreference::Fifo;
        std::vector<const char*> layers_{};

        VkInstance instance_ = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
        VkSurfaceKHR surface_ = VK_NULL_HANDLE;
        VkDeviceChoice choice_{};
        VkDevice device_ = VK_NULL_HANDLE;
        VkQueue queue_ = VK_NULL_HANDLE;
        VkQueue present_queue_ = VK_NULL_HANDLE;
        VkCommandPool cmd_pool_ = VK_NULL_HANDLE;
        std::array<FrameSlot, kMaxFramesInFlight> slots_{};

        VkSwapchainTargets targets_{};
        VkRenderPass render_pass_ = VK_NULL_HANDLE;
        VkFormat render_pass_format_ = VK_FORMAT_UNDEFINED;
        BackendCapabilities caps_{};

        int pending_w_ = 0;
        int pending_h_ = 0;
        bool initialized_ = false;
        bool rebuild_pending_ = false;
        bool surface_lost_ = false;
        bool device_lost_ = false;
        uint64_t frame_counter_ = 0;
        uint64_t swapchain_generation_ = 0;
    };
}
