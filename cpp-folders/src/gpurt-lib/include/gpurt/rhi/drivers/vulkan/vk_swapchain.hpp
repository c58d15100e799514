#pragma once

/*
    GPURT RENDERER SAN

    FILE: vk_swapchain.hpp
    MODULE: rhi/drivers/vulkan
    PURPOSE: Swapchain and everything sized by it: image views, framebuffers
             for the present render pass, one present semaphore per image, and
             the fence of the frame slot that last rendered each image.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

#include <vulkan/vulkan.h>

#include "gpurt/rhi/core/backend.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_device.hpp"

namespace gpurt
{
    // SUBOPTIMAL still delivers an image, so it maps to Ok.
    inline FrameStatus frame_status_from_vk_result(VkResult res)
    {
        switch (res)
        {
            case VK_SUCCESS:
            case VK_SUBOPTIMAL_KHR:
                return FrameStatus::Ok;
            case VK_ERROR_OUT_OF_DATE_KHR:
                return FrameStatus::SurfaceOutOfDate;
            case VK_ERROR_SURFACE_LOST_KHR:
                return FrameStatus::SurfaceLost;
            case VK_ERROR_OUT_OF_HOST_MEMORY:
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:
                return FrameStatus::OutOfMemory;
            case VK_ERROR_DEVICE_LOST:
                return FrameStatus::DeviceLost;
            default:
                return FrameStatus::Error;
        }
    }

    struct VkSwapchainTargets
    {
        VkSwapchainKHR handle = VK_NULL_HANDLE;
        VkFormat format = VK_FORMAT_UNDEFINED;
        VkPresentModeKHR present_mode = VK_PRESENT_MODE_FIFO_KHR;
        VkExtent2D extent{};
        std::vector<VkImage> images{};
        std::vector<VkImageView> views{};
        std::vector<VkFramebuffer> framebuffers{};
        // Signaled by the submit that rendered image i, waited on by its present.
        std::vector<VkSemaphore> present_ready{};
        // Not owned. Fence of the slot whose submit last targeted image i.
        std::vector<VkFence> image_fences{};

        uint32_t image_count() const { return (uint32_t)images.size(); }
    };

    struct VkSwapchainRequest
    {
        VkSurfaceKHR surface = VK_NULL_HANDLE;
        VkQueueSelection queues{};
        PresentModePreference present_mode = PresentModePreference::Fifo;
        int drawable_width = 0;
        int drawable_height = 0;
        VkSwapchainKHR previous = VK_NULL_HANDLE;
    };

    // Clears to black, ends in PRESENT_SRC. The storage image is drawn over the
    // whole attachment so nothing else is needed.
    // Non-empty drawable size that the current swapchain does not already have.
    inline bool vk_drawable_differs(VkExtent2D current, int w, int h)
    {
        if (w <= 0 || h <= 0) return false;
        return (uint32_t)w != current.width || (uint32_t)h != current.height;
    }

    inline VkRenderPass vk_create_present_render_pass(VkDevice device, VkFormat color_format)
    {
        VkAttachmentDescription attachment{};
        attachment.format = color_format;
        attachment.samples = VK_SAMPLE_COUNT_1_BIT;
        attachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        attachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        attachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        attachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        attachment.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

        const VkAttachmentReference target{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

        VkSubpassDescription subpass{};
        subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
        subpass.colorAttachmentCount = 1;
        subpass.pColorAttachments = &target;

        // Acquire semaphore waits at COLOR_ATTACHMENT_OUTPUT; the layout
        // transition must not start earlier.
        VkSubpassDependency acquire_dep{};
        acquire_dep.srcSubpass = VK_SUBPASS_EXTERNAL;
        acquire_dep.dstSubpass = 0;
        acquire_dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        acquire_dep.srcAccessMask = 0;
        acquire_dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
        acquire_dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

        VkRenderPassCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        info.attachmentCount = 1;
        info.pAttachments = &attachment;
        info.subpassCount = 1;
        info.pSubpasses = &subpass;
        info.dependencyCount = 1;
        info.pDependencies = &acquire_dep;

        VkRenderPass pass = VK_NULL_HANDLE;
        if (vkCreateRenderPass(device, &info, nullptr, &pass) != VK_SUCCESS) return VK_NULL_HANDLE;
        return pass;
    }

    inline void vk_destroy_swapchain_targets(VkDevice device, VkSwapchainTargets& t)
    {
        if (device == VK_NULL_HANDLE) return;
        for (VkSemaphore s : t.present_ready)
        {
            if (s != VK_NULL_HANDLE) vkDestroySemaphore(device, s, nullptr);
        }
        for (VkFramebuffer fb : t.framebuffers)
        {
            if (fb != VK_NULL_HANDLE) vkDestroyFramebuffer(device, fb, nullptr);
        }
        for (VkImageView v : t.views)
        {
            if (v != VK_NULL_HANDLE) vkDestroyImageView(device, v, nullptr);
        }
        if (t.handle != VK_NULL_HANDLE) vkDestroySwapchainKHR(device, t.handle, nullptr);
        t = VkSwapchainTargets{};
    }

    // Returns Skipped for a zero-sized surface and SurfaceLost when the surface
    // no longer reports formats. On any failure `out` is left empty.
    inline FrameStatus vk_build_swapchain(
        VkPhysicalDevice gpu,
        VkDevice device,
        const VkSwapchainRequest& req,
        VkSwapchainTargets& out)
    {
        out = VkSwapchainTargets{};
        const VkSurfaceSupport support = vk_query_surface_support(gpu, req.surface);
        if (!support.usable()) return FrameStatus::SurfaceLost;

        const VkExtent2D extent = vk_pick_extent(support.caps, req.drawable_width, req.drawable_height);
        if (extent.width == 0 || extent.height == 0) return FrameStatus::Skipped;

        const VkSurfaceFormatKHR surface_format = vk_pick_surface_format(support.formats);
        const VkPresentModeKHR mode = vk_pick_present_mode(support.present_modes, req.present_mode);

        uint32_t min_images = support.caps.minImageCount + 1u;
        if (support.caps.maxImageCount != 0u) min_images = std::min(min_images, support.caps.maxImageCount);

        const uint32_t families[2] = {req.queues.graphics_compute.value_or(0u), req.queues.present.value_or(0u)};

        VkSwapchainCreateInfoKHR info{};
        info.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        info.surface = req.surface;
        info.minImageCount = min_images;
        info.imageFormat = surface_format.format;
        info.imageColorSpace = surface_format.colorSpace;
        info.imageExtent = extent;
        info.imageArrayLayers = 1;
        info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        info.imageSharingMode = req.queues.shared() ? VK_SHARING_MODE_EXCLUSIVE : VK_SHARING_MODE_CONCURRENT;
        info.queueFamilyIndexCount = req.queues.shared() ? 0u : 2u;
        info.pQueueFamilyIndices = req.queues.shared() ? nullptr : families;
        info.preTransform = support.caps.currentTransform;
        info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        info.presentMode = mode;
        info.clipped = VK_TRUE;
        info.oldSwapchain = req.previous;

        const VkResult created = vkCreateSwapchainKHR(device, &info, nullptr, &out.handle);
        if (created != VK_SUCCESS)
        {
            out.handle = VK_NULL_HANDLE;
            return frame_status_from_vk_result(created);
        }

        out.format = surface_format.format;
        out.present_mode = mode;
        out.extent = extent;

        uint32_t count = 0;
        if (vkGetSwapchainImagesKHR(device, out.handle, &count, nullptr) != VK_SUCCESS || count == 0)
        {
            vk_destroy_swapchain_targets(device, out);
            return FrameStatus::Error;
        }
        out.images.resize(count);
        if (vkGetSwapchainImagesKHR(device, out.handle, &count, out.images.data()) != VK_SUCCESS)
        {
            vk_destroy_swapchain_targets(device, out);
            return FrameStatus::Error;
        }

        out.views.assign(count, VK_NULL_HANDLE);
        out.present_ready.assign(count, VK_NULL_HANDLE);
        out.image_fences.assign(count, VK_NULL_HANDLE);

        VkSemaphoreCreateInfo sem_info{};
        sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
        for (uint32_t i = 0; i < count; ++i)
        {
            VkImageViewCreateInfo view_info{};
            view_info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            view_info.image = out.images[i];
            view_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
            view_info.format = out.format;
            view_info.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
            if (vkCreateImageView(device, &view_info, nullptr, &out.views[i]) != VK_SUCCESS ||
                vkCreateSemaphore(device, &sem_info, nullptr, &out.present_ready[i]) != VK_SUCCESS)
            {
                vk_destroy_swapchain_targets(device, out);
                return FrameStatus::Error;
            }
        }
        return FrameStatus::Ok;
    }

    inline bool vk_create_swapchain_framebuffers(VkDevice device, VkRenderPass render_pass, VkSwapchainTargets& t)
    {
        t.framebuffers.assign(t.views.size(), VK_NULL_HANDLE);
        for (size_t i = 0; i < t.views.size(); ++i)
        {
            VkFramebufferCreateInfo info{};
            info.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
            info.renderPass = render_pass;
            info.attachmentCount = 1;
            info.pAttachments = &t.views[i];
            info.width = t.extent.width;
            info.height = t.extent.height;
            info.layers = 1;
            if (vkCreateFramebuffer(device, &info, nullptr, &t.framebuffers[i]) != VK_SUCCESS) return false;
        }
        return true;
    }
}
