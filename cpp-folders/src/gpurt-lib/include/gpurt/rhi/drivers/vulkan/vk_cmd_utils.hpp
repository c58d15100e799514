#pragma once

/*
    GPURT RENDERER SAN

    FILE: vk_cmd_utils.hpp
    MODULE: rhi/drivers/vulkan
    PURPOSE: Command recording helpers: viewport/scissor and color image
             layout barriers between the compute and fragment stages.
*/


#include <cstdint>

#include <vulkan/vulkan.h>

namespace gpurt
{
    inline VkViewport vk_make_viewport(uint32_t width, uint32_t height, bool flip_y)
    {
        VkViewport vp{};
        vp.x = 0.0f;
        vp.y = flip_y ? static_cast<float>(height) : 0.0f;
        vp.width = static_cast<float>(width);
        vp.height = flip_y ? -static_cast<float>(height) : static_cast<float>(height);
        vp.minDepth = 0.0f;
        vp.maxDepth = 1.0f;
        return vp;
    }

    inline VkRect2D vk_make_scissor(uint32_t width, uint32_t height)
    {
        VkRect2D sc{};
        sc.offset = {0, 0};
        sc.extent = {width, height};
        return sc;
    }

    inline void vk_cmd_set_viewport_scissor(VkCommandBuffer cmd, uint32_t width, uint32_t height, bool flip_y)
    {
        const VkViewport vp = vk_make_viewport(width, height, flip_y);
        const VkRect2D sc = vk_make_scissor(width, height);
        vkCmdSetViewport(cmd, 0, 1, &vp);
        vkCmdSetScissor(cmd, 0, 1, &sc);
    }

    struct VkImageTransition
    {
        VkImageLayout old_layout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkImageLayout new_layout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkPipelineStageFlags src_stage = VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT;
        VkPipelineStageFlags dst_stage = VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT;
        VkAccessFlags src_access = 0;
        VkAccessFlags dst_access = 0;
    };

    inline void vk_cmd_transition_color_image(VkCommandBuffer cmd, VkImage image, const VkImageTransition& t)
    {
        VkImageMemoryBarrier b{};
        b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
        b.oldLayout = t.old_layout;
        b.newLayout = t.new_layout;
        b.srcAccessMask = t.src_access;
        b.dstAccessMask = t.dst_access;
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.image = image;
        b.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        b.subresourceRange.baseMipLevel = 0;
        b.subresourceRange.levelCount = 1;
        b.subresourceRange.baseArrayLayer = 0;
        b.subresourceRange.layerCount = 1;
        vkCmdPipelineBarrier(cmd, t.src_stage, t.dst_stage, 0, 0, nullptr, 0, nullptr, 1, &b);
    }

    // Storage image becomes writable by the compute pass. Prior fragment
    // sampling (previous frame) must finish first.
    inline VkImageTransition vk_transition_for_compute_write(VkImageLayout current)
    {
        VkImageTransition t{};
        t.old_layout = current;
        t.new_layout = VK_IMAGE_LAYOUT_GENERAL;
        t.src_stage = current == VK_IMAGE_LAYOUT_UNDEFINED
            ? VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT
            : VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
        t.src_access = current == VK_IMAGE_LAYOUT_UNDEFINED ? 0 : VK_ACCESS_SHADER_READ_BIT;
        t.dst_stage = VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT;
        t.dst_access = VK_ACCESS_SHADER_WRITE_BIT;
        return t;
    }

    inline VkImageTransition vk_transition_for_fragment_sample()
    {
        VkImageTransition t{};
        t.old_layout = VK_IMAGE_LAYOUT_GENERAL;
        t.new_layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        t.src_stage = VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT;
        t.src_access = VK_ACCESS_SHADER_WRITE_BIT;
        t.dst_stage = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
        t.dst_access = VK_ACCESS_SHADER_READ_BIT;
        return t;
    }
}
