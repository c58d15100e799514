#pragma once

/*
    GPURT RENDERER SAN

    FILE: storage_target.hpp
    MODULE: render
    PURPOSE: Off-screen RGBA8 image written by the compute tracer and sampled by
             the present pass. Sized to the swapchain extent; its layout is
             tracked across frames so barriers know what to transition from.
*/


#include <cstdint>

#include <vulkan/vulkan.h>

#include "gpurt/rhi/drivers/vulkan/vk_cmd_utils.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_device.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_memory_utils.hpp"

namespace gpurt
{
    // The storage image follows the swapchain. A zero-area swapchain (window
    // minimized, possibly since startup) gets no image until it grows again.
    inline bool storage_target_needs_rebuild(VkExtent2D current, VkExtent2D swapchain, bool swapchain_changed)
    {
        if (swapchain.width == 0 || swapchain.height == 0) return false;
        return swapchain_changed || current.width != swapchain.width || current.height != swapchain.height;
    }

    class StorageTarget
    {
    public:
        StorageTarget() = default;
        ~StorageTarget() { destroy(); }

        StorageTarget(const StorageTarget&) = delete;
        StorageTarget& operator=(const StorageTarget&) = delete;

        // Caller guarantees the GPU no longer uses the previous image.
        bool create(VkDevice device, VkPhysicalDevice gpu, VkExtent2D extent)
        {
            destroy_image();
            device_ = device;
            if (device_ == VK_NULL_HANDLE || extent.width == 0 || extent.height == 0) return false;

            VkImageCreateInfo ici{};
            ici.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
            ici.imageType = VK_IMAGE_TYPE_2D;
            ici.format = k_storage_target_format;
            ici.extent = {extent.width, extent.height, 1};
            ici.mipLevels = 1;
            ici.arrayLayers = 1;
            ici.samples = VK_SAMPLE_COUNT_1_BIT;
            ici.tiling = VK_IMAGE_TILING_OPTIMAL;
            ici.usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
            ici.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
            ici.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            if (!vk_create_image(device_, gpu, ici, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, image_, memory_)) return false;

            VkImageViewCreateInfo iv{};
            iv.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            iv.image = image_;
            iv.viewType = VK_IMAGE_VIEW_TYPE_2D;
            iv.format = k_storage_target_format;
            iv.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            iv.subresourceRange.levelCount = 1;
            iv.subresourceRange.layerCount = 1;
            if (vkCreateImageView(device_, &iv, nullptr, &view_) != VK_SUCCESS)
            {
                view_ = VK_NULL_HANDLE;
                destroy_image();
                return false;
            }

            if (sampler_ == VK_NULL_HANDLE && !create_sampler())
            {
                destroy_image();
                return false;
            }

            extent_ = extent;
            layout_ = VK_IMAGE_LAYOUT_UNDEFINED;
            ++generation_;
            return true;
        }

        void destroy()
        {
            destroy_image();
            if (device_ != VK_NULL_HANDLE && sampler_ != VK_NULL_HANDLE)
            {
                vkDestroySampler(device_, sampler_, nullptr);
            }
            sampler_ = VK_NULL_HANDLE;
        }

        void record_begin_write(VkCommandBuffer cmd)
        {
            vk_cmd_transition_color_image(cmd, image_, vk_transition_for_compute_write(layout_));
            layout_ = VK_IMAGE_LAYOUT_GENERAL;
        }

        void record_end_write(VkCommandBuffer cmd)
        {
            vk_cmd_transition_color_image(cmd, image_, vk_transition_for_fragment_sample());
            layout_ = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        }

        bool valid() const { return image_ != VK_NULL_HANDLE && view_ != VK_NULL_HANDLE; }
        bool matches(VkExtent2D extent) const
        {
            return valid() && extent.width == extent_.width && extent.height == extent_.height;
        }

        VkImage image() const { return image_; }
        VkImageView view() const { return view_; }
        VkSampler sampler() const { return sampler_; }
        VkExtent2D extent() const { return extent_; }
        VkImageLayout layout() const { return layout_; }
        uint64_t generation() const { return generation_; }

    private:
        bool create_sampler()
        {
            VkSamplerCreateInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
            si.magFilter = VK_FILTER_LINEAR;
            si.minFilter = VK_FILTER_LINEAR;
            si.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
            si.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            si.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            si.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            si.maxLod = 0.0f;
            si.borderColor = VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK;
            if (vkCreateSampler(device_, &si, nullptr, &sampler_) != VK_SUCCESS)
            {
                sampler_ = VK_NULL_HANDLE;
                return false;
            }
            return true;
        }

        void destroy_image()
        {
            if (device_ != VK_NULL_HANDLE && view_ != VK_NULL_HANDLE)
            {
                vkDestroyImageView(device_, view_, nullptr);
            }
            view_ = VK_NULL_HANDLE;
            vk_destroy_image(device_, image_, memory_);
            extent_ = VkExtent2D{0, 0};
            layout_ = VK_IMAGE_LAYOUT_UNDEFINED;
        }

        VkDevice device_ = VK_NULL_HANDLE;
        VkImage image_ = VK_NULL_HANDLE;
        VkDeviceMemory memory_ = VK_NULL_HANDLE;
        VkImageView view_ = VK_NULL_HANDLE;
        VkSampler sampler_ = VK_NULL_HANDLE;
        VkExtent2D extent_{0, 0};
        VkImageLayout layout_ = VK_IMAGE_LAYOUT_UNDEFINED;
        uint64_t generation_ = 0;
    };
}
