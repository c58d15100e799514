#pragma once

/*
    GPURT RENDERER SAN

    FILE: vk_memory_utils.hpp
    MODULE: rhi/drivers/vulkan
    PURPOSE: Dedicated-allocation helpers for the storage image and the
             persistently mapped host buffers that carry per-frame uniform
             and sphere data.
*/


#include <cstdint>
#include <cstring>
#include <optional>

#include <vulkan/vulkan.h>

namespace gpurt
{
    inline std::optional<uint32_t> vk_find_memory_type(
        VkPhysicalDevice gpu,
        uint32_t allowed_types,
        VkMemoryPropertyFlags wanted)
    {
        VkPhysicalDeviceMemoryProperties mem{};
        vkGetPhysicalDeviceMemoryProperties(gpu, &mem);
        for (uint32_t t = 0; t < mem.memoryTypeCount; ++t)
        {
            if ((allowed_types >> t & 1u) == 0u) continue;
            if ((mem.memoryTypes[t].propertyFlags & wanted) == wanted) return t;
        }
        return std::nullopt;
    }

    // One allocation per resource; the renderer owns a handful of them.
    inline bool vk_allocate_memory(
        VkDevice device,
        VkPhysicalDevice gpu,
        const VkMemoryRequirements& needs,
        VkMemoryPropertyFlags wanted,
        VkDeviceMemory& out_memory)
    {
        out_memory = VK_NULL_HANDLE;
        const std::optional<uint32_t> type = vk_find_memory_type(gpu, needs.memoryTypeBits, wanted);
        if (!type) return false;

        VkMemoryAllocateInfo alloc{};
        alloc.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        alloc.allocationSize = needs.size;
        alloc.memoryTypeIndex = *type;
        if (vkAllocateMemory(device, &alloc, nullptr, &out_memory) == VK_SUCCESS) return true;
        out_memory = VK_NULL_HANDLE;
        return false;
    }

    inline void vk_destroy_image(VkDevice device, VkImage& image, VkDeviceMemory& memory)
    {
        if (device != VK_NULL_HANDLE && image != VK_NULL_HANDLE) vkDestroyImage(device, image, nullptr);
        if (device != VK_NULL_HANDLE && memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
        image = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }

    // On failure nothing is left allocated.
    inline bool vk_create_image(
        VkDevice device,
        VkPhysicalDevice gpu,
        const VkImageCreateInfo& info,
        VkMemoryPropertyFlags wanted,
        VkImage& out_image,
        VkDeviceMemory& out_memory)
    {
        out_image = VK_NULL_HANDLE;
        out_memory = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE || gpu == VK_NULL_HANDLE) return false;
        if (vkCreateImage(device, &info, nullptr, &out_image) != VK_SUCCESS)
        {
            out_image = VK_NULL_HANDLE;
            return false;
        }

        VkMemoryRequirements needs{};
        vkGetImageMemoryRequirements(device, out_image, &needs);
        const bool ok =
            vk_allocate_memory(device, gpu, needs, wanted, out_memory) &&
            vkBindImageMemory(device, out_image, out_memory, 0) == VK_SUCCESS;
        if (!ok) vk_destroy_image(device, out_image, out_memory);
        return ok;
    }

    // Host-visible, host-coherent buffer kept mapped for its whole lifetime.
    struct VkHostBuffer
    {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkDeviceSize size = 0;
        void* mapped = nullptr;

        bool valid() const { return buffer != VK_NULL_HANDLE && mapped != nullptr; }
    };

    inline void vk_destroy_host_buffer(VkDevice device, VkHostBuffer& b)
    {
        if (device != VK_NULL_HANDLE)
        {
            if (b.mapped) vkUnmapMemory(device, b.memory);
            if (b.buffer != VK_NULL_HANDLE) vkDestroyBuffer(device, b.buffer, nullptr);
            if (b.memory != VK_NULL_HANDLE) vkFreeMemory(device, b.memory, nullptr);
        }
        b = VkHostBuffer{};
    }

    inline bool vk_create_host_buffer(
        VkDevice device,
        VkPhysicalDevice gpu,
        VkDeviceSize size,
        VkBufferUsageFlags usage,
        VkHostBuffer& out)
    {
        out = VkHostBuffer{};
        if (device == VK_NULL_HANDLE || gpu == VK_NULL_HANDLE || size == 0) return false;

        VkBufferCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        info.size = size;
        info.usage = usage;
        info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        if (vkCreateBuffer(device, &info, nullptr, &out.buffer) != VK_SUCCESS)
        {
            out.buffer = VK_NULL_HANDLE;
            return false;
        }

        VkMemoryRequirements needs{};
        vkGetBufferMemoryRequirements(device, out.buffer, &needs);
        constexpr VkMemoryPropertyFlags kHostCoherent =
            VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        const bool ok =
            vk_allocate_memory(device, gpu, needs, kHostCoherent, out.memory) &&
            vkBindBufferMemory(device, out.buffer, out.memory, 0) == VK_SUCCESS &&
            vkMapMemory(device, out.memory, 0, size, 0, &out.mapped) == VK_SUCCESS;
        if (!ok)
        {
            out.mapped = nullptr;
            vk_destroy_host_buffer(device, out);
            return false;
        }
        out.size = size;
        return true;
    }

    inline bool vk_write_host_buffer(VkHostBuffer& b, const void* src, VkDeviceSize bytes, VkDeviceSize offset = 0)
    {
        if (!b.valid() || !src || offset + bytes > b.size) return false;
        std::memcpy(static_cast<uint8_t*>(b.mapped) + offset, src, (size_t)bytes);
        return true;
    }
}
