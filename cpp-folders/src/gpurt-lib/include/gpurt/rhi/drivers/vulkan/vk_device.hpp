#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: vk_device.hpp
    МОДУЛЬ: rhi/drivers/vulkan
    ЗОРИЛГО: Physical device сонголт, queue family хайлт, surface-ийн
            format/present mode/extent сонголт болон capability бөглөлт.
            Ray tracer нэг queue дээр compute болон graphics ажлыг хийдэг.
*/


#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <vector>

#include <vulkan/vulkan.h>

#include "gpurt/rhi/core/backend.hpp"
#include "gpurt/rhi/core/capabilities.hpp"

namespace gpurt
{
    inline constexpr VkFormat k_storage_target_format = VK_FORMAT_R8G8B8A8_UNORM;

    inline bool vk_has_instance_layer(const char* name)
    {
        uint32_t count = 0;
        if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS) return false;
        std::vector<VkLayerProperties> all(count);
        if (vkEnumerateInstanceLayerProperties(&count, all.data()) != VK_SUCCESS) return false;
        return std::any_of(all.begin(), all.end(), [name](const VkLayerProperties& p) {
            return std::strcmp(p.layerName, name) == 0;
        });
    }

    inline bool vk_has_instance_extension(const char* name)
    {
        uint32_t count = 0;
        if (vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr) != VK_SUCCESS) return false;
        std::vector<VkExtensionProperties> all(count);
        if (vkEnumerateInstanceExtensionProperties(nullptr, &count, all.data()) != VK_SUCCESS) return false;
        return std::any_of(all.begin(), all.end(), [name](const VkExtensionProperties& p) {
            return std::strcmp(p.extensionName, name) == 0;
        });
    }

    inline bool vk_has_device_extension(VkPhysicalDevice gpu, const char* name)
    {
        uint32_t count = 0;
        if (vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr) != VK_SUCCESS) return false;
        std::vector<VkExtensionProperties> all(count);
        if (vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, all.data()) != VK_SUCCESS) return false;
        return std::any_of(all.begin(), all.end(), [name](const VkExtensionProperties& p) {
            return std::strcmp(p.extensionName, name) == 0;
        });
    }

    // Compute dispatch, present pass and barriers all go on one queue, so it
    // must expose both graphics and compute.
    struct VkQueueSelection
    {
        std::optional<uint32_t> graphics_compute{};
        std::optional<uint32_t> present{};

        bool complete() const { return graphics_compute.has_value() && present.has_value(); }
        bool shared() const { return complete() && *graphics_compute == *present; }
    };

    inline VkQueueSelection vk_select_queues(VkPhysicalDevice gpu, VkSurfaceKHR surface)
    {
        uint32_t count = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
        std::vector<VkQueueFamilyProperties> families(count);
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, families.data());

        constexpr VkQueueFlags kGraphicsCompute = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
        VkQueueSelection sel{};
        for (uint32_t fam = 0; fam < count; ++fam)
        {
            const bool can_trace = families[fam].queueCount > 0 &&
                (families[fam].queueFlags & kGraphicsCompute) == kGraphicsCompute;
            VkBool32 can_present = VK_FALSE;
            if (vkGetPhysicalDeviceSurfaceSupportKHR(gpu, fam, surface, &can_present) != VK_SUCCESS)
            {
                can_present = VK_FALSE;
            }

            if (can_trace && can_present == VK_TRUE)
            {
                sel.graphics_compute = fam;
                sel.present = fam;
                return sel;
            }
            if (can_trace && !sel.graphics_compute) sel.graphics_compute = fam;
            if (can_present == VK_TRUE && !sel.present) sel.present = fam;
        }
        return sel;
    }

    struct VkSurfaceSupport
    {
        VkSurfaceCapabilitiesKHR caps{};
        std::vector<VkSurfaceFormatKHR> formats{};
        std::vector<VkPresentModeKHR> present_modes{};

        bool usable() const { return !formats.empty() && !present_modes.empty(); }
    };

    inline VkSurfaceSupport vk_query_surface_support(VkPhysicalDevice gpu, VkSurfaceKHR surface)
    {
        VkSurfaceSupport s{};
        if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu, surface, &s.caps) != VK_SUCCESS) return s;

        uint32_t n = 0;
        if (vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &n, nullptr) == VK_SUCCESS && n > 0)
        {
            s.formats.resize(n);
            if (vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface, &n, s.formats.data()) != VK_SUCCESS) s.formats.clear();
        }
        n = 0;
        if (vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &n, nullptr) == VK_SUCCESS && n > 0)
        {
            s.present_modes.resize(n);
            if (vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface, &n, s.present_modes.data()) != VK_SUCCESS) s.present_modes.clear();
        }
        return s;
    }

    // Storage write, sampled read and linear filtering of the trace target.
    inline bool vk_storage_target_supported(VkPhysicalDevice gpu)
    {
        VkFormatProperties fp{};
        vkGetPhysicalDeviceFormatProperties(gpu, k_storage_target_format, &fp);
        constexpr VkFormatFeatureFlags kRequired =
            VK_FORMAT_FEATURE_STORAGE_IMAGE_BIT |
            VK_FORMAT_FEATURE_SAMPLED_IMAGE_BIT |
            VK_FORMAT_FEATURE_SAMPLED_IMAGE_FILTER_LINEAR_BIT;
        return (fp.optimalTilingFeatures & kRequired) == kRequired;
    }

    struct VkDeviceChoice
    {
        VkPhysicalDevice gpu = VK_NULL_HANDLE;
        VkQueueSelection queues{};
        VkPhysicalDeviceProperties props{};
    };

    inline int vk_device_type_rank(VkPhysicalDeviceType t)
    {
        switch (t)
        {
            case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return 3;
            case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return 2;
            case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return 1;
            default: return 0;
        }
    }

    // Highest-ranked device that can trace and present; ties keep enumeration order.
    inline std::optional<VkDeviceChoice> vk_pick_device(VkInstance instance, VkSurfaceKHR surface)
    {
        uint32_t count = 0;
        if (vkEnumeratePhysicalDevices(instance, &count, nullptr) != VK_SUCCESS || count == 0) return std::nullopt;
        std::vector<VkPhysicalDevice> candidates(count);
        if (vkEnumeratePhysicalDevices(instance, &count, candidates.data()) != VK_SUCCESS) return std::nullopt;

        std::optional<VkDeviceChoice> best{};
        int best_rank = -1;
        for (VkPhysicalDevice gpu : candidates)
        {
            const VkQueueSelection queues = vk_select_queues(gpu, surface);
            if (!queues.complete()) continue;
            if (!vk_has_device_extension(gpu, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) continue;
            if (!vk_query_surface_support(gpu, surface).usable()) continue;
            if (!vk_storage_target_supported(gpu)) continue;

            VkDeviceChoice c{};
            c.gpu = gpu;
            c.queues = queues;
            vkGetPhysicalDeviceProperties(gpu, &c.props);
            const int rank = vk_device_type_rank(c.props.deviceType);
            if (rank > best_rank)
            {
                best = c;
                best_rank = rank;
            }
        }
        return best;
    }

    // The compute shader already gamma-encodes, so UNORM formats are preferred
    // over _SRGB ones.
    inline VkSurfaceFormatKHR vk_pick_surface_format(const std::vector<VkSurfaceFormatKHR>& formats)
    {
        constexpr VkFormat kPreferred[] = {VK_FORMAT_B8G8R8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM};
        for (VkFormat want : kPreferred)
        {
            for (const VkSurfaceFormatKHR& f : formats)
            {
                if (f.format == want && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) return f;
            }
        }
        return formats.empty() ? VkSurfaceFormatKHR{} : formats.front();
    }

    // FIFO is always available; mailbox only on request.
    inline VkPresentModeKHR vk_pick_present_mode(const std::vector<VkPresentModeKHR>& modes, PresentModePreference pref)
    {
        const auto has = [&](VkPresentModeKHR m) {
            return std::find(modes.begin(), modes.end(), m) != modes.end();
        };
        if (pref == PresentModePreference::Mailbox && has(VK_PRESENT_MODE_MAILBOX_KHR)) return VK_PRESENT_MODE_MAILBOX_KHR;
        return VK_PRESENT_MODE_FIFO_KHR;
    }

    // Zero extent means the window is minimized.
    inline VkExtent2D vk_pick_extent(const VkSurfaceCapabilitiesKHR& caps, int drawable_w, int drawable_h)
    {
        if (caps.currentExtent.width != UINT32_MAX) return caps.currentExtent;
        if (drawable_w <= 0 || drawable_h <= 0) return VkExtent2D{0, 0};
        VkExtent2D e{};
        e.width = std::clamp((uint32_t)drawable_w, caps.minImageExtent.width, caps.maxImageExtent.width);
        e.height = std::clamp((uint32_t)drawable_h, caps.minImageExtent.height, caps.maxImageExtent.height);
        return e;
    }

    inline BackendCapabilities vk_describe_device(const VkDeviceChoice& choice, VkSurfaceKHR surface, bool validation, uint32_t frames_in_flight)
    {
        BackendCapabilities caps{};
        caps.supports_offscreen = true;
        caps.supports_present = surface != VK_NULL_HANDLE;
        caps.features.validation_layers = validation;
        caps.features.push_constants = true;
        caps.features.compute_shaders = true;
        caps.features.storage_image_rgba8 = vk_storage_target_supported(choice.gpu);

        const VkPhysicalDeviceLimits& lim = choice.props.limits;
        caps.limits.max_frames_in_flight = frames_in_flight;
        caps.limits.max_push_constant_bytes = lim.maxPushConstantsSize;
        std::copy(std::begin(lim.maxComputeWorkGroupCount), std::end(lim.maxComputeWorkGroupCount), caps.limits.max_compute_workgroup_count);
        caps.limits.max_compute_workgroup_invocations = lim.maxComputeWorkGroupInvocations;
        caps.limits.max_image_dimension_2d = lim.maxImageDimension2D;
        caps.limits.max_storage_buffer_range = lim.maxStorageBufferRange;

        uint32_t count = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(choice.gpu, &count, nullptr);
        std::vector<VkQueueFamilyProperties> families(count);
        vkGetPhysicalDeviceQueueFamilyProperties(choice.gpu, &count, families.data());
        for (uint32_t fam = 0; fam < count; ++fam)
        {
            const VkQueueFamilyProperties& qf = families[fam];
            const bool graphics = (qf.queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;
            const bool compute = (qf.queueFlags & VK_QUEUE_COMPUTE_BIT) != 0;
            if (graphics) caps.queues.graphics_count += qf.queueCount;
            if (compute) caps.queues.compute_count += qf.queueCount;
            if (compute && !graphics && qf.queueCount > 0) caps.features.async_compute = true;

            VkBool32 can_present = VK_FALSE;
            if (surface != VK_NULL_HANDLE &&
                vkGetPhysicalDeviceSurfaceSupportKHR(choice.gpu, fam, surface, &can_present) == VK_SUCCESS &&
                can_present == VK_TRUE)
            {
                caps.queues.present_count += qf.queueCount;
            }
        }
        return caps;
    }
}
