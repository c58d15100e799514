#include <cstdint>
#include <cstdio>
#include <vector>

#include "gpurt/rhi/drivers/vulkan/vk_device.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_swapchain.hpp"

// Surface/device choices that need no GPU: they only look at reported lists.

namespace
{
    VkSurfaceCapabilitiesKHR caps_with_extent(uint32_t w, uint32_t h)
    {
        VkSurfaceCapabilitiesKHR caps{};
        caps.currentExtent = VkExtent2D{w, h};
        caps.minImageExtent = VkExtent2D{16, 16};
        caps.maxImageExtent = VkExtent2D{4096, 2048};
        caps.minImageCount = 2;
        return caps;
    }

    bool test_vk_result_mapping()
    {
        using gpurt::FrameStatus;
        using gpurt::frame_status_from_vk_result;
        if (frame_status_from_vk_result(VK_SUCCESS) != FrameStatus::Ok) return false;
        if (frame_status_from_vk_result(VK_SUBOPTIMAL_KHR) != FrameStatus::Ok) return false;
        if (frame_status_from_vk_result(VK_ERROR_OUT_OF_DATE_KHR) != FrameStatus::SurfaceOutOfDate) return false;
        if (frame_status_from_vk_result(VK_ERROR_SURFACE_LOST_KHR) != FrameStatus::SurfaceLost) return false;
        if (frame_status_from_vk_result(VK_ERROR_OUT_OF_DEVICE_MEMORY) != FrameStatus::OutOfMemory) return false;
        if (frame_status_from_vk_result(VK_ERROR_DEVICE_LOST) != FrameStatus::DeviceLost) return false;
        return frame_status_from_vk_result(VK_ERROR_INITIALIZATION_FAILED) == FrameStatus::Error;
    }

    bool test_surface_format_preference()
    {
        const std::vector<VkSurfaceFormatKHR> mixed{
            {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
            {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
            {VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        };
        if (gpurt::vk_pick_surface_format(mixed).format != VK_FORMAT_B8G8R8A8_UNORM) return false;

        const std::vector<VkSurfaceFormatKHR> rgba_only{
            {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
            {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        };
        if (gpurt::vk_pick_surface_format(rgba_only).format != VK_FORMAT_R8G8B8A8_UNORM) return false;

        // Nothing preferred: first reported format.
        const std::vector<VkSurfaceFormatKHR> srgb_only{{VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR}};
        if (gpurt::vk_pick_surface_format(srgb_only).format != VK_FORMAT_B8G8R8A8_SRGB) return false;
        return gpurt::vk_pick_surface_format({}).format == VK_FORMAT_UNDEFINED;
    }

    bool test_present_mode_choice()
    {
        using gpurt::PresentModePreference;
        const std::vector<VkPresentModeKHR> with_mailbox{VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_MAILBOX_KHR};
        const std::vector<VkPresentModeKHR> fifo_only{VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR};
        if (gpurt::vk_pick_present_mode(with_mailbox, PresentModePreference::Mailbox) != VK_PRESENT_MODE_MAILBOX_KHR) return false;
        if (gpurt::vk_pick_present_mode(with_mailbox, PresentModePreference::Fifo) != VK_PRESENT_MODE_FIFO_KHR) return false;
        return gpurt::vk_pick_present_mode(fifo_only, PresentModePreference::Mailbox) == VK_PRESENT_MODE_FIFO_KHR;
    }

    bool test_extent_choice()
    {
        // A fixed surface extent wins over the drawable size.
        const VkExtent2D fixed = gpurt::vk_pick_extent(caps_with_extent(800, 600), 1024, 768);
        if (fixed.width != 800 || fixed.height != 600) return false;

        const VkSurfaceCapabilitiesKHR open = caps_with_extent(UINT32_MAX, UINT32_MAX);
        const VkExtent2D drawable = gpurt::vk_pick_extent(open, 1024, 768);
        if (drawable.width != 1024 || drawable.height != 768) return false;

        const VkExtent2D clamped = gpurt::vk_pick_extent(open, 8, 9000);
        if (clamped.width != 16 || clamped.height != 2048) return false;

        const VkExtent2D minimized = gpurt::vk_pick_extent(open, 0, 600);
        return minimized.width == 0 && minimized.height == 0;
    }

    bool test_drawable_resize_request()
    {
        const VkExtent2D current{1280, 720};
        // Same size every frame must not rebuild the swapchain.
        if (gpurt::vk_drawable_differs(current, 1280, 720)) return false;
        if (gpurt::vk_drawable_differs(current, 0, 720)) return false;
        if (gpurt::vk_drawable_differs(current, 1280, -1)) return false;
        if (!gpurt::vk_drawable_differs(current, 1281, 720)) return false;
        if (!gpurt::vk_drawable_differs(current, 1280, 721)) return false;
        return gpurt::vk_drawable_differs(VkExtent2D{0, 0}, 640, 480);
    }

    bool test_device_rank_and_queue_selection()
    {
        if (gpurt::vk_device_type_rank(VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) <=
            gpurt::vk_device_type_rank(VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)) return false;
        if (gpurt::vk_device_type_rank(VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) <=
            gpurt::vk_device_type_rank(VK_PHYSICAL_DEVICE_TYPE_CPU)) return false;

        gpurt::VkQueueSelection sel{};
        if (sel.complete() || sel.shared()) return false;
        sel.graphics_compute = 0u;
        if (sel.complete()) return false;
        sel.present = 1u;
        if (!sel.complete() || sel.shared()) return false;
        sel.present = 0u;
        return sel.shared();
    }
}

int main()
{
    const bool ok_results = test_vk_result_mapping();
    const bool ok_formats = test_surface_format_preference();
    const bool ok_modes = test_present_mode_choice();
    const bool ok_extent = test_extent_choice();
    const bool ok_device = test_device_rank_and_queue_selection();
    const bool ok_resize = test_drawable_resize_request();

    if (!ok_results) std::fprintf(stderr, "[vk-selection-tests] VkResult to FrameStatus mapping failed\n");
    if (!ok_formats) std::fprintf(stderr, "[vk-selection-tests] surface format preference failed\n");
    if (!ok_modes) std::fprintf(stderr, "[vk-selection-tests] present mode choice failed\n");
    if (!ok_extent) std::fprintf(stderr, "[vk-selection-tests] extent choice failed\n");
    if (!ok_device) std::fprintf(stderr, "[vk-selection-tests] device rank / queue selection failed\n");
    if (!ok_resize) std::fprintf(stderr, "[vk-selection-tests] drawable resize request failed\n");

    if (!(ok_results && ok_formats && ok_modes && ok_extent && ok_device && ok_resize)) return 1;
    std::fprintf(stderr, "[vk-selection-tests] all tests passed\n");
    return 0;
}
