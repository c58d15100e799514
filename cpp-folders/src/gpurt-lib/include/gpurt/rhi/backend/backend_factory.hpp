#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: backend_factory.hpp
    МОДУЛЬ: rhi/backend
    ЗОРИЛГО: Хүссэн backend-ийн төрлөөр Context-д бүртгэх backend-уудыг үүсгэнэ.
            Software backend үргэлж бүртгэгдэнэ: CPU горимд үндсэн, Vulkan
            горимд capture-д ашиглагдана.
*/


#include <memory>
#include <string>
#include <vector>

#include "gpurt/rhi/core/backend.hpp"
#include "gpurt/rhi/drivers/software/sw_backend.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_backend.hpp"

namespace gpurt
{
    struct RenderBackendSet
    {
        // Primary first.
        std::vector<std::unique_ptr<IRenderBackend>> owned{};
        RenderBackendType active = RenderBackendType::Software;
        std::string note{};
    };

    inline RenderBackendSet create_render_backends(RenderBackendType requested)
    {
        RenderBackendSet set{};
        set.active = requested;
        if (requested == RenderBackendType::Vulkan)
        {
            set.owned.push_back(std::make_unique<VulkanRenderBackend>());
            set.note = "Vulkan backend selected; software backend kept for captures.";
        }
        set.owned.push_back(std::make_unique<SoftwareRenderBackend>());
        return set;
    }
}
