#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: vk_frame_ownership.hpp
    МОДУЛЬ: rhi/drivers/vulkan
    ЗОРИЛГО: Frame slot бүрт хамаарах нөөцийн ring, slot бүр ямар
            scene generation-ийг хуулсныг хянах tracker, мөн slot бүрт
            нэг descriptor set хуваарилах helper.
*/


#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <vulkan/vulkan.h>

namespace gpurt
{
    // Zero slots collapse to slot 0.
    inline uint32_t vk_frame_slot(uint64_t frame_index, uint32_t slot_count)
    {
        return slot_count == 0u ? 0u : (uint32_t)(frame_index % slot_count);
    }

    template <typename T, size_t SlotCount>
    class VkFrameRing final
    {
        static_assert(SlotCount > 0, "VkFrameRing needs at least one slot");

    public:
        bool valid_slot(uint32_t slot) const { return slot < (uint32_t)SlotCount; }

        T& at_slot(uint32_t slot)
        {
            check(slot);
            return items_[slot];
        }

        const T& at_slot(uint32_t slot) const
        {
            check(slot);
            return items_[slot];
        }

        T& at_frame(uint64_t frame_index) { return items_[vk_frame_slot(frame_index, (uint32_t)SlotCount)]; }

        template <typename Fn>
        void for_each(Fn&& fn)
        {
            for (size_t i = 0; i < SlotCount; ++i) fn((uint32_t)i, items_[i]);
        }

    private:
        void check(uint32_t slot) const
        {
            if (!valid_slot(slot)) throw std::out_of_range("VkFrameRing: slot " + std::to_string(slot) + " out of range");
        }

        std::array<T, SlotCount> items_{};
    };

    // Slot бүр scene-ийн аль geometry generation-ийг буфертээ хуулсныг санана.
    // Тухайн slot-ын fence хүлээгдсэний дараа л mark_uploaded дуудна.
    template <size_t SlotCount>
    class VkSlotGenerationTracker final
    {
    public:
        static constexpr uint64_t k_never = UINT64_MAX;

        VkSlotGenerationTracker() { invalidate_all(); }

        bool stale(uint32_t slot, uint64_t generation) const
        {
            return slot >= SlotCount || copied_[slot] != generation;
        }

        void mark_uploaded(uint32_t slot, uint64_t generation)
        {
            if (slot < SlotCount) copied_[slot] = generation;
        }

        void invalidate(uint32_t slot)
        {
            if (slot < SlotCount) copied_[slot] = k_never;
        }

        void invalidate_all() { copied_.fill(k_never); }

    private:
        std::array<uint64_t, SlotCount> copied_{};
    };

    // All sets share one layout; the pool must hold SlotCount of them.
    template <size_t SlotCount>
    bool vk_allocate_descriptor_set_ring(
        VkDevice device,
        VkDescriptorPool pool,
        VkDescriptorSetLayout layout,
        std::array<VkDescriptorSet, SlotCount>& out_sets)
    {
        if (device == VK_NULL_HANDLE || pool == VK_NULL_HANDLE || layout == VK_NULL_HANDLE) return false;

        std::array<VkDescriptorSetLayout, SlotCount> layouts{};
        layouts.fill(layout);

        VkDescriptorSetAllocateInfo alloc{};
        alloc.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        alloc.descriptorPool = pool;
        alloc.descriptorSetCount = (uint32_t)SlotCount;
        alloc.pSetLayouts = layouts.data();
        return vkAllocateDescriptorSets(device, &alloc, out_sets.data()) == VK_SUCCESS;
    }
}
