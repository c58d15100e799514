#pragma once

/*
    GPURT RENDERER SAN

    FILE: raytrace_pass.hpp
    MODULE: render
    PURPOSE: Compute pipeline that traces one primary ray per pixel into the
             storage target. One descriptor set per frame slot.
*/


#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <vulkan/vulkan.h>

#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_frame_ownership.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_shader_utils.hpp"

namespace gpurt
{
    template <size_t SlotCount>
    class RayTracePass
    {
    public:
        RayTracePass() = default;
        ~RayTracePass() { destroy(); }

        RayTracePass(const RayTracePass&) = delete;
        RayTracePass& operator=(const RayTracePass&) = delete;

        void create(VkDevice device, const std::string& compute_spv_path)
        {
            destroy();
            device_ = device;
            if (device_ == VK_NULL_HANDLE) throw std::runtime_error("RayTracePass: Vulkan device not ready");

            VkDescriptorSetLayoutBinding b[3]{};
            b[0].binding = k_trace_binding_output;
            b[0].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
            b[0].descriptorCount = 1;
            b[0].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            b[1].binding = k_trace_binding_frame;
            b[1].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            b[1].descriptorCount = 1;
            b[1].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            b[2].binding = k_trace_binding_spheres;
            b[2].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            b[2].descriptorCount = 1;
            b[2].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

            VkDescriptorSetLayoutCreateInfo dl{};
            dl.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            dl.bindingCount = 3;
            dl.pBindings = b;
            if (vkCreateDescriptorSetLayout(device_, &dl, nullptr, &set_layout_) != VK_SUCCESS)
            {
                throw std::runtime_error("RayTracePass: vkCreateDescriptorSetLayout failed");
            }

            VkPushConstantRange pcr{};
            pcr.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
            pcr.offset = 0;
            pcr.size = sizeof(RayTracePushConstants);

            VkPipelineLayoutCreateInfo pl{};
            pl.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
            pl.setLayoutCount = 1;
            pl.pSetLayouts = &set_layout_;
            pl.pushConstantRangeCount = 1;
            pl.pPushConstantRanges = &pcr;
            if (vkCreatePipelineLayout(device_, &pl, nullptr, &pipeline_layout_) != VK_SUCCESS)
            {
                throw std::runtime_error("RayTracePass: vkCreatePipelineLayout failed");
            }

            VkScopedShaderModule cs(device_, vk_load_shader_module(device_, compute_spv_path));

            VkComputePipelineCreateInfo cp{};
            cp.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
            cp.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            cp.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
            cp.stage.module = cs.get();
            cp.stage.pName = "main";
            cp.layout = pipeline_layout_;
            if (vkCreateComputePipelines(device_, VK_NULL_HANDLE, 1, &cp, nullptr, &pipeline_) != VK_SUCCESS)
            {
                throw std::runtime_error("RayTracePass: vkCreateComputePipelines failed");
            }

            VkDescriptorPoolSize sizes[3]{};
            sizes[0].type = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
            sizes[0].descriptorCount = (uint32_t)SlotCount;
            sizes[1].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            sizes[1].descriptorCount = (uint32_t)SlotCount;
            sizes[2].type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            sizes[2].descriptorCount = (uint32_t)SlotCount;

            VkDescriptorPoolCreateInfo dp{};
            dp.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
            dp.maxSets = (uint32_t)SlotCount;
            dp.poolSizeCount = 3;
            dp.pPoolSizes = sizes;
            if (vkCreateDescriptorPool(device_, &dp, nullptr, &pool_) != VK_SUCCESS)
            {
                throw std::runtime_error("RayTracePass: vkCreateDescriptorPool failed");
            }
            if (!vk_allocate_descriptor_set_ring<SlotCount>(device_, pool_, set_layout_, sets_))
            {
                throw std::runtime_error("RayTracePass: descriptor set allocation failed");
            }
        }

        void destroy()
        {
            if (device_ == VK_NULL_HANDLE) return;
            if (pipeline_ != VK_NULL_HANDLE) vkDestroyPipeline(device_, pipeline_, nullptr);
            if (pipeline_layout_ != VK_NULL_HANDLE) vkDestroyPipelineLayout(device_, pipeline_layout_, nullptr);
            // Sets are freed with the pool.
            if (pool_ != VK_NULL_HANDLE) vkDestroyDescriptorPool(device_, pool_, nullptr);
            if (set_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, set_layout_, nullptr);
            pipeline_ = VK_NULL_HANDLE;
            pipeline_layout_ = VK_NULL_HANDLE;
            pool_ = VK_NULL_HANDLE;
            set_layout_ = VK_NULL_HANDLE;
            sets_.fill(VK_NULL_HANDLE);
            device_ = VK_NULL_HANDLE;
        }

        // The slot's set must not be in use by a pending command buffer.
        void write_descriptors(
            uint32_t slot,
            VkImageView output_view,
            const VkDescriptorBufferInfo& frame,
            const VkDescriptorBufferInfo& spheres)
        {
            VkDescriptorImageInfo img{};
            img.imageView = output_view;
            img.imageLayout = VK_IMAGE_LAYOUT_GENERAL;

            VkWriteDescriptorSet w[3]{};
            for (auto& x : w)
            {
                x.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                x.dstSet = sets_.at(slot);
                x.descriptorCount = 1;
            }
            w[0].dstBinding = k_trace_binding_output;
            w[0].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
            w[0].pImageInfo = &img;
            w[1].dstBinding = k_trace_binding_frame;
            w[1].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            w[1].pBufferInfo = &frame;
            w[2].dstBinding = k_trace_binding_spheres;
            w[2].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            w[2].pBufferInfo = &spheres;
            vkUpdateDescriptorSets(device_, 3, w, 0, nullptr);
        }

        // Storage image must already be in GENERAL layout.
        DispatchGroups record(VkCommandBuffer cmd, uint32_t slot, VkExtent2D extent, const RayTracePushConstants& pc)
        {
            const DispatchGroups groups = trace_dispatch_groups(extent.width, extent.height);
            VkDescriptorSet set = sets_.at(slot);
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline_);
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline_layout_, k_trace_set_index, 1, &set, 0, nullptr);
            vkCmdPushConstants(cmd, pipeline_layout_, VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(pc), &pc);
            vkCmdDispatch(cmd, groups.x, groups.y, 1);
            return groups;
        }

        bool ready() const { return pipeline_ != VK_NULL_HANDLE; }

    private:
        VkDevice device_ = VK_NULL_HANDLE;
        VkDescriptorSetLayout set_layout_ = VK_NULL_HANDLE;
        VkPipelineLayout pipeline_layout_ = VK_NULL_HANDLE;
        VkPipeline pipeline_ = VK_NULL_HANDLE;
        VkDescriptorPool pool_ = VK_NULL_HANDLE;
        std::array<VkDescriptorSet, SlotCount> sets_{};
    };
}
