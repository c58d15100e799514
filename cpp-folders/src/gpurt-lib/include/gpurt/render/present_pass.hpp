#pragma once

/*
    GPURT RENDERER SAN

    FILE: present_pass.hpp
    MODULE: render
    PURPOSE: Full-screen quad that samples the storage target into the
             swapchain image. The pipeline follows the backend's render pass.
*/


#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <vulkan/vulkan.h>

#include "gpurt/gpu/gpu_layout.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_cmd_utils.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_frame_ownership.hpp"
#include "gpurt/rhi/drivers/vulkan/vk_shader_utils.hpp"

namespace gpurt
{
    template <size_t SlotCount>
    class PresentPass
    {
    public:
        PresentPass() = default;
        ~PresentPass() { destroy(); }

        PresentPass(const PresentPass&) = delete;
        PresentPass& operator=(const PresentPass&) = delete;

        void create(VkDevice device, VkRenderPass render_pass, const std::string& vert_spv_path, const std::string& frag_spv_path)
        {
            destroy();
            device_ = device;
            if (device_ == VK_NULL_HANDLE) throw std::runtime_error("PresentPass: Vulkan device not ready");
            vert_path_ = vert_spv_path;
            frag_path_ = frag_spv_path;

            VkDescriptorSetLayoutBinding binding{};
            binding.binding = k_present_binding_texture;
            binding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            binding.descriptorCount = 1;
            binding.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

            VkDescriptorSetLayoutCreateInfo set_layout_info{};
            set_layout_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            set_layout_info.bindingCount = 1;
            set_layout_info.pBindings = &binding;
            if (vkCreateDescriptorSetLayout(device_, &set_layout_info, nullptr, &set_layout_) != VK_SUCCESS)
            {
                throw std::runtime_error("PresentPass: vkCreateDescriptorSetLayout failed");
            }

            VkPipelineLayoutCreateInfo layout_info{};
            layout_info.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
            layout_info.setLayoutCount = 1;
            layout_info.pSetLayouts = &set_layout_;
            if (vkCreatePipelineLayout(device_, &layout_info, nullptr, &pipeline_layout_) != VK_SUCCESS)
            {
                throw std::runtime_error("PresentPass: vkCreatePipelineLayout failed");
            }

            VkDescriptorPoolSize pool_size{};
            pool_size.type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            pool_size.descriptorCount = (uint32_t)SlotCount;
            VkDescriptorPoolCreateInfo pool_info{};
            pool_info.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
            pool_info.maxSets = (uint32_t)SlotCount;
            pool_info.poolSizeCount = 1;
            pool_info.pPoolSizes = &pool_size;
            if (vkCreateDescriptorPool(device_, &pool_info, nullptr, &pool_) != VK_SUCCESS)
            {
                throw std::runtime_error("PresentPass: vkCreateDescriptorPool failed");
            }
            if (!vk_allocate_descriptor_set_ring<SlotCount>(device_, pool_, set_layout_, sets_))
            {
                throw std::runtime_error("PresentPass: descriptor set allocation failed");
            }

            create_pipeline(render_pass);
        }

        // Only the pipeline depends on the render pass; layouts and sets survive.
        // Call after the device is idle.
        void recreate_pipeline(VkRenderPass render_pass)
        {
            create_pipeline(render_pass);
        }

        void destroy()
        {
            if (device_ == VK_NULL_HANDLE) return;
            destroy_pipeline();
            if (pipeline_layout_ != VK_NULL_HANDLE) vkDestroyPipelineLayout(device_, pipeline_layout_, nullptr);
            if (pool_ != VK_NULL_HANDLE) vkDestroyDescriptorPool(device_, pool_, nullptr);
            if (set_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, set_layout_, nullptr);
            pipeline_layout_ = VK_NULL_HANDLE;
            pool_ = VK_NULL_HANDLE;
            set_layout_ = VK_NULL_HANDLE;
            sets_.fill(VK_NULL_HANDLE);
            device_ = VK_NULL_HANDLE;
        }

        void write_descriptor(uint32_t slot, VkImageView view, VkSampler sampler)
        {
            VkDescriptorImageInfo image_info{};
            image_info.sampler = sampler;
            image_info.imageView = view;
            image_info.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

            VkWriteDescriptorSet write{};
            write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            write.dstSet = sets_.at(slot);
            write.dstBinding = k_present_binding_texture;
            write.descriptorCount = 1;
            write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            write.pImageInfo = &image_info;
            vkUpdateDescriptorSets(device_, 1, &write, 0, nullptr);
        }

        void record(VkCommandBuffer cmd, uint32_t slot, VkRenderPass render_pass, VkFramebuffer framebuffer, VkExtent2D extent)
        {
            VkClearValue clear{};
            clear.color = {{0.0f, 0.0f, 0.0f, 1.0f}};
            VkRenderPassBeginInfo pass_begin{};
            pass_begin.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
            pass_begin.renderPass = render_pass;
            pass_begin.framebuffer = framebuffer;
            pass_begin.renderArea.offset = {0, 0};
            pass_begin.renderArea.extent = extent;
            pass_begin.clearValueCount = 1;
            pass_begin.pClearValues = &clear;
            vkCmdBeginRenderPass(cmd, &pass_begin, VK_SUBPASS_CONTENTS_INLINE);

            VkDescriptorSet set = sets_.at(slot);
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_);
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_layout_, k_present_set_index, 1, &set, 0, nullptr);
            // No y-flip: row 0 of the traced image is the top of the window.
            vk_cmd_set_viewport_scissor(cmd, extent.width, extent.height, false);
            vkCmdDraw(cmd, k_present_vertex_count, 1, 0, 0);
            vkCmdEndRenderPass(cmd);
        }

    private:
        void create_pipeline(VkRenderPass render_pass)
        {
            destroy_pipeline();
            if (render_pass == VK_NULL_HANDLE) throw std::runtime_error("PresentPass: Vulkan render pass not ready");

            VkScopedShaderModule vert_module(device_, vk_load_shader_module(device_, vert_path_));
            VkScopedShaderModule frag_module(device_, vk_load_shader_module(device_, frag_path_));

            VkPipelineShaderStageCreateInfo stages[2]{};
            stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
            stages[0].module = vert_module.get();
            stages[0].pName = "main";
            stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
            stages[1].module = frag_module.get();
            stages[1].pName = "main";

            VkPipelineVertexInputStateCreateInfo vertex_input{};
            vertex_input.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;

            VkPipelineInputAssemblyStateCreateInfo assembly{};
            assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
            assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

            VkPipelineViewportStateCreateInfo viewport{};
            viewport.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
            viewport.viewportCount = 1;
            viewport.scissorCount = 1;

            VkPipelineRasterizationStateCreateInfo raster{};
            raster.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
            raster.polygonMode = VK_POLYGON_MODE_FILL;
            raster.cullMode = VK_CULL_MODE_NONE;
            raster.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
            raster.lineWidth = 1.0f;

            VkPipelineMultisampleStateCreateInfo multisample{};
            multisample.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
            multisample.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

            VkPipelineColorBlendAttachmentState blend_attachment{};
            blend_attachment.colorWriteMask =
                VK_COLOR_COMPONENT_R_BIT |
                VK_COLOR_COMPONENT_G_BIT |
                VK_COLOR_COMPONENT_B_BIT |
                VK_COLOR_COMPONENT_A_BIT;
            blend_attachment.blendEnable = VK_FALSE;

            VkPipelineColorBlendStateCreateInfo blend{};
            blend.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
            blend.attachmentCount = 1;
            blend.pAttachments = &blend_attachment;

            const VkDynamicState dynamic_states[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
            VkPipelineDynamicStateCreateInfo dynamic{};
            dynamic.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
            dynamic.dynamicStateCount = 2;
            dynamic.pDynamicStates = dynamic_states;

            VkGraphicsPipelineCreateInfo pipeline_info{};
            pipeline_info.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
            pipeline_info.stageCount = 2;
            pipeline_info.pStages = stages;
            pipeline_info.pVertexInputState = &vertex_input;
            pipeline_info.pInputAssemblyState = &assembly;
            pipeline_info.pViewportState = &viewport;
            pipeline_info.pRasterizationState = &raster;
            pipeline_info.pMultisampleState = &multisample;
            pipeline_info.pColorBlendState = &blend;
            pipeline_info.pDynamicState = &dynamic;
            pipeline_info.layout = pipeline_layout_;
            pipeline_info.renderPass = render_pass;
            pipeline_info.subpass = 0;
            if (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &pipeline_) != VK_SUCCESS)
            {
                pipeline_ = VK_NULL_HANDLE;
                throw std::runtime_error("PresentPass: vkCreateGraphicsPipelines failed");
            }
        }

        void destroy_pipeline()
        {
            if (device_ != VK_NULL_HANDLE && pipeline_ != VK_NULL_HANDLE)
            {
                vkDestroyPipeline(device_, pipeline_, nullptr);
            }
            pipeline_ = VK_NULL_HANDLE;
        }

        VkDevice device_ = VK_NULL_HANDLE;
        std::string vert_path_{};
        std::string frag_path_{};
        VkDescriptorSetLayout set_layout_ = VK_NULL_HANDLE;
        VkPipelineLayout pipeline_layout_ = VK_NULL_HANDLE;
        VkPipeline pipeline_ = VK_NULL_HANDLE;
        VkDescriptorPool pool_ = VK_NULL_HANDLE;
        std::array<VkDescriptorSet, SlotCount> sets_{};
    };
}
