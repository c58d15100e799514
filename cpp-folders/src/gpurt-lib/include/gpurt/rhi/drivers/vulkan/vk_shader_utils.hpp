#pragma once

/*
    GPURT RENDERER SAN

    FILE: vk_shader_utils.hpp
    MODULE: rhi/drivers/vulkan
    PURPOSE: SPIR-V lookup and shader module helpers. Build-time paths come from
             compile definitions; GPURT_SHADER_DIR moves them at run time.
*/


#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

namespace gpurt
{
    inline bool vk_try_read_binary_file(const char* path, std::vector<char>& out_bytes) noexcept
    {
        out_bytes.clear();
        if (!path || path[0] == '\0')
        {
            return false;
        }

        std::ifstream f(path, std::ios::ate | std::ios::binary);
        if (!f.is_open())
        {
            return false;
        }

        const std::streampos end_pos = f.tellg();
        if (end_pos <= 0)
        {
            return false;
        }
        const size_t sz = static_cast<size_t>(end_pos);

        out_bytes.resize(sz);
        f.seekg(0);
        f.read(out_bytes.data(), static_cast<std::streamsize>(sz));
        if (!f)
        {
            out_bytes.clear();
            return false;
        }
        return true;
    }

    inline std::vector<char> vk_read_binary_file(const char* path)
    {
        std::vector<char> out{};
        if (!vk_try_read_binary_file(path, out))
        {
            throw std::runtime_error(std::string("Failed to read binary file: ") + (path ? path : "<null>"));
        }
        return out;
    }

    // With an override directory, only the file name of the built-in path is kept.
    inline std::string vk_resolve_shader_path(const std::string& override_dir, const char* builtin_path)
    {
        if (!builtin_path) return {};
        if (override_dir.empty()) return builtin_path;
        const std::filesystem::path name = std::filesystem::path(builtin_path).filename();
        return (std::filesystem::path(override_dir) / name).string();
    }

    inline bool vk_try_create_shader_module(
        VkDevice device,
        const std::vector<char>& spirv_code,
        VkShaderModule& out_shader_module) noexcept
    {
        out_shader_module = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE)
        {
            return false;
        }
        if (spirv_code.empty() || (spirv_code.size() % 4) != 0)
        {
            return false;
        }

        VkShaderModuleCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        ci.codeSize = spirv_code.size();
        ci.pCode = reinterpret_cast<const uint32_t*>(spirv_code.data());

        return vkCreateShaderModule(device, &ci, nullptr, &out_shader_module) == VK_SUCCESS;
    }

    inline VkShaderModule vk_load_shader_module(VkDevice device, const std::string& path)
    {
        const std::vector<char> code = vk_read_binary_file(path.c_str());
        VkShaderModule out = VK_NULL_HANDLE;
        if (!vk_try_create_shader_module(device, code, out))
        {
            throw std::runtime_error("vk_load_shader_module: invalid SPIR-V in " + path);
        }
        return out;
    }

    // Destroys the module when it leaves scope.
    class VkScopedShaderModule
    {
    public:
        VkScopedShaderModule(VkDevice device, VkShaderModule module)
            : device_(device), module_(module)
        {}

        ~VkScopedShaderModule()
        {
            if (device_ != VK_NULL_HANDLE && module_ != VK_NULL_HANDLE)
            {
                vkDestroyShaderModule(device_, module_, nullptr);
            }
        }

        VkScopedShaderModule(const VkScopedShaderModule&) = delete;
        VkScopedShaderModule& operator=(const VkScopedShaderModule&) = delete;

        VkShaderModule get() const { return module_; }

    private:
        VkDevice device_ = VK_NULL_HANDLE;
        VkShaderModule module_ = VK_NULL_HANDLE;
    };
}
