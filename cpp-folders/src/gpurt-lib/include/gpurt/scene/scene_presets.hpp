#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: scene_presets.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Нэрээр сонгох бэлэн scene-үүд (single, default, grid).
*/


#include <array>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "gpurt/camera/camera.hpp"
#include "gpurt/core/result.hpp"
#include "gpurt/scene/scene.hpp"

namespace gpurt
{
    inline constexpr std::array<std::string_view, 3> k_scene_preset_names{"single", "default", "grid"};

    inline std::string scene_preset_list()
    {
        std::string out{};
        for (std::string_view n : k_scene_preset_names)
        {
            if (!out.empty()) out += "|";
            out += n;
        }
        return out;
    }

    // Камерын эх цэгт, -Z рүү харсан нэг бөмбөлөг.
    inline Scene make_single_sphere_scene(ImageExtent image)
    {
        Scene s{};
        s.camera = Camera(CameraDesc{}, image);
        const uint32_t mat = s.add_material(Material{glm::vec3(0.8f, 0.35f, 0.3f)});
        s.add_sphere(Sphere{Point3(0.0f, 0.0f, -1.0f), 0.5f, mat});
        return s;
    }

    inline Scene make_default_scene(ImageExtent image)
    {
        Scene s{};
        s.camera = Camera(CameraDesc{}, image);
        const uint32_t center_mat = s.add_material(Material{glm::vec3(0.7f, 0.3f, 0.3f)});
        const uint32_t ground_mat = s.add_material(Material{glm::vec3(0.8f, 0.8f, 0.0f)});
        s.add_sphere(Sphere{Point3(0.0f, 0.0f, -1.0f), 0.5f, center_mat});
        s.add_sphere(Sphere{Point3(0.0f, -100.5f, -1.0f), 100.0f, ground_mat});
        return s;
    }

    inline Scene make_grid_scene(ImageExtent image)
    {
        Scene s{};
        CameraDesc desc{};
        desc.origin = Point3(0.0f, 0.6f, 1.2f);
        desc.vfov_degrees = 70.0f;
        s.camera = Camera(desc, image);
        s.camera.look_at(Point3(0.0f, -0.2f, -2.5f));

        const uint32_t ground_mat = s.add_material(Material{glm::vec3(0.55f, 0.55f, 0.6f)});
        s.add_sphere(Sphere{Point3(0.0f, -1000.5f, -2.5f), 1000.0f, ground_mat});

        constexpr int kCols = 5;
        constexpr int kRows = 3;
        for (int row = 0; row < kRows; ++row)
        {
            for (int col = 0; col < kCols; ++col)
            {
                const float hue = (float)(row * kCols + col) / (float)(kCols * kRows);
                const glm::vec3 albedo{
                    0.5f + 0.45f * std::cos(6.2831853f * (hue + 0.00f)),
                    0.5f + 0.45f * std::cos(6.2831853f * (hue + 0.33f)),
                    0.5f + 0.45f * std::cos(6.2831853f * (hue + 0.67f))};
                const uint32_t mat = s.add_material(Material{albedo});
                const float x = -1.6f + 0.8f * (float)col;
                const float z = -1.5f - 1.0f * (float)row;
                s.add_sphere(Sphere{Point3(x, -0.2f, z), 0.3f, mat});
            }
        }
        return s;
    }

    inline Result<Scene> make_scene_preset(std::string_view name, ImageExtent image)
    {
        if (name == "single") return Result<Scene>::success(make_single_sphere_scene(image));
        if (name == "default") return Result<Scene>::success(make_default_scene(image));
        if (name == "grid") return Result<Scene>::success(make_grid_scene(image));
        return Result<Scene>::failure("unknown scene '" + std::string(name) + "', expected " + scene_preset_list());
    }
}
