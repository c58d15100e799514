#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: aabb.hpp
    МОДУЛЬ: geometry
    ЗОРИЛГО: Тэнхлэгтэй зэрэгцээ хязгаарын хайрцаг. Scene-ийн хүрээ болон
            камерын анхны байрлалыг тооцоход ашиглана.
*/

#include <algorithm>

#include <glm/glm.hpp>

namespace gpurt
{
    struct AABB
    {
        glm::vec3 minv{1e30f};
        glm::vec3 maxv{-1e30f};

        void expand(const glm::vec3& p)
        {
            minv = glm::min(minv, p);
            maxv = glm::max(maxv, p);
        }

        void expand(const AABB& other)
        {
            if (!other.valid()) return;
            expand(other.minv);
            expand(other.maxv);
        }

        bool valid() const
        {
            return minv.x <= maxv.x && minv.y <= maxv.y && minv.z <= maxv.z;
        }

        glm::vec3 center() const { return 0.5f * (minv + maxv); }
        glm::vec3 extent() const { return 0.5f * (maxv - minv); }
    };
}
