/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: gpurt_lib.cpp
    МОДУЛЬ: gpurt-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "gpurt/render/vk_ray_tracer.hpp"
#include "gpurt/rhi/backend/backend_factory.hpp"
#include "gpurt/trace/cpu_ray_tracer.hpp"

namespace gpurt
{
    int gpurt_compiled_target_anchor()
    {
        return 0;
    }
}
