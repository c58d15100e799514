#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: CPU tracer мөрүүдийг тараах job system-ийн интерфэйс.
*/


#include <cstddef>
#include <functional>

namespace gpurt
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t worker_count() const = 0;
    };

    // Worker thread үүсгэхгүй, enqueue дээр шууд ажиллуулна. Тест болон headless capture-д.
    class InlineJobSystem final : public IJobSystem
    {
    public:
        void enqueue(std::function<void()> job) override
        {
            if (job) job();
        }

        void wait_idle() override {}

        size_t worker_count() const override { return 1; }
    };
}
