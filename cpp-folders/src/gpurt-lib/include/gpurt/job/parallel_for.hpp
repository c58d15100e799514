#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Зургийн мөр/tile-уудыг job system дээр тараах helper-ууд.
*/


#include <algorithm>
#include <cstddef>

#include "gpurt/job/job_system.hpp"
#include "gpurt/job/wait_group.hpp"

namespace gpurt
{
    template<typename Fn>
    inline void parallel_for_1d(
        IJobSystem* js,
        int begin,
        int end,
        int min_grain,
        Fn&& fn
    )
    {
        if (end <= begin) return;
        const int count = end - begin;
        // Ажил бага эсвэл job system байхгүй үед sync замаар ажиллуулна.
        if (!js || count <= std::max(1, min_grain))
        {
            fn(begin, end);
            return;
        }

        const int workers = (int)std::max<size_t>(1, js->worker_count());
        const int chunks = std::max(1, std::min(workers * 2, (count + min_grain - 1) / std::max(1, min_grain)));
        const int chunk_size = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        for (int i = 0; i < chunks; ++i)
        {
            const int b = begin + i * chunk_size;
            const int e = std::min(end, b + chunk_size);
            if (b >= e) continue;

            wg.add(1);
            js->enqueue([b, e, &fn, &wg]() {
                wg.run([&]() { fn(b, e); });
            });
        }
        wg.wait();
    }

    // width x height-ийг tile_w x tile_h хэсгүүдэд хуваана. fn(x0, y0, x1, y1) нь хагас нээлттэй муж.
    // Compute shader-ийн workgroup-тэй ижил хуваалт.
    template<typename Fn>
    inline void parallel_for_tiles_2d(
        IJobSystem* js,
        int width,
        int height,
        int tile_w,
        int tile_h,
        Fn&& fn
    )
    {
        if (width <= 0 || height <= 0) return;
        tile_w = std::max(1, tile_w);
        tile_h = std::max(1, tile_h);
        const int tiles_x = (width + tile_w - 1) / tile_w;
        const int tiles_y = (height + tile_h - 1) / tile_h;

        parallel_for_1d(js, 0, tiles_x * tiles_y, 4, [&](int tb, int te) {
            for (int t = tb; t < te; ++t)
            {
                const int tx = t % tiles_x;
                const int ty = t / tiles_x;
                const int x0 = tx * tile_w;
                const int y0 = ty * tile_h;
                fn(x0, y0, std::min(width, x0 + tile_w), std::min(height, y0 + tile_h));
            }
        });
    }
}
