#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: image.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: CPU талын RGBA8 зураг, SDL texture руу хуулах болон PPM бичих helper-ууд.
            Мөрүүд дээрээс доош дарааллаар хадгалагдана (compute storage image-тэй ижил).
*/


#include <algorithm>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace gpurt
{
    struct Color
    {
        uint8_t r, g, b, a;

        bool operator==(const Color&) const = default;
    };

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = std::max(0, W);
            h = std::max(0, H);
            data.assign((size_t)w * (size_t)h, clear);
        }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }
    };

    struct RT_ColorLDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int W, int H, Color clear = {0, 0, 0, 255}) : w(W), h(H), color(W, H, clear) {}

        // Хэмжээ өөрчлөгдсөн үед л дахин хуваарилна.
        bool ensure_size(int W, int H, Color clear = {0, 0, 0, 255})
        {
            if (W == w && H == h) return false;
            w = W;
            h = H;
            color.resize(W, H, clear);
            return true;
        }

        const uint8_t* rgba8_data() const
        {
            return reinterpret_cast<const uint8_t*>(color.data.data());
        }

        int pitch_bytes() const { return w * 4; }
    };

    static_assert(sizeof(Color) == 4, "Color must be tightly packed RGBA8");

    inline bool write_ldr_to_ppm(const std::string& path, const RT_ColorLDR& ldr)
    {
        if (ldr.w <= 0 || ldr.h <= 0) return false;
        std::ofstream out(path, std::ios::binary);
        if (!out) return false;
        out << "P6\n" << ldr.w << " " << ldr.h << "\n255\n";
        std::vector<char> row((size_t)ldr.w * 3);
        for (int y = 0; y < ldr.h; ++y)
        {
            for (int x = 0; x < ldr.w; ++x)
            {
                const Color c = ldr.color.at(x, y);
                row[(size_t)x * 3 + 0] = (char)c.r;
                row[(size_t)x * 3 + 1] = (char)c.g;
                row[(size_t)x * 3 + 2] = (char)c.b;
            }
            out.write(row.data(), (std::streamsize)row.size());
        }
        return out.good();
    }
}
