#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Validation болон parse үр дүнг алдааны мессежтэй хамт буцаах төрөл.
*/


#include <string>
#include <utility>

namespace gpurt
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        explicit operator bool() const { return ok; }
    };

    // Утга буцаахгүй шалгалтуудад зориулсан хоосон төрөл.
    struct Unit
    {
    };

    using Status = Result<Unit>;

    inline Status status_ok()
    {
        return Status::success(Unit{});
    }
}
