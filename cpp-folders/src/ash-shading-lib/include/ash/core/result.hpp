#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Тохиргоо уншилт, файл бичилт зэрэг fragment-ээс гадуурх үйлдлийн
            амжилт/алдааг буцаах бүтэц.
*/


#include <string>
#include <utility>

namespace ash
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
    };
}
