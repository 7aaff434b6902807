#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: [begin, end) мужийг хэсэгчлэн job system-д өгч, бүгд дуустал хүлээнэ.
*/


#include <algorithm>

#include "ash/job/job_system.hpp"

namespace ash
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
        const int grain = std::max(1, min_grain);
        // Job system байхгүй эсвэл ажил цөөн бол дуудаж буй thread дээр шууд.
        if (!js || count <= grain)
        {
            fn(begin, end);
            return;
        }

        const int workers = (int)std::max<size_t>(1, js->worker_count());
        const int chunks = std::clamp((count + grain - 1) / grain, 1, workers * 2);
        const int chunk_size = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        for (int b = begin; b < end; b += chunk_size)
        {
            const int e = std::min(end, b + chunk_size);
            wg.add(1);
            js->enqueue([b, e, &fn, &wg]() {
                fn(b, e);
                wg.done();
            });
        }
        wg.wait();
    }
}
