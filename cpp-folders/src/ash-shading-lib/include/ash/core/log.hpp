#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Тохиргоо болон demo талын мэдээллийг консол руу бичих энгийн лог.
            Fragment-ийн тооцоолол дотор ашиглахгүй.
*/


#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace ash
{
    enum class LogLevel
    {
        Info = 0,
        Warn = 1,
        Error = 2,
        Off = 3
    };

    namespace detail
    {
        inline std::atomic<int>& log_threshold()
        {
            static std::atomic<int> level{(int)LogLevel::Info};
            return level;
        }

        inline void log_line(LogLevel level, std::ostream& os, const char* tag, const std::string& msg)
        {
            if ((int)level < log_threshold().load()) return;
            static std::mutex mtx{};
            std::lock_guard<std::mutex> lock(mtx);
            os << tag << ' ' << msg << std::endl;
        }
    }

    // Тестүүд Warn-оос доош мөрийг дарж болно.
    inline void set_log_level(LogLevel level)
    {
        detail::log_threshold().store((int)level);
    }

    inline void log_info(const std::string& msg) { detail::log_line(LogLevel::Info, std::cout, "[INFO]", msg); }
    inline void log_warn(const std::string& msg) { detail::log_line(LogLevel::Warn, std::cout, "[WARN]", msg); }
    inline void log_error(const std::string& msg) { detail::log_line(LogLevel::Error, std::cerr, "[ERROR]", msg); }
}
