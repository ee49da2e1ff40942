#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>

namespace s3_cli::log
{

    namespace
    {
        std::atomic<level> g_level{level::info};
        std::mutex         g_write_mutex;

        auto level_name(level _level) -> const char*
        {
            switch (_level) {
                case level::error: return "ERROR";
                case level::warn:  return "WARN";
                case level::info:  return "INFO";
                case level::debug: return "DEBUG";
            }
            return "UNKNOWN";
        }
    } // anonymous namespace

    void set_level(level _level)
    {
        g_level = _level;
    }

    auto is_enabled(level _level) -> bool
    {
        return static_cast<int>(_level) <= static_cast<int>(g_level.load());
    }

    void write(level _level, const std::string& _msg)
    {
        if (!is_enabled(_level)) {
            return;
        }

        char time_buffer[32];
        std::time_t now = std::time(nullptr);
        std::tm tm_now{};
        gmtime_r(&now, &tm_now);
        std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_now);

        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::fprintf(stderr, "%s %-5s %s\n", time_buffer, level_name(_level), _msg.c_str());
        std::fflush(stderr);
    }

    auto get_thread_identifier() -> unsigned long
    {
        return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    }

} // s3_cli::log
