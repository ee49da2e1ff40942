#ifndef S3_CLI_LOG_HPP
#define S3_CLI_LOG_HPP

#include <fmt/format.h>

#include <string>

namespace s3_cli::log
{

    enum class level
    {
        error = 0,
        warn,
        info,
        debug
    };

    void set_level(level _level);
    auto is_enabled(level _level) -> bool;

    void write(level _level, const std::string& _msg);

    // Returns a short identifier for the calling thread, used to tag debug lines.
    auto get_thread_identifier() -> unsigned long;

    inline void error(const std::string& _msg) { write(level::error, _msg); }
    inline void warn(const std::string& _msg)  { write(level::warn, _msg); }
    inline void info(const std::string& _msg)  { write(level::info, _msg); }

    // Debug lines carry the source location of the caller.
    inline void debug(const char* _file, int _line, const char* _function, const std::string& _msg)
    {
        if (!is_enabled(level::debug)) {
            return;
        }
        write(level::debug, fmt::format("{}:{} ({}) [[{}]] {}", _file, _line, _function,
                    get_thread_identifier(), _msg));
    }

} // s3_cli::log

#endif // S3_CLI_LOG_HPP
