// rtini_log.hpp - Round-trip INI - Diagnostics logging
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_LOG_HPP
#define RTINI_LOG_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

// 0 = debug, 1 = info, 2 = error
#ifndef RTINI_LOG_LEVEL
#define RTINI_LOG_LEVEL 2
#endif

namespace rtini
{
    // One log line. Constructed by RTINI_LOG(...), collects the message through
    // stream() and hands it to the sink when it goes out of scope.
    class logger
    {
    public:
        enum class level
        {
            debug,
            info,
            error
        };

        logger(level lvl, char const * file, int line)
            : level_(lvl), file_(file), line_(line)
        {}

        logger(logger const &) = delete;
        logger & operator=(logger const &) = delete;

        ~logger()
        {
            if (!enabled(level_))
                return;

            std::ostringstream output;
            output << '[' << level_to_string(level_) << "] ("
                   << basename(file_) << ':' << line_ << ") " << stream_.str() << '\n';
            *sink_ << output.str();
            sink_->flush();
        }

        std::ostringstream & stream() { return stream_; }

        static void set_level(level lvl) { threshold_ = lvl; }
        static level get_level() { return threshold_; }

        // nullptr silences all output
        static void set_sink(std::ostream * sink) { sink_ = sink; }

        static bool enabled(level lvl)
        {
            return sink_ != nullptr && static_cast<int>(lvl) >= static_cast<int>(threshold_);
        }

        static std::string_view level_to_string(level lvl)
        {
            switch (lvl)
            {
                case level::debug: return "DEBUG";
                case level::info:  return "INFO";
                case level::error: return "ERROR";
            }
            return "UNKNOWN";
        }

    private:
        static std::string_view basename(std::string_view path)
        {
            auto slash = path.find_last_of("/\\");
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }

        level              level_;
        char const *       file_;
        int                line_;
        std::ostringstream stream_;

        static inline level threshold_ =
            (RTINI_LOG_LEVEL >= 0 && RTINI_LOG_LEVEL <= 2)
                ? static_cast<level>(RTINI_LOG_LEVEL)
                : level::error;

        static inline std::ostream * sink_ = &std::clog;
    };

} // namespace rtini

#define RTINI_LOG(lvl) \
    if (!::rtini::logger::enabled(::rtini::logger::level::lvl)) {} \
    else ::rtini::logger(::rtini::logger::level::lvl, __FILE__, __LINE__).stream()

#endif // RTINI_LOG_HPP
