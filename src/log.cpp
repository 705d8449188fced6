// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace bpocv
{

    namespace
    {
        constexpr spdlog::level::level_enum default_level()
        {
#ifdef NDEBUG
            return spdlog::level::info;
#else
            return spdlog::level::debug;
#endif
        }
    } // namespace

    spdlog::level::level_enum parse_log_level(const char* env)
    {
        if (!env) return default_level();

        const std::string s(env);
        if (s == "trace") return spdlog::level::trace;
        if (s == "debug") return spdlog::level::debug;
        if (s == "info")  return spdlog::level::info;
        if (s == "warn")  return spdlog::level::warn;
        if (s == "error") return spdlog::level::err;
        if (s == "off")   return spdlog::level::off;
        return default_level();
    }

    std::shared_ptr<spdlog::logger> logger()
    {
        static std::shared_ptr<spdlog::logger> log = []
        {
            auto l = spdlog::get("bpocv");
            if (!l) l = spdlog::stderr_color_mt("bpocv");
            l->set_level(parse_log_level(std::getenv("BPOCV_LOG")));
            l->set_pattern("[%H:%M:%S.%e][%n][%^%l%$] %v");
            return l;
        }();
        return log;
    }

} // namespace bpocv
