// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#pragma once
#include <spdlog/spdlog.h>

#include <memory>

namespace bpocv
{

    /**
     * @brief Library-wide logger named "bpocv" (stderr, colored).
     *
     * Created on first use. The level is read once from the BPOCV_LOG
     * environment variable: trace, debug, info, warn, error or off.
     */
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Map a BPOCV_LOG value to a level; null or unknown values select the build default.
    spdlog::level::level_enum parse_log_level(const char* env);

} // namespace bpocv
