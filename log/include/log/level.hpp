#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <spdlog/common.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    /**
     * @brief Severity of a log line. Shares its numbering with spdlog, so the conversions are plain casts.
     */
    enum class Level : int
    {
        Trace = SPDLOG_LEVEL_TRACE,
        Debug = SPDLOG_LEVEL_DEBUG,
        Info = SPDLOG_LEVEL_INFO,
        Warning = SPDLOG_LEVEL_WARN,
        Error = SPDLOG_LEVEL_ERROR,
        Critical = SPDLOG_LEVEL_CRITICAL,
        Off = SPDLOG_LEVEL_OFF
    };

    struct LevelName
    {
        std::string_view name;
        Level level;
    };

    // The first name of a level is its canonical one, the configuration writes it back.
    inline constexpr std::array<LevelName, 9> levelNames{{
        {"trace", Level::Trace},
        {"debug", Level::Debug},
        {"info", Level::Info},
        {"warning", Level::Warning},
        {"warn", Level::Warning},
        {"error", Level::Error},
        {"err", Level::Error},
        {"critical", Level::Critical},
        {"off", Level::Off},
    }};

    constexpr spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        return static_cast<spdlog::level::level_enum>(level);
    }

    constexpr Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        if (level < spdlog::level::trace || level >= spdlog::level::n_levels)
            return Level::Info;
        return static_cast<Level>(level);
    }

    /**
     * @brief Case-insensitive lookup in levelNames. Yields nothing for unknown names, the caller picks the fallback.
     */
    inline std::optional<Level> parseLevel(std::string_view name)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(std::string{name});
        const auto iter = std::find_if(levelNames.begin(), levelNames.end(), [&lowered](LevelName const& entry) {
            return entry.name == lowered;
        });
        if (iter == levelNames.end())
            return std::nullopt;
        return iter->level;
    }

    inline std::string_view levelName(Level level)
    {
        const auto iter = std::find_if(levelNames.begin(), levelNames.end(), [level](LevelName const& entry) {
            return entry.level == level;
        });
        if (iter == levelNames.end())
            return "info";
        return iter->name;
    }

    /**
     * @brief True if a line of the given severity passes a logger set to threshold.
     */
    constexpr bool passes(Level severity, Level threshold)
    {
        return threshold != Level::Off && severity != Level::Off &&
            static_cast<int>(severity) >= static_cast<int>(threshold);
    }
}
