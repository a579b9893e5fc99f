#pragma once

#include <log/level.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    struct LogOptions
    {
        Level level{Level::Info};
        std::optional<std::filesystem::path> file{std::nullopt};
        bool console{true};
    };

    class Logger
    {
      public:
        Logger();

        /**
         * @brief Replaces the sinks of the underlying spdlog logger.
         * Falls back to console only logging if the log file cannot be opened.
         *
         * @param options Where to log to and at which level.
         */
        void setup(LogOptions const& options);

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            return fromSpdlogLevel(logger_->level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            std::shared_ptr<spdlog::logger> logger;
            {
                std::scoped_lock lock{guard_};
                logger = logger_;
            }
            if (!passes(level, fromSpdlogLevel(logger->level())))
                return;

            logger->log(toSpdlogLevel(level), fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
        }

        void flush();

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
