#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    Logger::Logger()
        : guard_{}
        , logger_{std::make_shared<spdlog::logger>(
              "remote-files",
              std::make_shared<spdlog::sinks::stdout_color_sink_mt>())}
    {
        logger_->set_level(spdlog::level::info);
    }

    void Logger::setup(LogOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.console)
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        std::optional<std::string> fileError{std::nullopt};
        if (options.file)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
            }
            catch (spdlog::spdlog_ex const& exc)
            {
                fileError = exc.what();
                if (!options.console)
                    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }
        }

        auto logger = std::make_shared<spdlog::logger>("remote-files", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(options.level));
        {
            std::scoped_lock lock{guard_};
            logger_ = std::move(logger);
        }

        if (fileError)
            log(Level::Error, "Cannot open log file '{}': {}", options.file->string(), *fileError);
    }

    void Logger::flush()
    {
        std::scoped_lock lock{guard_};
        logger_->flush();
    }

    void setup(LogOptions const& options)
    {
        Detail::logger.setup(options);
    }

    void flush()
    {
        Detail::logger.flush();
    }
}
