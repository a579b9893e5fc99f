#pragma once

#include <persistence/state_core.hpp>
#include <persistence/state/remote_options.hpp>
#include <log/logger.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    struct LogSettings
    {
        std::optional<std::string> level{std::nullopt};
        std::optional<std::string> file{std::nullopt};

        Log::LogOptions toLogOptions() const;
    };
    void to_json(nlohmann::json& j, LogSettings const& settings);
    void from_json(nlohmann::json const& j, LogSettings& settings);

    struct Configuration
    {
        RemoteOptions main{};
        // Alternative endpoints, already completed with the defaults of main.
        std::vector<RemoteOptions> altServer{};
        std::optional<LogSettings> log{std::nullopt};

        /**
         * @brief Finds an endpoint by its display name, searching main first.
         */
        RemoteOptions const* find(std::string const& name) const;
    };
    void to_json(nlohmann::json& j, Configuration const& configuration);
    void from_json(nlohmann::json const& j, Configuration& configuration);

    /**
     * @brief Builds a configuration from the JSON object, reporting type errors as strings.
     */
    std::expected<Configuration, std::string> parseConfiguration(nlohmann::json const& json);

    /**
     * @brief Reads and parses a configuration file. Comments are allowed in the file.
     */
    std::expected<Configuration, std::string> loadConfiguration(std::filesystem::path const& path);

    std::expected<void, std::string> saveConfiguration(std::filesystem::path const& path, Configuration const& configuration);
}
