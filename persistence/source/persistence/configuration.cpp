#include <persistence/configuration.hpp>
#include <log/log.hpp>

#include <fstream>

namespace Persistence
{
    Log::LogOptions LogSettings::toLogOptions() const
    {
        Log::LogOptions options{};
        if (level)
        {
            if (const auto parsed = Log::parseLevel(*level))
                options.level = *parsed;
            else
                Log::warn("Unknown log level '{}', using '{}'.", *level, Log::levelName(options.level));
        }
        if (file)
            options.file = std::filesystem::path{*file};
        return options;
    }
    void to_json(nlohmann::json& j, LogSettings const& settings)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, settings, level);
        TO_JSON_OPTIONAL(j, settings, file);
    }
    void from_json(nlohmann::json const& j, LogSettings& settings)
    {
        settings = {};
        FROM_JSON_OPTIONAL(j, settings, level);
        FROM_JSON_OPTIONAL(j, settings, file);
    }

    RemoteOptions const* Configuration::find(std::string const& name) const
    {
        if (main.name && *main.name == name)
            return &main;
        for (auto const& alternative : altServer)
        {
            if (alternative.name && *alternative.name == name)
                return &alternative;
        }
        return nullptr;
    }

    void to_json(nlohmann::json& j, Configuration const& configuration)
    {
        j = configuration.main;
        if (!configuration.altServer.empty())
            j["altServer"] = configuration.altServer;
        if (configuration.log)
            j["log"] = *configuration.log;
    }
    void from_json(nlohmann::json const& j, Configuration& configuration)
    {
        configuration = {};
        j.get_to(configuration.main);

        if (j.contains("altServer"))
        {
            for (auto const& entry : j.at("altServer"))
            {
                auto alternative = entry.get<RemoteOptions>();
                alternative.useDefaultsFrom(configuration.main);
                configuration.altServer.push_back(std::move(alternative));
            }
        }
        if (j.contains("log"))
            configuration.log = j.at("log").get<LogSettings>();
    }

    std::expected<Configuration, std::string> parseConfiguration(nlohmann::json const& json)
    {
        if (!json.is_object())
            return std::unexpected(std::string{"Configuration must be a JSON object."});

        try
        {
            return json.get<Configuration>();
        }
        catch (std::exception const& exc)
        {
            return std::unexpected(std::string{"Invalid configuration: "} + exc.what());
        }
    }

    std::expected<Configuration, std::string> loadConfiguration(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected("Cannot open configuration file: " + path.string());

        nlohmann::json json{};
        try
        {
            json = nlohmann::json::parse(reader, nullptr, true, true);
        }
        catch (nlohmann::json::parse_error const& exc)
        {
            Log::error("Failed to parse config file '{}': {}", path.string(), exc.what());
            return std::unexpected(std::string{"Failed to parse configuration: "} + exc.what());
        }
        return parseConfiguration(json);
    }

    std::expected<void, std::string> saveConfiguration(std::filesystem::path const& path, Configuration const& configuration)
    {
        std::ofstream writer{path, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
            return std::unexpected("Cannot write configuration file: " + path.string());

        writer << nlohmann::json(configuration).dump(4);
        if (!writer.good())
            return std::unexpected("Failed writing configuration file: " + path.string());
        return {};
    }
}
