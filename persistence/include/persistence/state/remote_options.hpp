#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace Persistence
{
    enum class Protocol
    {
        Ftp,
        Ftps,
        Sftp
    };
    void to_json(nlohmann::json& j, Protocol const& protocol);
    void from_json(nlohmann::json const& j, Protocol& protocol);

    /**
     * @brief Everything needed to reach one remote endpoint and to present its file names.
     */
    struct RemoteOptions
    {
        static constexpr char const* defaultFileNameEncoding = "binary";
        static constexpr char const* defaultHostCharset = "UTF-8";
        static constexpr std::chrono::milliseconds defaultConnectionTimeout{60'000};

        // Prefixed to every reported state and log line.
        std::optional<std::string> name{std::nullopt};
        std::optional<Protocol> protocol{std::nullopt};
        std::string host{};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> username{std::nullopt};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::string> privateKey{std::nullopt};
        std::optional<std::string> passphrase{std::nullopt};
        std::optional<std::string> remotePath{std::nullopt};
        std::optional<std::chrono::milliseconds> connectionTimeout{std::nullopt};
        // Charset of the names on the wire.
        std::optional<std::string> fileNameEncoding{std::nullopt};
        std::optional<std::string> hostCharset{std::nullopt};
        std::optional<bool> ignoreWrongFileEncoding{std::nullopt};

        void useDefaultsFrom(RemoteOptions const& other);

        Protocol protocolOrDefault() const;
        int portOrDefault() const;
        std::chrono::milliseconds connectionTimeoutOrDefault() const;
        std::string fileNameEncodingOrDefault() const;
        std::string hostCharsetOrDefault() const;
    };
    void to_json(nlohmann::json& j, RemoteOptions const& options);
    void from_json(nlohmann::json const& j, RemoteOptions& options);
}
