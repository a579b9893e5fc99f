#include <persistence/state/remote_options.hpp>

#include <utility/algorithm/case_convert.hpp>

#include <stdexcept>

namespace Persistence
{
    void to_json(nlohmann::json& j, Protocol const& protocol)
    {
        switch (protocol)
        {
            case Protocol::Ftp:
                j = "ftp";
                return;
            case Protocol::Ftps:
                j = "ftps";
                return;
            case Protocol::Sftp:
                j = "sftp";
                return;
        }
        throw std::invalid_argument("Invalid protocol value");
    }
    void from_json(nlohmann::json const& j, Protocol& protocol)
    {
        const auto name = Utility::Algorithm::toLowerCase(j.get<std::string>());
        if (name == "ftp")
            protocol = Protocol::Ftp;
        else if (name == "ftps")
            protocol = Protocol::Ftps;
        else if (name == "sftp")
            protocol = Protocol::Sftp;
        else
            throw std::invalid_argument("Unknown protocol: " + name);
    }

    void RemoteOptions::useDefaultsFrom(RemoteOptions const& other)
    {
        if (!name)
            name = other.name;
        if (!protocol)
            protocol = other.protocol;
        if (host.empty())
            host = other.host;
        if (!port)
            port = other.port;
        if (!username)
            username = other.username;
        if (!password)
            password = other.password;
        if (!privateKey)
            privateKey = other.privateKey;
        if (!passphrase)
            passphrase = other.passphrase;
        if (!remotePath)
            remotePath = other.remotePath;
        if (!connectionTimeout)
            connectionTimeout = other.connectionTimeout;
        if (!fileNameEncoding)
            fileNameEncoding = other.fileNameEncoding;
        if (!hostCharset)
            hostCharset = other.hostCharset;
        if (!ignoreWrongFileEncoding)
            ignoreWrongFileEncoding = other.ignoreWrongFileEncoding;
    }

    Protocol RemoteOptions::protocolOrDefault() const
    {
        return protocol.value_or(Protocol::Ftp);
    }
    int RemoteOptions::portOrDefault() const
    {
        if (port)
            return *port;
        return protocolOrDefault() == Protocol::Sftp ? 22 : 21;
    }
    std::chrono::milliseconds RemoteOptions::connectionTimeoutOrDefault() const
    {
        return connectionTimeout.value_or(defaultConnectionTimeout);
    }
    std::string RemoteOptions::fileNameEncodingOrDefault() const
    {
        return fileNameEncoding.value_or(defaultFileNameEncoding);
    }
    std::string RemoteOptions::hostCharsetOrDefault() const
    {
        return hostCharset.value_or(defaultHostCharset);
    }

    void to_json(nlohmann::json& j, RemoteOptions const& options)
    {
        j = nlohmann::json::object();
        if (!options.host.empty())
            j["host"] = options.host;

        TO_JSON_OPTIONAL(j, options, name);
        TO_JSON_OPTIONAL(j, options, protocol);
        TO_JSON_OPTIONAL(j, options, port);
        TO_JSON_OPTIONAL(j, options, username);
        TO_JSON_OPTIONAL(j, options, password);
        TO_JSON_OPTIONAL(j, options, privateKey);
        TO_JSON_OPTIONAL(j, options, passphrase);
        TO_JSON_OPTIONAL(j, options, remotePath);
        if (options.connectionTimeout)
            j["connectionTimeout"] = options.connectionTimeout->count();
        TO_JSON_OPTIONAL(j, options, fileNameEncoding);
        TO_JSON_OPTIONAL(j, options, hostCharset);
        TO_JSON_OPTIONAL(j, options, ignoreWrongFileEncoding);
    }
    void from_json(nlohmann::json const& j, RemoteOptions& options)
    {
        options = {};

        if (j.contains("host"))
            j.at("host").get_to(options.host);

        FROM_JSON_OPTIONAL(j, options, name);
        FROM_JSON_OPTIONAL(j, options, protocol);
        FROM_JSON_OPTIONAL(j, options, port);
        FROM_JSON_OPTIONAL(j, options, username);
        FROM_JSON_OPTIONAL(j, options, password);
        FROM_JSON_OPTIONAL(j, options, privateKey);
        FROM_JSON_OPTIONAL(j, options, passphrase);
        FROM_JSON_OPTIONAL(j, options, remotePath);
        if (j.contains("connectionTimeout"))
            options.connectionTimeout = std::chrono::milliseconds{j.at("connectionTimeout").get<long long>()};
        FROM_JSON_OPTIONAL(j, options, fileNameEncoding);
        FROM_JSON_OPTIONAL(j, options, hostCharset);
        FROM_JSON_OPTIONAL(j, options, ignoreWrongFileEncoding);
    }
}
