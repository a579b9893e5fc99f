#pragma once

#include <remote_files/charset_transcoder.hpp>
#include <persistence/state/remote_options.hpp>

#include <optional>
#include <string>

namespace RemoteFiles
{
    struct SessionOptions
    {
        // Prefixed to every announced and logged message.
        std::optional<std::string> displayName{std::nullopt};
        CharsetOptions charset{};
        // Accept suspect names silently.
        bool tolerateEncodingErrors{false};
    };

    inline SessionOptions sessionOptionsFrom(Persistence::RemoteOptions const& options)
    {
        return SessionOptions{
            .displayName = options.name,
            .charset =
                CharsetOptions{
                    .wireCharset = options.fileNameEncodingOrDefault(),
                    .hostCharset = options.hostCharsetOrDefault(),
                },
            .tolerateEncodingErrors = options.ignoreWrongFileEncoding.value_or(false),
        };
    }
}
