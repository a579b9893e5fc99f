#pragma once

#include <string>
#include <string_view>

namespace RemoteFiles::RemotePath
{
    /**
     * @brief Normalizes a '/' separated remote path: collapses repeated separators, drops "." segments and
     * resolves ".." segments. Absolute paths never climb above "/". Relative paths keep leading "..".
     * The result has no trailing separator. An empty relative result is ".".
     */
    std::string normalize(std::string_view path);

    bool isAbsolute(std::string_view path);

    /**
     * @brief Joins two remote paths. An absolute second path replaces the first.
     */
    std::string join(std::string_view base, std::string_view child);

    /**
     * @brief The last path segment, or an empty string for "/".
     */
    std::string_view filename(std::string_view path);
}
