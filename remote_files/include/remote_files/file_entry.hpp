#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace RemoteFiles
{
    enum class FileType : std::uint8_t
    {
        Regular,
        Directory,
        Symlink,
        Other
    };

    struct FileEntry
    {
        // Host charset once returned by a listing, wire charset while inside a backend.
        std::string name{};
        FileType type{FileType::Other};
        std::uint64_t size{0};
        // Seconds since epoch.
        std::uint64_t mtime{0};
        // Absolute normalized target, filled in by readlink.
        std::optional<std::string> link{std::nullopt};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }

        friend bool operator==(FileEntry const&, FileEntry const&) = default;
    };
}
