#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a uniquely named directory and removes it with all its contents on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @param basePath The directory to create the temporary directory in.
         * @param removeBasePath Also try to remove basePath on destruction (succeeds only if it is empty by then).
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBasePath);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBasePath_;
    };
}
