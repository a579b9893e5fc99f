#include <utility/temporary_directory.hpp>

#include <random>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace Utility
{
    namespace
    {
        std::string generateRandomString(int length)
        {
            static constexpr std::string_view characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

            std::random_device device{};
            std::mt19937 rng(device());
            std::uniform_int_distribution<std::size_t> distribution(0, characters.size() - 1);

            std::string randomString;
            randomString.reserve(static_cast<std::size_t>(length));
            for (int i = 0; i < length; ++i)
                randomString += characters[distribution(rng)];

            return randomString;
        }
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "remote_files_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBasePath)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBasePath_{removeBasePath}
    {
        std::filesystem::create_directories(basePath_);

        for (int i = 0; i != 1000; ++i)
        {
            const auto candidate = basePath_ / ("dir"s + generateRandomString(10));
            if (std::filesystem::create_directory(candidate))
            {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("Could not setup temporary directory in: " + basePath_.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        if (removeBasePath_)
            std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}
