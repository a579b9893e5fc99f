#include <remote_files/remote_path.hpp>

#include <vector>

namespace RemoteFiles::RemotePath
{
    bool isAbsolute(std::string_view path)
    {
        return !path.empty() && path.front() == '/';
    }

    std::string normalize(std::string_view path)
    {
        const bool absolute = isAbsolute(path);
        std::vector<std::string_view> segments{};

        std::size_t start = 0;
        while (start <= path.size())
        {
            auto end = path.find('/', start);
            if (end == std::string_view::npos)
                end = path.size();

            const auto segment = path.substr(start, end - start);
            start = end + 1;

            if (segment.empty() || segment == ".")
                continue;

            if (segment == "..")
            {
                if (!segments.empty() && segments.back() != "..")
                    segments.pop_back();
                else if (!absolute)
                    segments.push_back(segment);
                continue;
            }
            segments.push_back(segment);
        }

        std::string result{};
        if (absolute)
            result = "/";
        for (std::size_t i = 0; i != segments.size(); ++i)
        {
            if (i != 0)
                result += '/';
            result += segments[i];
        }
        if (result.empty())
            return ".";
        return result;
    }

    std::string join(std::string_view base, std::string_view child)
    {
        if (isAbsolute(child) || base.empty())
            return std::string{child};
        if (child.empty())
            return std::string{base};
        if (base.back() == '/')
            return std::string{base} + std::string{child};
        return std::string{base} + "/" + std::string{child};
    }

    std::string_view filename(std::string_view path)
    {
        while (path.size() > 1 && path.back() == '/')
            path.remove_suffix(1);
        if (path == "/")
            return {};
        const auto pos = path.rfind('/');
        if (pos == std::string_view::npos)
            return path;
        return path.substr(pos + 1);
    }
}
