#include "filesystem.hpp"

void to_json(json &j, const FileInfo &info)
{
    j = json{{"name", info.name},
             {"isDir", info.isDirectory},
             {"size", info.size},
             {"modified", static_cast<int64_t>(info.modifiedTime)}};
}

std::string File::readAll()
{
    static constexpr size_t CHUNK_SIZE = 16384;

    std::string content;
    if (info().size > 0 && info().size < std::numeric_limits<uint32_t>::max())
    {
        content.reserve(info().size);
    }

    char buffer[CHUNK_SIZE];
    size_t n;
    while ((n = read(buffer, sizeof(buffer))) > 0)
    {
        content.append(buffer, n);
    }
    return content;
}

std::shared_ptr<const FileSystem> FileSystem::sub(const std::string &dir) const
{
    auto cleaned = cleanPath(dir);
    if (!cleaned)
    {
        throw NotFoundError("invalid path: " + dir);
    }
    if (cleaned->empty())
    {
        return shared_from_this();
    }

    FileInfo info = stat(*cleaned);
    if (!info.isDirectory)
    {
        throw NotFoundError(*cleaned + " is not a directory");
    }
    return std::make_shared<ScopedFileSystem>(shared_from_this(), *cleaned);
}

bool FileSystem::exists(const std::string &path) const
{
    try
    {
        (void)stat(path);
        return true;
    }
    catch (const NotFoundError &)
    {
        return false;
    }
}

std::optional<std::string> FileSystem::cleanPath(std::string_view path)
{
    if (path.empty() || path == ".")
    {
        return std::string();
    }
    if (path.front() == '/' || path.back() == '/')
    {
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos)
        {
            end = path.size();
        }

        std::string_view element = path.substr(start, end - start);
        if (element.empty() || element == "." || element == ".." ||
            element.find('\0') != std::string_view::npos)
        {
            return std::nullopt;
        }
        start = end + 1;
    }

    return std::string(path);
}

std::string FileSystem::join(std::string_view dir, std::string_view name)
{
    if (dir.empty() || dir == ".")
    {
        return std::string(name);
    }
    if (name.empty() || name == ".")
    {
        return std::string(dir);
    }

    std::string joined;
    joined.reserve(dir.size() + name.size() + 1);
    joined += dir;
    joined += '/';
    joined += name;
    return joined;
}

ScopedFileSystem::ScopedFileSystem(std::shared_ptr<const FileSystem> parent,
                                   std::string prefix)
    : parent(std::move(parent)), dirPrefix(std::move(prefix))
{
}

std::string ScopedFileSystem::resolve(const std::string &path) const
{
    auto cleaned = cleanPath(path);
    if (!cleaned)
    {
        throw NotFoundError("invalid path: " + path);
    }
    return join(dirPrefix, *cleaned);
}

std::unique_ptr<File> ScopedFileSystem::open(const std::string &path) const
{
    return parent->open(resolve(path));
}

FileInfo ScopedFileSystem::stat(const std::string &path) const
{
    return parent->stat(resolve(path));
}

std::vector<FileInfo> ScopedFileSystem::list(const std::string &path) const
{
    return parent->list(resolve(path));
}

std::shared_ptr<const FileSystem> ScopedFileSystem::sub(const std::string &dir) const
{
    auto cleaned = cleanPath(dir);
    if (!cleaned)
    {
        throw NotFoundError("invalid path: " + dir);
    }
    if (cleaned->empty())
    {
        return shared_from_this();
    }

    // flatten nested scopes so lookups stay one hop away from the real provider
    std::string nested = join(dirPrefix, *cleaned);
    FileInfo info = parent->stat(nested);
    if (!info.isDirectory)
    {
        throw NotFoundError(*cleaned + " is not a directory");
    }
    return std::make_shared<ScopedFileSystem>(parent, std::move(nested));
}
