#include "memory_filesystem.hpp"

namespace
{
    class MemoryFile : public File
    {
        std::shared_ptr<const std::string> content;
        FileInfo fileInfo;
        size_t offset{0};

    public:
        MemoryFile(std::shared_ptr<const std::string> c, FileInfo info)
            : content(std::move(c)), fileInfo(std::move(info)) {}

        size_t read(char *buffer, size_t size) override
        {
            size_t n = std::min(size, content->size() - offset);
            std::memcpy(buffer, content->data() + offset, n);
            offset += n;
            return n;
        }

        const FileInfo &info() const noexcept override
        {
            return fileInfo;
        }
    };
}

std::shared_ptr<MemoryFileSystem> MemoryFileSystem::create()
{
    return std::shared_ptr<MemoryFileSystem>(new MemoryFileSystem());
}

MemoryFileSystem::MemoryFileSystem()
{
    nodes.emplace("", Node{true, nullptr, 0});
}

std::string MemoryFileSystem::baseName(const std::string &path)
{
    if (path.empty())
    {
        return ".";
    }
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

MemoryFileSystem &MemoryFileSystem::addDirectory(const std::string &path, time_t modifiedTime)
{
    auto cleaned = cleanPath(path);
    if (!cleaned)
    {
        throw std::invalid_argument("invalid path: " + path);
    }

    // create every ancestor on the way down
    size_t pos = 0;
    while (pos != std::string::npos)
    {
        pos = cleaned->find('/', pos == 0 ? 0 : pos + 1);
        std::string prefix = pos == std::string::npos ? *cleaned : cleaned->substr(0, pos);

        auto it = nodes.find(prefix);
        if (it == nodes.end())
        {
            nodes.emplace(prefix, Node{true, nullptr, modifiedTime});
        }
        else if (!it->second.isDirectory)
        {
            throw std::invalid_argument(prefix + " is a file");
        }
    }
    return *this;
}

MemoryFileSystem &MemoryFileSystem::addFile(const std::string &path, std::string content,
                                            time_t modifiedTime)
{
    auto cleaned = cleanPath(path);
    if (!cleaned || cleaned->empty())
    {
        throw std::invalid_argument("invalid file path: " + path);
    }

    size_t slash = cleaned->find_last_of('/');
    if (slash != std::string::npos)
    {
        addDirectory(cleaned->substr(0, slash), modifiedTime);
    }

    auto it = nodes.find(*cleaned);
    if (it != nodes.end() && it->second.isDirectory)
    {
        throw std::invalid_argument(*cleaned + " is a directory");
    }

    nodes[*cleaned] = Node{false, std::make_shared<const std::string>(std::move(content)), modifiedTime};
    return *this;
}

MemoryFileSystem &MemoryFileSystem::failPath(const std::string &path)
{
    auto cleaned = cleanPath(path);
    if (!cleaned)
    {
        throw std::invalid_argument("invalid path: " + path);
    }
    failing.insert(*cleaned);
    return *this;
}

std::string MemoryFileSystem::checked(const std::string &path) const
{
    auto cleaned = cleanPath(path);
    if (!cleaned)
    {
        throw NotFoundError("invalid path: " + path);
    }

    for (const auto &failed : failing)
    {
        if (*cleaned == failed ||
            (cleaned->size() > failed.size() && cleaned->compare(0, failed.size(), failed) == 0 &&
             (*cleaned)[failed.size()] == '/'))
        {
            throw IoError("simulated I/O failure on " + *cleaned);
        }
    }
    return *cleaned;
}

const MemoryFileSystem::Node &MemoryFileSystem::lookup(const std::string &cleaned,
                                                       const std::string &path) const
{
    auto it = nodes.find(cleaned);
    if (it == nodes.end())
    {
        throw NotFoundError("file does not exist: " + path);
    }
    return it->second;
}

std::unique_ptr<File> MemoryFileSystem::open(const std::string &path) const
{
    std::string cleaned = checked(path);
    const Node &node = lookup(cleaned, path);
    if (node.isDirectory)
    {
        throw NotFoundError(path + " is a directory");
    }

    FileInfo info{baseName(cleaned), false, node.content->size(), node.modifiedTime};
    return std::make_unique<MemoryFile>(node.content, std::move(info));
}

FileInfo MemoryFileSystem::stat(const std::string &path) const
{
    std::string cleaned = checked(path);
    const Node &node = lookup(cleaned, path);
    return FileInfo{baseName(cleaned), node.isDirectory,
                    node.isDirectory ? 0 : node.content->size(), node.modifiedTime};
}

std::vector<FileInfo> MemoryFileSystem::list(const std::string &path) const
{
    std::string cleaned = checked(path);
    const Node &node = lookup(cleaned, path);
    if (!node.isDirectory)
    {
        throw NotFoundError(path + " is not a directory");
    }

    std::string prefix = cleaned.empty() ? "" : cleaned + "/";

    // std::map keeps keys sorted, so children come out in name order
    std::vector<FileInfo> entries;
    for (auto it = nodes.lower_bound(prefix); it != nodes.end(); ++it)
    {
        const std::string &key = it->first;
        if (key.compare(0, prefix.size(), prefix) != 0)
        {
            break;
        }
        if (key.size() == prefix.size())
        {
            continue; // the root itself
        }

        std::string_view rest = std::string_view(key).substr(prefix.size());
        if (rest.find('/') != std::string_view::npos)
        {
            continue; // grandchild
        }

        const Node &child = it->second;
        entries.push_back(FileInfo{std::string(rest), child.isDirectory,
                                   child.isDirectory ? 0 : child.content->size(),
                                   child.modifiedTime});
    }
    return entries;
}
