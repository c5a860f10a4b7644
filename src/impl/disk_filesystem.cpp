#include "disk_filesystem.hpp"

namespace
{
    // RAII owner of a read-only file descriptor
    class DiskFile : public File
    {
        int fd;
        FileInfo fileInfo;
        std::string path;

    public:
        DiskFile(int f, FileInfo info, std::string p)
            : fd(f), fileInfo(std::move(info)), path(std::move(p)) {}

        ~DiskFile() override
        {
            if (fd != -1)
                close(fd);
        }

        size_t read(char *buffer, size_t size) override
        {
            for (;;)
            {
                ssize_t n = ::read(fd, buffer, size);
                if (n >= 0)
                {
                    return static_cast<size_t>(n);
                }
                if (errno != EINTR)
                {
                    throw IoError("failed to read " + path, errno);
                }
            }
        }

        const FileInfo &info() const noexcept override
        {
            return fileInfo;
        }
    };

    bool isNotExist(int err)
    {
        return err == ENOENT || err == ENOTDIR;
    }
}

std::shared_ptr<DiskFileSystem> DiskFileSystem::create(const fs::path &root)
{
    std::error_code ec;
    if (!fs::is_directory(root, ec))
    {
        throw std::runtime_error("Template root is not a directory: " + root.string());
    }
    return std::shared_ptr<DiskFileSystem>(new DiskFileSystem(root));
}

DiskFileSystem::DiskFileSystem(fs::path root) : rootDir(std::move(root))
{
}

fs::path DiskFileSystem::resolve(const std::string &path) const
{
    auto cleaned = cleanPath(path);
    if (!cleaned)
    {
        throw NotFoundError("invalid path: " + path);
    }
    return cleaned->empty() ? rootDir : rootDir / *cleaned;
}

FileInfo DiskFileSystem::infoFromStat(const std::string &name, const struct stat &st)
{
    FileInfo info;
    info.name = name;
    info.isDirectory = S_ISDIR(st.st_mode);
    info.size = info.isDirectory ? 0 : static_cast<uint64_t>(st.st_size);
    info.modifiedTime = st.st_mtime;
    return info;
}

std::unique_ptr<File> DiskFileSystem::open(const std::string &path) const
{
    fs::path fullPath = resolve(path);

    int fd = ::open(fullPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        if (isNotExist(errno))
        {
            throw NotFoundError("file does not exist: " + path);
        }
        throw IoError("failed to open " + path, errno);
    }

    struct stat st;
    if (fstat(fd, &st) == -1)
    {
        int err = errno;
        close(fd);
        throw IoError("failed to stat " + path, err);
    }
    if (S_ISDIR(st.st_mode))
    {
        close(fd);
        throw NotFoundError("is a directory: " + path);
    }

    // advise kernel about access pattern, files are read front to back
    posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);

    return std::make_unique<DiskFile>(fd, infoFromStat(fullPath.filename().string(), st), path);
}

FileInfo DiskFileSystem::stat(const std::string &path) const
{
    fs::path fullPath = resolve(path);

    struct stat st;
    if (::stat(fullPath.c_str(), &st) == -1)
    {
        if (isNotExist(errno))
        {
            throw NotFoundError("file does not exist: " + path);
        }
        throw IoError("failed to stat " + path, errno);
    }

    std::string name = path.empty() || path == "." ? "." : fullPath.filename().string();
    return infoFromStat(name, st);
}

std::vector<FileInfo> DiskFileSystem::list(const std::string &path) const
{
    fs::path fullPath = resolve(path);

    std::error_code ec;
    fs::directory_iterator it(fullPath, ec);
    if (ec)
    {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        {
            throw NotFoundError("directory does not exist: " + path);
        }
        throw IoError("failed to list " + path + ": " + ec.message());
    }

    std::vector<FileInfo> entries;
    for (const fs::directory_entry &entry : it)
    {
        struct stat st;
        if (::stat(entry.path().c_str(), &st) == -1)
        {
            // dangling symlinks and entries removed mid-listing are skipped
            if (isNotExist(errno))
            {
                continue;
            }
            throw IoError("failed to stat " + entry.path().string(), errno);
        }
        entries.push_back(infoFromStat(entry.path().filename().string(), st));
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileInfo &a, const FileInfo &b)
              { return a.name < b.name; });
    return entries;
}
