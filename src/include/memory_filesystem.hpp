#ifndef ARBOR_MEMORY_FILESYSTEM_HPP
#define ARBOR_MEMORY_FILESYSTEM_HPP

#include "filesystem.hpp"

// In-memory FileSystem. Populate it before sharing it between threads;
// reads are safe to run concurrently once population is done.
class MemoryFileSystem : public FileSystem
{
public:
    [[nodiscard]] static std::shared_ptr<MemoryFileSystem> create();

    // add or replace a file, creating parent directories as needed
    MemoryFileSystem &addFile(const std::string &path, std::string content,
                              time_t modifiedTime = 0);
    MemoryFileSystem &addDirectory(const std::string &path, time_t modifiedTime = 0);

    // make every operation on path (and beneath it) fail with IoError
    MemoryFileSystem &failPath(const std::string &path);

    [[nodiscard]] std::unique_ptr<File> open(const std::string &path) const override;
    [[nodiscard]] FileInfo stat(const std::string &path) const override;
    [[nodiscard]] std::vector<FileInfo> list(const std::string &path) const override;

private:
    MemoryFileSystem();

    struct Node
    {
        bool isDirectory{false};
        std::shared_ptr<const std::string> content; // null for directories
        time_t modifiedTime{0};
    };

    std::map<std::string, Node> nodes; // keyed by cleaned path, "" is the root
    std::set<std::string> failing;

    [[nodiscard]] const Node &lookup(const std::string &cleaned, const std::string &path) const;
    [[nodiscard]] std::string checked(const std::string &path) const;
    [[nodiscard]] static std::string baseName(const std::string &path);
};

#endif // ARBOR_MEMORY_FILESYSTEM_HPP
