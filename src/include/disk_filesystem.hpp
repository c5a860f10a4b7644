#ifndef ARBOR_DISK_FILESYSTEM_HPP
#define ARBOR_DISK_FILESYSTEM_HPP

#include "filesystem.hpp"

// FileSystem backed by a directory of the host filesystem
class DiskFileSystem : public FileSystem
{
public:
    // throws std::runtime_error when root is not an existing directory
    [[nodiscard]] static std::shared_ptr<DiskFileSystem> create(const fs::path &root);

    [[nodiscard]] std::unique_ptr<File> open(const std::string &path) const override;
    [[nodiscard]] FileInfo stat(const std::string &path) const override;
    [[nodiscard]] std::vector<FileInfo> list(const std::string &path) const override;

    [[nodiscard]] const fs::path &root() const noexcept { return rootDir; }

private:
    explicit DiskFileSystem(fs::path root);

    fs::path rootDir;

    [[nodiscard]] fs::path resolve(const std::string &path) const;
    [[nodiscard]] static FileInfo infoFromStat(const std::string &name, const struct stat &st);
};

#endif // ARBOR_DISK_FILESYSTEM_HPP
