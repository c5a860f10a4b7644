#ifndef ARBOR_FILESYSTEM_HPP
#define ARBOR_FILESYSTEM_HPP

#include "common.hpp"
#include "errors.hpp"

// Metadata for one entry of a FileSystem
struct FileInfo
{
    std::string name;      // base name of entry
    bool isDirectory{false};
    uint64_t size{0};      // size in bytes, 0 for directories
    time_t modifiedTime{0}; // last modification time
};

void to_json(json &j, const FileInfo &info);

// An open, readable file
class File
{
public:
    virtual ~File() = default;

    // read up to size bytes; returns 0 at end of file, throws IoError on failure
    [[nodiscard]] virtual size_t read(char *buffer, size_t size) = 0;

    [[nodiscard]] virtual const FileInfo &info() const noexcept = 0;

    // read everything left in the file
    [[nodiscard]] std::string readAll();

    File(const File &) = delete;
    File &operator=(const File &) = delete;

protected:
    File() = default;
};

// Read-only hierarchical file provider.
//
// Paths are relative and '/'-separated; "" and "." name the root. Paths that
// are absolute or contain "..", "." or empty elements never exist. Missing
// entries raise NotFoundError, every other failure raises IoError. All
// implementations must tolerate concurrent calls from several threads.
class FileSystem : public std::enable_shared_from_this<FileSystem>
{
public:
    virtual ~FileSystem() = default;

    // directories cannot be opened and raise NotFoundError
    [[nodiscard]] virtual std::unique_ptr<File> open(const std::string &path) const = 0;
    [[nodiscard]] virtual FileInfo stat(const std::string &path) const = 0;

    // immediate children of a directory, sorted by name
    [[nodiscard]] virtual std::vector<FileInfo> list(const std::string &path) const = 0;

    // view of a subdirectory as its own root
    [[nodiscard]] virtual std::shared_ptr<const FileSystem> sub(const std::string &dir) const;

    // true when stat succeeds, false for NotFoundError; IoError propagates
    [[nodiscard]] bool exists(const std::string &path) const;

    // normalise a relative path; nullopt when it can never exist
    [[nodiscard]] static std::optional<std::string> cleanPath(std::string_view path);

    [[nodiscard]] static std::string join(std::string_view dir, std::string_view name);

protected:
    FileSystem() = default;
};

// FileSystem rooted at a subdirectory of another FileSystem
class ScopedFileSystem : public FileSystem
{
public:
    ScopedFileSystem(std::shared_ptr<const FileSystem> parent, std::string prefix);

    [[nodiscard]] std::unique_ptr<File> open(const std::string &path) const override;
    [[nodiscard]] FileInfo stat(const std::string &path) const override;
    [[nodiscard]] std::vector<FileInfo> list(const std::string &path) const override;
    [[nodiscard]] std::shared_ptr<const FileSystem> sub(const std::string &dir) const override;

    [[nodiscard]] const std::string &prefix() const noexcept { return dirPrefix; }

private:
    std::shared_ptr<const FileSystem> parent;
    std::string dirPrefix;

    [[nodiscard]] std::string resolve(const std::string &path) const;
};

#endif // ARBOR_FILESYSTEM_HPP
