// VERISCORE - Filesystem Utilities
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// POSIX file helpers for the key store and the CLI. Key and proof files are
// written through a temporary sibling that is synced and renamed into place,
// so a reader never sees a half-written key.

#ifndef VERISCORE_UTIL_FS_H
#define VERISCORE_UTIL_FS_H

#include <string>
#include <vector>

namespace veriscore {
namespace util {
namespace fs {

/// Join two path components with a single separator
std::string JoinPath(const std::string& base, const std::string& name);

/// Parent directory ("" for a bare filename)
std::string ParentPath(const std::string& path);

/// $TMPDIR, or /tmp
std::string TempDirectoryPath();

bool Exists(const std::string& path);
bool IsFile(const std::string& path);
bool IsDirectory(const std::string& path);

/// Names (not paths) of the entries in a directory, sorted
std::vector<std::string> ListDirectory(const std::string& path);

/// mkdir -p; true if the directory exists afterwards
bool CreateDirectories(const std::string& path);

/// Remove a file or a directory tree; a missing path counts as removed
bool RemoveAll(const std::string& path);

/// Read a whole file; false if it cannot be opened or read
bool ReadFile(const std::string& path, std::string& content);

/// Write, fsync and rename over path. The parent directory must exist.
bool WriteFileAtomic(const std::string& path, const std::string& content);

/// Directory under TempDirectoryPath() removed with its contents on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "veriscore_");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& GetPath() const { return path_; }
    bool IsValid() const { return !path_.empty(); }

private:
    std::string path_;
};

} // namespace fs
} // namespace util
} // namespace veriscore

#endif // VERISCORE_UTIL_FS_H
