// VERISCORE - Filesystem Utilities Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/util/fs.h"
#include "veriscore/core/random.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace veriscore {
namespace util {
namespace fs {

namespace {

/// Owns a file descriptor
class FileHandle {
public:
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() { Close(); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    bool Close() {
        if (fd_ < 0) {
            return true;
        }
        const int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

private:
    int fd_;
};

bool WriteAll(int fd, const char* data, size_t len) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool StatMode(const std::string& path, mode_t& mode) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    mode = st.st_mode;
    return true;
}

int RemoveEntry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

} // namespace

std::string JoinPath(const std::string& base, const std::string& name) {
    if (base.empty()) {
        return name;
    }
    return base.back() == '/' ? base + name : base + '/' + name;
}

std::string ParentPath(const std::string& path) {
    const size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return slash == 0 ? "/" : path.substr(0, slash);
}

std::string TempDirectoryPath() {
    const char* tmp = std::getenv("TMPDIR");
    return (tmp != nullptr && *tmp != '\0') ? tmp : "/tmp";
}

bool Exists(const std::string& path) {
    mode_t mode;
    return StatMode(path, mode);
}

bool IsFile(const std::string& path) {
    mode_t mode;
    return StatMode(path, mode) && S_ISREG(mode);
}

bool IsDirectory(const std::string& path) {
    mode_t mode;
    return StatMode(path, mode) && S_ISDIR(mode);
}

std::vector<std::string> ListDirectory(const std::string& path) {
    std::vector<std::string> names;
    DIR* dir = ::opendir(path.c_str());
    if (dir == nullptr) {
        return names;
    }
    while (const struct dirent* entry = ::readdir(dir)) {
        const std::string name = entry->d_name;
        if (name != "." && name != "..") {
            names.push_back(name);
        }
    }
    ::closedir(dir);
    std::sort(names.begin(), names.end());
    return names;
}

bool CreateDirectories(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (IsDirectory(path)) {
        return true;
    }
    const std::string parent = ParentPath(path);
    if (!parent.empty() && !CreateDirectories(parent)) {
        return false;
    }
    // EEXIST covers a concurrent creator
    return ::mkdir(path.c_str(), 0755) == 0 || (errno == EEXIST && IsDirectory(path));
}

bool RemoveAll(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return ::unlink(path.c_str()) == 0;
    }
    return ::nftw(path.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS) == 0;
}

bool ReadFile(const std::string& path, std::string& content) {
    FileHandle file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file.IsOpen()) {
        return false;
    }

    std::string data;
    char buf[8192];
    for (;;) {
        const ssize_t n = ::read(file.Get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) break;
        data.append(buf, static_cast<size_t>(n));
    }
    content.swap(data);
    return true;
}

bool WriteFileAtomic(const std::string& path, const std::string& content) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), ".tmp%016llx",
                  static_cast<unsigned long long>(GetRandUint64()));
    const std::string tmpPath = path + suffix;

    FileHandle file(::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!file.IsOpen()) {
        return false;
    }
    const bool written = WriteAll(file.Get(), content.data(), content.size()) &&
                         ::fsync(file.Get()) == 0;
    if (!file.Close() || !written || ::rename(tmpPath.c_str(), path.c_str()) != 0) {
        ::unlink(tmpPath.c_str());
        return false;
    }
    return true;
}

TempDirectory::TempDirectory(const std::string& prefix) {
    std::string pattern = JoinPath(TempDirectoryPath(), prefix + "XXXXXX");
    if (::mkdtemp(&pattern[0]) != nullptr) {
        path_ = pattern;
    }
}

TempDirectory::~TempDirectory() {
    if (!path_.empty()) {
        RemoveAll(path_);
    }
}

} // namespace fs
} // namespace util
} // namespace veriscore
