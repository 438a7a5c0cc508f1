#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Write exactly n bytes to fd, retrying on partial writes and EINTR
bool write_all(int fd, const void* buf, size_t n);

std::vector<uint8_t> readFileBytes(const std::string& path);

/// Writes into a temporary sibling of `path` and renames it over `path` on
/// commit(). If the object is destroyed before commit() the temporary is
/// removed and `path` is left untouched.
class AtomicFile {
public:
    explicit AtomicFile(const std::string& path);
    ~AtomicFile();
    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    void write(const void* buf, size_t n);
    void write(const std::string& s) { write(s.data(), s.size()); }
    void commit();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string tmpPath_;
    int fd_ = -1;
    bool committed_ = false;

    void discard();
};
