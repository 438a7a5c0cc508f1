#include "utils_sys.hpp"
#include "error.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

bool write_all(int fd, const void* buf, size_t n) {
    const char* p = static_cast<const char*>(buf);
    while (n > 0) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        error("Error opening file: %s", path.c_str());
    }
    std::streamsize len = in.tellg();
    if (len < 0) {
        error("Error reading file: %s", path.c_str());
    }
    std::vector<uint8_t> bytes(static_cast<size_t>(len));
    in.seekg(0);
    if (len > 0 && !in.read(reinterpret_cast<char*>(bytes.data()), len)) {
        error("Error reading file: %s", path.c_str());
    }
    return bytes;
}

AtomicFile::AtomicFile(const std::string& path) : path_(path) {
    std::vector<char> tmpl(path.begin(), path.end());
    const char suffix[] = ".tmp.XXXXXX";
    tmpl.insert(tmpl.end(), suffix, suffix + sizeof(suffix));
    fd_ = mkstemp(tmpl.data());
    if (fd_ < 0) {
        error("%s: Cannot create temporary file for %s: %s", __func__, path.c_str(), strerror(errno));
    }
    tmpPath_.assign(tmpl.data());
}

AtomicFile::~AtomicFile() {
    if (!committed_) discard();
}

void AtomicFile::write(const void* buf, size_t n) {
    if (fd_ < 0) {
        error("%s: File %s is already closed", __func__, path_.c_str());
    }
    if (!write_all(fd_, buf, n)) {
        int err = errno;
        discard();
        error("Write error on %s: %s", path_.c_str(), strerror(err));
    }
}

void AtomicFile::commit() {
    if (fd_ < 0) {
        error("%s: File %s is already closed", __func__, path_.c_str());
    }
    if (fsync(fd_) != 0 || ::close(fd_) != 0) {
        int err = errno;
        fd_ = -1;
        discard();
        error("Error flushing %s: %s", path_.c_str(), strerror(err));
    }
    fd_ = -1;
    if (fchmodat(AT_FDCWD, tmpPath_.c_str(), 0644, 0) != 0) {
        warning("%s: Cannot set permissions on %s", __func__, tmpPath_.c_str());
    }
    if (std::rename(tmpPath_.c_str(), path_.c_str()) != 0) {
        int err = errno;
        discard();
        error("Error renaming %s to %s: %s", tmpPath_.c_str(), path_.c_str(), strerror(err));
    }
    committed_ = true;
}

void AtomicFile::discard() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!tmpPath_.empty()) {
        ::unlink(tmpPath_.c_str());
        tmpPath_.clear();
    }
}
