#include <noclaw/sandbox/scoped_file.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <unistd.h>

namespace noclaw {

ScopedFile& ScopedFile::operator=(ScopedFile&& other) {
    if (this != &other) {
        remove();
        path_ = other.path_;
        other.path_.clear();
    }
    return *this;
}

void ScopedFile::remove() {
    if (path_.empty()) return;
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LOG_WARN("[ScopedFile] Failed to remove %s: %s", path_.c_str(), strerror(errno));
    }
    path_.clear();
}

ScopedFile ScopedFile::create_temp(const std::string& dir,
                                   const std::string& prefix,
                                   const std::string& suffix,
                                   const std::string& content,
                                   std::string& error) {
    std::string pattern = join_path(dir, prefix + "XXXXXX" + suffix);
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        error = "cannot create temp file in " + dir + ": " + strerror(errno);
        return ScopedFile();
    }
    ScopedFile file(std::string(buf.data()));

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "cannot write " + file.path() + ": " + strerror(errno);
            close(fd);
            return ScopedFile();   // `file` unlinks on return
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    if (close(fd) != 0) {
        error = "cannot close " + file.path() + ": " + strerror(errno);
        return ScopedFile();
    }
    return file;
}

std::string temp_directory() {
    const char* tmp = getenv("TMPDIR");
    if (tmp && tmp[0] != '\0') {
        return tmp;
    }
    return "/tmp";
}

} // namespace noclaw
